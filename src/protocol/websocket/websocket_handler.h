// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_PROTOCOL_WEBSOCKET_HANDLER_H_
#define TEXTSYNC_PROTOCOL_WEBSOCKET_HANDLER_H_

#include <memory>
#include <string>

#include "core/timer.h"
#include "protocol/websocket/websocket_parser.h"
#include "protocol_handler.h"
#include "service_handler.h"

namespace textsync {

namespace {

#define WS_PING_PAYLOAD "Are you ok?"

// 发送ping帧后等待pong帧的超时时间，默认30秒
constexpr static uint32_t kTimeToCloseAfterPing = 30000;

} // namespace

// websocket阶段的协议处理器，负责帧的解析、分片重组与控制帧
// 完整的数据消息交给业务处理接口处理
class WebSocketHandler : public ProtocolHandler {
public:
  // max_message_length同时限制单个帧与重组后的消息长度
  WebSocketHandler(TcpConnection *connection, uint32_t conn_id,
                   std::unique_ptr<ServiceHandler> service,
                   uint64_t max_message_length = kMaxPayloadLength);
  ~WebSocketHandler();

  // 开始提供服务，失败时向客户端发送关闭帧并返回false
  bool start();

  size_t RecvDataHandle(const void *buffer, size_t length) override;

  void TimeoutHandle() override;

  void CloseHandle() override;

  // 以单个文本帧发送一条消息
  static bool send_data_frame(TcpConnection *connection,
                              const std::string &data);

protected:
  // 以下操作默认作用于所属的连接
  // 写入已编码的帧，close_after为true时写入完毕后关闭连接
  virtual bool write(std::string frame, bool close_after = false);
  virtual bool connection_closed() const;
  virtual void close_connection();

private:
  // websocket协议处理状态机
  enum class ws_handle_state_t : uint8_t {
    kWsHandleStateNormal = 0,
    kWsHandleStateContinued,
    kWsHandleStateClosing
  };

  void frame_handle();

  void control_frame_handle();

  // 一条完整的消息已重组完毕
  void message_handle();

  void send_ping_frame();

  // 发送关闭帧，发送完成后关闭连接
  void send_close_frame(uint16_t code);

  void send_pong_frame(const std::string &payload);

  // 发送ping帧之后，等待pong帧的计时器
  TimeWheel::timer_node wait_pong_timer_;
  bool wait_pong_flag_{false};

  ws_handle_state_t handle_state_{ws_handle_state_t::kWsHandleStateNormal};

  uint32_t conn_id_;
  uint64_t max_message_length_;

  // 分片消息的重组缓存
  std::string payload_cache_;

  WebSocketParser parser_;

  std::unique_ptr<ServiceHandler> service_;
};

} // namespace textsync

#endif
