// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_INCLUDE_PROTOCOL_HANDLER_H_
#define TEXTSYNC_INCLUDE_PROTOCOL_HANDLER_H_

#include <cstdlib>

namespace textsync {

class TcpConnection;
// 连接所处阶段的协议处理器接口，HTTP阶段与WebSocket阶段各有一个实现
class ProtocolHandler {
public:
  explicit ProtocolHandler(TcpConnection *connection)
      : connection_(connection) {}
  virtual ~ProtocolHandler() = default;

  ProtocolHandler(const ProtocolHandler &) = delete;
  ProtocolHandler &operator=(const ProtocolHandler &) = delete;

  // 处理接收到的数据，返回已消耗的字节数
  // 若返回值小于length，剩余数据交给切换后的下一阶段处理器
  virtual size_t RecvDataHandle(const void *buffer, size_t length) = 0;
  // 连接闲置超时
  virtual void TimeoutHandle() = 0;
  // 连接开始关闭，之后不会再收到数据
  virtual void CloseHandle() {}

protected:
  TcpConnection *connection_;
};

} // namespace textsync

#endif
