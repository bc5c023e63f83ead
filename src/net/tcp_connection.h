// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_NET_TCP_CONNECTION_H_
#define TEXTSYNC_NET_TCP_CONNECTION_H_

#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "core/event_loop.h"
#include "net/message_sequencer.h"
#include "protocol_handler.h"

namespace textsync {

namespace {
// 闲置连接超时时间，默认60s
constexpr static uint32_t kConnIdleTimeout = 60000;
// 一组链接发送请求需要在该时间内完成，默认10s
constexpr static uint32_t kSendTimeout = 10000;
// 发送队列中允许积压字节数的最小上限，默认8MB
// 实际上限至少能容纳两条最大的同步消息
constexpr static size_t kMaxQueuedBytes = 8 << 20;
// 一组链接发送请求最多使用的缓冲区数量
constexpr static uint32_t kMaxChainBuffers = 64;
} // namespace

class TcpConnection {
public:
  // 当前连接阶段
  enum conn_stage_t { kConnStageHttp = 0, kConnStageWebsocket };

  TcpConnection(EventLoop *event_loop, int fd, uint32_t conn_id);
  ~TcpConnection();

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  inline int fd() const { return fd_; }
  inline uint32_t conn_id() const { return conn_id_; }
  inline bool closed() const { return closed_; }
  inline EventLoop *GetEventLoop() { return event_loop_; }
  inline conn_stage_t GetConnStage() const { return stage_; }

  // 开始计时，连接加入worker后调用
  void start();

  // 读操作完成处理函数，传入已读取的缓冲区地址和读取的字节数
  void RecvHandle(const void *buffer, size_t length);

  // 一个发送请求完成，res为内核返回的结果
  void SendHandle(int res);

  // 将数据加入发送队列，按加入顺序发送
  // close_after为true时发送完毕后关闭连接，之后的数据不再接收
  // 发送队列积压过多或没有可用的发送缓冲区时关闭连接并返回false
  bool Send(std::string data, bool close_after = false);

  // 处理其他线程投递给该连接的消息，按序号顺序以文本帧发送
  // 空消息表示该连接已被同步中心移除，按序到达时关闭连接
  void MessageHandle(uint64_t seq, std::shared_ptr<const std::string> message);

  // 切换到下一阶段的协议处理器，在当前处理器返回后生效
  // 本次未消耗的数据交给新的处理器
  void transition_stage(conn_stage_t stage,
                        std::unique_ptr<ProtocolHandler> handler);

  // 取消该连接上所有请求并关闭，重复调用无副作用
  void close();

  // 重置闲置计时器
  inline void refresh() { event_loop_->AddTimer(&idle_timer_, kConnIdleTimeout); }

private:
  struct pending_send {
    std::string data;
    // 已提交发送的字节数
    size_t offset;
    bool close_after;
  };

  // 将队首数据的下一段提交为一组链接的发送请求
  void submit_front();

  conn_stage_t stage_{kConnStageHttp};
  std::unique_ptr<ProtocolHandler> handler_;
  std::unique_ptr<ProtocolHandler> next_handler_;

  // 直接文件描述符
  int fd_;
  // 连接id
  uint32_t conn_id_;
  bool closed_{false};
  // 已加入关闭前的最后一条数据，不再接收新数据
  bool draining_{false};
  uint64_t recv_bytes_{0};
  uint64_t send_bytes_{0};

  std::deque<pending_send> send_queue_;
  size_t queued_bytes_{0};
  size_t max_queued_bytes_{kMaxQueuedBytes};
  // 当前这组发送请求尚未完成的数量以及字节数
  uint32_t inflight_sends_{0};
  size_t inflight_bytes_{0};
  size_t inflight_sent_{0};
  bool send_failed_{false};

  MessageSequencer sequencer_;

  // 指向该文件描述符所属的事件循环
  EventLoop *event_loop_;

  TimeWheel::timer_node idle_timer_;
  TimeWheel::timer_node send_timer_;
};

} // namespace textsync

#endif
