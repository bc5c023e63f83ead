// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_PROTOCOL_WEBSOCKET_SESSION_H_
#define TEXTSYNC_PROTOCOL_WEBSOCKET_SESSION_H_

#include <atomic>

#include "services/sync/session_registry.h"

namespace textsync {

// websocket连接在同步中心中的会话，会话id即连接id
// 消息通过跨线程消息投递给连接所属的worker，由该worker负责发送
class WsSession : public Session {
public:
  using Session::Session;

  // 必须在事件循环线程中且持有同步中心的锁时调用，否则返回false
  bool Deliver(std::shared_ptr<const std::string> message) override;

  inline void Close() override {
    closed_.store(true, std::memory_order_release);
  }

private:
  std::atomic<bool> closed_{false};
  // 投递给该会话的下一条消息序号，由同步中心的锁保护
  // 连接所属的worker按该序号还原同步中心的投递顺序
  uint64_t next_seq_{0};
};

} // namespace textsync

#endif
