// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "websocket_session.h"

#include "core/event_loop.h"

namespace textsync {

bool WsSession::Deliver(std::shared_ptr<const std::string> message) {
  if (closed_.load(std::memory_order_acquire))
    return false;
  EventLoop *loop = EventLoop::Current();
  if (loop == nullptr)
    return false;
  // 即使目标连接属于当前线程也异步投递，调用方此时持有同步中心的锁
  loop->submit_cross_thread_msg(id(),
                                new CTContext(next_seq_++, std::move(message)));
  return true;
}

} // namespace textsync
