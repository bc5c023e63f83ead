// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_CORE_WORKER_H_
#define TEXTSYNC_CORE_WORKER_H_

#include <memory>
#include <string>
#include <unordered_map>

#include <pthread.h>

#include "event_loop.h"
#include "net/tcp_connection.h"

namespace textsync {

// 工作线程，拥有一个事件循环以及分配给它的所有连接
// 连接只会在所属的工作线程中被访问
class Worker {
public:
  Worker(TextSyncServer *server, std::string name);
  ~Worker();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  static void *worker_main(void *arg);
  inline struct io_uring *GetRingInstance() {
    return event_loop_->GetRingInstance();
  }

  std::shared_ptr<TcpConnection> GetConnection(uint32_t conn_id);

  void AddConnection(uint32_t conn_id,
                     std::shared_ptr<TcpConnection> connection);

  void DelConnection(uint32_t conn_id);

  const std::string &GetName() const { return name_; }

private:
  pthread_t thread_;
  pthread_barrier_t barrier_;
  std::string name_;
  TextSyncServer *parent_;
  std::unique_ptr<EventLoop> event_loop_;

  // 保存着connection_id到TcpConnection类实例的映射，先于事件循环销毁
  std::unordered_map<uint32_t, std::shared_ptr<TcpConnection>> conn_map_;
};

} // namespace textsync

#endif
