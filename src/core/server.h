// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_CORE_SERVER_H_
#define TEXTSYNC_CORE_SERVER_H_

#include <memory>
#include <vector>

#include "config/config.h"
#include "event_loop.h"
#include "worker.h"

namespace textsync {

class SyncHub;

class TextSyncServer {
public:
  TextSyncServer(const ServerConfig &config, SyncHub *hub);
  ~TextSyncServer();

  TextSyncServer(const TextSyncServer &) = delete;
  TextSyncServer &operator=(const TextSyncServer &) = delete;

  int Run();

  inline int ConnectionIdToRingFd(uint32_t conn_id) {
    return worker_threads_[(conn_id - 1) % nr_threads_]
        ->GetRingInstance()
        ->ring_fd;
  }

  // 为新连接分配连接id以及所属worker线程的ring实例，只在master线程中调用
  uint32_t NextConnection(int *ring_fd);

  inline SyncHub *GetHub() { return hub_; }

private:
  EventLoop event_loop_;
  std::vector<int> listen_fds_;

  std::vector<std::unique_ptr<Worker>> worker_threads_;
  unsigned int nr_threads_;
  // 为每个新连接设置一个唯一的连接id，从1开始
  // 通过(连接id - 1) % nr_threads_获取该连接所处于的工作线程
  uint32_t next_conn_id_{1};

  SyncHub *hub_;
};

} // namespace textsync

#endif
