// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "server.h"

#include <thread>

#include <liburing.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include "context.h"
#include "utils/helpers.h"

namespace textsync {

TextSyncServer::TextSyncServer(const ServerConfig &config, SyncHub *hub)
    : event_loop_(this, nullptr), hub_(hub) {
  for (const listen_address &address : config.ListenAddresses()) {
    int fd = create_listening_socket(address.host, address.port);
    if (fd < 0) {
      spdlog::error("cannot listen on {}:{}", address.host, address.port);
      exit(EXIT_FAILURE);
    }
    spdlog::info("listening on {}:{}", address.host, address.port);
    listen_fds_.push_back(fd);
  }
  unsigned int nr_threads = config.worker_threads
                                ? config.worker_threads
                                : std::thread::hardware_concurrency();
  nr_threads_ = nr_threads ? nr_threads : 1;
  worker_threads_.reserve(nr_threads_);
  for (unsigned int i = 0; i < nr_threads_; ++i) {
    worker_threads_.push_back(
        std::make_unique<Worker>(this, fmt::format("worker-{}", i)));
  }
  spdlog::info("started {} worker threads", nr_threads_);
}

TextSyncServer::~TextSyncServer() {
  for (int fd : listen_fds_) {
    close(fd);
  }
}

int TextSyncServer::Run() {
  // 每个监听套接字提交一个accept请求
  for (int fd : listen_fds_) {
    event_loop_.prep_accept(fd);
  }
  // 开始事件循环
  return event_loop_.Run();
}

uint32_t TextSyncServer::NextConnection(int *ring_fd) {
  uint32_t conn_id = next_conn_id_;
  // 连接id占用user_data中的28位，0保留给HTTP请求
  if (++next_conn_id_ > kConnIdMask)
    next_conn_id_ = 1;
  *ring_fd = ConnectionIdToRingFd(conn_id);
  return conn_id;
}

} // namespace textsync
