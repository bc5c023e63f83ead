// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "worker.h"

#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>

namespace textsync {

Worker::Worker(TextSyncServer *server, std::string name)
    : name_(std::move(name)), parent_(server) {
  pthread_barrier_init(&barrier_, NULL, 2);
  int ret = pthread_create(&thread_, NULL, worker_main, this);
  if (ret) {
    spdlog::error("[{}] pthread_create failed. error: {}", name_,
                  strerror(ret));
    exit(EXIT_FAILURE);
  }
  // 等待工作线程创建好事件循环
  pthread_barrier_wait(&barrier_);
}

Worker::~Worker() {
  pthread_join(thread_, NULL);
  pthread_barrier_destroy(&barrier_);
  conn_map_.clear();
}

void *Worker::worker_main(void *arg) {
  Worker *worker = static_cast<Worker *>(arg);
  pthread_setname_np(pthread_self(), worker->name_.c_str());
  // io_uring实例设置了SINGLE_ISSUER，必须在运行它的线程中创建
  worker->event_loop_ = std::make_unique<EventLoop>(worker->parent_, worker);
  pthread_barrier_wait(&worker->barrier_);
  spdlog::debug("[{}] event loop started", worker->name_);
  worker->event_loop_->Run();
  spdlog::error("[{}] event loop exited", worker->name_);
  return NULL;
}

std::shared_ptr<TcpConnection> Worker::GetConnection(uint32_t conn_id) {
  auto it = conn_map_.find(conn_id);
  if (it != conn_map_.end()) {
    return it->second;
  }
  return nullptr;
}

void Worker::AddConnection(uint32_t conn_id,
                           std::shared_ptr<TcpConnection> connection) {
  bool ret = conn_map_.insert({conn_id, std::move(connection)}).second;
  if (!ret) {
    spdlog::error("[{}] duplicate conn_id: {}", name_, conn_id);
  }
}

void Worker::DelConnection(uint32_t conn_id) {
  auto it = conn_map_.find(conn_id);
  if (it != conn_map_.end()) {
    conn_map_.erase(it);
  }
}

} // namespace textsync
