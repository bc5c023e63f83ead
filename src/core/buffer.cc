// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "buffer.h"

#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>

namespace textsync {

BufferPool::BufferPool(struct io_uring *ring) : ring_(ring) {
  int err;
  buf_ring_ = io_uring_setup_buf_ring(ring_, kBufferEntriesMax, bgid_, 0, &err);
  if (!buf_ring_) {
    spdlog::error("io_uring_setup_buf_ring failed. error: {}", strerror(-err));
    exit(EXIT_FAILURE);
  }
  err = io_uring_register_buffers_sparse(ring_, kBufferEntriesMax);
  if (err) {
    spdlog::error("io_uring_register_buffers_sparse failed. error: {}",
                  strerror(-err));
    exit(EXIT_FAILURE);
  }
  free_send_.reserve(kBufferEntriesMax);
  // 初始化接受缓冲池
  alloc_recv_buffers();
  // 初始化发送缓冲池
  alloc_send_buffers();
}

BufferPool::~BufferPool() {
  int ret = io_uring_free_buf_ring(ring_, buf_ring_, kBufferEntriesMax, bgid_);
  if (ret < 0) {
    spdlog::error("io_uring_free_buf_ring failed. error: {}", strerror(-ret));
  }
  for (auto p : recv_pool_) {
    free(p);
  }
  ret = io_uring_unregister_buffers(ring_);
  if (ret < 0) {
    spdlog::error("io_uring_unregister_buffers failed. error: {}",
                  strerror(-ret));
  }
  for (auto p : send_pool_) {
    free(p);
  }
}

// 通过bid获取缓冲池中对应的缓冲区
void *BufferPool::GetRecvBuffer(uint16_t bid) {
  uint32_t index = bid / kBufferCount;
  if (index >= recv_pool_.size())
    return nullptr;
  return static_cast<char *>(recv_pool_[index]) +
         (kBufferSize * (bid & (kBufferCount - 1)));
}

// 将缓冲区返回缓冲池中，使内核有新的可用缓冲区
void BufferPool::ReplenishRecvBuffer(void *buffer_addr, uint16_t bid) {
  io_uring_buf_ring_add(buf_ring_, buffer_addr, kBufferSize, bid,
                        io_uring_buf_ring_mask(kBufferEntriesMax), 0);
  io_uring_buf_ring_advance(buf_ring_, 1);
}

// 扩容接收缓冲池大小
void BufferPool::alloc_recv_buffers() {
  if (recv_buffer_count_ == kBufferEntriesMax)
    return;
  void *buffer_addr;
  int ret = posix_memalign(&buffer_addr, 4096, kBlockSize);
  if (ret) {
    spdlog::error("posix_memalign failed. error: {}", strerror(ret));
    return;
  }
  recv_pool_.push_back(buffer_addr);
  for (uint16_t i = 0; i < kBufferCount; ++i) {
    io_uring_buf_ring_add(buf_ring_, buffer_addr, kBufferSize,
                          recv_buffer_count_++,
                          io_uring_buf_ring_mask(kBufferEntriesMax), i);
    buffer_addr = static_cast<char *>(buffer_addr) + kBufferSize;
  }
  io_uring_buf_ring_advance(buf_ring_, kBufferCount);
}

// 对发送缓冲区进行扩容，新缓冲区注册到固定缓冲区表中
void BufferPool::alloc_send_buffers() {
  if (send_buffer_count_ == kBufferEntriesMax)
    return;
  void *buffer_addr;
  int ret = posix_memalign(&buffer_addr, 4096, kBlockSize);
  if (ret) {
    spdlog::error("posix_memalign failed. error: {}", strerror(ret));
    return;
  }
  struct iovec iovecs[kBufferCount] = {};
  void *buffer_base = buffer_addr;
  for (uint16_t i = 0; i < kBufferCount; ++i) {
    iovecs[i].iov_base = buffer_addr;
    iovecs[i].iov_len = kBufferSize;
    buffer_addr = static_cast<char *>(buffer_addr) + kBufferSize;
  }
  ret = io_uring_register_buffers_update_tag(ring_, send_buffer_count_, iovecs,
                                             nullptr, kBufferCount);
  if (ret != static_cast<int>(kBufferCount)) {
    spdlog::error("io_uring_register_buffers_update_tag failed. error: {}",
                  strerror(-ret));
    free(buffer_base);
    return;
  }
  send_pool_.push_back(buffer_base);
  // 倒序放入，先分配低下标的缓冲区
  for (uint32_t i = kBufferCount; i > 0; --i) {
    free_send_.push_back(static_cast<uint16_t>(send_buffer_count_ + i - 1));
  }
  send_buffer_count_ += kBufferCount;
}

// 当没有可用的发送缓冲区时，进行扩容操作，若发送缓冲区已经达到容量上限，则返回-1
int BufferPool::GetSendBufferIndex() {
  if (free_send_.empty()) {
    alloc_send_buffers();
    if (free_send_.empty())
      return -1;
  }
  uint16_t bidx = free_send_.back();
  free_send_.pop_back();
  return bidx;
}

void *BufferPool::GetSendBuffer(uint16_t bidx) {
  if (bidx >= send_buffer_count_)
    return nullptr;
  uint32_t index = bidx / kBufferCount;
  return static_cast<char *>(send_pool_[index]) +
         (kBufferSize * (bidx & (kBufferCount - 1)));
}

void BufferPool::ReplenishSendBuffer(uint16_t bidx) {
  if (bidx >= send_buffer_count_) {
    spdlog::error("ReplenishSendBuffer failed. invalid buffer index: {}", bidx);
    return;
  }
  free_send_.push_back(bidx);
}

} // namespace textsync
