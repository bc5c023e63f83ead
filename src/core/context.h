// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_CORE_CONTEXT_H_
#define TEXTSYNC_CORE_CONTEXT_H_

#include <cstdint>
#include <memory>
#include <string>

#include <liburing.h>

namespace textsync {

// user_data布局：
//   高32位：高4位为操作码，低28位为连接id
//   低32位：普通请求为 fd(16位) | bid(16位)
//           跨线程消息为上下文对象的低32位地址
//           跨线程消息发送方的完成事件为发送序号
namespace {
constexpr static unsigned kOpShift = 28;
constexpr static uint32_t kConnIdMask = 0x0FFFFFFF;
} // namespace

enum {
  __ACCEPT = 0,
  __RECV,
  __SEND_ZC,
  __CANCEL,
  __SHUTDOWN,
  __CLOSE,
  __FD_PASS,
  __CROSS_THREAD_MSG,
  __MSG_RING_SENT,
  __TIMEOUT,
  __NOP
};

// 跨线程投递给某个连接的消息，使用时动态分配，由接收方线程释放
// 使用MSG_RING操作将高32位地址放入cqe->res字段中，低32位地址放入user_data中
struct CTContext {
  // 该连接上的消息序号，接收方按序号顺序发送
  uint64_t seq;
  // 多个接收方共享同一份消息内容，为空时表示接收方需要关闭连接
  std::shared_ptr<const std::string> message;

  CTContext(uint64_t seq, std::shared_ptr<const std::string> msg)
      : seq(seq), message(std::move(msg)) {}

  CTContext(const CTContext &) = delete;
  CTContext &operator=(const CTContext &) = delete;
};

static inline uint32_t ctcontext_high_addr(CTContext *context) {
  return static_cast<uint32_t>(reinterpret_cast<uint64_t>(context) >> 32);
}

static inline uint32_t ctcontext_low_addr(CTContext *context) {
  return static_cast<uint32_t>(reinterpret_cast<uint64_t>(context) &
                               0xFFFFFFFFULL);
}

static inline CTContext *get_ctcontext(uint32_t high_addr, uint32_t low_addr) {
  return reinterpret_cast<CTContext *>(
      (static_cast<uint64_t>(high_addr) << 32) | low_addr);
}

static inline uint64_t context_encode(int opcode, uint32_t conn_id,
                                      uint32_t low) {
  uint64_t op_conn_id = (static_cast<uint64_t>(opcode) << kOpShift) |
                        (conn_id & kConnIdMask);
  return (op_conn_id << 32) | low;
}

static inline uint64_t context_encode(int opcode, uint32_t conn_id, int fd,
                                      uint16_t bid) {
  uint32_t low = (static_cast<uint32_t>(static_cast<uint16_t>(fd)) << 16) | bid;
  return context_encode(opcode, conn_id, low);
}

// 传递跨线程上下文低32位地址，封装为user_data
static inline uint64_t ctcontext_encode(uint32_t conn_id, uint32_t ctx_addr) {
  return context_encode(__CROSS_THREAD_MSG, conn_id, ctx_addr);
}

static inline void user_data_encode(struct io_uring_sqe *sqe, int opcode,
                                    uint32_t conn_id, int fd, uint16_t bid) {
  io_uring_sqe_set_data64(sqe, context_encode(opcode, conn_id, fd, bid));
}

static inline uint32_t cqe_to_conn_id(const struct io_uring_cqe *cqe) {
  return static_cast<uint32_t>(cqe->user_data >> 32) & kConnIdMask;
}

static inline int cqe_to_op(const struct io_uring_cqe *cqe) {
  return static_cast<int>(cqe->user_data >> (32 + kOpShift));
}

static inline uint16_t cqe_to_fd(const struct io_uring_cqe *cqe) {
  return static_cast<uint16_t>(cqe->user_data >> 16);
}

static inline uint16_t cqe_to_bid(const struct io_uring_cqe *cqe) {
  return static_cast<uint16_t>(cqe->user_data);
}

static inline uint32_t cqe_to_addr(const struct io_uring_cqe *cqe) {
  return static_cast<uint32_t>(cqe->user_data);
}

} // namespace textsync

#endif
