// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_CORE_EVENT_LOOP_H_
#define TEXTSYNC_CORE_EVENT_LOOP_H_

#include <memory>
#include <string>
#include <unordered_map>

#include <liburing.h>

#include "buffer.h"
#include "context.h"
#include "timer.h"

namespace textsync {

// 一些常量的定义，只能在该文件内所使用
namespace {
// io_uring实例队列最大条目数量
constexpr static uint32_t kQueueDepth = 2048;
// io_uring实例注册的文件描述符表大小
constexpr static uint32_t kFdTableSize = 2048;
// 时间轮刻度，ms为单位
constexpr static uint32_t kTimeWheelTick = 100;

} // namespace

class Worker;
class TextSyncServer;

// 事件循环类，每个线程都维护着一个事件循环实例
// worker为空时代表master线程的事件循环，只负责接受新连接
class EventLoop {
public:
  EventLoop(TextSyncServer *server, Worker *worker);
  ~EventLoop();

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  // 当前线程正在运行的事件循环，非事件循环线程返回nullptr
  static EventLoop *Current();

  inline struct io_uring *GetRingInstance() { return &ring_; }
  inline TextSyncServer *GetServer() { return server_; }
  const std::string &GetName() const;

  // 开始事件循环处理已完成事件
  int Run();

  int prep_accept(int listen_fd);

  int prep_recv(int fd, uint32_t conn_id);

  // 零拷贝发送，buffer必须是通过get_send_buffer获取的固定缓冲区
  // flag为true时与下一个请求链接，保证按顺序发送
  int prep_send_zc(int fd, uint32_t conn_id, void *data, uint16_t bidx,
                   size_t length, bool flag = false);

  int prep_close(int fd, uint32_t conn_id);

  // 提交一个跨线程消息，其中conn_id为目标线程的连接id
  // 立即提交，多次调用的消息按调用顺序进入目标ring
  // 提交后context的所有权转移给接收方，发送失败时由本线程处理
  int submit_cross_thread_msg(uint32_t conn_id, CTContext *context);

  // 取消该连接上所有未完成的请求，完成后关闭连接
  int submit_cancel(int fd, uint32_t conn_id);

  // 获取发送缓冲区，用于填充发送数据
  // 若存在可用发送缓冲区，则设置buffer_ptr指向发送缓冲区地址，否则为NULL
  // 返回固定缓冲区索引，失败时返回-1
  int get_send_buffer(void **buffer_ptr);

  // 归还尚未提交的发送缓冲区
  void put_send_buffer(uint16_t bidx);

  // 保证提交队列中至少有n个空闲条目，避免链接请求被拆分到两次提交中
  void reserve_sqes(unsigned int n);

  // 添加一个超时任务
  inline void AddTimer(TimeWheel::timer_node *timer, uint32_t millis) {
    time_wheel_->AddTimer(timer, millis);
  }

  struct io_uring_sqe *GetSqe();

private:
  void SetUpIoUring(uint32_t entries);
  void DestroyIoUring();

  // 准备下一次时间轮刻度
  void prep_timeout();

  int EventHandler(struct io_uring_cqe *cqe);
  // 事件处理函数
  int handle_accept(struct io_uring_cqe *cqe);
  int handle_recv(struct io_uring_cqe *cqe);
  int handle_send_zc(struct io_uring_cqe *cqe);
  int handle_cancel(struct io_uring_cqe *cqe);
  int handle_shutdown(struct io_uring_cqe *cqe);
  int handle_close(struct io_uring_cqe *cqe);
  int handle_fd_pass(struct io_uring_cqe *cqe);
  int handle_cross_thread_msg(struct io_uring_cqe *cqe);
  int handle_msg_ring_sent(struct io_uring_cqe *cqe);
  int handle_timeout(struct io_uring_cqe *cqe);
  int handle_nop(struct io_uring_cqe *cqe);

  // 缓冲池，用于管理接受/发送数据缓冲区
  std::unique_ptr<BufferPool> buffer_pool_;

  TextSyncServer *server_;
  Worker *worker_;

  struct io_uring ring_;
  bool running_{false};

  // 时间轮，用于管理超时任务
  std::unique_ptr<TimeWheel> time_wheel_;
  struct __kernel_timespec tick_ts_{};

  // 已提交但未确认的跨线程消息，发送失败时需要释放
  std::unordered_map<uint32_t, CTContext *> inflight_msgs_;
  uint32_t next_msg_seq_{0};
};

} // namespace textsync

#endif
