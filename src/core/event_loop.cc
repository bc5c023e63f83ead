// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "event_loop.h"

#include <cstdlib>
#include <cstring>

#include <liburing.h>
#include <spdlog/spdlog.h>

#include "net/tcp_connection.h"
#include "server.h"
#include "services/sync/sync_hub.h"
#include "worker.h"

namespace textsync {

namespace {
thread_local EventLoop *tls_event_loop = nullptr;
const std::string kMasterName = "master";
} // namespace

EventLoop::EventLoop(TextSyncServer *server, Worker *worker)
    : server_(server), worker_(worker) {
  SetUpIoUring(kQueueDepth);
  // 只有worker线程需要
  if (worker_) {
    buffer_pool_ = std::make_unique<BufferPool>(&ring_);
    time_wheel_ = std::make_unique<TimeWheel>(kTimeWheelTick);
    tick_ts_.tv_sec = 0;
    tick_ts_.tv_nsec = static_cast<long long>(kTimeWheelTick) * 1000000;
    prep_timeout();
  }
}

EventLoop::~EventLoop() {
  // 对端未收到的消息由本线程释放
  for (auto &[seq, context] : inflight_msgs_) {
    delete context;
  }
  buffer_pool_.reset();
  DestroyIoUring();
}

EventLoop *EventLoop::Current() { return tls_event_loop; }

const std::string &EventLoop::GetName() const {
  return worker_ ? worker_->GetName() : kMasterName;
}

int EventLoop::Run() {
  tls_event_loop = this;
  running_ = true;
  struct io_uring_cqe *cqe;
  int ret = 0;
  while (running_) {
    unsigned head, completion_count = 0;
    // 等待完成队列
    ret = io_uring_submit_and_wait(&ring_, 1);
    if (ret < 0) {
      if (ret == -EINTR)
        continue;
      running_ = false;
      spdlog::error("[{}] io_uring_submit_and_wait failed. error msg: {}",
                    GetName(), strerror(-ret));
      break;
    }
    // 当完成队列中有完成条目，则批量获取完成条目，并对其进行处理
    io_uring_for_each_cqe(&ring_, head, cqe) {
      ++completion_count;
      if (EventHandler(cqe)) {
        running_ = false;
        break;
      }
    }
    io_uring_cq_advance(&ring_, completion_count);
  }
  tls_event_loop = nullptr;
  // 事件循环只会因错误而退出
  return -1;
}

int EventLoop::EventHandler(struct io_uring_cqe *cqe) {
  int ret = 0;
  // 获取操作码，调用对应的处理函数进行处理
  switch (cqe_to_op(cqe)) {
  case __ACCEPT:
    ret = handle_accept(cqe);
    break;
  case __RECV:
    ret = handle_recv(cqe);
    break;
  case __SEND_ZC:
    ret = handle_send_zc(cqe);
    break;
  case __CANCEL:
    ret = handle_cancel(cqe);
    break;
  case __SHUTDOWN:
    ret = handle_shutdown(cqe);
    break;
  case __CLOSE:
    ret = handle_close(cqe);
    break;
  case __FD_PASS:
    ret = handle_fd_pass(cqe);
    break;
  case __CROSS_THREAD_MSG:
    ret = handle_cross_thread_msg(cqe);
    break;
  case __MSG_RING_SENT:
    ret = handle_msg_ring_sent(cqe);
    break;
  case __TIMEOUT:
    ret = handle_timeout(cqe);
    break;
  case __NOP:
    ret = handle_nop(cqe);
    break;
  default:
    spdlog::error("[{}] Unknown Operation Code: {}", GetName(), cqe_to_op(cqe));
    return -1;
  }
  return ret;
}

void EventLoop::SetUpIoUring(uint32_t entries) {
  struct io_uring_params params;
  memset(&params, 0, sizeof(struct io_uring_params));
  params.flags = IORING_SETUP_DEFER_TASKRUN | IORING_SETUP_SINGLE_ISSUER;
  int ret = io_uring_queue_init_params(entries, &ring_, &params);
  if (ret < 0) {
    spdlog::error("io_uring_queue_init_params failed. error msg: {}",
                  strerror(-ret));
    exit(EXIT_FAILURE);
  }
  // 向io_uring实例中注册直接文件描述符表，默认2048个直接文件描述符
  ret = io_uring_register_files_sparse(&ring_, kFdTableSize);
  if (ret < 0) {
    spdlog::error("io_uring_register_files_sparse failed. error msg: {}",
                  strerror(-ret));
    exit(EXIT_FAILURE);
  }
  ret = io_uring_register_ring_fd(&ring_);
  if (ret != 1) {
    spdlog::error("io_uring_register_ring_fd failed. error msg: {}",
                  strerror(-ret));
    exit(EXIT_FAILURE);
  }
}

void EventLoop::DestroyIoUring() {
  int ret = io_uring_unregister_files(&ring_);
  if (ret < 0) {
    spdlog::error("io_uring_unregister_files failed. error msg: {}",
                  strerror(-ret));
  }
  io_uring_queue_exit(&ring_);
}

struct io_uring_sqe *EventLoop::GetSqe() {
  struct io_uring_sqe *sqe;
  do {
    sqe = io_uring_get_sqe(&ring_);
    if (sqe)
      break;
    io_uring_submit(&ring_);
  } while (1);
  return sqe;
}

void EventLoop::reserve_sqes(unsigned int n) {
  if (io_uring_sq_space_left(&ring_) < n)
    io_uring_submit(&ring_);
}

int EventLoop::prep_accept(int listen_fd) {
  struct io_uring_sqe *sqe = GetSqe();
  io_uring_prep_multishot_accept_direct(sqe, listen_fd, NULL, NULL, 0);
  user_data_encode(sqe, __ACCEPT, 0, listen_fd, 0);
  return 0;
}

int EventLoop::prep_recv(int fd, uint32_t conn_id) {
  struct io_uring_sqe *sqe = GetSqe();
  io_uring_prep_recv_multishot(sqe, fd, NULL, 0, 0);
  sqe->flags |= IOSQE_FIXED_FILE | IOSQE_BUFFER_SELECT;
  sqe->buf_group = buffer_pool_->GetBgid();
  user_data_encode(sqe, __RECV, conn_id, fd, 0);
  return 0;
}

// 零拷贝发送操作
int EventLoop::prep_send_zc(int fd, uint32_t conn_id, void *data, uint16_t bidx,
                            size_t length, bool flag) {
  struct io_uring_sqe *sqe = GetSqe();
  io_uring_prep_send_zc(sqe, fd, data, length, MSG_WAITALL | MSG_NOSIGNAL, 0);
  sqe->buf_index = bidx;
  sqe->ioprio = IORING_RECVSEND_FIXED_BUF;
  sqe->flags |= IOSQE_FIXED_FILE;
  if (flag)
    sqe->flags |= IOSQE_IO_LINK;
  user_data_encode(sqe, __SEND_ZC, conn_id, fd, bidx);
  return 0;
}

// shutdown失败时close依然执行
int EventLoop::prep_close(int fd, uint32_t conn_id) {
  reserve_sqes(2);
  struct io_uring_sqe *sqe = GetSqe();
  io_uring_prep_shutdown(sqe, fd, SHUT_RDWR);
  sqe->flags |= IOSQE_FIXED_FILE | IOSQE_IO_HARDLINK | IOSQE_CQE_SKIP_SUCCESS;
  user_data_encode(sqe, __SHUTDOWN, conn_id, fd, 0);
  sqe = GetSqe();
  io_uring_prep_close_direct(sqe, static_cast<unsigned int>(fd));
  user_data_encode(sqe, __CLOSE, conn_id, fd, 0);
  return 0;
}

// 向其他事件循环中的io_uring实例提交sqe，实现跨线程通讯
int EventLoop::submit_cross_thread_msg(uint32_t conn_id, CTContext *context) {
  struct io_uring_sqe *sqe = GetSqe();
  uint64_t user_data = ctcontext_encode(conn_id, ctcontext_low_addr(context));
  int ring_fd = server_->ConnectionIdToRingFd(conn_id);
  io_uring_prep_msg_ring(sqe, ring_fd, ctcontext_high_addr(context), user_data,
                         0);
  uint32_t seq = next_msg_seq_++;
  inflight_msgs_[seq] = context;
  io_uring_sqe_set_data64(sqe, context_encode(__MSG_RING_SENT, conn_id, seq));
  // 调用方持有同步中心的锁，在锁内提交才能保证各线程发出的消息顺序一致
  int ret = io_uring_submit(&ring_);
  // 提交失败时sqe仍在提交队列中，随事件循环的下一次提交发出
  if (ret < 0) {
    spdlog::error("[{}] io_uring_submit failed. error msg: {}", GetName(),
                  strerror(-ret));
  }
  return ret < 0 ? ret : 0;
}

// 提交取消请求，准备关闭连接
int EventLoop::submit_cancel(int fd, uint32_t conn_id) {
  struct io_uring_sqe *sqe = GetSqe();
  io_uring_prep_cancel_fd(sqe, fd,
                          IORING_ASYNC_CANCEL_FD_FIXED | IORING_ASYNC_CANCEL_ALL);
  user_data_encode(sqe, __CANCEL, conn_id, fd, 0);
  return 0;
}

// 通过io_uring_prep_msg_ring_fd_alloc将连接的文件描述符传递给对应的ring实例
// 传递完成后关闭master中的直接文件描述符
int EventLoop::handle_accept(struct io_uring_cqe *cqe) {
  int listen_fd = cqe_to_fd(cqe);
  if (cqe->res < 0) {
    spdlog::error("[master] accept failed on listener {}. error: {}",
                  listen_fd, strerror(-cqe->res));
  } else {
    int ring_fd;
    uint32_t conn_id = server_->NextConnection(&ring_fd);
    spdlog::debug("[master] new connection accepted, fd: {}, conn_id: {}",
                  cqe->res, conn_id);
    // 通过轮询的方式将新连接分发给不同的worker线程
    reserve_sqes(2);
    struct io_uring_sqe *sqe = GetSqe();
    uint64_t user_data = context_encode(__FD_PASS, conn_id, 0, 0);
    io_uring_prep_msg_ring_fd_alloc(sqe, ring_fd, cqe->res, user_data, 0);
    sqe->flags |= IOSQE_IO_HARDLINK;
    user_data_encode(sqe, __NOP, conn_id, cqe->res, 0);
    sqe = GetSqe();
    io_uring_prep_close_direct(sqe, static_cast<unsigned int>(cqe->res));
    user_data_encode(sqe, __CLOSE, conn_id, cqe->res, 0);
  }
  // 如果IORING_CQE_F_MORE标志未设置，则需要重新提交accept请求
  if (!(cqe->flags & IORING_CQE_F_MORE)) {
    prep_accept(listen_fd);
  }
  return 0;
}

// 接受主线程传递过来的直接文件描述符
int EventLoop::handle_fd_pass(struct io_uring_cqe *cqe) {
  if (cqe->res < 0) {
    spdlog::warn("[{}] fd pass failed. error: {}", GetName(),
                 strerror(-cqe->res));
    return 0;
  }
  uint32_t conn_id = cqe_to_conn_id(cqe);
  spdlog::debug("[{}] accepted a new fd: {}, conn_id: {}", GetName(), cqe->res,
                conn_id);
  auto connection = std::make_shared<TcpConnection>(this, cqe->res, conn_id);
  worker_->AddConnection(conn_id, connection);
  connection->start();
  // 开始发起接受请求
  prep_recv(cqe->res, conn_id);
  return 0;
}

int EventLoop::handle_recv(struct io_uring_cqe *cqe) {
  uint32_t conn_id = cqe_to_conn_id(cqe);
  int fd = cqe_to_fd(cqe);
  std::shared_ptr<TcpConnection> connection = worker_->GetConnection(conn_id);
  if (cqe->res < 0) {
    if (cqe->res == -ENOBUFS) {
      spdlog::debug("[{}] no avaliable buffers", GetName());
      // 需要对缓冲池进行扩容，并重新提交接受数据请求
      buffer_pool_->alloc_recv_buffers();
      if (connection && !connection->closed())
        prep_recv(fd, conn_id);
    } else if (cqe->res != -ECANCELED) {
      spdlog::debug("[{}] recv failed, conn_id: {}. error: {}", GetName(),
                    conn_id, strerror(-cqe->res));
      if (connection)
        connection->close();
    }
    return 0;
  }
  void *recv_buf = nullptr;
  uint16_t bid = 0;
  if (cqe->flags & IORING_CQE_F_BUFFER) {
    bid = cqe->flags >> IORING_CQE_BUFFER_SHIFT;
    recv_buf = buffer_pool_->GetRecvBuffer(bid);
    if (!recv_buf) {
      spdlog::error("[{}] invalid selected buffer, bid: {}", GetName(), bid);
      return -1;
    }
  }
  if (connection && !connection->closed()) {
    if (cqe->res == 0) {
      // 客户端关闭连接
      connection->close();
    } else {
      spdlog::debug("[{}] receive {} bytes from conn_id: {}", GetName(),
                    cqe->res, conn_id);
      connection->RecvHandle(recv_buf, static_cast<size_t>(cqe->res));
      if (!(cqe->flags & IORING_CQE_F_MORE) && !connection->closed())
        prep_recv(fd, conn_id);
    }
  }
  // 处理完毕后需要将接收缓冲区放回缓存池中
  if (recv_buf)
    buffer_pool_->ReplenishRecvBuffer(recv_buf, bid);
  return 0;
}

// 通知事件代表内核不再使用该缓冲区，没有通知事件的请求在完成时即可回收
int EventLoop::handle_send_zc(struct io_uring_cqe *cqe) {
  uint16_t bidx = cqe_to_bid(cqe);
  if (cqe->flags & IORING_CQE_F_NOTIF) {
    buffer_pool_->ReplenishSendBuffer(bidx);
    return 0;
  }
  if (!(cqe->flags & IORING_CQE_F_MORE))
    buffer_pool_->ReplenishSendBuffer(bidx);
  std::shared_ptr<TcpConnection> connection =
      worker_->GetConnection(cqe_to_conn_id(cqe));
  if (connection)
    connection->SendHandle(cqe->res);
  return 0;
}

int EventLoop::handle_shutdown(struct io_uring_cqe *cqe) {
  spdlog::debug("[{}] shutdown failed, conn_id: {}. error: {}", GetName(),
                cqe_to_conn_id(cqe), strerror(-cqe->res));
  return 0;
}

int EventLoop::handle_close(struct io_uring_cqe *cqe) {
  if (cqe->res < 0) {
    spdlog::error("[{}] io_uring_prep_close_direct failed, fd: {}. error: {}",
                  GetName(), cqe_to_fd(cqe), strerror(-cqe->res));
  }
  if (!worker_)
    return 0;
  spdlog::debug("[{}] connection closed, fd: {}, conn_id: {}", GetName(),
                cqe_to_fd(cqe), cqe_to_conn_id(cqe));
  worker_->DelConnection(cqe_to_conn_id(cqe));
  return 0;
}

// 当取消操作完成后，需要对连接进行关闭操作
int EventLoop::handle_cancel(struct io_uring_cqe *cqe) {
  prep_close(cqe_to_fd(cqe), cqe_to_conn_id(cqe));
  return 0;
}

// 处理跨线程消息
int EventLoop::handle_cross_thread_msg(struct io_uring_cqe *cqe) {
  // 通过获取cqe->res中存放的高32位地址和user_data中低32位地址
  // 得到实际的跨线程上下文对象地址
  uint32_t low_addr = cqe_to_addr(cqe);
  uint32_t high_addr = static_cast<uint32_t>(cqe->res);
  std::unique_ptr<CTContext> context(get_ctcontext(high_addr, low_addr));
  if (!context) {
    spdlog::error("[{}] got a null cross thread message", GetName());
    return 0;
  }
  uint32_t conn_id = cqe_to_conn_id(cqe);
  std::shared_ptr<TcpConnection> connection = worker_->GetConnection(conn_id);
  if (!connection || connection->closed()) {
    spdlog::debug("[{}] conn_id: {} not online", GetName(), conn_id);
    return 0;
  }
  connection->MessageHandle(context->seq, std::move(context->message));
  return 0;
}

// 跨线程消息发送方的完成事件，失败时接收方收不到上下文，需要在此处理
int EventLoop::handle_msg_ring_sent(struct io_uring_cqe *cqe) {
  auto it = inflight_msgs_.find(cqe_to_addr(cqe));
  if (it == inflight_msgs_.end())
    return 0;
  CTContext *context = it->second;
  inflight_msgs_.erase(it);
  if (cqe->res >= 0)
    return 0;
  uint32_t conn_id = cqe_to_conn_id(cqe);
  spdlog::warn("[{}] message to conn_id: {} not delivered. error: {}",
               GetName(), conn_id, strerror(-cqe->res));
  if (!context->message) {
    spdlog::error("[{}] close notice to conn_id: {} lost", GetName(), conn_id);
    delete context;
    return 0;
  }
  // 会话漏收了一条消息，将其从同步中心移除，并以相同序号通知所属线程关闭连接
  server_->GetHub()->Drop(conn_id);
  context->message.reset();
  submit_cross_thread_msg(conn_id, context);
  return 0;
}

int EventLoop::handle_nop(struct io_uring_cqe *cqe) {
  if (cqe->res < 0) {
    spdlog::warn("[{}] request for conn_id: {} failed. error: {}", GetName(),
                 cqe_to_conn_id(cqe), strerror(-cqe->res));
  }
  return 0;
}

void EventLoop::prep_timeout() {
  io_uring_sqe *sqe = GetSqe();
  io_uring_prep_timeout(sqe, &tick_ts_, 0, 0);
  user_data_encode(sqe, __TIMEOUT, 0, 0, 0);
}

// 定时器事件处理函数，处理当前超时的事件
int EventLoop::handle_timeout(struct io_uring_cqe *cqe) {
  if (cqe->res != -ETIME && cqe->res != 0) {
    spdlog::error("[{}] io_uring_prep_timeout failed. error: {}", GetName(),
                  strerror(-cqe->res));
  }
  time_wheel_->Update();
  prep_timeout();
  return 0;
}

int EventLoop::get_send_buffer(void **buffer_ptr) {
  int bidx = buffer_pool_->GetSendBufferIndex();
  if (bidx == -1) {
    *buffer_ptr = NULL;
  } else {
    *buffer_ptr = buffer_pool_->GetSendBuffer(static_cast<uint16_t>(bidx));
  }
  return bidx;
}

void EventLoop::put_send_buffer(uint16_t bidx) {
  buffer_pool_->ReplenishSendBuffer(bidx);
}

} // namespace textsync
