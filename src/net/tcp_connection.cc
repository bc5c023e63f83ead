// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "tcp_connection.h"

#include <algorithm>
#include <cstring>

#include <spdlog/spdlog.h>

#include "core/server.h"
#include "errors.h"
#include "protocol/http/http_handler.h"
#include "protocol/websocket/websocket_handler.h"
#include "services/sync/sync_hub.h"

namespace textsync {

TcpConnection::TcpConnection(EventLoop *event_loop, int fd, uint32_t conn_id)
    : fd_(fd), conn_id_(conn_id), event_loop_(event_loop),
      idle_timer_([this]() { handler_->TimeoutHandle(); }),
      send_timer_([this]() {
        spdlog::warn("[{}] conn_id: {} send timed out. error: {}",
                     event_loop_->GetName(), conn_id_,
                     error_message(TEXTSYNC_ERROR_SESSION_UNREACHABLE));
        close();
      }) {
  // HTTP处理器在构造时需要访问事件循环，必须在其他成员初始化之后创建
  handler_ = std::make_unique<HttpHandler>(this);
  max_queued_bytes_ =
      std::max(kMaxQueuedBytes,
               2 * event_loop_->GetServer()->GetHub()->max_message_bytes());
}

TcpConnection::~TcpConnection() {
  // 处理器可能在析构时访问连接，需要先于其他成员销毁
  next_handler_.reset();
  handler_.reset();
}

void TcpConnection::start() { refresh(); }

// 读操作完成处理函数，传入已读取的缓冲区地址和读取的字节数
void TcpConnection::RecvHandle(const void *buffer, size_t length) {
  if (closed_ || draining_)
    return;
  recv_bytes_ += length;
  // 更新连接超时定时器
  refresh();
  const char *data = static_cast<const char *>(buffer);
  while (!closed_ && !draining_) {
    size_t consumed = handler_->RecvDataHandle(data, length);
    if (!next_handler_)
      break;
    // 旧处理器在其调用返回后才能销毁
    handler_ = std::move(next_handler_);
    if (consumed >= length)
      break;
    data += consumed;
    length -= consumed;
  }
}

void TcpConnection::transition_stage(conn_stage_t stage,
                                     std::unique_ptr<ProtocolHandler> handler) {
  stage_ = stage;
  next_handler_ = std::move(handler);
}

bool TcpConnection::Send(std::string data, bool close_after) {
  if (closed_ || draining_)
    return false;
  if (queued_bytes_ + data.size() > max_queued_bytes_) {
    spdlog::warn("[{}] conn_id: {} has {} bytes queued. error: {}",
                 event_loop_->GetName(), conn_id_, queued_bytes_,
                 error_message(TEXTSYNC_ERROR_SESSION_UNREACHABLE));
    close();
    return false;
  }
  queued_bytes_ += data.size();
  if (close_after)
    draining_ = true;
  send_queue_.push_back({std::move(data), 0, close_after});
  if (inflight_sends_ == 0)
    submit_front();
  return !closed_;
}

void TcpConnection::MessageHandle(uint64_t seq,
                                  std::shared_ptr<const std::string> message) {
  if (closed_)
    return;
  std::vector<MessageSequencer::message_ptr> ready;
  sequencer_.Push(seq, std::move(message), &ready);
  for (const auto &msg : ready) {
    if (closed_)
      return;
    if (!msg) {
      spdlog::warn("[{}] conn_id: {} missed a message. error: {}",
                   event_loop_->GetName(), conn_id_,
                   error_message(TEXTSYNC_ERROR_SESSION_UNREACHABLE));
      close();
      return;
    }
    if (stage_ == kConnStageWebsocket)
      WebSocketHandler::send_data_frame(this, *msg);
  }
}

void TcpConnection::submit_front() {
  while (!send_queue_.empty()) {
    pending_send &front = send_queue_.front();
    size_t remain = front.data.size() - front.offset;
    if (remain == 0) {
      bool close_after = front.close_after;
      send_queue_.pop_front();
      if (close_after) {
        close();
        return;
      }
      continue;
    }
    uint32_t count = static_cast<uint32_t>(
        std::min<size_t>((remain + kBufferSize - 1) / kBufferSize,
                         kMaxChainBuffers));
    // 先获取这组请求需要的全部缓冲区，不足时不提交任何请求
    uint16_t bidx[kMaxChainBuffers];
    void *buffers[kMaxChainBuffers];
    for (uint32_t i = 0; i < count; ++i) {
      int ret = event_loop_->get_send_buffer(&buffers[i]);
      if (ret == -1) {
        for (uint32_t j = 0; j < i; ++j) {
          event_loop_->put_send_buffer(bidx[j]);
        }
        spdlog::error("[{}] not avaliable buffer to send. closing conn_id: {}",
                      event_loop_->GetName(), conn_id_);
        close();
        return;
      }
      bidx[i] = static_cast<uint16_t>(ret);
    }
    event_loop_->reserve_sqes(count);
    size_t offset = front.offset;
    for (uint32_t i = 0; i < count; ++i) {
      size_t length = std::min<size_t>(kBufferSize, front.data.size() - offset);
      memcpy(buffers[i], front.data.data() + offset, length);
      event_loop_->prep_send_zc(fd_, conn_id_, buffers[i], bidx[i], length,
                                i + 1 < count);
      offset += length;
    }
    inflight_sends_ = count;
    inflight_bytes_ = offset - front.offset;
    inflight_sent_ = 0;
    front.offset = offset;
    event_loop_->AddTimer(&send_timer_, kSendTimeout);
    return;
  }
}

void TcpConnection::SendHandle(int res) {
  if (inflight_sends_ == 0)
    return;
  if (res < 0)
    send_failed_ = true;
  else
    inflight_sent_ += static_cast<size_t>(res);
  if (--inflight_sends_)
    return;
  TimeWheel::Cancel(&send_timer_);
  if (closed_)
    return;
  if (send_failed_ || inflight_sent_ != inflight_bytes_) {
    spdlog::debug("[{}] send failed, conn_id: {}", event_loop_->GetName(),
                  conn_id_);
    close();
    return;
  }
  send_bytes_ += inflight_sent_;
  queued_bytes_ -= inflight_bytes_;
  pending_send &front = send_queue_.front();
  if (front.offset == front.data.size()) {
    bool close_after = front.close_after;
    send_queue_.pop_front();
    if (close_after) {
      close();
      return;
    }
  }
  submit_front();
}

void TcpConnection::close() {
  if (closed_)
    return;
  closed_ = true;
  spdlog::debug("[{}] conn_id: {} closing. recv bytes: {}, send bytes: {}",
                event_loop_->GetName(), conn_id_, recv_bytes_, send_bytes_);
  TimeWheel::Cancel(&idle_timer_);
  TimeWheel::Cancel(&send_timer_);
  handler_->CloseHandle();
  // 尚未生效的下一阶段处理器同样需要释放其持有的资源
  if (next_handler_)
    next_handler_->CloseHandle();
  event_loop_->submit_cancel(fd_, conn_id_);
}

} // namespace textsync
