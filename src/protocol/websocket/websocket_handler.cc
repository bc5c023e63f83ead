// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "websocket_handler.h"

#include <spdlog/spdlog.h>

#include "net/tcp_connection.h"

namespace textsync {

WebSocketHandler::WebSocketHandler(TcpConnection *connection, uint32_t conn_id,
                                   std::unique_ptr<ServiceHandler> service,
                                   uint64_t max_message_length)
    : ProtocolHandler(connection), wait_pong_timer_([this]() {
        if (wait_pong_flag_) {
          spdlog::info("websocket: conn_id: {} pong timed out", conn_id_);
          close_connection();
        }
      }),
      conn_id_(conn_id), max_message_length_(max_message_length),
      parser_(max_message_length), service_(std::move(service)) {}

WebSocketHandler::~WebSocketHandler() {
  TimeWheel::Cancel(&wait_pong_timer_);
}

bool WebSocketHandler::start() {
  if (!service_->start()) {
    spdlog::error("websocket: conn_id: {} service start failed", conn_id_);
    send_close_frame(WebSocketParser::WS_CLOSE_INTERNAL_ERROR);
    return false;
  }
  return true;
}

size_t WebSocketHandler::RecvDataHandle(const void *buffer, size_t length) {
  const char *data = static_cast<const char *>(buffer);
  size_t remain = length;
  // 处理粘包情况，一次读取可能包含多个帧
  while (remain && !connection_closed() &&
         handle_state_ != ws_handle_state_t::kWsHandleStateClosing) {
    size_t parsed_bytes = parser_.ParserExecute(data, remain);
    if (!parser_.IsDone()) {
      // 解析出现错误，否则需要更多数据进行解析
      if (parser_.GetErrorCode()) {
        spdlog::warn("websocket: conn_id: {} parser failed. error: {}",
                     conn_id_, parser_.GetError());
        send_close_frame(static_cast<uint16_t>(parser_.GetErrorCode()));
      }
      break;
    }
    if (parser_.IsControlFrame())
      control_frame_handle();
    else
      frame_handle();
    parser_.Reset();
    data += parsed_bytes;
    remain -= parsed_bytes;
  }
  return length;
}

void WebSocketHandler::frame_handle() {
  switch (parser_.opcode_) {
  case WebSocketParser::WS_OPCODE_CONTINUED: {
    if (handle_state_ != ws_handle_state_t::kWsHandleStateContinued) {
      send_close_frame(WebSocketParser::WS_CLOSE_PROTOCOL_ERROR);
      return;
    }
    if (payload_cache_.size() + parser_.data_.size() > max_message_length_) {
      send_close_frame(WebSocketParser::WS_CLOSE_PAYLOAD_TOO_BIG);
      return;
    }
    payload_cache_.append(parser_.data_);
    if (parser_.fin_flag_) {
      handle_state_ = ws_handle_state_t::kWsHandleStateNormal;
      message_handle();
    }
    break;
  }
  case WebSocketParser::WS_OPCODE_TEXT: {
    // 上一条分片消息尚未结束
    if (handle_state_ == ws_handle_state_t::kWsHandleStateContinued) {
      send_close_frame(WebSocketParser::WS_CLOSE_PROTOCOL_ERROR);
      return;
    }
    payload_cache_ = std::move(parser_.data_);
    if (parser_.fin_flag_)
      message_handle();
    else
      handle_state_ = ws_handle_state_t::kWsHandleStateContinued;
    break;
  }
  default: {
    // 所有消息均为JSON文本，不接受二进制帧
    send_close_frame(WebSocketParser::WS_CLOSE_UNSUPPORTED_DATA);
  }
  }
}

void WebSocketHandler::message_handle() {
  std::string reply = service_->handle(std::move(payload_cache_));
  payload_cache_.clear();
  if (!reply.empty())
    write(WebSocketParser::encode_frame(true, WebSocketParser::WS_OPCODE_TEXT,
                                        reply));
}

void WebSocketHandler::control_frame_handle() {
  switch (parser_.opcode_) {
  case WebSocketParser::WS_OPCODE_CLOSE: {
    // 客户端发起了close请求
    spdlog::debug("websocket: conn_id: {} got a CLOSE frame", conn_id_);
    send_close_frame(WebSocketParser::WS_CLOSE_NORMAL);
    break;
  }
  case WebSocketParser::WS_OPCODE_PING: {
    send_pong_frame(parser_.data_);
    break;
  }
  case WebSocketParser::WS_OPCODE_PONG: {
    if (wait_pong_flag_) {
      wait_pong_flag_ = false;
      TimeWheel::Cancel(&wait_pong_timer_);
    }
    break;
  }
  default: {
    send_close_frame(WebSocketParser::WS_CLOSE_UNSUPPORTED_DATA);
  }
  }
}

void WebSocketHandler::TimeoutHandle() {
  // 闲置超时后先探测客户端是否存活
  if (wait_pong_flag_)
    return;
  send_ping_frame();
}

void WebSocketHandler::CloseHandle() {
  TimeWheel::Cancel(&wait_pong_timer_);
  service_->stop();
}

void WebSocketHandler::send_ping_frame() {
  if (!write(WebSocketParser::encode_frame(
          true, WebSocketParser::WS_OPCODE_PING, WS_PING_PAYLOAD)))
    return;
  wait_pong_flag_ = true;
  connection_->GetEventLoop()->AddTimer(&wait_pong_timer_,
                                        kTimeToCloseAfterPing);
}

void WebSocketHandler::send_close_frame(uint16_t code) {
  if (handle_state_ == ws_handle_state_t::kWsHandleStateClosing)
    return;
  handle_state_ = ws_handle_state_t::kWsHandleStateClosing;
  spdlog::debug("websocket: conn_id: {} send close frame. message: {}",
                conn_id_, WebSocketParser::close_message(code));
  write(WebSocketParser::encode_close_frame(code), true);
}

void WebSocketHandler::send_pong_frame(const std::string &payload) {
  write(WebSocketParser::encode_frame(true, WebSocketParser::WS_OPCODE_PONG,
                                      payload));
}

bool WebSocketHandler::write(std::string frame, bool close_after) {
  return connection_->Send(std::move(frame), close_after);
}

bool WebSocketHandler::connection_closed() const {
  return connection_->closed();
}

void WebSocketHandler::close_connection() { connection_->close(); }

bool WebSocketHandler::send_data_frame(TcpConnection *connection,
                                       const std::string &data) {
  return connection->Send(
      WebSocketParser::encode_frame(true, WebSocketParser::WS_OPCODE_TEXT, data));
}

} // namespace textsync
