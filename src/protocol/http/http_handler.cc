// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "http_handler.h"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include "core/server.h"
#include "errors.h"
#include "net/tcp_connection.h"
#include "protocol/websocket/websocket_handler.h"
#include "services/sync/messages.h"
#include "services/sync/sync_hub.h"
#include "services/sync/sync_service.h"

namespace textsync {

namespace {

nlohmann::json optional_to_json(const std::optional<std::string> &value) {
  if (value)
    return *value;
  return nullptr;
}

} // namespace

HttpHandler::HttpHandler(TcpConnection *connection)
    : ProtocolHandler(connection),
      hub_(connection->GetEventLoop()->GetServer()->GetHub()),
      parser_(max_message_length(hub_)) {}

size_t HttpHandler::max_message_length(const SyncHub *hub) {
  return std::max(kMaxBodyLength, hub->max_message_bytes());
}

void HttpHandler::TimeoutHandle() { connection_->close(); }

// 用于生成sec-websocket-accept的值
std::string HttpHandler::generate_accept_key(const std::string &key) {
  std::string value = key + kMagicValue;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char *>(value.data()), value.size(),
       digest);
  // 20字节的base64编码为28个字符，外加结尾的'\0'
  unsigned char encoded[32] = {};
  int length = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
  return std::string(reinterpret_cast<char *>(encoded),
                     static_cast<size_t>(length));
}

const char *HttpHandler::status_reason(int status) {
  switch (status) {
  case 101:
    return "Switching Protocols";
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  default:
    return "Internal Server Error";
  }
}

std::string HttpHandler::make_response(const http_response &response) {
  std::string message = fmt::format(
      "HTTP/1.1 {} {}\r\nServer: " kHttpServerName
      "\r\nContent-Type: application/json\r\nContent-Length: {}\r\n",
      response.status, status_reason(response.status), response.body.size());
  if (!response.allow.empty()) {
    message += "Allow: ";
    message += response.allow;
    message += "\r\n";
  }
  message += "Connection: close\r\n\r\n";
  message += response.body;
  return message;
}

http_response HttpHandler::error_response(int status, const char *detail) {
  http_response response;
  response.status = status;
  response.body = dump_json({{"detail", detail}});
  return response;
}

http_response HttpHandler::route(SyncHub *hub, const HttpParser &request) {
  const std::string &method = request.method_;
  const std::string &path = request.location_;
  http_response response;
  if (path == "/") {
    if (method == "GET")
      return handle_root();
    response = error_response(405, "Method Not Allowed");
    response.allow = "GET";
  } else if (path == "/text") {
    if (method == "GET")
      return handle_get_text(hub);
    if (method == "POST")
      return handle_post_text(hub, request);
    response = error_response(405, "Method Not Allowed");
    response.allow = "GET, POST";
  } else if (path == "/status") {
    if (method == "GET")
      return handle_status(hub);
    response = error_response(405, "Method Not Allowed");
    response.allow = "GET";
  } else if (path == kWebSocketPath) {
    if (method != "GET") {
      response = error_response(405, "Method Not Allowed");
      response.allow = "GET";
    } else if (!request.IsWebSocketUpgrade()) {
      response = error_response(400, "Invalid Handshake Request");
    } else {
      response.status = 101;
      response.upgrade = true;
    }
  } else {
    response = error_response(404, "The requested resource does not exist.");
  }
  return response;
}

http_response HttpHandler::handle_root() {
  nlohmann::json j;
  j["message"] = "Collaborative Text Editor API";
  j["endpoints"] = {{"GET /text", "Get current text content"},
                    {"POST /text", "Update text content"},
                    {"GET /status", "Get server status"},
                    {"WebSocket /ws", "Real-time updates"}};
  http_response response;
  response.body = dump_json(j);
  return response;
}

http_response HttpHandler::handle_get_text(SyncHub *hub) {
  document_snapshot state = hub->Snapshot();
  nlohmann::json j;
  j["content"] = std::move(state.content);
  j["last_updated"] = state.last_modified;
  j["user_count"] = hub->SessionCount();
  j["version"] = state.version;
  j["last_editor"] = optional_to_json(state.last_editor);
  http_response response;
  response.body = dump_json(j);
  return response;
}

http_response HttpHandler::handle_post_text(SyncHub *hub,
                                            const HttpParser &request) {
  edit_event edit;
  if (parse_edit_request(request.body_, false, &edit) != TEXTSYNC_ERROR_OK) {
    return error_response(400,
                          error_message(TEXTSYNC_ERROR_MALFORMED_MESSAGE));
  }
  // 通过HTTP提交的编辑不属于任何会话
  edit.origin_session = 0;
  document_snapshot state;
  int ret = hub->OnEdit(std::move(edit), &state);
  if (ret == TEXTSYNC_ERROR_OVERSIZED_CONTENT)
    return error_response(413, error_message(ret));
  if (ret != TEXTSYNC_ERROR_OK)
    return error_response(400, error_message(ret));
  nlohmann::json j;
  j["message"] = "Text updated successfully";
  j["timestamp"] = state.last_modified;
  j["version"] = state.version;
  http_response response;
  response.body = dump_json(j);
  return response;
}

http_response HttpHandler::handle_status(SyncHub *hub) {
  document_snapshot state = hub->Snapshot();
  size_t sessions = hub->SessionCount();
  nlohmann::json j;
  j["connected_sessions"] = sessions;
  j["connected_clients"] = sessions;
  j["text_length"] = state.content.size();
  j["last_updated"] = state.last_modified;
  j["last_editor"] = optional_to_json(state.last_editor);
  j["version"] = state.version;
  j["file_path"] = hub->store_path();
  http_response response;
  response.body = dump_json(j);
  return response;
}

size_t HttpHandler::RecvDataHandle(const void *buffer, size_t length) {
  size_t parsed_bytes = parser_.ParserExecute(buffer, length);
  if (parser_.IsDone()) {
    http_response response = route(hub_, parser_);
    spdlog::debug("http: conn_id: {} {} {} -> {}", connection_->conn_id(),
                  parser_.method_, parser_.location_, response.status);
    if (response.upgrade)
      upgrade_handle();
    else
      connection_->Send(make_response(response), true);
    return parsed_bytes;
  }
  // 解析失败可能是因为需要更多数据进行解析，或是遇到了解析错误
  if (parser_.GetErrorCode()) {
    parsing_fail_handle();
  }
  return length;
}

void HttpHandler::upgrade_handle() {
  auto service = std::make_unique<SyncService>(connection_,
                                               connection_->conn_id(), hub_);
  if (!service->parse_parameters(parser_.query_args_)) {
    connection_->Send(
        make_response(error_response(400, "Invalid Query Parameters")), true);
    return;
  }
  std::string message =
      "HTTP/1.1 101 Switching Protocols\r\nConnection: Upgrade\r\n"
      "Upgrade: websocket\r\nServer: " kHttpServerName
      "\r\nSec-WebSocket-Accept: " +
      generate_accept_key(parser_.websocket_key_) + "\r\n\r\n";
  if (!connection_->Send(std::move(message)))
    return;
  auto handler = std::make_unique<WebSocketHandler>(
      connection_, connection_->conn_id(), std::move(service),
      max_message_length(hub_));
  // 握手响应已在发送队列中，之后的初始状态消息排在其后
  handler->start();
  connection_->transition_stage(TcpConnection::kConnStageWebsocket,
                                std::move(handler));
}

void HttpHandler::parsing_fail_handle() {
  spdlog::warn("http: conn_id: {} parser failed. error: {}",
               connection_->conn_id(), parser_.GetError());
  int status = parser_.GetErrorCode() == HttpParser::PARSER_ERROR_BODY_TOO_LARGE
                   ? 413
                   : 400;
  connection_->Send(make_response(error_response(status, parser_.GetError())),
                    true);
}

} // namespace textsync
