// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_PROTOCOL_HTTP_HANDLER_H_
#define TEXTSYNC_PROTOCOL_HTTP_HANDLER_H_

#include <string>

#include "protocol/http/http_parser.h"
#include "protocol_handler.h"

namespace textsync {

namespace {
#define kHttpServerName "textsync_server"
#define kMagicValue "258EAFA5-E914-47DA-95CA-C5AB0DC85B11"
#define kWebSocketPath "/ws"
} // namespace

class SyncHub;

// 一次请求的处理结果
struct http_response {
  int status{200};
  std::string body;
  // 405响应需要携带的Allow字段
  std::string allow;
  // 为true时需要升级为websocket协议
  bool upgrade{false};
};

class HttpHandler : public ProtocolHandler {
public:
  explicit HttpHandler(TcpConnection *connection);
  ~HttpHandler() = default;

  size_t RecvDataHandle(const void *buffer, size_t length) override;

  void TimeoutHandle() override;

  // 根据请求方法与路径生成响应，不涉及网络操作
  static http_response route(SyncHub *hub, const HttpParser &request);

  // 生成完整的响应报文，所有响应都会在发送完毕后关闭连接
  static std::string make_response(const http_response &response);

  // 用于生成sec-websocket-accept的值
  static std::string generate_accept_key(const std::string &key);

  static const char *status_reason(int status);

  // 请求体与websocket消息的长度上限，需要容纳转义后最大的文档内容
  static size_t max_message_length(const SyncHub *hub);

private:
  static http_response handle_root();
  static http_response handle_get_text(SyncHub *hub);
  static http_response handle_post_text(SyncHub *hub,
                                        const HttpParser &request);
  static http_response handle_status(SyncHub *hub);
  static http_response error_response(int status, const char *detail);

  // 发送101响应报文，并切换到websocket阶段
  void upgrade_handle();

  void parsing_fail_handle();

  SyncHub *hub_;
  HttpParser parser_;
};

} // namespace textsync

#endif
