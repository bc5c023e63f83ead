// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_PROTOCOL_WEBSOCKET_PARSER_H_
#define TEXTSYNC_PROTOCOL_WEBSOCKET_PARSER_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "parser.h"

namespace textsync {

namespace {
// 单个帧及重组后消息的最大载荷长度，默认4MB
constexpr const uint64_t kMaxPayloadLength = 4 << 20;
// 控制帧的最大载荷长度
constexpr const uint64_t kMaxControlPayloadLength = 125;

#define WS_OPCODE_MAP(X)                                                       \
  X(0x0, CONTINUED)                                                            \
  X(0x1, TEXT)                                                                 \
  X(0x2, BINARY)                                                               \
  X(0x8, CLOSE)                                                                \
  X(0x9, PING)                                                                 \
  X(0xA, PONG)

#define WS_CLOSE_STATUS_MAP(X)                                                 \
  X(NORMAL, 1000, "connection successfully closed")                            \
  X(GOING_AWAY, 1001, "endpoint is going away")                                \
  X(PROTOCOL_ERROR, 1002, "encounter protocol error")                          \
  X(UNSUPPORTED_DATA, 1003, "received a type of data cannot accept")           \
  X(INVALID_PAYLOAD, 1007,                                                     \
    "received data within a message that was not consistent with the "         \
    "type of the message")                                                     \
  X(POLICY_VIOLATION, 1008, "received a message that violates its policy")     \
  X(PAYLOAD_TOO_BIG, 1009,                                                     \
    "received a message that is too big for it to process")                    \
  X(EXTENSION_REQUIRED, 1010,                                                  \
    "expected the one or more extension but not response")                     \
  X(INTERNAL_ERROR, 1011, "encountered an unexpected condition")

} // namespace

// 客户端帧的增量解析器，每次解析出一个完整的帧
// 错误码即为关闭连接时应使用的状态码
class WebSocketParser : public Parser {
public:
  enum ws_opcode_t {
#define X(code, name) WS_OPCODE_##name = code,
    WS_OPCODE_MAP(X)
#undef X
  };

  enum ws_close_code_t {
#define X(name, code, reason) WS_CLOSE_##name = code,
    WS_CLOSE_STATUS_MAP(X)
#undef X
  };

  explicit WebSocketParser(uint64_t max_payload_length = kMaxPayloadLength);
  ~WebSocketParser() = default;

  size_t ParserExecute(const void *buffer, size_t length) override;
  inline bool IsDone() const override {
    return state_ == parser_state_t::kWsParserDone;
  }
  void Reset() override;
  inline int GetErrorCode() const override { return error_code_; }
  const char *GetError() const override { return close_message(error_code_); }

  inline bool IsControlFrame() const { return (opcode_ & 0x08) != 0; }

  static const char *close_message(uint16_t code);

  // 封装一个服务端帧，服务端发送的帧不使用掩码
  static std::string encode_frame(bool fin_flag, ws_opcode_t opcode,
                                  std::string_view payload);

  // 封装关闭帧，载荷为网络字节序的状态码
  static std::string encode_close_frame(uint16_t code);

  uint8_t fin_flag_;
  uint8_t opcode_;
  // 去除掩码后的载荷数据
  std::string data_;

private:
  enum class parser_state_t {
    kWsParserFinAndOpcode = 0,
    kWsParserMaskAndLen,
    kWsParserPayloadLen16,
    kWsParserPayloadLen64,
    kWsParserMaskingKey,
    kWsParserPayloadData,
    kWsParserDone
  };

  // 载荷长度确定后进行检查
  bool payload_length_done();

  parser_state_t state_;
  uint16_t error_code_;
  uint8_t mask_[4];
  uint64_t payload_length_;
  uint64_t remain_bytes_;
  uint64_t max_payload_length_;
};

} // namespace textsync

#endif
