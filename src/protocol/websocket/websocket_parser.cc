// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include <algorithm>
#include <cstring>

#include <endian.h>

#include "websocket_parser.h"

namespace textsync {

WebSocketParser::WebSocketParser(uint64_t max_payload_length)
    : max_payload_length_(max_payload_length) {
  Reset();
}

size_t WebSocketParser::ParserExecute(const void *buffer, size_t length) {
  size_t i = 0;
  const uint8_t *buf = static_cast<const uint8_t *>(buffer);
  if (state_ == parser_state_t::kWsParserDone || error_code_)
    return 0;
  for (; i < length; ++i) {
    switch (state_) {
    case parser_state_t::kWsParserFinAndOpcode:
      fin_flag_ = (buf[i] & 0x80) != 0;
      opcode_ = (buf[i] & 0x0F);
      // 未协商任何扩展，保留位必须为0
      if (buf[i] & 0x70) {
        error_code_ = WS_CLOSE_PROTOCOL_ERROR;
        return 0;
      }
      switch (opcode_) {
#define X(code, name) case code:
        WS_OPCODE_MAP(X)
#undef X
        break;
      default:
        error_code_ = WS_CLOSE_PROTOCOL_ERROR;
        return 0;
      }
      // 控制帧不能分片
      if (IsControlFrame() && !fin_flag_) {
        error_code_ = WS_CLOSE_PROTOCOL_ERROR;
        return 0;
      }
      state_ = parser_state_t::kWsParserMaskAndLen;
      break;
    case parser_state_t::kWsParserMaskAndLen: {
      // 客户端发送的帧必须使用掩码
      if (!(buf[i] & 0x80)) {
        error_code_ = WS_CLOSE_PROTOCOL_ERROR;
        return 0;
      }
      uint8_t len = buf[i] & 0x7F;
      payload_length_ = 0;
      if (len < 126) {
        payload_length_ = len;
        if (!payload_length_done())
          return 0;
      } else if (len == 126) {
        state_ = parser_state_t::kWsParserPayloadLen16;
        remain_bytes_ = 2;
      } else {
        state_ = parser_state_t::kWsParserPayloadLen64;
        remain_bytes_ = 8;
      }
      break;
    }
    case parser_state_t::kWsParserPayloadLen16:
    case parser_state_t::kWsParserPayloadLen64:
      // 按网络字节序逐字节累加
      payload_length_ = (payload_length_ << 8) | buf[i];
      if (--remain_bytes_ == 0) {
        if (state_ == parser_state_t::kWsParserPayloadLen64 &&
            (payload_length_ >> 63)) {
          error_code_ = WS_CLOSE_PROTOCOL_ERROR;
          return 0;
        }
        if (!payload_length_done())
          return 0;
      }
      break;
    case parser_state_t::kWsParserMaskingKey:
      mask_[4 - remain_bytes_] = buf[i];
      if (--remain_bytes_ == 0) {
        if (payload_length_ == 0) {
          state_ = parser_state_t::kWsParserDone;
          return i + 1;
        }
        data_.reserve(payload_length_);
        state_ = parser_state_t::kWsParserPayloadData;
      }
      break;
    case parser_state_t::kWsParserPayloadData: {
      size_t n = static_cast<size_t>(
          std::min<uint64_t>(payload_length_ - data_.size(), length - i));
      size_t index = data_.size();
      data_.append(reinterpret_cast<const char *>(buf + i), n);
      for (size_t k = index; k < data_.size(); ++k) {
        data_[k] = static_cast<char>(data_[k] ^ mask_[k % 4]);
      }
      i += n - 1;
      if (data_.size() == payload_length_) {
        state_ = parser_state_t::kWsParserDone;
        return i + 1;
      }
      break;
    }
    case parser_state_t::kWsParserDone:
      return i;
    }
  }
  return i;
}

bool WebSocketParser::payload_length_done() {
  if (IsControlFrame() && payload_length_ > kMaxControlPayloadLength) {
    error_code_ = WS_CLOSE_PROTOCOL_ERROR;
    return false;
  }
  if (payload_length_ > max_payload_length_) {
    error_code_ = WS_CLOSE_PAYLOAD_TOO_BIG;
    return false;
  }
  state_ = parser_state_t::kWsParserMaskingKey;
  remain_bytes_ = 4;
  return true;
}

void WebSocketParser::Reset() {
  state_ = parser_state_t::kWsParserFinAndOpcode;
  fin_flag_ = 0;
  opcode_ = 0;
  error_code_ = 0;
  payload_length_ = 0;
  remain_bytes_ = 0;
  data_.clear();
}

const char *WebSocketParser::close_message(uint16_t code) {
  switch (code) {
  case 0:
    return "need more data to parsing";
#define X(name, code, reason)                                                  \
  case code:                                                                   \
    return reason;
    WS_CLOSE_STATUS_MAP(X)
#undef X
  default:
    return "Unknown Reason";
  }
}

std::string WebSocketParser::encode_frame(bool fin_flag, ws_opcode_t opcode,
                                          std::string_view payload) {
  std::string frame;
  size_t length = payload.size();
  frame.reserve(length + 10);
  frame.push_back(static_cast<char>((fin_flag << 7) | opcode));
  if (length < 126) {
    frame.push_back(static_cast<char>(length));
  } else if (length <= 0xFFFF) {
    frame.push_back(static_cast<char>(126));
    uint16_t len = htobe16(static_cast<uint16_t>(length));
    frame.append(reinterpret_cast<const char *>(&len), sizeof(len));
  } else {
    frame.push_back(static_cast<char>(127));
    uint64_t len = htobe64(static_cast<uint64_t>(length));
    frame.append(reinterpret_cast<const char *>(&len), sizeof(len));
  }
  frame.append(payload.data(), length);
  return frame;
}

std::string WebSocketParser::encode_close_frame(uint16_t code) {
  uint16_t status = htobe16(code);
  return encode_frame(
      true, WS_OPCODE_CLOSE,
      std::string_view(reinterpret_cast<const char *>(&status), sizeof(status)));
}

} // namespace textsync
