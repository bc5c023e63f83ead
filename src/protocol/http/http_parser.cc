// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "http_parser.h"

#include <algorithm>
#include <cstring>

#include <strings.h>

namespace textsync {

namespace {

int hex_value(char ch) {
  if (ch >= '0' && ch <= '9')
    return ch - '0';
  if (ch >= 'a' && ch <= 'f')
    return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F')
    return ch - 'A' + 10;
  return -1;
}

} // namespace

HttpParser::HttpParser(size_t max_body_length)
    : max_body_length_(max_body_length) {
  Reset();
}

size_t HttpParser::ParserExecute(const void *buffer, size_t length) {
  size_t i = 0;
  char ch, lc;
  const char *buf = static_cast<const char *>(buffer);
  if (state_ == parser_state_t::kHttpParserDone || error_code_)
    return 0;
  // 状态切换后需要用新状态重新处理当前字符时，使用continue跳过++i
  while (i != length) {
    ch = buf[i];
    switch (state_) {
    case parser_state_t::kHttpParserStart: {
      // 忽略请求之前多余的空行
      if (ch == '\r' || ch == '\n')
        break;
      state_ = parser_state_t::kHttpParserMethod;
      continue;
    }
    case parser_state_t::kHttpParserMethod: {
      if (ch == ' ') {
        if (method_.empty()) {
          error_code_ = error_code_t::PARSER_ERROR_INVALID_METHOD;
          return 0;
        }
        state_ = parser_state_t::kHttpParserUri;
        break;
      }
      if (ch < 'A' || ch > 'Z' || method_.size() >= 16) {
        error_code_ = error_code_t::PARSER_ERROR_INVALID_METHOD;
        return 0;
      }
      method_.push_back(ch);
      break;
    }
    case parser_state_t::kHttpParserUri: {
      if (ch == ' ') {
        if (!request_uri_parse()) {
          error_code_ = error_code_t::PARSER_ERROR_INVALID_URI;
          return 0;
        }
        state_ = parser_state_t::kHttpParserVersion;
        index_ = 0;
        break;
      }
      if ((request_uri_.empty() && ch != '/') ||
          static_cast<uint8_t>(ch) <= 0x20 || ch == 0x7F ||
          request_uri_.size() >= kHttpUriSize) {
        error_code_ = error_code_t::PARSER_ERROR_INVALID_URI;
        return 0;
      }
      request_uri_.push_back(ch);
      break;
    }
    case parser_state_t::kHttpParserVersion: {
      if (index_ < sizeof(kHttpVersionPrefix) - 1) {
        if (ch != kHttpVersionPrefix[index_]) {
          error_code_ = error_code_t::PARSER_ERROR_PROTOCOL_ERROR;
          return 0;
        }
        ++index_;
        break;
      }
      // 支持HTTP/1.0与HTTP/1.1
      if (ch != '0' && ch != '1') {
        error_code_ = error_code_t::PARSER_ERROR_PROTOCOL_ERROR;
        return 0;
      }
      state_ = parser_state_t::kHttpParserAfterVersion;
      index_ = 0;
      break;
    }
    case parser_state_t::kHttpParserAfterVersion: {
      if (ch != '\r') {
        error_code_ = error_code_t::PARSER_ERROR_PROTOCOL_ERROR;
        return 0;
      }
      state_ = parser_state_t::kHttpParserHeaderLineAlmostDone;
      break;
    }
    case parser_state_t::kHttpParserHeaderLineAlmostDone: {
      if (ch != '\n') {
        error_code_ = error_code_t::PARSER_ERROR_PROTOCOL_ERROR;
        return 0;
      }
      state_ = parser_state_t::kHttpParserHeaderLineDone;
      break;
    }
    case parser_state_t::kHttpParserHeaderLineDone: {
      if (ch == ' ' || ch == '\t') {
        // 不支持折叠的头部字段
        error_code_ = error_code_t::PARSER_ERROR_PROTOCOL_ERROR;
        return 0;
      }
      if (ch == '\r') {
        state_ = parser_state_t::kHttpParserFinished;
      } else {
        if (++header_count_ > kHttpMaxHeaders) {
          error_code_ = error_code_t::PARSER_ERROR_FIELD_OUT_OF_RANGE;
          return 0;
        }
        field_.clear();
        value_.clear();
        state_ = parser_state_t::kHttpParserHeaderField;
        continue;
      }
      break;
    }
    case parser_state_t::kHttpParserHeaderField: {
      if (ch == ':' && !field_.empty()) {
        state_ = parser_state_t::kHttpParserFieldValue;
        break;
      }
      if (field_.size() >= kHttpHeaderElementSize) {
        error_code_ = error_code_t::PARSER_ERROR_FIELD_OUT_OF_RANGE;
        return 0;
      }
      lc = tokens[static_cast<uint8_t>(ch)];
      if (lc == ' ' || !lc) {
        error_code_ = error_code_t::PARSER_ERROR_INVALID_HEADER_FIELD;
        return 0;
      }
      field_.push_back(lc);
      break;
    }
    case parser_state_t::kHttpParserFieldValue: {
      if (ch == '\r') {
        // 去除字段值末尾的空白字符
        while (!value_.empty() &&
               (value_.back() == ' ' || value_.back() == '\t')) {
          value_.pop_back();
        }
        if (!header_line_done())
          return 0;
        state_ = parser_state_t::kHttpParserHeaderLineAlmostDone;
        break;
      }
      if ((ch == ' ' || ch == '\t') && value_.empty())
        break;
      if ((static_cast<uint8_t>(ch) < 0x20 && ch != '\t') || ch == 0x7F) {
        error_code_ = error_code_t::PARSER_ERROR_INVALID_FIELD_VALUE;
        return 0;
      }
      if (value_.size() >= kHttpHeaderValueSize) {
        error_code_ = error_code_t::PARSER_ERROR_FIELD_OUT_OF_RANGE;
        return 0;
      }
      value_.push_back(ch);
      break;
    }
    case parser_state_t::kHttpParserFinished: {
      if (ch != '\n') {
        error_code_ = error_code_t::PARSER_ERROR_PROTOCOL_ERROR;
        return 0;
      }
      if (content_length_ == 0) {
        state_ = parser_state_t::kHttpParserDone;
        return i + 1;
      }
      body_.reserve(content_length_);
      state_ = parser_state_t::kHttpParserBody;
      break;
    }
    case parser_state_t::kHttpParserBody: {
      // 一次性拷贝当前缓冲区中属于请求体的数据
      size_t n = std::min(content_length_ - body_.size(), length - i);
      body_.append(buf + i, n);
      i += n - 1;
      if (body_.size() == content_length_) {
        state_ = parser_state_t::kHttpParserDone;
        return i + 1;
      }
      break;
    }
    case parser_state_t::kHttpParserDone:
      return i;
    }
    ++i;
  }
  return i;
}

void HttpParser::Reset() {
  state_ = parser_state_t::kHttpParserStart;
  flags_ = 0;
  error_code_ = 0;
  index_ = 0;
  header_count_ = 0;
  has_content_length_ = false;
  content_length_ = 0;
  method_.clear();
  location_.clear();
  host_.clear();
  origin_.clear();
  websocket_key_.clear();
  body_.clear();
  query_args_.clear();
  request_uri_.clear();
  field_.clear();
  value_.clear();
}

bool HttpParser::percent_decode(const char *data, size_t length,
                                std::string *result, bool plus_as_space) {
  result->clear();
  result->reserve(length);
  for (size_t i = 0; i < length; ++i) {
    char ch = data[i];
    if (ch == '%') {
      if (i + 2 >= length)
        return false;
      int high = hex_value(data[i + 1]);
      int low = hex_value(data[i + 2]);
      if (high < 0 || low < 0)
        return false;
      result->push_back(static_cast<char>((high << 4) | low));
      i += 2;
    } else if (ch == '+' && plus_as_space) {
      result->push_back(' ');
    } else {
      result->push_back(ch);
    }
  }
  return true;
}

bool HttpParser::request_uri_parse() {
  if (request_uri_.empty())
    return false;
  size_t query_pos = request_uri_.find('?');
  size_t path_length =
      query_pos == std::string::npos ? request_uri_.size() : query_pos;
  if (!percent_decode(request_uri_.data(), path_length, &location_, false))
    return false;
  if (query_pos == std::string::npos)
    return true;
  // 解析查询参数 key1=value1&key2=value2
  size_t start = query_pos + 1;
  while (start <= request_uri_.size()) {
    size_t end = request_uri_.find('&', start);
    if (end == std::string::npos)
      end = request_uri_.size();
    if (end > start) {
      size_t eq = request_uri_.find('=', start);
      if (eq == std::string::npos || eq > end)
        eq = end;
      std::string key, value;
      if (!percent_decode(request_uri_.data() + start, eq - start, &key, true))
        return false;
      if (eq < end && !percent_decode(request_uri_.data() + eq + 1,
                                      end - eq - 1, &value, true))
        return false;
      if (!key.empty())
        query_args_[key].push_back(std::move(value));
    }
    start = end + 1;
  }
  return true;
}

bool HttpParser::value_has_token(const std::string &value, const char *token) {
  size_t token_length = strlen(token);
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(',', start);
    if (end == std::string::npos)
      end = value.size();
    size_t b = start, e = end;
    while (b < e && (value[b] == ' ' || value[b] == '\t'))
      ++b;
    while (e > b && (value[e - 1] == ' ' || value[e - 1] == '\t'))
      --e;
    if (e - b == token_length && strncasecmp(value.data() + b, token,
                                             token_length) == 0)
      return true;
    start = end + 1;
  }
  return false;
}

bool HttpParser::header_line_done() {
  if (field_ == kHttpHost) {
    host_ = value_;
    flags_ |= WS_HANDSHAKE_FLAG_HOST;
  } else if (field_ == kHttpOrigin) {
    origin_ = value_;
  } else if (field_ == kHttpConnection) {
    if (value_has_token(value_, kHttpUpgrade))
      flags_ |= WS_HANDSHAKE_FLAG_CONNECTION_UPGRADE;
  } else if (field_ == kHttpUpgrade) {
    if (value_has_token(value_, kHttpWebsocket))
      flags_ |= WS_HANDSHAKE_FLAG_UPGRADE_WEBSOCKET;
  } else if (field_ == kHttpSecWebsocketKey) {
    // 16字节随机数的base64编码，固定24个字符
    if (value_.size() != 24 ||
        !std::all_of(value_.begin(), value_.end(), [](char c) {
          return websocket_key_valid[static_cast<uint8_t>(c)] != 0;
        })) {
      error_code_ = error_code_t::PARSER_ERROR_INVALID_FIELD_VALUE;
      return false;
    }
    websocket_key_ = value_;
    flags_ |= WS_HANDSHAKE_FLAG_WEBSOCKET_KEY;
  } else if (field_ == kHttpSecWebsocketVersion) {
    if (value_ == kHttpSecWebsocketVersion13)
      flags_ |= WS_HANDSHAKE_FLAG_WEBSOCKET_VERSION_13;
  } else if (field_ == kHttpContentLength) {
    if (value_.empty() || value_.size() > 18 ||
        !std::all_of(value_.begin(), value_.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
      error_code_ = error_code_t::PARSER_ERROR_INVALID_FIELD_VALUE;
      return false;
    }
    size_t content_length = std::stoull(value_);
    if (has_content_length_ && content_length != content_length_) {
      error_code_ = error_code_t::PARSER_ERROR_PROTOCOL_ERROR;
      return false;
    }
    if (content_length > max_body_length_) {
      error_code_ = error_code_t::PARSER_ERROR_BODY_TOO_LARGE;
      return false;
    }
    has_content_length_ = true;
    content_length_ = content_length;
  } else if (field_ == kHttpTransferEncoding) {
    error_code_ = error_code_t::PARSER_ERROR_UNSUPPORTED_TRANSFER_ENCODING;
    return false;
  }
  return true;
}

} // namespace textsync
