// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_PROTOCOL_HTTP_PARSER_H_
#define TEXTSYNC_PROTOCOL_HTTP_PARSER_H_

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "parser.h"

namespace textsync {

namespace {
// http请求报文中头部字段名的最大长度限制，默认256字节
constexpr const uint32_t kHttpHeaderElementSize = 256;
// 头部字段值的最大长度限制
constexpr const uint32_t kHttpHeaderValueSize = 4096;
// 请求uri的最大长度限制
constexpr const uint32_t kHttpUriSize = 2048;
// 头部字段的最大数量
constexpr const uint32_t kHttpMaxHeaders = 64;
// 默认的请求体最大长度，4MB
constexpr const size_t kMaxBodyLength = 4 << 20;

#define kHttpVersionPrefix "HTTP/1."
#define kHttpOrigin "origin"
#define kHttpHost "host"
#define kHttpUpgrade "upgrade"
#define kHttpConnection "connection"
#define kHttpWebsocket "websocket"
#define kHttpSecWebsocketKey "sec-websocket-key"
#define kHttpSecWebsocketVersion "sec-websocket-version"
#define kHttpSecWebsocketVersion13 "13"
#define kHttpContentLength "content-length"
#define kHttpTransferEncoding "transfer-encoding"

constexpr static char tokens[256] = {
    /*   0 nul    1 soh    2 stx    3 etx    4 eot    5 enq    6 ack    7
       bel */
    0, 0, 0, 0, 0, 0, 0, 0,
    /*   8 bs     9 ht    10 nl    11 vt    12 np    13 cr    14 so    15 si
     */
    0, 0, 0, 0, 0, 0, 0, 0,
    /*  16 dle   17 dc1   18 dc2   19 dc3   20 dc4   21 nak   22 syn   23
       etb */
    0, 0, 0, 0, 0, 0, 0, 0,
    /*  24 can   25 em    26 sub   27 esc   28 fs    29 gs    30 rs    31 us
     */
    0, 0, 0, 0, 0, 0, 0, 0,
    /*  32 sp    33  !    34  "    35  #    36  $    37  %    38  &    39  '
     */
    ' ', '!', 0, '#', '$', '%', '&', '\'',
    /*  40  (    41  )    42  *    43  +    44  ,    45  -    46  .    47  /
     */
    0, 0, '*', '+', 0, '-', '.', 0,
    /*  48  0    49  1    50  2    51  3    52  4    53  5    54  6    55  7
     */
    '0', '1', '2', '3', '4', '5', '6', '7',
    /*  56  8    57  9    58  :    59  ;    60  <    61  =    62  >    63  ?
     */
    '8', '9', 0, 0, 0, 0, 0, 0,
    /*  64  @    65  A    66  B    67  C    68  D    69  E    70  F    71  G
     */
    0, 'a', 'b', 'c', 'd', 'e', 'f', 'g',
    /*  72  H    73  I    74  J    75  K    76  L    77  M    78  N    79  O
     */
    'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o',
    /*  80  P    81  Q    82  R    83  S    84  T    85  U    86  V    87  W
     */
    'p', 'q', 'r', 's', 't', 'u', 'v', 'w',
    /*  88  X    89  Y    90  Z    91  [    92  \    93  ]    94  ^    95  _
     */
    'x', 'y', 'z', 0, 0, 0, '^', '_',
    /*  96  `    97  a    98  b    99  c   100  d   101  e   102  f   103  g
     */
    '`', 'a', 'b', 'c', 'd', 'e', 'f', 'g',
    /* 104  h   105  i   106  j   107  k   108  l   109  m   110  n   111  o
     */
    'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o',
    /* 112  p   113  q   114  r   115  s   116  t   117  u   118  v   119  w
     */
    'p', 'q', 'r', 's', 't', 'u', 'v', 'w',
    /* 120  x   121  y   122  z   123  {   124  |   125  }   126  ~   127
       del */
    'x', 'y', 'z', 0, '|', 0, '~', 0};

constexpr static const char websocket_key_valid[256] = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1,
    0, 0, 0, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 0, 0, 1, 0, 0, 0, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0};

#define HTTP_PARSER_ERROR_MAP(X)                                               \
  X(0, NEED_MORE_DATA, "Need More Data To Parsing")                            \
  X(1, INVALID_METHOD, "Invalid HTTP Request Method")                          \
  X(2, INVALID_URI, "Request URI Length Out Of Range OR INVALID")              \
  X(3, INVALID_HEADER_FIELD, "Invalid Header Field")                           \
  X(4, INVALID_FIELD_VALUE, "Invalid Field Value")                             \
  X(5, PROTOCOL_ERROR, "Not Standard HTTP Protocol")                           \
  X(6, FIELD_OUT_OF_RANGE, "Header Field OR Value Out Of Range")               \
  X(7, BODY_TOO_LARGE, "Request Body Out Of Range")                            \
  X(8, UNSUPPORTED_TRANSFER_ENCODING, "Transfer Encoding Not Supported")

constexpr const char *errors_desc_table[] = {
#define X(n, name, str) str,
    HTTP_PARSER_ERROR_MAP(X)
#undef X
};

} // namespace

// HTTP/1.x请求报文的增量解析器，支持分多次传入数据
// 解析完成后请求行、常用头部字段与请求体保存在公开成员中
class HttpParser : public Parser {
public:
  enum error_code_t {
#define X(n, name, str) PARSER_ERROR_##name = n,
    HTTP_PARSER_ERROR_MAP(X)
#undef X
  };

  explicit HttpParser(size_t max_body_length = kMaxBodyLength);
  ~HttpParser() = default;

  size_t ParserExecute(const void *buffer, size_t length) override;
  inline bool IsDone() const override {
    return state_ == parser_state_t::kHttpParserDone;
  }
  void Reset() override;
  inline int GetErrorCode() const override { return error_code_; }
  const char *GetError() const override {
    return errors_desc_table[error_code_];
  }

  // 请求是否包含完整的websocket握手字段
  inline bool IsWebSocketUpgrade() const {
    return (flags_ & WS_HANDSHAKE_FLAG_COMPLETE) == WS_HANDSHAKE_FLAG_COMPLETE;
  }

  // 对百分号编码进行解码，plus_as_space为true时将'+'解码为空格
  static bool percent_decode(const char *data, size_t length,
                             std::string *result, bool plus_as_space);

  std::string method_;
  // 解码后的请求路径，不包含查询参数
  std::string location_;
  std::string host_;
  std::string origin_;
  std::string websocket_key_;
  std::string body_;
  // 查询参数，同名参数按出现顺序保存
  std::unordered_map<std::string, std::vector<std::string>> query_args_;

private:
  enum class parser_state_t {
    kHttpParserStart = 0,
    kHttpParserMethod,
    kHttpParserUri,
    kHttpParserVersion,
    kHttpParserAfterVersion,
    kHttpParserHeaderField,
    kHttpParserFieldValue,
    kHttpParserHeaderLineAlmostDone,
    kHttpParserHeaderLineDone,
    kHttpParserFinished,
    kHttpParserBody,
    kHttpParserDone
  };

  // 用于判断websocket协议的http握手报文是否符合规则
  enum websocket_handshake_flag {
    WS_HANDSHAKE_FLAG_HOST = 1 << 0,
    WS_HANDSHAKE_FLAG_CONNECTION_UPGRADE = 1 << 1,
    WS_HANDSHAKE_FLAG_UPGRADE_WEBSOCKET = 1 << 2,
    WS_HANDSHAKE_FLAG_WEBSOCKET_KEY = 1 << 3,
    WS_HANDSHAKE_FLAG_WEBSOCKET_VERSION_13 = 1 << 4,
    WS_HANDSHAKE_FLAG_COMPLETE = (1 << 5) - 1
  };

  // 请求uri接收完毕后解析路径与查询参数
  bool request_uri_parse();

  // 一个头部字段接收完毕
  bool header_line_done();

  // 逗号分隔的字段值中是否包含指定的token，不区分大小写
  static bool value_has_token(const std::string &value, const char *token);

  // 当前解析器的解析状态
  parser_state_t state_;
  // 检测当前http请求报文的头部字段是否满足websocket握手报文所需
  uint8_t flags_;
  // 保存解析器的错误代码，以便用来生成对应的响应报文
  uint8_t error_code_;
  // 辅助解析函数的执行
  size_t index_;
  uint32_t header_count_;
  bool has_content_length_;
  size_t content_length_;
  size_t max_body_length_;
  // 未解码的请求uri
  std::string request_uri_;
  // 当前头部字段名（小写）与字段值
  std::string field_;
  std::string value_;
};

} // namespace textsync

#endif
