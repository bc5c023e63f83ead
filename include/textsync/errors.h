// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_INCLUDE_ERRORS_H_
#define TEXTSYNC_INCLUDE_ERRORS_H_

namespace textsync {

// 同步服务中所有可恢复错误的错误码，均在本地处理，不会导致进程退出
#define TEXTSYNC_ERROR_MAP(X)                                                  \
  X(0, OK, "success")                                                          \
  X(1, MALFORMED_MESSAGE, "message is unparseable or misses a required field") \
  X(2, STORE_UNAVAILABLE, "persistent store cannot be read or written")        \
  X(3, SESSION_UNREACHABLE, "session is disconnected or too slow to deliver")  \
  X(4, OVERSIZED_CONTENT, "content exceeds the accepted size bound")

enum error_code_t {
#define X(n, name, str) TEXTSYNC_ERROR_##name = n,
  TEXTSYNC_ERROR_MAP(X)
#undef X
};

inline const char *error_message(int code) {
  switch (code) {
#define X(n, name, str)                                                        \
  case n:                                                                      \
    return str;
    TEXTSYNC_ERROR_MAP(X)
#undef X
  default:
    return "unknown error";
  }
}

} // namespace textsync

#endif
