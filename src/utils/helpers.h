// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_UTILS_HELPERS_H_
#define TEXTSYNC_UTILS_HELPERS_H_

#include <cstdint>
#include <ctime>
#include <string>

namespace textsync {

// 创建监听套接字，host为点分十进制的IPv4地址，失败时返回-1
int create_listening_socket(const std::string &host, uint16_t port);

static inline uint64_t get_current_millis() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return uint64_t(ts.tv_sec) * 1000 + uint64_t(ts.tv_nsec) / 1000000;
}

// 获取当前UTC时间的ISO-8601字符串，如2026-01-02T03:04:05.678901Z
std::string get_datetime();

} // namespace textsync

#endif
