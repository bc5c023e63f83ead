// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "helpers.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace textsync {

int create_listening_socket(const std::string &host, uint16_t port) {
  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    spdlog::error("invalid listening address: {}", host);
    return -1;
  }

  int listen_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd < 0) {
    spdlog::error("create listening socket failed. error: {}", strerror(errno));
    return -1;
  }

  int enable = 1;
  int ret =
      setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(int));
  if (ret < 0) {
    spdlog::error("setsockopt failed. error: {}", strerror(errno));
    close(listen_fd);
    return -1;
  }

  ret = bind(listen_fd, (const struct sockaddr *)&addr, sizeof(addr));
  if (ret < 0) {
    spdlog::error("bind {}:{} failed. error: {}", host, port, strerror(errno));
    close(listen_fd);
    return -1;
  }

  ret = listen(listen_fd, 1024);
  if (ret < 0) {
    spdlog::error("listen failed. error: {}", strerror(errno));
    close(listen_fd);
    return -1;
  }

  return listen_fd;
}

std::string get_datetime() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_utc;
  gmtime_r(&ts.tv_sec, &tm_utc);
  char buf[32];
  size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
  snprintf(buf + n, sizeof(buf) - n, ".%06ldZ", ts.tv_nsec / 1000);
  return buf;
}

} // namespace textsync
