// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "persistent_store.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace textsync {

namespace {
constexpr static size_t kReadChunkSize = 64 * 1024;
} // namespace

FileStore::FileStore(std::string path)
    : path_(std::move(path)), tmp_path_(path_ + ".tmp") {}

int FileStore::Load(std::string *content) {
  int fd = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) {
      spdlog::info("store: no saved document found at {}", path_);
    } else {
      spdlog::error("store: open {} failed. error: {}", path_,
                    strerror(errno));
    }
    return TEXTSYNC_ERROR_STORE_UNAVAILABLE;
  }
  std::string data;
  char buf[kReadChunkSize];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      spdlog::error("store: read {} failed. error: {}", path_, strerror(errno));
      close(fd);
      return TEXTSYNC_ERROR_STORE_UNAVAILABLE;
    }
    if (n == 0)
      break;
    data.append(buf, static_cast<size_t>(n));
  }
  close(fd);
  *content = std::move(data);
  spdlog::info("store: loaded document ({} bytes) from {}", content->size(),
               path_);
  return TEXTSYNC_ERROR_OK;
}

int FileStore::Save(const std::string &content) {
  int fd = open(tmp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                0644);
  if (fd < 0) {
    spdlog::error("store: open {} failed. error: {}", tmp_path_,
                  strerror(errno));
    return TEXTSYNC_ERROR_STORE_UNAVAILABLE;
  }
  const char *data = content.data();
  size_t remain = content.size();
  while (remain) {
    ssize_t n = write(fd, data, remain);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      spdlog::error("store: write {} failed. error: {}", tmp_path_,
                    strerror(errno));
      close(fd);
      unlink(tmp_path_.c_str());
      return TEXTSYNC_ERROR_STORE_UNAVAILABLE;
    }
    data += n;
    remain -= static_cast<size_t>(n);
  }
  if (fsync(fd) < 0) {
    spdlog::error("store: fsync {} failed. error: {}", tmp_path_,
                  strerror(errno));
    close(fd);
    unlink(tmp_path_.c_str());
    return TEXTSYNC_ERROR_STORE_UNAVAILABLE;
  }
  if (close(fd) < 0) {
    spdlog::error("store: close {} failed. error: {}", tmp_path_,
                  strerror(errno));
    unlink(tmp_path_.c_str());
    return TEXTSYNC_ERROR_STORE_UNAVAILABLE;
  }
  if (rename(tmp_path_.c_str(), path_.c_str()) < 0) {
    spdlog::error("store: rename {} -> {} failed. error: {}", tmp_path_, path_,
                  strerror(errno));
    unlink(tmp_path_.c_str());
    return TEXTSYNC_ERROR_STORE_UNAVAILABLE;
  }
  spdlog::debug("store: saved document ({} bytes)", content.size());
  return TEXTSYNC_ERROR_OK;
}

} // namespace textsync
