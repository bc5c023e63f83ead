// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "session_registry.h"

#include <spdlog/spdlog.h>

namespace textsync {

uint32_t SessionRegistry::Register(std::shared_ptr<Session> session) {
  if (!session || session->id() == 0) {
    spdlog::error("registry: refuse to register an invalid session");
    return 0;
  }
  uint32_t handle = session->id();
  bool ret;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ret = sessions_.emplace(handle, std::move(session)).second;
  }
  if (!ret) {
    spdlog::error("registry: session {} already registered", handle);
    return 0;
  }
  return handle;
}

bool SessionRegistry::Unregister(uint32_t handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(handle) != 0;
}

std::shared_ptr<Session> SessionRegistry::Find(uint32_t handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(handle);
  if (it != sessions_.end()) {
    return it->second;
  }
  return nullptr;
}

size_t SessionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<uint32_t> SessionRegistry::ForEach(const Visitor &visitor) const {
  std::vector<std::shared_ptr<Session>> members;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    members.reserve(sessions_.size());
    for (const auto &item : sessions_) {
      members.push_back(item.second);
    }
  }
  std::vector<uint32_t> failed;
  for (const auto &session : members) {
    if (!visitor(*session)) {
      failed.push_back(session->id());
    }
  }
  return failed;
}

} // namespace textsync
