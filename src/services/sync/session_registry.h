// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_SERVICES_SYNC_SESSION_REGISTRY_H_
#define TEXTSYNC_SERVICES_SYNC_SESSION_REGISTRY_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace textsync {

// 一个在线客户端会话，user_id由客户端提供，仅作为标签使用
class Session {
public:
  Session(uint32_t id, std::optional<std::string> user_id)
      : id_(id), user_id_(std::move(user_id)) {}
  virtual ~Session() = default;

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  inline uint32_t id() const { return id_; }
  inline const std::optional<std::string> &user_id() const { return user_id_; }

  // 非阻塞地投递一条消息，会话已断开或无法接收时返回false
  virtual bool Deliver(std::shared_ptr<const std::string> message) = 0;

  // 会话被同步中心移除或连接关闭，之后的投递均应失败
  virtual void Close() {}

private:
  uint32_t id_;
  std::optional<std::string> user_id_;
};

// 在线会话集合，所有对集合的访问都在同一把互斥锁下进行
class SessionRegistry {
public:
  using Visitor = std::function<bool(Session &)>;

  SessionRegistry() = default;
  ~SessionRegistry() = default;

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  // 注册会话，返回会话句柄，id为0或已存在时返回0
  uint32_t Register(std::shared_ptr<Session> session);

  bool Unregister(uint32_t handle);

  std::shared_ptr<Session> Find(uint32_t handle) const;

  size_t Size() const;

  // 在锁内复制当前成员列表，再在锁外逐个调用visitor
  // 之后注册的会话不会被访问，visitor中可以安全地注册或注销会话
  // 返回visitor返回false的会话句柄
  std::vector<uint32_t> ForEach(const Visitor &visitor) const;

private:
  mutable std::mutex mutex_;
  // 按句柄有序，保证每次广播的投递顺序一致
  std::map<uint32_t, std::shared_ptr<Session>> sessions_;
};

} // namespace textsync

#endif
