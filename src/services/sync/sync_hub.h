// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_SERVICES_SYNC_SYNC_HUB_H_
#define TEXTSYNC_SERVICES_SYNC_SYNC_HUB_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "document_state.h"
#include "persistent_store.h"
#include "session_registry.h"

namespace textsync {

namespace {
// 默认接受的文档内容上限，1MB
constexpr static size_t kDefaultMaxContentBytes = 1 << 20;
} // namespace

// 所有状态变更的唯一入口
// 校验、应用、持久化与广播在同一把锁内完成，所有会话看到的编辑顺序一致
class SyncHub {
public:
  SyncHub(PersistentStore *store, std::string initial_content,
          std::string loaded_at,
          size_t max_content_bytes = kDefaultMaxContentBytes);
  ~SyncHub() = default;

  SyncHub(const SyncHub &) = delete;
  SyncHub &operator=(const SyncHub &) = delete;

  // 应用一次编辑并广播结果，timestamp为空时使用服务器当前时间
  // user_id为空时记为匿名用户
  // 返回TEXTSYNC_ERROR_OK、TEXTSYNC_ERROR_MALFORMED_MESSAGE或
  // TEXTSYNC_ERROR_OVERSIZED_CONTENT，持久化失败不影响返回值
  int OnEdit(edit_event edit, document_snapshot *result = nullptr);

  // 注册会话，向其发送初始状态，并广播在线人数
  bool Join(std::shared_ptr<Session> session);

  // 注销会话并广播在线人数
  void Leave(uint32_t session_id);

  // 会话无法继续接收消息，关闭并移除该会话，之后广播在线人数
  void Drop(uint32_t session_id);

  inline document_snapshot Snapshot() const { return state_.Read(); }

  inline size_t SessionCount() const { return registry_.Size(); }

  inline size_t max_content_bytes() const { return max_content_bytes_; }

  // 包含最大文档内容的一条同步消息可能达到的长度
  size_t max_message_bytes() const;

  inline const std::string &store_path() const { return store_->path(); }

private:
  // 调用方需持有mutex_
  void broadcast(const std::shared_ptr<const std::string> &message);

  void drop_unreachable(const std::vector<uint32_t> &sessions);

  std::mutex mutex_;
  PersistentStore *store_;
  DocumentState state_;
  SessionRegistry registry_;
  size_t max_content_bytes_;
};

} // namespace textsync

#endif
