// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "sync_hub.h"

#include <spdlog/spdlog.h>

#include "errors.h"
#include "messages.h"
#include "utils/helpers.h"

namespace textsync {

SyncHub::SyncHub(PersistentStore *store, std::string initial_content,
                 std::string loaded_at, size_t max_content_bytes)
    : store_(store), state_(std::move(initial_content), std::move(loaded_at)),
      max_content_bytes_(max_content_bytes) {}

int SyncHub::OnEdit(edit_event edit, document_snapshot *result) {
  if (!edit.content) {
    spdlog::warn("hub: reject edit. error: {}",
                 error_message(TEXTSYNC_ERROR_MALFORMED_MESSAGE));
    return TEXTSYNC_ERROR_MALFORMED_MESSAGE;
  }
  if (edit.content->size() > max_content_bytes_) {
    spdlog::warn("hub: reject edit of {} bytes (limit {}). error: {}",
                 edit.content->size(), max_content_bytes_,
                 error_message(TEXTSYNC_ERROR_OVERSIZED_CONTENT));
    return TEXTSYNC_ERROR_OVERSIZED_CONTENT;
  }
  if (edit.timestamp.empty())
    edit.timestamp = get_datetime();
  if (!edit.user_id)
    edit.user_id = kAnonymousUser;

  std::lock_guard<std::mutex> lock(mutex_);
  document_snapshot state = state_.Apply(edit);
  // 持久化失败时内存状态已经改变，只记录错误，广播照常进行
  if (store_->Save(state.content) != TEXTSYNC_ERROR_OK) {
    spdlog::error("hub: version {} not persisted. error: {}", state.version,
                  error_message(TEXTSYNC_ERROR_STORE_UNAVAILABLE));
  }
  broadcast(std::make_shared<const std::string>(
      make_text_update(state, edit.origin_session)));
  spdlog::info("hub: text updated by {} (version {}, {} bytes)",
               state.last_editor.value_or(kAnonymousUser), state.version,
               state.content.size());
  if (result)
    *result = std::move(state);
  return TEXTSYNC_ERROR_OK;
}

bool SyncHub::Join(std::shared_ptr<Session> session) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint32_t handle = registry_.Register(session);
  if (!handle)
    return false;
  auto initial = std::make_shared<const std::string>(
      make_initial_state(state_.Read(), registry_.Size(), handle));
  if (!session->Deliver(initial)) {
    spdlog::warn("hub: session {} unreachable on join", handle);
    registry_.Unregister(handle);
    return false;
  }
  spdlog::info("hub: session {} joined as {}. total sessions: {}", handle,
               session->user_id().value_or(kAnonymousUser), registry_.Size());
  broadcast(std::make_shared<const std::string>(
      make_user_count_update(registry_.Size())));
  return true;
}

void SyncHub::Leave(uint32_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!registry_.Unregister(session_id))
    return;
  spdlog::info("hub: session {} left. total sessions: {}", session_id,
               registry_.Size());
  broadcast(std::make_shared<const std::string>(
      make_user_count_update(registry_.Size())));
}

void SyncHub::Drop(uint32_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!registry_.Find(session_id))
    return;
  drop_unreachable({session_id});
  broadcast(std::make_shared<const std::string>(
      make_user_count_update(registry_.Size())));
}

size_t SyncHub::max_message_bytes() const {
  return max_encoded_message_bytes(max_content_bytes_);
}

void SyncHub::broadcast(const std::shared_ptr<const std::string> &message) {
  std::vector<uint32_t> failed = registry_.ForEach(
      [&message](Session &session) { return session.Deliver(message); });
  if (failed.empty())
    return;
  drop_unreachable(failed);
  // 有会话被移除时通知剩余会话在线人数，此次失败的会话不再重复通知
  auto update = std::make_shared<const std::string>(
      make_user_count_update(registry_.Size()));
  drop_unreachable(registry_.ForEach(
      [&update](Session &session) { return session.Deliver(update); }));
}

void SyncHub::drop_unreachable(const std::vector<uint32_t> &sessions) {
  for (uint32_t id : sessions) {
    std::shared_ptr<Session> session = registry_.Find(id);
    if (session && registry_.Unregister(id)) {
      session->Close();
      spdlog::warn("hub: drop session {}. error: {}", id,
                   error_message(TEXTSYNC_ERROR_SESSION_UNREACHABLE));
    }
  }
}

} // namespace textsync
