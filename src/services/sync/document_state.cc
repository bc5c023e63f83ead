// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "document_state.h"

#include <mutex>

namespace textsync {

DocumentState::DocumentState(std::string content, std::string last_modified) {
  state_.content = std::move(content);
  state_.last_modified = std::move(last_modified);
}

document_snapshot DocumentState::Apply(const edit_event &edit) {
  std::lock_guard<std::shared_mutex> lock(mutex_);
  state_.content = edit.content.value_or(std::string());
  state_.last_modified = edit.timestamp;
  state_.last_editor = edit.user_id;
  ++state_.version;
  return state_;
}

document_snapshot DocumentState::Read() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_;
}

} // namespace textsync
