// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "messages.h"

#include <spdlog/spdlog.h>

#include "errors.h"

namespace textsync {

namespace {

// 字段不存在或为null时返回空，类型不是字符串时抛出type_error
std::optional<std::string> optional_string(const nlohmann::json &j,
                                           const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  return it->get<std::string>();
}

nlohmann::json optional_to_json(const std::optional<std::string> &value) {
  if (value)
    return *value;
  return nullptr;
}

} // namespace

void from_json(const nlohmann::json &j, syncmsg_desc &msg) {
  msg.type = j.value("type", SyncMsgType::UNKNOW);
  msg.content = j.at("content").get<std::string>();
  msg.user_id = optional_string(j, "user_id");
  msg.timestamp = optional_string(j, "timestamp");
}

void to_json(nlohmann::json &j, const syncmsg_desc &msg) {
  switch (msg.type) {
  case SyncMsgType::TEXT_UPDATE: {
    j["type"] = msg.type;
    j["content"] = msg.content;
    j["user_id"] = optional_to_json(msg.user_id);
    j["timestamp"] = optional_to_json(msg.timestamp);
    j["version"] = msg.version;
    j["session_id"] = msg.session_id;
    break;
  }
  case SyncMsgType::INITIAL_STATE: {
    j["type"] = msg.type;
    j["content"] = msg.content;
    j["last_updated"] = optional_to_json(msg.timestamp);
    j["user_count"] = msg.user_count;
    j["version"] = msg.version;
    j["session_id"] = msg.session_id;
    break;
  }
  case SyncMsgType::USER_COUNT_UPDATE: {
    j["type"] = msg.type;
    j["user_count"] = msg.user_count;
    break;
  }
  case SyncMsgType::UNKNOW:
    break;
  }
}

int parse_edit_request(const std::string &data, bool require_type,
                       edit_event *edit) {
  try {
    nlohmann::json j = nlohmann::json::parse(data);
    if (!j.is_object()) {
      spdlog::warn("sync: message is not a json object");
      return TEXTSYNC_ERROR_MALFORMED_MESSAGE;
    }
    syncmsg_desc msg = j.get<syncmsg_desc>();
    if (require_type && msg.type != SyncMsgType::TEXT_UPDATE) {
      spdlog::warn("sync: unsupported message type");
      return TEXTSYNC_ERROR_MALFORMED_MESSAGE;
    }
    edit->content = std::move(msg.content);
    edit->user_id = std::move(msg.user_id);
    if (msg.timestamp)
      edit->timestamp = std::move(*msg.timestamp);
    return TEXTSYNC_ERROR_OK;
  } catch (const nlohmann::json::exception &e) {
    spdlog::warn("sync: json parser failed. error: {}", e.what());
    return TEXTSYNC_ERROR_MALFORMED_MESSAGE;
  }
}

std::string make_text_update(const document_snapshot &state,
                             uint32_t origin_session) {
  syncmsg_desc msg;
  msg.type = SyncMsgType::TEXT_UPDATE;
  msg.content = state.content;
  msg.user_id = state.last_editor;
  msg.timestamp = state.last_modified;
  msg.version = state.version;
  msg.session_id = origin_session;
  return dump_json(msg);
}

std::string make_initial_state(const document_snapshot &state,
                               size_t user_count, uint32_t session_id) {
  syncmsg_desc msg;
  msg.type = SyncMsgType::INITIAL_STATE;
  msg.content = state.content;
  msg.timestamp = state.last_modified;
  msg.version = state.version;
  msg.session_id = session_id;
  msg.user_count = user_count;
  return dump_json(msg);
}

std::string make_user_count_update(size_t user_count) {
  syncmsg_desc msg;
  msg.type = SyncMsgType::USER_COUNT_UPDATE;
  msg.user_count = user_count;
  return dump_json(msg);
}

std::string dump_json(const nlohmann::json &j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace textsync
