// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_SERVICES_SYNC_MESSAGES_H_
#define TEXTSYNC_SERVICES_SYNC_MESSAGES_H_

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "document_state.h"

namespace textsync {

namespace {
// 消息中content以外的字段所预留的长度，64KB
constexpr static size_t kMessageFieldsReserve = 64 << 10;
// 未提供user_id的编辑者
#define kAnonymousUser "anonymous"
} // namespace

enum class SyncMsgType { UNKNOW, TEXT_UPDATE, INITIAL_STATE, USER_COUNT_UPDATE };
NLOHMANN_JSON_SERIALIZE_ENUM(SyncMsgType,
                             {{SyncMsgType::UNKNOW, nullptr},
                              {SyncMsgType::TEXT_UPDATE, "text_update"},
                              {SyncMsgType::INITIAL_STATE, "initial_state"},
                              {SyncMsgType::USER_COUNT_UPDATE,
                               "user_count_update"}});

// 流式通道上传输的消息描述
struct syncmsg_desc {
  SyncMsgType type{SyncMsgType::UNKNOW};
  std::string content;
  std::optional<std::string> user_id;
  std::optional<std::string> timestamp;
  uint64_t version{0};
  uint32_t session_id{0};
  size_t user_count{0};
};

// 只解析客户端可以发送的字段，content缺失或类型错误时抛出json异常
void from_json(const nlohmann::json &j, syncmsg_desc &msg);
void to_json(nlohmann::json &j, const syncmsg_desc &msg);

// 解析客户端提交的编辑请求，require_type为true时要求type字段为text_update
// 成功时填充edit的content与user_id，timestamp仅在客户端提供时填充
// 返回TEXTSYNC_ERROR_OK或TEXTSYNC_ERROR_MALFORMED_MESSAGE
int parse_edit_request(const std::string &data, bool require_type,
                       edit_event *edit);

// 编辑被接受后广播给所有会话的消息
std::string make_text_update(const document_snapshot &state,
                             uint32_t origin_session);

// 会话加入时发送给该会话的初始状态
std::string make_initial_state(const document_snapshot &state,
                               size_t user_count, uint32_t session_id);

std::string make_user_count_update(size_t user_count);

// 包含max_content_bytes字节内容的消息编码后的最大长度
// JSON转义时控制字符会扩展为6个字节
inline size_t max_encoded_message_bytes(size_t max_content_bytes) {
  return max_content_bytes * 6 + kMessageFieldsReserve;
}

// 序列化时遇到非法UTF-8字节以U+FFFD替换，避免持久化文件中的任意字节导致异常
std::string dump_json(const nlohmann::json &j);

} // namespace textsync

#endif
