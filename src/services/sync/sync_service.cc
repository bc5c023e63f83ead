// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "sync_service.h"

#include <spdlog/spdlog.h>

#include "errors.h"
#include "messages.h"
#include "protocol/websocket/websocket_session.h"
#include "sync_hub.h"

namespace textsync {

SyncService::SyncService(TcpConnection *connection, uint32_t session_id,
                         SyncHub *hub)
    : ServiceHandler(connection), session_id_(session_id), hub_(hub) {}

SyncService::~SyncService() { stop(); }

bool SyncService::parse_parameters(
    const std::unordered_map<std::string, std::vector<std::string>> &args) {
  auto it = args.find("user_id");
  if (it != args.end() && !it->second.empty() && !it->second.front().empty())
    user_id_ = it->second.front();
  return true;
}

std::shared_ptr<Session>
SyncService::create_session(uint32_t session_id,
                            std::optional<std::string> user_id) {
  return std::make_shared<WsSession>(session_id, std::move(user_id));
}

bool SyncService::start() {
  session_ = create_session(session_id_, user_id_);
  joined_ = hub_->Join(session_);
  return joined_;
}

void SyncService::stop() {
  if (session_)
    session_->Close();
  if (!joined_)
    return;
  joined_ = false;
  hub_->Leave(session_id_);
}

std::string SyncService::handle(std::string data) {
  spdlog::debug("sync: conn_id: {} got message of {} bytes", session_id_,
                data.size());
  edit_event edit;
  if (parse_edit_request(data, true, &edit) != TEXTSYNC_ERROR_OK) {
    spdlog::warn("sync: conn_id: {} drop message. error: {}", session_id_,
                 error_message(TEXTSYNC_ERROR_MALFORMED_MESSAGE));
    return "";
  }
  if (!edit.user_id)
    edit.user_id = user_id_;
  // 流式通道上的编辑使用服务器接收时间
  edit.timestamp.clear();
  edit.origin_session = session_id_;
  // 被拒绝的编辑已由同步中心记录，流式通道上不回复错误
  if (hub_->OnEdit(std::move(edit)) != TEXTSYNC_ERROR_OK)
    spdlog::debug("sync: conn_id: {} edit rejected", session_id_);
  return "";
}

} // namespace textsync
