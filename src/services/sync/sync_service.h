// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_SERVICES_SYNC_SYNC_SERVICE_H_
#define TEXTSYNC_SERVICES_SYNC_SYNC_SERVICE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "service_handler.h"

namespace textsync {

class Session;
class SyncHub;

// 流式通道上的同步业务：加入同步中心，并将客户端的编辑提交给同步中心
// session_id即所属连接的id，编辑广播时作为来源会话
class SyncService : public ServiceHandler {
public:
  SyncService(TcpConnection *connection, uint32_t session_id, SyncHub *hub);
  ~SyncService();

  // 可选参数user_id，多次出现时取第一个
  bool parse_parameters(
      const std::unordered_map<std::string, std::vector<std::string>> &args)
      override;

  bool start() override;

  void stop() override;

  std::string handle(std::string data) override;

protected:
  // 创建代表该连接的会话，默认通过跨线程消息投递给所属连接
  virtual std::shared_ptr<Session>
  create_session(uint32_t session_id, std::optional<std::string> user_id);

private:
  uint32_t session_id_;
  SyncHub *hub_;
  std::optional<std::string> user_id_;
  std::shared_ptr<Session> session_;
  bool joined_{false};
};

} // namespace textsync

#endif
