// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_INCLUDE_SERVICE_HANDLER_H_
#define TEXTSYNC_INCLUDE_SERVICE_HANDLER_H_

#include <string>
#include <unordered_map>
#include <vector>

namespace textsync {

class TcpConnection;

// 流式通道上的业务处理接口，WebSocket握手完成后由处理器创建
class ServiceHandler {
public:
  explicit ServiceHandler(TcpConnection *connection)
      : connection_(connection) {}
  virtual ~ServiceHandler() = default;

  // 解析握手请求携带的查询参数，缺少必要参数时返回false
  virtual bool parse_parameters(
      const std::unordered_map<std::string, std::vector<std::string>>
          &args) = 0;

  // 参数解析完成后开始提供服务，失败时返回false
  virtual bool start() = 0;

  // 连接关闭，停止提供服务，重复调用无副作用
  virtual void stop() = 0;

  // 处理一条完整的消息，返回需要回复给客户端的数据，为空则不回复
  virtual std::string handle(std::string data) = 0;

protected:
  TcpConnection *connection_;
};

} // namespace textsync

#endif
