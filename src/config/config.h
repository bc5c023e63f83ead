// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_CONFIG_CONFIG_H_
#define TEXTSYNC_CONFIG_CONFIG_H_

#include <cstdint>
#include <string>
#include <vector>

namespace textsync {

struct listen_address {
  std::string host;
  uint16_t port;
};

struct ServerConfig {
  // 请求/响应接口的监听地址
  std::string host{"0.0.0.0"};
  uint16_t port{1133};
  // 流式通道的监听地址，未配置时与上面相同
  std::string ws_host;
  uint16_t ws_port{0};
  std::string text_file{"shared_text.txt"};
  std::string log_level{"info"};
  size_t max_content_bytes{1 << 20};
  // 0代表使用硬件线程数
  unsigned int worker_threads{0};

  // 去重后的监听地址列表
  std::vector<listen_address> ListenAddresses() const;
};

enum config_status_t {
  kConfigOk = 0,
  // 打印了帮助信息，进程应正常退出
  kConfigHelp,
  kConfigError
};

// 依次从命令行参数、环境变量和内置默认值加载配置，命令行优先级最高
int LoadConfig(int argc, const char *const argv[], ServerConfig *config);

} // namespace textsync

#endif
