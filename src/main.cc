// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include <cstdlib>

#include <spdlog/spdlog.h>

#include "config/config.h"
#include "core/server.h"
#include "errors.h"
#include "services/sync/persistent_store.h"
#include "services/sync/sync_hub.h"
#include "utils/helpers.h"

int main(int argc, char *argv[]) {
  textsync::ServerConfig config;
  int ret = textsync::LoadConfig(argc, argv, &config);
  if (ret == textsync::kConfigHelp)
    return EXIT_SUCCESS;
  if (ret != textsync::kConfigOk)
    return EXIT_FAILURE;
  spdlog::set_level(spdlog::level::from_str(config.log_level));

  textsync::FileStore store(config.text_file);
  std::string content;
  // 读取失败时以空文档启动，原因已由存储层记录
  if (store.Load(&content) != textsync::TEXTSYNC_ERROR_OK)
    content.clear();

  textsync::SyncHub hub(&store, std::move(content), textsync::get_datetime(),
                        config.max_content_bytes);
  textsync::TextSyncServer server(config, &hub);
  if (server.Run() < 0) {
    spdlog::critical("event loop exited unexpectedly");
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
