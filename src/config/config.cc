// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "config.h"

#include <iostream>
#include <unordered_map>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

namespace textsync {

namespace po = boost::program_options;

namespace {

// 环境变量名到选项名的映射
const std::unordered_map<std::string, std::string> kEnvOptions = {
    {"SERVER_HOST", "host"},
    {"SERVER_PORT", "port"},
    {"WS_HOST", "ws-host"},
    {"WS_PORT", "ws-port"},
    {"TEXT_FILE", "text-file"},
    {"LOG_LEVEL", "log-level"},
    {"MAX_CONTENT_BYTES", "max-content-bytes"},
    {"WORKER_THREADS", "threads"}};

const char *const kLogLevels[] = {"trace", "debug",   "info",     "warn",
                                  "warning", "err",   "error",    "critical",
                                  "off"};

bool valid_port(int port) { return port > 0 && port <= 65535; }

bool valid_log_level(const std::string &level) {
  for (const char *name : kLogLevels) {
    if (level == name)
      return true;
  }
  return false;
}

} // namespace

std::vector<listen_address> ServerConfig::ListenAddresses() const {
  std::vector<listen_address> addresses{{host, port}};
  std::string stream_host = ws_host.empty() ? host : ws_host;
  uint16_t stream_port = ws_port ? ws_port : port;
  if (stream_host != host || stream_port != port) {
    addresses.push_back({std::move(stream_host), stream_port});
  }
  return addresses;
}

int LoadConfig(int argc, const char *const argv[], ServerConfig *config) {
  int port = config->port;
  int ws_port = config->ws_port;
  uint64_t max_content_bytes = config->max_content_bytes;
  unsigned int threads = config->worker_threads;

  po::options_description desc("textsync server options");
  // clang-format off
  desc.add_options()
    ("help,h", "print this help message")
    ("host", po::value<std::string>(&config->host)->default_value(config->host),
     "listening address of the request/response surface (SERVER_HOST)")
    ("port,p", po::value<int>(&port)->default_value(port),
     "listening port of the request/response surface (SERVER_PORT)")
    ("ws-host", po::value<std::string>(&config->ws_host),
     "listening address of the streaming channel, defaults to --host (WS_HOST)")
    ("ws-port", po::value<int>(&ws_port),
     "listening port of the streaming channel, defaults to --port (WS_PORT)")
    ("text-file,f",
     po::value<std::string>(&config->text_file)->default_value(config->text_file),
     "file holding the shared document (TEXT_FILE)")
    ("log-level,l",
     po::value<std::string>(&config->log_level)->default_value(config->log_level),
     "trace, debug, info, warn, error, critical or off (LOG_LEVEL)")
    ("max-content-bytes",
     po::value<uint64_t>(&max_content_bytes)->default_value(max_content_bytes),
     "largest accepted document in bytes (MAX_CONTENT_BYTES)")
    ("threads,t", po::value<unsigned int>(&threads),
     "number of worker threads, defaults to hardware concurrency (WORKER_THREADS)");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    po::store(po::parse_environment(desc,
                                    [](const std::string &name) -> std::string {
                                      auto it = kEnvOptions.find(name);
                                      if (it != kEnvOptions.end())
                                        return it->second;
                                      return "";
                                    }),
              vm);
    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return kConfigHelp;
    }
    po::notify(vm);
  } catch (const po::error &e) {
    spdlog::error("config: {}", e.what());
    return kConfigError;
  }

  if (!valid_port(port)) {
    spdlog::error("config: invalid port: {}", port);
    return kConfigError;
  }
  if (vm.count("ws-port") && !valid_port(ws_port)) {
    spdlog::error("config: invalid ws port: {}", ws_port);
    return kConfigError;
  }
  if (!valid_log_level(config->log_level)) {
    spdlog::error("config: invalid log level: {}", config->log_level);
    return kConfigError;
  }
  if (config->text_file.empty()) {
    spdlog::error("config: text file path must not be empty");
    return kConfigError;
  }
  if (max_content_bytes == 0) {
    spdlog::error("config: max content bytes must be positive");
    return kConfigError;
  }
  if (vm.count("threads") && threads == 0) {
    spdlog::error("config: worker threads must be positive");
    return kConfigError;
  }

  config->port = static_cast<uint16_t>(port);
  config->ws_port = static_cast<uint16_t>(ws_port);
  config->max_content_bytes = static_cast<size_t>(max_content_bytes);
  config->worker_threads = threads;
  return kConfigOk;
}

} // namespace textsync
