#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace ask_continue {

struct BridgeConfig {
  std::string companion_host = "127.0.0.1";
  int default_companion_port = 23983;
  std::string port_file_dir;

  std::string callback_host = "127.0.0.1";
  int callback_port_start = 23984;
  int callback_bind_attempts = 50;

  int max_connect_rounds = 5;
  std::chrono::milliseconds retry_interval{5000};
  int ask_timeout_seconds = 5;
};

BridgeConfig DefaultBridgeConfig();

std::string DefaultPortFileDir();

std::string TruncateForLog(std::string s, size_t max_chars);

}  // namespace ask_continue
