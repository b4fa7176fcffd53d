#include "config.hpp"

#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

namespace ask_continue {

std::string DefaultPortFileDir() {
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec || tmp.empty()) tmp = "/tmp";
  return (tmp / "ask-continue-ports").string();
}

BridgeConfig DefaultBridgeConfig() {
  BridgeConfig cfg;
  cfg.port_file_dir = DefaultPortFileDir();
  return cfg;
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

}  // namespace ask_continue
