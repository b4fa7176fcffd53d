#include "port_discovery.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ask_continue {
namespace {

static bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::optional<int> ReadMarkerPort(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return std::nullopt;
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;
  if (!j.contains("port") || !j["port"].is_number_integer()) return std::nullopt;
  const auto port = j["port"].get<long long>();
  if (port <= 0 || port > 65535) return std::nullopt;
  return static_cast<int>(port);
}

}  // namespace

std::vector<int> DiscoverCompanionPorts(const std::string& dir, int default_port) {
  std::vector<int> ports;
  std::error_code ec;
  const std::filesystem::path root(dir);
  if (!dir.empty() && std::filesystem::is_directory(root, ec)) {
    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code fec;
      if (!it->is_regular_file(fec)) continue;
      if (!EndsWith(it->path().filename().string(), ".port")) continue;
      files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());
    for (const auto& f : files) {
      auto port = ReadMarkerPort(f);
      if (port) ports.push_back(*port);
    }
  }
  if (ports.empty()) ports.push_back(default_port);
  return ports;
}

}  // namespace ask_continue
