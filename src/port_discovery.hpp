#pragma once

#include <string>
#include <vector>

namespace ask_continue {

// Reads `<dir>/*.port` marker files ({"port": N, ...}) and returns the ports
// they name, ordered by file name. Unreadable or invalid files are skipped.
// Falls back to {default_port} when nothing valid is found.
std::vector<int> DiscoverCompanionPorts(const std::string& dir, int default_port);

}  // namespace ask_continue
