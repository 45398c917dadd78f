#pragma once

#include <string>
#include <unordered_map>

#include "types.hpp"

namespace phrasecheck {

// Parses KEY=VALUE lines from a .env file ('#' comments, optional quotes).
// A missing file yields an empty map.
std::unordered_map<std::string, std::string> load_env_file(const fs::path& path);

} // namespace phrasecheck
