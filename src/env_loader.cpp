#include "phrasecheck/env_loader.hpp"

#include <fstream>
#include <iostream>

#include "phrasecheck/textutil.hpp"

namespace phrasecheck {

std::unordered_map<std::string, std::string> load_env_file(const fs::path& path) {
    std::unordered_map<std::string, std::string> vars;

    std::ifstream in(path);
    if (!in.is_open()) return vars;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Strip matching surrounding quotes
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) vars[key] = value;
    }

    std::cout << "[env] loaded " << vars.size() << " variables from " << path << "\n";
    return vars;
}

} // namespace phrasecheck
