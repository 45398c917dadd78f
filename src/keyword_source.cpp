#include "phrasecheck/keyword_source.hpp"

#include <fstream>

#include "phrasecheck/textutil.hpp"

namespace phrasecheck {

std::vector<std::string> FileKeywordSource::load() {
    if (!fs::exists(path_)) {
        throw LoadError("keyword file not found: " + path_.string());
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw LoadError("cannot open keyword file: " + path_.string());
    }

    std::vector<std::string> out;
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        // UTF-8 BOM on the first line
        if (first && line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        first = false;

        std::string kw = trim(line);
        if (!kw.empty()) out.push_back(std::move(kw));
    }

    if (in.bad()) {
        throw LoadError("read error in keyword file: " + path_.string());
    }
    return out;
}

} // namespace phrasecheck
