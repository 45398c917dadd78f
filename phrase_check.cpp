#include <iostream>
#include <string>
#include <vector>

#include "phrasecheck/config.hpp"
#include "phrasecheck/engine.hpp"
#include "phrasecheck/keyword_source.hpp"

// Scores phrases read from stdin against a keyword file, one JSON report per line.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: phrase_check <KEYWORDS_FILE> [min_similarity] [--no-partial]\n"
                  << "Example: echo 'theyre acount' | phrase_check keywords.txt 0.5\n";
        return 1;
    }

    phrasecheck::Config cfg;
    cfg.keywords_path = argv[1];

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--no-partial") {
            cfg.enable_partial_matching = false;
            continue;
        }
        try {
            cfg.min_similarity = std::stod(arg);
        } catch (const std::exception&) {
            std::cerr << "Invalid min_similarity: " << arg << "\n";
            return 1;
        }
    }
    cfg.sanitize();

    phrasecheck::Engine engine(cfg);
    phrasecheck::FileKeywordSource source(cfg.keywords_path);
    if (!engine.reload(source)) {
        std::cerr << "Failed to load keywords from: " << cfg.keywords_path << "\n";
        return 1;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        auto j = engine.check(line, cfg.min_similarity, cfg.enable_partial_matching);
        std::cout << j.dump() << "\n";
    }
    return 0;
}
