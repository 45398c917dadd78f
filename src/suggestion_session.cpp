#include "phrasecheck/suggestion_session.hpp"

#include <iostream>

namespace phrasecheck {

const char* state_name(SuggestionState s) {
    return s == SuggestionState::Pending ? "pending" : "idle";
}

const PendingSuggestion* SuggestionSession::current() const {
    return pending() ? &current_ : nullptr;
}

bool SuggestionSession::consume_force() {
    bool was = force_;
    force_ = false;
    return was;
}

uint64_t SuggestionSession::open(std::string phrase, std::vector<std::string> ranked, std::string context) {
    current_.id = next_id_++;
    current_.phrase = std::move(phrase);
    current_.ranked = std::move(ranked);
    current_.context = std::move(context);
    state_ = SuggestionState::Pending;
    return current_.id;
}

uint64_t SuggestionSession::reset() {
    if (!pending()) return 0;
    uint64_t id = current_.id;
    state_ = SuggestionState::Idle;
    current_ = PendingSuggestion{};
    return id;
}

std::optional<PendingSuggestion> SuggestionSession::resolve(uint64_t id, const char* action) {
    if (!pending() || current_.id != id) {
        std::cerr << "[session] " << action << " for suggestion " << id
                  << " ignored (outstanding: " << (pending() ? std::to_string(current_.id) : "none")
                  << ")\n";
        return std::nullopt;
    }

    PendingSuggestion done = std::move(current_);
    current_ = PendingSuggestion{};
    state_ = SuggestionState::Idle;
    return done;
}

} // namespace phrasecheck
