#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace phrasecheck {

enum class SuggestionState {
    Idle,
    Pending
};

const char* state_name(SuggestionState s);

struct PendingSuggestion {
    uint64_t id = 0;
    std::string phrase;
    std::vector<std::string> ranked;
    std::string context;
};

// Tracks whether a suggestion is outstanding.
//
// Only one of accept / ignore / expire can resolve a given suggestion: each
// checks that the id is the outstanding one and moves Pending -> Idle.
// Later calls with the same id return nullopt. Not synchronized; the owner
// (InputAssembler) serializes access.
class SuggestionSession {
public:
    SuggestionState state() const { return state_; }
    bool pending() const { return state_ == SuggestionState::Pending; }

    // Outstanding suggestion, or nullptr when Idle.
    const PendingSuggestion* current() const;

    // True when a new completion must be dropped.
    bool should_suppress() const { return pending() && !force_; }

    // Arms a one-shot bypass of the Pending check.
    void request_force() { force_ = true; }
    bool force_requested() const { return force_; }

    // Clears the force flag, returning whether it was set.
    bool consume_force();

    // Moves to Pending with a fresh id (replacing any outstanding suggestion).
    uint64_t open(std::string phrase, std::vector<std::string> ranked, std::string context);

    std::optional<PendingSuggestion> accept(uint64_t id) { return resolve(id, "accept"); }
    std::optional<PendingSuggestion> ignore(uint64_t id) { return resolve(id, "ignore"); }
    std::optional<PendingSuggestion> expire(uint64_t id) { return resolve(id, "timeout"); }

    // Drops the outstanding suggestion without a resolution (Pending -> Idle).
    // Returns the invalidated id, 0 when there was none.
    uint64_t reset();

private:
    SuggestionState state_ = SuggestionState::Idle;
    PendingSuggestion current_;
    uint64_t next_id_ = 1;
    bool force_ = false;

    std::optional<PendingSuggestion> resolve(uint64_t id, const char* action);
};

} // namespace phrasecheck
