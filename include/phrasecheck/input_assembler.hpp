#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "correction_applier.hpp"
#include "engine.hpp"
#include "event_channel.hpp"
#include "phrase_window.hpp"
#include "suggestion_session.hpp"
#include "timeout_scheduler.hpp"
#include "types.hpp"

namespace phrasecheck {

// Turns key events into words, words into n-gram candidates, and candidates
// into SuggestionReady events.
//
// All state (typed characters, phrase window, recent phrases, session) is
// guarded by one mutex, so key handling and accept / ignore / timeout coming
// from other threads are serialized.
class InputAssembler {
public:
    static constexpr size_t MAX_NGRAM = 4;

    // Returns an opaque handle of the focused target (window title, id, ...).
    using ContextProbe = std::function<std::string()>;

    enum class Submit {
        Suppressed,
        NoMatch,
        Emitted
    };

    // The scheduler, when given, must be stopped before the assembler dies.
    InputAssembler(const Engine& engine,
                   const Config& cfg,
                   EventChannel<SuggestionReady>& suggestions,
                   CorrectionApplier& applier,
                   TimeoutScheduler* timeouts = nullptr,
                   ContextProbe probe = {});

    void on_key(const KeyEvent& e);

    // Scores one phrase completion and emits a suggestion when it matches.
    Submit on_phrase_completed(const std::string& phrase);

    // Resolutions of suggestion `id`. False when id is not outstanding.
    bool accept(uint64_t id, const std::string& correction);
    bool ignore(uint64_t id);
    bool expire(uint64_t id);

    // Arms a one-shot Pending bypass and re-runs the combination check on the
    // current window. True if a suggestion was emitted.
    bool force_resubmit();

    std::string typed() const;
    std::vector<std::string> window() const;
    SuggestionState state() const;
    uint64_t pending_id() const;
    size_t recent_count() const;

    static bool is_word_boundary(const std::string& key);
    static bool is_deletion(const std::string& key);

private:
    const Engine& engine_;
    Config cfg_;
    EventChannel<SuggestionReady>& suggestions_;
    CorrectionApplier& applier_;
    TimeoutScheduler* timeouts_;
    ContextProbe probe_;

    mutable std::mutex mtx_;
    std::string typed_;
    PhraseWindow window_;
    RecentPhrases recent_;
    SuggestionSession session_;
    TimeoutScheduler::Ticket timeout_ticket_ = 0;

    void complete_word_locked();
    bool check_combinations_locked(bool forced);
    Submit submit_locked(const std::string& phrase);
    void cancel_timeout_locked();
};

} // namespace phrasecheck
