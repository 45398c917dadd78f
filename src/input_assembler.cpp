#include "phrasecheck/input_assembler.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_set>

#include "phrasecheck/textutil.hpp"

namespace phrasecheck {

namespace {

bool has_digit(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) { return std::isdigit((unsigned char)c) != 0; });
}

// Length of a UTF-8 sequence from its lead byte, 0 for a continuation byte.
size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// One printable character: an ASCII graphic char or a single UTF-8 code point.
bool is_single_printable(const std::string& key) {
    if (key.empty()) return false;
    unsigned char lead = (unsigned char)key[0];
    if (lead < 0x80) return key.size() == 1 && std::isprint(lead) && lead != ' ';
    size_t n = utf8_length(lead);
    if (n < 2 || n != key.size()) return false;
    for (size_t i = 1; i < n; i++) {
        if (((unsigned char)key[i] & 0xC0) != 0x80) return false;
    }
    return true;
}

void pop_last_char(std::string& s) {
    while (!s.empty()) {
        unsigned char c = (unsigned char)s.back();
        s.pop_back();
        if ((c & 0xC0) != 0x80) break;
    }
}

} // namespace

InputAssembler::InputAssembler(const Engine& engine,
                               const Config& cfg,
                               EventChannel<SuggestionReady>& suggestions,
                               CorrectionApplier& applier,
                               TimeoutScheduler* timeouts,
                               ContextProbe probe)
    : engine_(engine),
      cfg_(cfg),
      suggestions_(suggestions),
      applier_(applier),
      timeouts_(timeouts),
      probe_(std::move(probe)),
      window_((size_t)std::max(1, cfg.max_phrase_length)),
      recent_((size_t)std::max(0, cfg.recent_phrases_size)) {}

bool InputAssembler::is_word_boundary(const std::string& key) {
    static const std::unordered_set<std::string> boundaries = {
        "space", "enter", "return", "tab", " ", "\t", "\n", "\r",
        ".", ",", "?", "!", ";", ":",
        "(", ")", "[", "]", "{", "}", "<", ">", "\"", "`"
    };
    return boundaries.count(key) > 0;
}

bool InputAssembler::is_deletion(const std::string& key) {
    return key == "backspace";
}

void InputAssembler::on_key(const KeyEvent& e) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::string& key = e.name;

    // Punctuation is printable too, so boundaries are checked first
    if (is_word_boundary(key)) {
        complete_word_locked();
        return;
    }

    if (is_deletion(key)) {
        pop_last_char(typed_);
        return;
    }

    if (key.size() == 1 && std::isdigit((unsigned char)key[0])) {
        // numbers never take part in a correctable phrase
        typed_.clear();
        return;
    }

    if (is_single_printable(key)) typed_ += key;
}

void InputAssembler::complete_word_locked() {
    if (typed_.empty()) return;

    std::string word = trim(typed_);
    typed_.clear();
    if (word.empty() || has_digit(word)) return;

    window_.push(word);

    if (!session_.force_requested()) {
        uint64_t stale = session_.reset();
        if (stale != 0) {
            cancel_timeout_locked();
            std::cout << "[assembler] suggestion #" << stale << " dropped, new word typed\n";
        }
    }

    check_combinations_locked(false);
}

bool InputAssembler::check_combinations_locked(bool forced) {
    size_t top = std::min(MAX_NGRAM, window_.size());

    // Longer windows are more specific, so they are tried first
    for (size_t n = top; n >= 1; n--) {
        std::string phrase = window_.tail(n);
        if (phrase.size() < (size_t)cfg_.min_phrase_length) continue;
        if (!forced && recent_.contains(normalize_text(phrase))) continue;

        Submit r = submit_locked(phrase);
        if (r == Submit::Emitted) return true;
        if (r == Submit::Suppressed) return false;
    }
    return false;
}

InputAssembler::Submit InputAssembler::on_phrase_completed(const std::string& phrase) {
    std::lock_guard<std::mutex> lock(mtx_);
    return submit_locked(phrase);
}

InputAssembler::Submit InputAssembler::submit_locked(const std::string& phrase) {
    // Never two suggestions at once
    if (session_.should_suppress()) return Submit::Suppressed;
    session_.consume_force();

    std::vector<std::string> ranked = engine_.suggest(phrase);
    if (ranked.empty()) return Submit::NoMatch;

    std::string context;
    if (probe_) {
        try {
            context = probe_();
        } catch (const std::exception& e) {
            std::cerr << "[assembler] context probe failed: " << e.what() << "\n";
        }
    }

    // A forced resubmission replaces the outstanding suggestion
    if (session_.pending()) cancel_timeout_locked();

    uint64_t id = session_.open(phrase, ranked, context);
    recent_.add(normalize_text(phrase));

    std::cout << "[match] #" << id << " '" << phrase << "' -> " << ranked.size() << " suggestions\n";

    SuggestionReady ev;
    ev.id = id;
    ev.phrase = phrase;
    ev.ranked = std::move(ranked);
    ev.context = std::move(context);
    if (!suggestions_.push(std::move(ev))) {
        std::cerr << "[assembler] suggestion channel closed, #" << id << " not delivered\n";
    }

    if (timeouts_ && cfg_.suggestion_timeout.count() > 0) {
        timeout_ticket_ = timeouts_->schedule(cfg_.suggestion_timeout, [this, id] { expire(id); });
    }
    return Submit::Emitted;
}

void InputAssembler::cancel_timeout_locked() {
    if (timeouts_ && timeout_ticket_ != 0) timeouts_->cancel(timeout_ticket_);
    timeout_ticket_ = 0;
}

bool InputAssembler::accept(uint64_t id, const std::string& correction) {
    ApplyCorrection req;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto done = session_.accept(id);
        if (!done) return false;

        cancel_timeout_locked();
        typed_.clear();
        window_.clear();

        req.id = id;
        req.original = std::move(done->phrase);
        req.correction = correction;
        req.context = std::move(done->context);
    }

    // Buffers stay cleared even when the replacement fails; no retry
    try {
        applier_.apply(req);
    } catch (const ApplicationError& e) {
        std::cerr << "[apply] correction #" << id << " '" << req.original << "' -> '"
                  << req.correction << "' failed: " << e.what() << "\n";
    }
    return true;
}

bool InputAssembler::ignore(uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto done = session_.ignore(id);
    if (!done) return false;

    cancel_timeout_locked();
    for (const auto& w : split_words(done->phrase)) window_.remove_first(w);

    std::cout << "[assembler] suggestion #" << id << " ignored\n";
    return true;
}

bool InputAssembler::expire(uint64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto done = session_.expire(id);
    if (!done) return false;

    cancel_timeout_locked();
    std::cout << "[assembler] suggestion #" << id << " timed out\n";
    return true;
}

bool InputAssembler::force_resubmit() {
    std::lock_guard<std::mutex> lock(mtx_);
    session_.request_force();
    bool emitted = check_combinations_locked(true);

    // The override is one-shot: disarm it when no window was submitted
    if (session_.consume_force()) {
        std::cout << "[assembler] force resubmit had nothing to submit\n";
    }
    return emitted;
}

std::string InputAssembler::typed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return typed_;
}

std::vector<std::string> InputAssembler::window() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return window_.words();
}

SuggestionState InputAssembler::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return session_.state();
}

uint64_t InputAssembler::pending_id() const {
    std::lock_guard<std::mutex> lock(mtx_);
    const PendingSuggestion* p = session_.current();
    return p ? p->id : 0;
}

size_t InputAssembler::recent_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return recent_.size();
}

} // namespace phrasecheck
