#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "phrasecheck/config.hpp"
#include "phrasecheck/correction_applier.hpp"
#include "phrasecheck/engine.hpp"
#include "phrasecheck/event_channel.hpp"
#include "phrasecheck/input_assembler.hpp"
#include "phrasecheck/timeout_scheduler.hpp"

using namespace phrasecheck;
using namespace std::chrono_literals;

namespace {

struct RecordingApplier : public CorrectionApplier {
    std::vector<ApplyCorrection> seen;
    bool fail = false;

    void apply(const ApplyCorrection& request) override {
        seen.push_back(request);
        if (fail) throw ApplicationError("target window is gone");
    }
};

const std::vector<std::string> kKeywords = {
    "their account", "there is", "they're going", "machine learning"
};

} // namespace

class InputAssemblerTest : public ::testing::Test {
protected:
    Config cfg;
    std::unique_ptr<Engine> engine;
    EventChannel<SuggestionReady> events;
    RecordingApplier applier;
    std::unique_ptr<InputAssembler> assembler;

    void SetUp() override {
        cfg.suggestion_timeout = 0ms;
    }

    void start(const std::vector<std::string>& keywords,
               TimeoutScheduler* timeouts = nullptr,
               InputAssembler::ContextProbe probe = {}) {
        engine = std::make_unique<Engine>(cfg);
        engine->load(keywords);
        assembler = std::make_unique<InputAssembler>(*engine, cfg, events, applier, timeouts, probe);
    }

    void type(const std::string& text) {
        for (char c : text) {
            std::string name = c == ' ' ? "space" : std::string(1, c);
            assembler->on_key(KeyEvent{name});
        }
    }
};

TEST_F(InputAssemblerTest, MisspelledPhraseSurfacesClosestKeywords) {
    start(kKeywords);
    type("...theyre acount ");

    auto out = events.drain();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].phrase, "theyre");

    const auto& last = out.back();
    EXPECT_EQ(last.phrase, "theyre acount");
    ASSERT_GE(last.ranked.size(), 2u);
    EXPECT_EQ(last.ranked[0], "their account");
    EXPECT_EQ(last.ranked[1], "they're going");
    EXPECT_EQ(std::count(last.ranked.begin(), last.ranked.end(), "theyre acount"), 0);
    EXPECT_EQ(std::count(last.ranked.begin(), last.ranked.end(), "machine learning"), 0);
    EXPECT_EQ(assembler->state(), SuggestionState::Pending);
}

TEST_F(InputAssemblerTest, ExactBigramFallsBackToPartialUnigram) {
    start({"machine learning"});

    type("machine ");
    auto first = events.drain();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].phrase, "machine");
    EXPECT_EQ(first[0].ranked, (std::vector<std::string>{"machine learning"}));

    // "machine learning" is the keyword itself; only "learning" produces a suggestion
    type("learning extra");
    auto second = events.drain();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].phrase, "learning");
    EXPECT_EQ(second[0].ranked, (std::vector<std::string>{"machine learning"}));
    EXPECT_EQ(assembler->typed(), "extra");
}

TEST_F(InputAssemblerTest, DigitsInvalidateWordInProgress) {
    start(kKeywords);

    type("c3 ");
    EXPECT_TRUE(assembler->window().empty());
    EXPECT_EQ(events.size(), 0u);

    type("ab3cd ");
    EXPECT_EQ(assembler->window(), (std::vector<std::string>{"cd"}));
}

TEST_F(InputAssemblerTest, BackspaceAndIgnoredKeys) {
    start(kKeywords);

    type("cat");
    assembler->on_key(KeyEvent{"backspace"});
    EXPECT_EQ(assembler->typed(), "ca");

    assembler->on_key(KeyEvent{"shift"});
    assembler->on_key(KeyEvent{"ctrl"});
    assembler->on_key(KeyEvent{"f5"});
    EXPECT_EQ(assembler->typed(), "ca");

    assembler->on_key(KeyEvent{"backspace"});
    assembler->on_key(KeyEvent{"backspace"});
    assembler->on_key(KeyEvent{"backspace"});
    EXPECT_EQ(assembler->typed(), "");
}

TEST_F(InputAssemblerTest, PunctuationEndsWord) {
    start(kKeywords);
    type("hello,");
    EXPECT_EQ(assembler->window(), (std::vector<std::string>{"hello"}));
    assembler->on_key(KeyEvent{"enter"});
    EXPECT_EQ(assembler->window().size(), 1u);
}

TEST_F(InputAssemblerTest, WindowEvictsOldestWord) {
    cfg.max_phrase_length = 3;
    start(kKeywords);

    type("one two three four ");
    EXPECT_EQ(assembler->window(), (std::vector<std::string>{"two", "three", "four"}));
}

TEST_F(InputAssemblerTest, PendingSuppressesFurtherCompletions) {
    start(kKeywords);

    EXPECT_EQ(assembler->on_phrase_completed("theyre acount"), InputAssembler::Submit::Emitted);
    EXPECT_EQ(assembler->on_phrase_completed("there iz"), InputAssembler::Submit::Suppressed);
    EXPECT_EQ(assembler->on_phrase_completed("there iz"), InputAssembler::Submit::Suppressed);
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(InputAssemblerTest, ForceResubmitBypassesPendingOnce) {
    start(kKeywords);
    type("theyre acount ");
    uint64_t old_id = assembler->pending_id();
    events.drain();

    EXPECT_TRUE(assembler->force_resubmit());
    auto out = events.drain();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].phrase, "theyre acount");
    EXPECT_NE(out[0].id, old_id);
    EXPECT_EQ(assembler->pending_id(), out[0].id);

    EXPECT_FALSE(assembler->accept(old_id, "their account"));
    EXPECT_EQ(assembler->on_phrase_completed("there iz"), InputAssembler::Submit::Suppressed);
}

TEST_F(InputAssemblerTest, ForceResubmitWithNothingToSubmitDisarms) {
    start(kKeywords);
    EXPECT_EQ(assembler->on_phrase_completed("theyre acount"), InputAssembler::Submit::Emitted);
    uint64_t id = assembler->pending_id();

    // Window is empty, so there is nothing to resubmit
    EXPECT_FALSE(assembler->force_resubmit());
    EXPECT_EQ(assembler->on_phrase_completed("there iz"), InputAssembler::Submit::Suppressed);
    EXPECT_EQ(assembler->pending_id(), id);

    // Every window shorter than min_phrase_length
    type("ab ");
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);
    EXPECT_EQ(assembler->on_phrase_completed("theyre acount"), InputAssembler::Submit::Emitted);
    EXPECT_FALSE(assembler->force_resubmit());
    EXPECT_EQ(assembler->on_phrase_completed("there iz"), InputAssembler::Submit::Suppressed);
}

TEST_F(InputAssemblerTest, AcceptClearsBuffersAndAppliesCorrection) {
    start(kKeywords);
    type("theyre acount ");
    type("pa");
    uint64_t id = assembler->pending_id();
    ASSERT_NE(id, 0u);

    EXPECT_TRUE(assembler->accept(id, "their account"));
    ASSERT_EQ(applier.seen.size(), 1u);
    EXPECT_EQ(applier.seen[0].original, "theyre acount");
    EXPECT_EQ(applier.seen[0].correction, "their account");
    EXPECT_TRUE(assembler->window().empty());
    EXPECT_EQ(assembler->typed(), "");
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);

    // Only one resolution per suggestion
    EXPECT_FALSE(assembler->accept(id, "their account"));
    EXPECT_FALSE(assembler->ignore(id));
    EXPECT_FALSE(assembler->expire(id));
    EXPECT_EQ(applier.seen.size(), 1u);
}

TEST_F(InputAssemblerTest, FailedCorrectionStillClearsBuffers) {
    start(kKeywords);
    applier.fail = true;
    type("theyre acount ");

    EXPECT_TRUE(assembler->accept(assembler->pending_id(), "their account"));
    EXPECT_EQ(applier.seen.size(), 1u);
    EXPECT_TRUE(assembler->window().empty());
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);
}

TEST_F(InputAssemblerTest, IgnoreRemovesOnlyThePhraseWords) {
    start(kKeywords);
    type("aa bb cc dd ee ");

    auto out = events.drain();
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.back().phrase, "bb cc dd ee");

    EXPECT_TRUE(assembler->ignore(out.back().id));
    EXPECT_EQ(assembler->window(), (std::vector<std::string>{"aa"}));
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);
    EXPECT_TRUE(applier.seen.empty());
}

TEST_F(InputAssemblerTest, ExpireLeavesContextIntact) {
    start(kKeywords);
    type("theyre acount ");
    uint64_t id = assembler->pending_id();

    EXPECT_TRUE(assembler->expire(id));
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);
    EXPECT_EQ(assembler->window(), (std::vector<std::string>{"theyre", "acount"}));
    EXPECT_FALSE(assembler->accept(id, "their account"));
}

TEST_F(InputAssemblerTest, NewWordDropsStaleSuggestion) {
    start(kKeywords);
    type("theyre acount ");
    uint64_t id = assembler->pending_id();

    type("now ");
    EXPECT_NE(assembler->pending_id(), id);
    EXPECT_FALSE(assembler->accept(id, "their account"));
}

TEST_F(InputAssemblerTest, RecentlyOfferedPhraseIsNotOfferedAgain) {
    start({"their account"});
    type("theyre acount ");
    ASSERT_EQ(events.drain().size(), 2u);

    EXPECT_TRUE(assembler->ignore(assembler->pending_id()));
    EXPECT_TRUE(assembler->window().empty());

    type("theyre ");
    EXPECT_EQ(events.size(), 0u);
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);
    EXPECT_EQ(assembler->recent_count(), 2u);
}

TEST_F(InputAssemblerTest, ShortPhrasesAreNotSubmitted) {
    cfg.min_phrase_length = 20;
    start(kKeywords);
    type("theyre acount ");
    EXPECT_EQ(events.size(), 0u);
}

TEST_F(InputAssemblerTest, EmptyIndexNeverSuggests) {
    start({});
    type("theyre acount ");
    EXPECT_EQ(events.size(), 0u);
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);
}

TEST_F(InputAssemblerTest, ContextTravelsToCorrection) {
    start(kKeywords, nullptr, [] { return std::string("Untitled - Notepad"); });
    type("theyre acount ");

    auto out = events.drain();
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.back().context, "Untitled - Notepad");

    ASSERT_TRUE(assembler->accept(out.back().id, "their account"));
    ASSERT_EQ(applier.seen.size(), 1u);
    EXPECT_EQ(applier.seen[0].context, "Untitled - Notepad");
}

TEST_F(InputAssemblerTest, PendingSuggestionTimesOut) {
    cfg.suggestion_timeout = 30ms;
    TimeoutScheduler timeouts;
    start(kKeywords, &timeouts);

    type("theyre acount ");
    uint64_t id = assembler->pending_id();
    ASSERT_NE(id, 0u);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (assembler->state() == SuggestionState::Pending &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(assembler->state(), SuggestionState::Idle);
    EXPECT_FALSE(assembler->ignore(id));
    EXPECT_EQ(assembler->window().size(), 2u);

    timeouts.stop();
}
