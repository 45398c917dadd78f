#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "phrasecheck/phrase_index.hpp"

using phrasecheck::PhraseIndex;

TEST(PhraseIndex, BuildNormalizesAndIndexesWords) {
    PhraseIndex idx;
    idx.build({"Machine Learning", "Deep Learning", "they're going"});

    EXPECT_EQ(idx.size(), 3u);
    EXPECT_EQ(idx.phrase(0), "machine learning");
    EXPECT_EQ(idx.phrase(2), "they re going");

    EXPECT_EQ(idx.lookup_by_word("learning"),
              (std::vector<std::string>{"machine learning", "deep learning"}));
    EXPECT_EQ(idx.lookup_by_word("re"), (std::vector<std::string>{"they re going"}));
    EXPECT_TRUE(idx.lookup_by_word("nothing").empty());
}

TEST(PhraseIndex, CollisionKeepsLastOriginal) {
    PhraseIndex idx;
    idx.build({"machine learning", "Deep Learning", "Machine-Learning"});

    EXPECT_EQ(idx.size(), 2u);
    EXPECT_EQ(idx.entries().size(), 3u);
    EXPECT_EQ(idx.phrase(0), "machine learning");
    EXPECT_EQ(idx.original_of("machine learning"), "Machine-Learning");
    EXPECT_EQ(idx.original_of("deep learning"), "Deep Learning");
}

TEST(PhraseIndex, RepeatedWordListsPhraseOnce) {
    PhraseIndex idx;
    idx.build({"bye bye now"});
    EXPECT_EQ(idx.postings("bye").size(), 1u);
    EXPECT_EQ(idx.word_count(), 2u);
}

TEST(PhraseIndex, SkipsKeywordsThatNormalizeToNothing) {
    PhraseIndex idx;
    idx.build({"...", "ok then"});
    EXPECT_EQ(idx.size(), 1u);
    EXPECT_EQ(idx.find("ok then"), 0);
    EXPECT_EQ(idx.find(""), -1);
}

TEST(PhraseIndex, OriginalOfUnknownPhraseIsMisuse) {
    PhraseIndex idx;
    idx.build({"there is"});
    EXPECT_THROW(idx.original_of("their is"), std::logic_error);
}

TEST(PhraseIndex, RebuildReplacesEverything) {
    PhraseIndex idx;
    idx.build({"first phrase"});
    idx.build({"second one"});
    EXPECT_EQ(idx.size(), 1u);
    EXPECT_TRUE(idx.lookup_by_word("first").empty());
    EXPECT_EQ(idx.find("second one"), 0);

    idx.clear();
    EXPECT_TRUE(idx.empty());
}
