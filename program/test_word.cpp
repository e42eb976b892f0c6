#include <gtest/gtest.h>
#include <stdexcept>
#include "word.h"
#include "mathutils.h"

namespace {

struct golden_t{
    const char *guess;
    const char *answer;
    const char *pattern;
};

const golden_t GOLDEN[] = {
    {"belle", "level", "-GYYY"},
    {"lemon", "level", "GG---"},
    {"cools", "scoop", "YYG-Y"},
    {"raise", "crane", "YY--G"},
    {"stare", "crane", "--GYG"},
    {"eerie", "there", "Y-Y-G"},
    {"speed", "abide", "--Y-Y"},
    {"settle", "letter", "-GGGYY"},
    {"little", "letter", "G-GG-Y"},
    {"planet", "palate", "GYY-YY"},
    {"kitten", "tinket", "YGYYGY"},
};

}

TEST(WordCmp, GoldenPatterns){
    for(const auto &g : GOLDEN){
        EXPECT_EQ(pattern_str(word_cmp(g.guess, g.answer), std::string(g.guess).size()), g.pattern)
            << g.guess << " vs " << g.answer;
    }
}

TEST(WordCmp, SelfScoreIsAllGreen){
    for(const char *w : {"crane", "level", "aaaaa", "letter", "a", "abcdefgh"}){
        word_t word(w);
        EXPECT_TRUE(is_correct_guess(word_cmp(word, word), word.size())) << w;
    }
}

TEST(WordCmp, Deterministic){
    coloring_t first = word_cmp("belle", "level");
    for(int i = 0; i < 10; i++) EXPECT_EQ(word_cmp("belle", "level"), first);
}

TEST(WordCmp, LengthMismatchThrows){
    EXPECT_THROW(word_cmp("crane", "cranes"), std::invalid_argument);
    EXPECT_THROW(word_cmp("abcdefghi", "abcdefghi"), std::invalid_argument);
}

TEST(WordCmp, BaseThreeEncoding){
    EXPECT_EQ(get_num_patterns(5), 243u);
    EXPECT_TRUE(is_correct_guess(242, 5));
    EXPECT_FALSE(is_correct_guess(241, 5));
    // letter 0 is the least significant digit
    EXPECT_EQ(word_cmp("axxxx", "abbbb"), 2);
    EXPECT_EQ(word_cmp("xaxxx", "abbbb"), 1 * 3);
}

TEST(Pattern, TextRoundTrip){
    EXPECT_EQ(parse_pattern("-GYYY"), word_cmp("belle", "level"));
    EXPECT_EQ(pattern_str(parse_pattern("G-GG-Y"), 6), "G-GG-Y");
    EXPECT_THROW(parse_pattern("GX---"), std::invalid_argument);
}

TEST(Word, Normalization){
    EXPECT_EQ(str2word("  CrAnE \r"), "crane");
    EXPECT_TRUE(is_valid_word("crane", 5));
    EXPECT_FALSE(is_valid_word("cran3", 5));
    EXPECT_FALSE(is_valid_word("crane", 6));
    EXPECT_EQ(placeholder_word(4), "aaaa");
}

TEST(MathUtils, BucketStatistics){
    wordlist_t answers = {"crane", "raise", "stare", "trace", "cared", "adieu", "alone"};
    std::vector<unsigned> counts = bucket_counts("adieu", answers);
    EXPECT_EQ(worst_bucket(counts), 3u);
    EXPECT_NEAR(bucket_entropy(counts, answers.size()), 2.1281, 1e-4);
    EXPECT_NEAR(bucket_entropy(bucket_counts("crane", answers), answers.size()),
        std::log2(7.0), 1e-9);
    EXPECT_EQ(bucket_entropy(bucket_counts("crane", {"crane"}), 1), 0.0);
}
