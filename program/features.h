/**
 * Header File for the game state features fed to the bandit
 * #include "features.h"
*/

#ifndef FEATURES_H
#define FEATURES_H

#include <string>
#include <vector>
#include "word.h"

#define NO_PATTERN -1
#define NUM_PATTERN_TYPES 5

enum pattern_type_t{
    ALL_GRAY = 0,
    SOME_GREEN,
    SOME_YELLOW,
    MIX_GY,
    OTHER
};

struct features_t{
    std::vector<double> values;
    std::vector<std::string> names;
};

/**
 * Coarse class of the last feedback. NO_PATTERN maps to OTHER.
*/
pattern_type_t pattern_type(int pattern, int wordlen);

const char *pattern_type_name(pattern_type_t type);

/**
 * Feature vector length for words of length wordlen.
*/
int feature_dim(int wordlen);

/**
 * Builds the feature vector
 * [turn, N, log2|C|, shrink, dup_ratio, H_0 .. H_{N-1}, one-hot pattern type]
 * @param turn The turn about to be played (1-based)
 * @param candidates The live candidate set
 * @param prev_size Candidate count before the last guess, <= 0 if none
 * @param last_pattern The last feedback or NO_PATTERN
 * Slot entropies are in nats.
*/
features_t make_features(int turn, int wordlen, const wordlist_t &candidates,
    long prev_size, int last_pattern);

#endif /* FEATURES_H */
