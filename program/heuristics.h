/**
 * Header File for the letter frequency family of policies
 * #include "heuristics.h"
*/

#ifndef HEURISTICS_H
#define HEURISTICS_H

#include "policy.h"
#include "letterstats.h"

#define DUPLICATE_PENALTY 0.25
// Candidate count after the first probe above which a second probe is played
#define LARGE_THRESHOLD 1200

/**
 * Words of pool with the best positional score, in pool order.
*/
wordlist_t best_positional(const wordlist_t &pool, const position_counts_t &counts);

/**
 * Words of pool with the best distinct-letter coverage, in pool order.
 * @param banned letters ignored while scoring (optional)
*/
wordlist_t best_coverage(const wordlist_t &pool, const letter_counts_t &counts,
    const std::vector<bool> *banned = nullptr);

/**
 * Guess pool shared by the frequency heuristics: the candidates while there
 * are few of them, the allowed words otherwise (or when no candidate is left).
*/
const wordlist_t &frequency_pool(const game_state_t &state);

/** Uniform pick among the remaining candidates. */
class RandomConsistent : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "random_consistent"; }
};

/** Maximizes the summed frequency of the distinct letters of the guess. */
class LetterFrequency : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "letter_freq"; }
};

/** Maximizes per-position letter frequency, penalizing repeated letters. */
class PositionalFrequency : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "positional_freq"; }
};

/**
 * Coverage probe on turn 1, a second probe avoiding the letters of the
 * first one when the space is still large on turn 2, positional frequency
 * afterwards.
*/
class TwoStageProbe : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "two_stage_probe"; }
};

#endif /* HEURISTICS_H */
