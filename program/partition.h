/**
 * Header File for the policies that score a guess by the partition it
 * induces on the candidate set
 * #include "partition.h"
*/

#ifndef PARTITION_H
#define PARTITION_H

#include <unordered_map>
#include "policy.h"

// Number of top ranked candidates always merged into a capped entropy pool
#define TOP_CANDIDATES 100

/**
 * Entropy (bits) and largest bucket of the partition of candidates by guess.
 * Both are zero for at most one candidate.
*/
void partition_entropy(const word_t &guess, const wordlist_t &candidates,
    double &entropy, unsigned &worst);

/**
 * Maximizes the expected information gain, ties go to the smaller worst bucket.
*/
class EntropyPolicy : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "entropy"; }

    /**
     * The guesses worth scoring: all candidates while there are few,
     * otherwise the top candidates merged with the top allowed words by
     * letter coverage.
    */
    static wordlist_t select_pool(const wordlist_t &candidates, const wordlist_t &allowed);
};

/**
 * Entropy where each candidate carries a prior weight derived from global
 * letter frequencies over the allowed words.
*/
class WeightedEntropyPolicy : public Policy{
public:
    void reset(const wordlist_t &allowed, const wordlist_t &answers,
        int wordlen, unsigned seed) override;
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "entropy_weighted"; }

    // 1.0 for words outside the allowed list
    double prior_weight(const word_t &word) const;

    /**
     * All candidates while there are few, otherwise the POOL_CAP allowed
     * words with the largest prior weight.
    */
    wordlist_t select_pool(const wordlist_t &candidates, const wordlist_t &allowed) const;

private:
    std::unordered_map<word_t, double> prior_weight_;
};

/**
 * Guess pool of expected_left and max_patterns: all candidates while there
 * are few, otherwise the POOL_CAP allowed words covering the most candidates
 * (letters counted once per word).
*/
wordlist_t capped_pool(const wordlist_t &candidates, const wordlist_t &allowed);

/**
 * Minimizes the expected number of remaining candidates (sum of squared
 * bucket sizes over n).
*/
class ExpectedRemaining : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "expected_left"; }
};

/**
 * Maximizes the number of distinct feedback patterns.
*/
class MaxPatternDiversity : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "max_patterns"; }
};

#endif /* PARTITION_H */
