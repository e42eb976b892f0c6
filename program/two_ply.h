/**
 * Header File for the two-ply sampled lookahead policy
 * #include "two_ply.h"
*/

#ifndef TWO_PLY_H
#define TWO_PLY_H

#include "policy.h"

#define FIRST_POOL_CAP 40 // First guesses considered (half of them from the candidates)
#define SAMPLE_SIZE 32 // Answers sampled to estimate a first guess
#define CAND_CAP_PLY2 400 // Candidates scored for the second guess

/**
 * Positional frequency pick restricted to the candidates: only the
 * CAND_CAP_PLY2 best covering candidates are scored.
 * @returns the placeholder for an empty candidate set
*/
word_t capped_positional_pick(const wordlist_t &candidates, int wordlen,
    std::mt19937 &rng);

/**
 * On the first turn, evaluates every first guess g of a small pool by
 * sampling answers a, replying with a positional frequency guess g2 on the
 * candidates left after (g, a), and measuring how many candidates
 * (g, a), (g2, a) leave. The guess with the smallest average wins, ties go
 * to the smaller worst case.
 *
 * A first guess is abandoned as soon as its running average exceeds the
 * best completed average. This is a heuristic: the full average could
 * still have come out lower.
 *
 * Later turns use capped_positional_pick on the live candidates.
*/
class TwoPlyMC : public Policy{
public:
    word_t next_guess(const game_state_t &state) override;
    std::string id() const override { return "two_ply_mc"; }

    static wordlist_t select_first_pool(const wordlist_t &candidates,
        const wordlist_t &allowed);

    struct ply_score_t{
        double avg;      // mean second-ply bucket size over the groups evaluated
        unsigned worst;
        long groups;     // first-ply feedback groups evaluated
        bool pruned;     // stopped once avg exceeded bound
    };

    /**
     * Two-ply estimate of one first guess over the sampled answers.
     * @param bound Best completed average so far, evaluation stops as soon as
     * the running average exceeds it
    */
    static ply_score_t score_first_guess(const word_t &guess, const wordlist_t &candidates,
        const wordlist_t &sample, int wordlen, std::mt19937 &rng, double bound);
};

#endif /* TWO_PLY_H */
