/**
 * Header File for the game simulator: single games, batches of games and
 * the bandit environment built on top of them
 * #include "simulator.h"
*/

#ifndef SIMULATOR_H
#define SIMULATOR_H

#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "word.h"
#include "filter.h"
#include "policy.h"
#include "features.h"
#include "linucb.h"

#define MAX_TURNS 6 // Wordle turn budget, the only value run_case accepts
#define TIME_PENALTY 0.2 // Reward lost per 100 ms of policy compute

/**
 * Word lists of one run, restricted to words of length wordlen.
 * Shared read-only by every game.
*/
struct word_pools_t{
    int wordlen;
    wordlist_t answers;
    wordlist_t allowed;
    wordset_t allowed_set;
};

/**
 * Normalizes both lists and keeps the valid words of length wordlen,
 * preserving order.
*/
word_pools_t make_pools(const wordlist_t &answers, const wordlist_t &allowed, int wordlen);

enum episode_status_t{
    IN_PROGRESS = 0,
    WON,
    LOST
};

struct turn_record_t{
    word_t guess;
    coloring_t pattern;
    bool valid;       // false: not in the allowed list
    bool scored;      // false: colored all grey, nothing filtered
    double time_ms;   // policy compute time
    std::string policy_id;
};

struct episode_result_t{
    std::string solver;
    word_t answer;
    bool success;
    int guesses;
    double time_ms;
    history_t history;
    std::vector<std::string> policies; // policy used on each turn
};

/**
 * One game. The candidate set starts as the full answer pool and only
 * shrinks. The game is won on an all green pattern and lost after MAX_TURNS
 * guesses or once no candidate is left.
 *
 * Every well formed guess is scored. With enforce_allowed set, a guess
 * outside the allowed list is instead marked invalid, colored all grey and
 * filters nothing.
*/
class Episode{
public:
    explicit Episode(const word_pools_t &pools, bool enforce_allowed = false);

    /**
     * Starts a new game.
     * @param seed seeds the generator handed to policies through the state
    */
    void reset(const word_t &answer, unsigned seed);

    /**
     * Plays one turn with the given policy.
     * @throws std::logic_error if the game is already over
    */
    turn_record_t step(Policy &policy, const std::string &policy_id);

    episode_status_t status() const { return status_; }
    int turn() const { return turn_; }
    const word_t &answer() const { return answer_; }
    const history_t &history() const { return history_; }
    const wordlist_t &candidates() const { return candidates_; }
    long prev_size() const { return prev_size_; }
    int last_pattern() const { return last_pattern_; }
    double time_ms() const { return time_ms_; }

    /**
     * Features describing the turn about to be played.
    */
    features_t observe() const;

    episode_result_t result(const std::string &solver) const;

private:
    const word_pools_t &pools_;
    bool enforce_allowed_;
    word_t answer_;
    episode_status_t status_;
    int turn_;
    history_t history_;
    wordlist_t candidates_;
    std::vector<std::string> policies_;
    long prev_size_;
    int last_pattern_;
    double time_ms_;
    std::mt19937 rng_;
};

/**
 * Plays one game to the end.
 * @param max_turns must be MAX_TURNS
 * @throws std::invalid_argument for any other turn budget
*/
episode_result_t run_case(Policy &policy, const word_t &answer,
    const word_pools_t &pools, int max_turns, unsigned seed);

/**
 * Plays one game per answer with a fresh policy each, in parallel.
 * Game i (1-based) uses seed + i. Results follow the order of cases.
 * @param progress draw a progress bar on stdout
*/
std::vector<episode_result_t> run_batch(const std::string &policy_id,
    const wordlist_t &cases, const word_pools_t &pools, unsigned seed,
    bool progress = false);

/**
 * The first k answers (all of them for k <= 0).
*/
wordlist_t first_cases(const wordlist_t &answers, long k);

/**
 * A seeded shuffle of the answers cut to k words (all of them for k <= 0).
*/
wordlist_t sample_cases(const wordlist_t &answers, long k, unsigned seed);

/**
 * Runs every solver over the same cases.
*/
std::vector<episode_result_t> run_multi(const std::vector<std::string> &policy_ids,
    const wordlist_t &cases, const word_pools_t &pools, unsigned seed,
    bool progress = false);

struct bandit_step_t{
    double reward;
    bool done;
    turn_record_t turn;
};

/**
 * Game environment where each action is a policy id. Its games only score
 * allowed guesses.
 * Reward per turn is -1 - alpha_time * ms / 100, an invalid guess costs one
 * more point.
*/
class BanditEnv{
public:
    /**
     * @throws std::invalid_argument for unknown policy ids or an empty answer pool
    */
    BanditEnv(const word_pools_t &pools, const std::vector<std::string> &actions,
        double alpha_time, unsigned seed);

    /**
     * Starts a game on a random answer, or on the given one.
     * Every policy is reseeded from the environment generator.
     * @returns the observation for turn 1
    */
    features_t reset();
    features_t reset(const word_t &answer);

    /**
     * @throws std::invalid_argument for an action outside the action list
     * @throws std::logic_error once the game is over
    */
    bandit_step_t step(const std::string &action);

    features_t observe() const { return episode_.observe(); }
    const Episode &episode() const { return episode_; }
    const std::vector<std::string> &actions() const { return actions_; }
    int feature_dim() const;

private:
    const word_pools_t &pools_;
    std::vector<std::string> actions_;
    std::map<std::string, std::unique_ptr<Policy>> policies_;
    double alpha_time_;
    std::mt19937 rng_;
    Episode episode_;
};

struct train_stats_t{
    long episodes;
    long steps;
    long wins;
    double total_reward;
    double total_time_ms;
};

/**
 * Online LinUCB training, one game after the other.
 * @param log_every print running averages every log_every games (0: never)
*/
train_stats_t train_bandit(BanditEnv &env, LinUCB &bandit, long episodes,
    long log_every);

/**
 * Plays each case with the bandit choosing greedily by UCB score, no updates.
*/
std::vector<episode_result_t> eval_bandit(BanditEnv &env, const LinUCB &bandit,
    const wordlist_t &cases);

#endif /* SIMULATOR_H */
