#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include "simulator.h"
#include "heuristics.h"

namespace {

// Always plays the same word, allowed or not
class FixedGuess : public Policy{
public:
    explicit FixedGuess(const word_t &word) : word_(word) {}
    word_t next_guess(const game_state_t &state) override { (void)state; return word_; }
    std::string id() const override { return "fixed"; }
private:
    word_t word_;
};

const wordlist_t ANSWERS = {"crane", "raise", "stare", "trace", "cared", "adieu", "alone"};
const wordlist_t ALLOWED = {"crane", "raise", "stare", "trace", "cared", "adieu", "alone",
    "slate", "salet", "roate"};

}

TEST(RunCase, RandomConsistentSolvesSmallPool){
    word_pools_t pools = make_pools({"crane", "raise", "stare"},
        {"crane", "raise", "stare", "trace", "cared"}, 5);
    RandomConsistent policy;
    episode_result_t result = run_case(policy, "crane", pools, MAX_TURNS, 42);
    EXPECT_TRUE(result.success);
    EXPECT_LE(result.guesses, MAX_TURNS);
    EXPECT_EQ(result.history.back().first, "crane");
    EXPECT_TRUE(is_correct_guess(result.history.back().second, 5));
    EXPECT_EQ(result.solver, "random_consistent");
    EXPECT_EQ(result.policies.size(), result.history.size());
}

TEST(RunCase, AnswerMissingFromAllowedCanStillBeWon){
    word_pools_t pools = make_pools({"crane"}, {"raise", "stare"}, 5);
    RandomConsistent policy;
    episode_result_t result = run_case(policy, "crane", pools, MAX_TURNS, 42);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.guesses, 1);
    EXPECT_EQ(result.history[0].first, "crane");
}

TEST(RunCase, OnlySixTurnsAllowed){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    RandomConsistent policy;
    EXPECT_THROW(run_case(policy, "crane", pools, 7, 1), std::invalid_argument);
}

TEST(RunCase, EveryPolicyPlaysWithinTurnBudget){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    for(const auto &id : default_registry().ids()){
        for(const auto &answer : ANSWERS){
            std::unique_ptr<Policy> policy = create_policy(id);
            episode_result_t result = run_case(*policy, answer, pools, MAX_TURNS, 3);
            EXPECT_GE(result.guesses, 1) << id;
            EXPECT_LE(result.guesses, MAX_TURNS) << id;
            ASSERT_EQ(result.history.size(), static_cast<size_t>(result.guesses));
            EXPECT_EQ(result.success, is_correct_guess(result.history.back().second, 5))
                << id << " on " << answer;
            EXPECT_EQ(result.success, result.history.back().first == answer) << id;
        }
    }
}

TEST(Episode, LosesAfterSixWrongGuesses){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    Episode episode(pools);
    episode.reset("crane", 0);
    FixedGuess policy("slate");
    for(int i = 0; i < MAX_TURNS; i++){
        ASSERT_EQ(episode.status(), IN_PROGRESS);
        turn_record_t record = episode.step(policy, "fixed");
        EXPECT_TRUE(record.valid);
        EXPECT_EQ(record.pattern, word_cmp("slate", "crane"));
    }
    EXPECT_EQ(episode.status(), LOST);
    EXPECT_EQ(episode.turn(), MAX_TURNS);
    EXPECT_THROW(episode.step(policy, "fixed"), std::logic_error);
    EXPECT_FALSE(episode.result("fixed").success);
}

TEST(Episode, InvalidGuessIsGreyAndDoesNotFilter){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    Episode episode(pools, true);
    episode.reset("crane", 0);
    FixedGuess policy("zzzzz");
    turn_record_t record = episode.step(policy, "fixed");
    EXPECT_FALSE(record.valid);
    EXPECT_FALSE(record.scored);
    EXPECT_EQ(record.pattern, 0);
    EXPECT_EQ(episode.candidates(), pools.answers);
    EXPECT_EQ(episode.last_pattern(), 0);
    EXPECT_EQ(episode.status(), IN_PROGRESS);
}

TEST(Episode, UnlistedGuessIsScoredByDefault){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    Episode episode(pools);
    episode.reset("crane", 0);
    FixedGuess policy("caner");
    turn_record_t record = episode.step(policy, "fixed");
    EXPECT_FALSE(record.valid);
    EXPECT_TRUE(record.scored);
    EXPECT_EQ(record.pattern, word_cmp("caner", "crane"));
    EXPECT_EQ(episode.candidates(), (wordlist_t{"crane"}));
}

TEST(Episode, EmptyCandidatePoolLoses){
    // the answer is allowed but not in the answer pool
    word_pools_t pools = make_pools({"crane", "trace"}, {"crane", "trace", "slate"}, 5);
    Episode episode(pools);
    episode.reset("slate", 0);
    FixedGuess policy("crane");
    episode.step(policy, "fixed");
    EXPECT_TRUE(episode.candidates().empty());
    EXPECT_EQ(episode.status(), LOST);
}

TEST(RunBatch, OrderedAndReproducible){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    wordlist_t cases = first_cases(pools.answers, 5);
    ASSERT_EQ(cases.size(), 5u);
    std::vector<episode_result_t> first = run_batch("letter_freq", cases, pools, 123);
    std::vector<episode_result_t> second = run_batch("letter_freq", cases, pools, 123);
    ASSERT_EQ(first.size(), cases.size());
    for(size_t i = 0; i < cases.size(); i++){
        EXPECT_EQ(first[i].answer, cases[i]);
        EXPECT_EQ(first[i].history, second[i].history);
    }
    EXPECT_THROW(run_batch("nope", cases, pools, 1), std::invalid_argument);
}

TEST(RunBatch, MultiRunsEverySolver){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    wordlist_t cases = sample_cases(pools.answers, 3, 9);
    ASSERT_EQ(cases.size(), 3u);
    EXPECT_EQ(sample_cases(pools.answers, 3, 9), cases);
    std::vector<episode_result_t> results = run_multi({"entropy", "max_patterns"}, cases, pools, 9);
    ASSERT_EQ(results.size(), 6u);
    EXPECT_EQ(results[0].solver, "entropy");
    EXPECT_EQ(results[5].solver, "max_patterns");
}

TEST(BanditEnv, RewardsAndTermination){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    BanditEnv env(pools, {"positional_freq", "expected_left"}, TIME_PENALTY, 5);
    features_t obs = env.reset("crane");
    EXPECT_EQ(obs.values.size(), static_cast<size_t>(env.feature_dim()));
    EXPECT_DOUBLE_EQ(obs.values[0], 1.0);

    bool done = false;
    int steps = 0;
    while(!done){
        bandit_step_t step = env.step("expected_left");
        EXPECT_TRUE(step.turn.valid);
        EXPECT_LE(step.reward, -1.0);
        EXPECT_NEAR(step.reward, -1.0 - TIME_PENALTY * step.turn.time_ms / 100.0, 1e-12);
        done = step.done;
        steps++;
    }
    EXPECT_LE(steps, MAX_TURNS);
    EXPECT_EQ(env.episode().status(), WON);
    EXPECT_THROW(env.step("expected_left"), std::logic_error);
    EXPECT_THROW(env.step("entropy"), std::invalid_argument);
}

TEST(BanditEnv, InvalidGuessCostsExtra){
    // a policy that only knows the candidates, which are missing from the allowed list
    word_pools_t pools = make_pools({"crane", "trace"}, {"slate", "roate"}, 5);
    BanditEnv env(pools, {"random_consistent"}, 0.0, 1);
    env.reset("crane");
    bandit_step_t step = env.step("random_consistent");
    EXPECT_FALSE(step.turn.valid);
    EXPECT_DOUBLE_EQ(step.reward, -2.0);
    EXPECT_EQ(step.turn.pattern, 0);
    EXPECT_FALSE(step.done);
}

TEST(BanditEnv, TrainAndEvaluate){
    word_pools_t pools = make_pools(ANSWERS, ALLOWED, 5);
    std::vector<std::string> actions = {"positional_freq", "letter_freq"};
    BanditEnv env(pools, actions, TIME_PENALTY, 11);
    LinUCB bandit(actions, env.feature_dim());
    train_stats_t stats = train_bandit(env, bandit, 20, 0);
    EXPECT_EQ(stats.episodes, 20);
    EXPECT_GE(stats.steps, 20);
    EXPECT_LE(stats.steps, 20 * MAX_TURNS);
    EXPECT_LE(stats.total_reward, -stats.steps);

    std::vector<episode_result_t> results = eval_bandit(env, bandit, ANSWERS);
    ASSERT_EQ(results.size(), ANSWERS.size());
    for(const auto &r : results){
        EXPECT_EQ(r.solver, "linucb");
        for(const auto &id : r.policies){
            EXPECT_TRUE(std::find(actions.begin(), actions.end(), id) != actions.end());
        }
    }
}
