#include "simulator.h"
#include "utils.h"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <omp.h>

word_pools_t make_pools(const wordlist_t &answers, const wordlist_t &allowed, int wordlen){
    word_pools_t pools;
    pools.wordlen = wordlen;
    for(const auto &raw : answers){
        word_t word = str2word(raw);
        if(is_valid_word(word, wordlen)) pools.answers.push_back(word);
    }
    for(const auto &raw : allowed){
        word_t word = str2word(raw);
        if(is_valid_word(word, wordlen) && pools.allowed_set.insert(word).second)
            pools.allowed.push_back(word);
    }
    return pools;
}

/*******************************
 * Single Game
********************************/

Episode::Episode(const word_pools_t &pools, bool enforce_allowed) : pools_(pools),
    enforce_allowed_(enforce_allowed), status_(LOST), turn_(0),
    prev_size_(0), last_pattern_(NO_PATTERN), time_ms_(0.0) {}

void Episode::reset(const word_t &answer, unsigned seed){
    answer_ = str2word(answer);
    status_ = IN_PROGRESS;
    turn_ = 0;
    history_.clear();
    policies_.clear();
    candidates_ = pools_.answers;
    prev_size_ = 0;
    last_pattern_ = NO_PATTERN;
    time_ms_ = 0.0;
    rng_.seed(seed);
    if(candidates_.empty()) status_ = LOST;
}

turn_record_t Episode::step(Policy &policy, const std::string &policy_id){
    if(status_ != IN_PROGRESS)
        throw std::logic_error("Episode::step called on a finished game");

    int wordlen = pools_.wordlen;
    game_state_t state{turn_ + 1, history_, candidates_, pools_.allowed, wordlen, &rng_};

    turn_record_t record;
    auto start = timestamp;
    record.guess = str2word(policy.next_guess(state));
    auto end = timestamp;
    record.time_ms = TIME_MS(start, end);
    record.policy_id = policy_id;
    record.valid = validate_guess(record.guess, pools_.allowed_set, wordlen);
    record.scored = enforce_allowed_ ? record.valid
        : is_valid_word(record.guess, wordlen) && static_cast<int>(answer_.size()) == wordlen;
    record.pattern = record.scored ? word_cmp(record.guess, answer_) : 0;

    history_.push_back(std::make_pair(record.guess, record.pattern));
    policies_.push_back(policy_id);
    time_ms_ += record.time_ms;
    prev_size_ = candidates_.size();
    last_pattern_ = record.pattern;
    turn_ ++;

    if(record.scored && is_correct_guess(record.pattern, wordlen)){
        status_ = WON;
        return record;
    }
    if(record.scored){
        candidates_ = filter_candidates(candidates_,
            history_t(1, std::make_pair(record.guess, record.pattern)), wordlen);
    }
    if(turn_ >= MAX_TURNS || candidates_.empty())
        status_ = LOST;
    return record;
}

features_t Episode::observe() const{
    return make_features(turn_ + 1, pools_.wordlen, candidates_, prev_size_, last_pattern_);
}

episode_result_t Episode::result(const std::string &solver) const{
    episode_result_t out;
    out.solver = solver;
    out.answer = answer_;
    out.success = (status_ == WON);
    out.guesses = turn_;
    out.time_ms = time_ms_;
    out.history = history_;
    out.policies = policies_;
    return out;
}

episode_result_t run_case(Policy &policy, const word_t &answer,
    const word_pools_t &pools, int max_turns, unsigned seed){
    if(max_turns != MAX_TURNS)
        throw std::invalid_argument("max_turns must be " + std::to_string(MAX_TURNS) +
            " for Wordle rules; got " + std::to_string(max_turns));
    policy.reset(pools.allowed, pools.answers, pools.wordlen, seed);
    Episode episode(pools);
    episode.reset(answer, seed);
    std::string id = policy.id();
    while(episode.status() == IN_PROGRESS){
        episode.step(policy, id);
    }
    return episode.result(id);
}

/*******************************
 * Batches
********************************/

std::vector<episode_result_t> run_batch(const std::string &policy_id,
    const wordlist_t &cases, const word_pools_t &pools, unsigned seed,
    bool progress){
    // Fails fast on an unknown id before any thread starts
    create_policy(policy_id);

    int num_cases = cases.size();
    std::vector<episode_result_t> out(num_cases);
    std::exception_ptr error = nullptr;
    int done = 0;

    #pragma omp parallel for schedule(dynamic)
    for(int i = 0; i < num_cases; i++){
        try{
            std::unique_ptr<Policy> policy = create_policy(policy_id);
            out[i] = run_case(*policy, cases[i], pools, MAX_TURNS, seed + i + 1);
        }
        catch(...){
            // Exceptions may not leave the parallel region, the first one is rethrown below
            #pragma omp critical
            if(!error) error = std::current_exception();
        }
        if(progress){
            #pragma omp critical
            print_progress_bar(++done, num_cases);
        }
    }
    if(progress) std::cout << "\n";
    if(error) std::rethrow_exception(error);
    return out;
}

wordlist_t first_cases(const wordlist_t &answers, long k){
    if(k <= 0 || k >= static_cast<long>(answers.size())) return answers;
    return wordlist_t(answers.begin(), answers.begin() + k);
}

wordlist_t sample_cases(const wordlist_t &answers, long k, unsigned seed){
    wordlist_t out = answers;
    std::mt19937 rng(seed);
    std::shuffle(out.begin(), out.end(), rng);
    if(k > 0 && k < static_cast<long>(out.size())) out.resize(k);
    return out;
}

std::vector<episode_result_t> run_multi(const std::vector<std::string> &policy_ids,
    const wordlist_t &cases, const word_pools_t &pools, unsigned seed,
    bool progress){
    std::vector<episode_result_t> out;
    for(const auto &id : policy_ids){
        if(progress) std::cout << "Running " << id << " on " << cases.size() << " cases\n";
        std::vector<episode_result_t> results = run_batch(id, cases, pools, seed, progress);
        out.insert(out.end(), results.begin(), results.end());
    }
    return out;
}

/*******************************
 * Bandit Environment
********************************/

BanditEnv::BanditEnv(const word_pools_t &pools, const std::vector<std::string> &actions,
    double alpha_time, unsigned seed) : pools_(pools), actions_(actions),
    alpha_time_(alpha_time), rng_(seed), episode_(pools, true){
    if(actions_.empty())
        throw std::invalid_argument("BanditEnv: no actions");
    if(pools_.answers.empty())
        throw std::invalid_argument("BanditEnv: empty answer pool");
    for(const auto &id : actions_){
        policies_[id] = create_policy(id);
    }
}

int BanditEnv::feature_dim() const{
    return ::feature_dim(pools_.wordlen);
}

features_t BanditEnv::reset(){
    std::uniform_int_distribution<size_t> dist(0, pools_.answers.size() - 1);
    return reset(pools_.answers[dist(rng_)]);
}

features_t BanditEnv::reset(const word_t &answer){
    std::uniform_int_distribution<unsigned> seeds(0, 2147483647u);
    episode_.reset(answer, seeds(rng_));
    for(const auto &id : actions_){
        policies_[id]->reset(pools_.allowed, pools_.answers, pools_.wordlen, seeds(rng_));
    }
    return episode_.observe();
}

bandit_step_t BanditEnv::step(const std::string &action){
    auto it = policies_.find(action);
    if(it == policies_.end())
        throw std::invalid_argument("BanditEnv: unknown action " + action);
    bandit_step_t out;
    out.turn = episode_.step(*it->second, action);
    double penalty = alpha_time_ * (out.turn.time_ms / 100.0);
    out.reward = (out.turn.valid ? -1.0 : -2.0) - penalty;
    out.done = (episode_.status() != IN_PROGRESS);
    return out;
}

train_stats_t train_bandit(BanditEnv &env, LinUCB &bandit, long episodes,
    long log_every){
    train_stats_t stats = {0, 0, 0, 0.0, 0.0};
    for(long ep = 1; ep <= episodes; ep++){
        features_t x = env.reset();
        bool done = (env.episode().status() != IN_PROGRESS);
        while(!done){
            std::string action = bandit.select(x.values);
            bandit_step_t step = env.step(action);
            bandit.update(action, x.values, step.reward);
            stats.total_reward += step.reward;
            stats.total_time_ms += step.turn.time_ms;
            stats.steps ++;
            done = step.done;
            x = env.observe();
        }
        if(env.episode().status() == WON) stats.wins ++;
        stats.episodes = ep;

        if(log_every > 0 && ep % log_every == 0 && stats.steps > 0){
            std::cout << "[ep " << ep << "] avg_reward/step="
                << stats.total_reward / stats.steps
                << " win_rate=" << static_cast<double>(stats.wins) / ep
                << " avg_time_ms/step=" << stats.total_time_ms / stats.steps << "\n";
        }
    }
    return stats;
}

std::vector<episode_result_t> eval_bandit(BanditEnv &env, const LinUCB &bandit,
    const wordlist_t &cases){
    std::vector<episode_result_t> out;
    for(const auto &answer : cases){
        features_t x = env.reset(answer);
        while(env.episode().status() == IN_PROGRESS){
            env.step(bandit.select(x.values));
            x = env.observe();
        }
        out.push_back(env.episode().result("linucb"));
    }
    return out;
}
