#include "partition.h"
#include "letterstats.h"
#include "mathutils.h"
#include <algorithm>

void partition_entropy(const word_t &guess, const wordlist_t &candidates,
    double &entropy, unsigned &worst){
    entropy = 0.0;
    worst = 0;
    unsigned n = candidates.size();
    if(n <= 1) return;
    std::vector<unsigned> counts = bucket_counts(guess, candidates);
    entropy = bucket_entropy(counts, n);
    worst = worst_bucket(counts);
}

wordlist_t EntropyPolicy::select_pool(const wordlist_t &candidates,
    const wordlist_t &allowed){
    if(candidates.size() <= CAND_POOL_LIMIT) return candidates;
    letter_counts_t counts = letter_counts(candidates);
    return stable_union(top_k_by_coverage(candidates, counts, TOP_CANDIDATES),
        top_k_by_coverage(allowed, counts, POOL_CAP));
}

word_t EntropyPolicy::next_guess(const game_state_t &state){
    wordlist_t pool = select_pool(state.candidates, state.allowed);
    if(pool.empty()) return pick(state.allowed, state);

    wordlist_t best;
    double best_entropy = 0.0;
    unsigned best_worst = 0;
    double entropy;
    unsigned worst;
    for(const auto &guess : pool){
        partition_entropy(guess, state.candidates, entropy, worst);
        if(best.empty() || entropy > best_entropy
            || (entropy == best_entropy && worst < best_worst)){
            best_entropy = entropy;
            best_worst = worst;
            best.assign(1, guess);
        }
        else if(entropy == best_entropy && worst == best_worst){
            best.push_back(guess);
        }
    }
    return pick(best, state);
}

void WeightedEntropyPolicy::reset(const wordlist_t &allowed, const wordlist_t &answers,
    int wordlen, unsigned seed){
    Policy::reset(allowed, answers, wordlen, seed);
    letter_counts_t global = letter_counts(allowed);
    prior_weight_.clear();
    for(const auto &word : allowed){
        prior_weight_[word] = std::max(1.0, distinct_letter_score(word, global));
    }
}

double WeightedEntropyPolicy::prior_weight(const word_t &word) const{
    auto it = prior_weight_.find(word);
    return it == prior_weight_.end() ? 1.0 : it->second;
}

wordlist_t WeightedEntropyPolicy::select_pool(const wordlist_t &candidates,
    const wordlist_t &allowed) const{
    if(candidates.size() <= CAND_POOL_LIMIT) return candidates;
    std::vector<double> weights(allowed.size());
    for(size_t i = 0; i < allowed.size(); i++){
        weights[i] = prior_weight(allowed[i]);
    }
    return top_k(allowed, weights, POOL_CAP);
}

word_t WeightedEntropyPolicy::next_guess(const game_state_t &state){
    const wordlist_t &candidates = state.candidates;
    wordlist_t pool = select_pool(candidates, state.allowed);
    if(pool.empty()) return pick(state.allowed, state);

    std::vector<double> weights(candidates.size());
    double total = 0.0;
    for(size_t i = 0; i < candidates.size(); i++){
        weights[i] = prior_weight(candidates[i]);
        total += weights[i];
    }

    unsigned long num_patterns = get_num_patterns(state.wordlen);
    wordlist_t best;
    double best_entropy = 0.0;
    unsigned best_worst = 0;
    for(const auto &guess : pool){
        double entropy = 0.0;
        unsigned worst = 0;
        if(total > 0.0){
            std::vector<index_t> patterns = compute_patterns(guess, candidates);
            std::vector<double> pooled(num_patterns, 0.0);
            scatter_reduce(patterns, weights, pooled);
            entropy = entropy_compute(pooled, total);
            std::vector<unsigned> counts(num_patterns, 0);
            for(index_t p : patterns) counts[p] ++;
            worst = worst_bucket(counts);
        }
        if(best.empty() || entropy > best_entropy
            || (entropy == best_entropy && worst < best_worst)){
            best_entropy = entropy;
            best_worst = worst;
            best.assign(1, guess);
        }
        else if(entropy == best_entropy && worst == best_worst){
            best.push_back(guess);
        }
    }
    return pick(best, state);
}

wordlist_t capped_pool(const wordlist_t &candidates, const wordlist_t &allowed){
    if(candidates.size() <= CAND_POOL_LIMIT) return candidates;
    return top_k_by_coverage(allowed, alphabet_counts(candidates), POOL_CAP);
}

word_t ExpectedRemaining::next_guess(const game_state_t &state){
    wordlist_t pool = capped_pool(state.candidates, state.allowed);
    if(pool.empty()) return pick(state.allowed, state);

    wordlist_t best;
    unsigned long best_sum = 0;
    unsigned best_worst = 0;
    for(const auto &guess : pool){
        std::vector<unsigned> counts = bucket_counts(guess, state.candidates);
        unsigned long sum_sq = 0;
        for(unsigned c : counts) sum_sq += static_cast<unsigned long>(c) * c;
        unsigned worst = worst_bucket(counts);
        if(best.empty() || sum_sq < best_sum
            || (sum_sq == best_sum && worst < best_worst)){
            best_sum = sum_sq;
            best_worst = worst;
            best.assign(1, guess);
        }
        else if(sum_sq == best_sum && worst == best_worst){
            best.push_back(guess);
        }
    }
    return pick(best, state);
}

word_t MaxPatternDiversity::next_guess(const game_state_t &state){
    wordlist_t pool = capped_pool(state.candidates, state.allowed);
    if(pool.empty()) return pick(state.allowed, state);

    wordlist_t best;
    long best_patterns = 0;
    unsigned best_worst = 0;
    for(const auto &guess : pool){
        std::vector<unsigned> counts = bucket_counts(guess, state.candidates);
        long patterns = std::count_if(counts.begin(), counts.end(),
            [](unsigned c){ return c > 0; });
        unsigned worst = worst_bucket(counts);
        if(best.empty() || patterns > best_patterns
            || (patterns == best_patterns && worst < best_worst)){
            best_patterns = patterns;
            best_worst = worst;
            best.assign(1, guess);
        }
        else if(patterns == best_patterns && worst == best_worst){
            best.push_back(guess);
        }
    }
    return pick(best, state);
}
