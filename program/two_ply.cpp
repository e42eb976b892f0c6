#include "two_ply.h"
#include "filter.h"
#include "heuristics.h"
#include "letterstats.h"
#include "mathutils.h"
#include <algorithm>
#include <limits>
#include <map>
#include <numeric>

word_t capped_positional_pick(const wordlist_t &candidates, int wordlen,
    std::mt19937 &rng){
    if(candidates.empty()) return placeholder_word(wordlen);
    wordlist_t pool = top_k_by_coverage(candidates, alphabet_counts(candidates), CAND_CAP_PLY2);
    wordlist_t best = best_positional(pool, position_counts(candidates, wordlen));
    std::uniform_int_distribution<size_t> dist(0, best.size() - 1);
    return best[dist(rng)];
}

wordlist_t TwoPlyMC::select_first_pool(const wordlist_t &candidates,
    const wordlist_t &allowed){
    letter_counts_t counts = alphabet_counts(candidates.empty() ? allowed : candidates);
    return stable_union(top_k_by_coverage(candidates, counts, FIRST_POOL_CAP / 2),
        top_k_by_coverage(allowed, counts, FIRST_POOL_CAP));
}

// Up to k answers drawn without replacement, all of them if there are fewer
static wordlist_t sample_answers(const wordlist_t &candidates, size_t k,
    std::mt19937 &rng){
    if(candidates.size() <= k) return candidates;
    std::vector<size_t> idx(candidates.size());
    std::iota(idx.begin(), idx.end(), 0);
    wordlist_t out;
    out.reserve(k);
    for(size_t i = 0; i < k; i++){
        std::uniform_int_distribution<size_t> dist(i, idx.size() - 1);
        std::swap(idx[i], idx[dist(rng)]);
        out.push_back(candidates[idx[i]]);
    }
    return out;
}

TwoPlyMC::ply_score_t TwoPlyMC::score_first_guess(const word_t &guess,
    const wordlist_t &candidates, const wordlist_t &sample, int wordlen,
    std::mt19937 &rng, double bound){
    // Group the sampled answers by first feedback, in order of first appearance
    std::vector<coloring_t> order;
    std::map<coloring_t, wordlist_t> groups;
    for(const auto &answer : sample){
        coloring_t p1 = word_cmp(guess, answer);
        if(!groups.count(p1)) order.push_back(p1);
        groups[p1].push_back(answer);
    }

    ply_score_t out = {0.0, 0, 0, false};
    unsigned long total = 0;
    unsigned long processed = 0;
    for(coloring_t p1 : order){
        out.groups ++;
        history_t first_ply(1, std::make_pair(guess, p1));
        wordlist_t remaining = filter_candidates(candidates, first_ply, wordlen);
        if(remaining.empty()) continue;

        word_t reply = capped_positional_pick(remaining, wordlen, rng);
        std::vector<unsigned> buckets = bucket_counts(reply, remaining);
        for(const auto &answer : groups[p1]){
            unsigned left = buckets[word_cmp(reply, answer)];
            total += left;
            if(left > out.worst) out.worst = left;
            processed ++;
        }

        out.avg = static_cast<double>(total) / processed;
        if(out.avg > bound){
            out.pruned = true;
            break;
        }
    }
    return out;
}

word_t TwoPlyMC::next_guess(const game_state_t &state){
    std::mt19937 &gen = rng(state);
    const wordlist_t &candidates = state.candidates;
    if(candidates.empty()) return pick(state.allowed, state);
    if(state.turn > 1)
        return capped_positional_pick(candidates, state.wordlen, gen);

    wordlist_t pool = select_first_pool(candidates, state.allowed);
    wordlist_t sample = sample_answers(candidates, SAMPLE_SIZE, gen);

    wordlist_t best;
    double best_avg = 0.0;
    unsigned best_worst = 0;
    for(const auto &guess : pool){
        double bound = best.empty() ? std::numeric_limits<double>::infinity() : best_avg;
        ply_score_t score = score_first_guess(guess, candidates, sample, state.wordlen, gen, bound);
        if(score.pruned) continue;

        if(best.empty() || score.avg < best_avg
            || (score.avg == best_avg && score.worst < best_worst)){
            best_avg = score.avg;
            best_worst = score.worst;
            best.assign(1, guess);
        }
        else if(score.avg == best_avg && score.worst == best_worst){
            best.push_back(guess);
        }
    }
    return pick(best, state);
}
