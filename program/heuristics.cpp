#include "heuristics.h"

wordlist_t best_positional(const wordlist_t &pool, const position_counts_t &counts){
    wordlist_t best;
    double best_score = 0.0;
    for(const auto &word : pool){
        double score = positional_score(word, counts, DUPLICATE_PENALTY);
        if(best.empty() || score > best_score){
            best_score = score;
            best.assign(1, word);
        }
        else if(score == best_score){
            best.push_back(word);
        }
    }
    return best;
}

wordlist_t best_coverage(const wordlist_t &pool, const letter_counts_t &counts,
    const std::vector<bool> *banned){
    wordlist_t best;
    double best_score = 0.0;
    for(const auto &word : pool){
        double score = distinct_letter_score(word, counts, banned);
        if(best.empty() || score > best_score){
            best_score = score;
            best.assign(1, word);
        }
        else if(score == best_score){
            best.push_back(word);
        }
    }
    return best;
}

const wordlist_t &frequency_pool(const game_state_t &state){
    if(state.candidates.empty() || state.candidates.size() > CAND_POOL_LIMIT)
        return state.allowed;
    return state.candidates;
}

// Histograms follow the live candidates, the allowed words stand in once none is left
static const wordlist_t &stats_source(const game_state_t &state){
    return state.candidates.empty() ? state.allowed : state.candidates;
}

word_t RandomConsistent::next_guess(const game_state_t &state){
    return pick(stats_source(state), state);
}

word_t LetterFrequency::next_guess(const game_state_t &state){
    letter_counts_t counts = letter_counts(stats_source(state));
    return pick(best_coverage(frequency_pool(state), counts), state);
}

word_t PositionalFrequency::next_guess(const game_state_t &state){
    position_counts_t counts = position_counts(stats_source(state), state.wordlen);
    return pick(best_positional(frequency_pool(state), counts), state);
}

word_t TwoStageProbe::next_guess(const game_state_t &state){
    const wordlist_t &probes = state.allowed.empty() ? state.candidates : state.allowed;
    if(state.turn == 1){
        letter_counts_t counts = alphabet_counts(stats_source(state));
        return pick(best_coverage(probes, counts), state);
    }
    if(state.turn == 2 && !state.history.empty()
        && state.candidates.size() > LARGE_THRESHOLD){
        std::vector<bool> banned(NUMLETTERS, false);
        for(char ch : str2word(state.history[0].first)){
            if(ch >= 'a' && ch <= 'z') banned[ch - 'a'] = true;
        }
        letter_counts_t counts = alphabet_counts(stats_source(state));
        return pick(best_coverage(probes, counts, &banned), state);
    }
    position_counts_t counts = position_counts(stats_source(state), state.wordlen);
    return pick(best_positional(frequency_pool(state), counts), state);
}
