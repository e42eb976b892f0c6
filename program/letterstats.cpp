#include "letterstats.h"
#include <algorithm>
#include <numeric>
#include <unordered_set>

static inline int letter_index(char ch){
    return (ch >= 'a' && ch <= 'z') ? ch - 'a' : -1;
}

letter_counts_t letter_counts(const wordlist_t &words){
    letter_counts_t out(NUMLETTERS, 0.0);
    for(const auto &word : words){
        for(char ch : word){
            int j = letter_index(ch);
            if(j >= 0) out[j] += 1.0;
        }
    }
    return out;
}

letter_counts_t alphabet_counts(const wordlist_t &words){
    letter_counts_t out(NUMLETTERS, 0.0);
    for(const auto &word : words){
        bool seen[NUMLETTERS] = { 0 };
        for(char ch : word){
            int j = letter_index(ch);
            if(j < 0 || seen[j]) continue;
            seen[j] = true;
            out[j] += 1.0;
        }
    }
    return out;
}

position_counts_t position_counts(const wordlist_t &words, int wordlen){
    position_counts_t out(wordlen, letter_counts_t(NUMLETTERS, 0.0));
    for(const auto &word : words){
        int n = std::min(wordlen, static_cast<int>(word.size()));
        for(int i = 0; i < n; i++){
            int j = letter_index(word[i]);
            if(j >= 0) out[i][j] += 1.0;
        }
    }
    return out;
}

double distinct_letter_score(const word_t &word, const letter_counts_t &counts,
    const std::vector<bool> *banned){
    bool seen[NUMLETTERS] = { 0 };
    double score = 0.0;
    for(char ch : word){
        int j = letter_index(ch);
        if(j < 0 || seen[j]) continue;
        if(banned != nullptr && (*banned)[j]) continue;
        seen[j] = true;
        score += counts[j];
    }
    return score;
}

double positional_score(const word_t &word, const position_counts_t &counts,
    double penalty){
    bool seen[NUMLETTERS] = { 0 };
    double score = 0.0;
    int n = std::min(counts.size(), word.size());
    for(int i = 0; i < n; i++){
        int j = letter_index(word[i]);
        if(j < 0) continue;
        score += counts[i][j];
        if(seen[j]) score -= penalty;
        else seen[j] = true;
    }
    return score;
}

bool has_repeated_letter(const word_t &word){
    bool seen[NUMLETTERS] = { 0 };
    for(char ch : word){
        int j = letter_index(ch);
        if(j < 0) continue;
        if(seen[j]) return true;
        seen[j] = true;
    }
    return false;
}

wordlist_t top_k(const wordlist_t &words, const std::vector<double> &scores,
    size_t k){
    std::vector<size_t> order(words.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scores](size_t a, size_t b){
        return scores[a] > scores[b];
    });
    size_t n = std::min(k, order.size());
    wordlist_t out;
    out.reserve(n);
    for(size_t i = 0; i < n; i++){
        out.push_back(words[order[i]]);
    }
    return out;
}

wordlist_t top_k_by_coverage(const wordlist_t &words, const letter_counts_t &counts,
    size_t k){
    std::vector<double> scores(words.size());
    for(size_t i = 0; i < words.size(); i++){
        scores[i] = distinct_letter_score(words[i], counts);
    }
    return top_k(words, scores, k);
}

wordlist_t stable_union(const wordlist_t &first, const wordlist_t &second){
    std::unordered_set<word_t> seen;
    wordlist_t out;
    out.reserve(first.size() + second.size());
    for(const auto *list : { &first, &second }){
        for(const auto &word : *list){
            if(seen.insert(word).second) out.push_back(word);
        }
    }
    return out;
}
