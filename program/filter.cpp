#include "filter.h"

wordlist_t filter_candidates(const wordlist_t &pool, const history_t &history,
    int wordlen){
    wordlist_t out;
    for(const auto &raw : pool){
        word_t word = str2word(raw);
        if(!is_valid_word(word, wordlen)) continue;
        bool consistent = true;
        for(const auto &entry : history){
            if(static_cast<int>(entry.first.size()) != wordlen) continue;
            if(word_cmp(entry.first, word) != entry.second){
                consistent = false;
                break;
            }
        }
        if(consistent) out.push_back(word);
    }
    return out;
}

bool validate_guess(const word_t &guess, const wordset_t &allowed, int wordlen){
    word_t word = str2word(guess);
    if(!is_valid_word(word, wordlen)) return false;
    return allowed.count(word) > 0;
}
