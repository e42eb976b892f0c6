#include "features.h"
#include "letterstats.h"
#include <algorithm>
#include <cmath>

static const char *PATTERN_TYPE_NAMES[NUM_PATTERN_TYPES] = {
    "all_gray", "some_green", "some_yellow", "mix_GY", "other"
};

pattern_type_t pattern_type(int pattern, int wordlen){
    if(pattern == NO_PATTERN || wordlen <= 0) return OTHER;
    int greens = 0;
    int yellows = 0;
    for(int i = 0; i < wordlen; i++){
        if(pattern % NUMCOLORS == 2) greens++;
        else if(pattern % NUMCOLORS == 1) yellows++;
        pattern /= NUMCOLORS;
    }
    if(greens == 0 && yellows == 0) return ALL_GRAY;
    if(yellows == 0) return SOME_GREEN;
    if(greens == 0) return SOME_YELLOW;
    return MIX_GY;
}

const char *pattern_type_name(pattern_type_t type){
    return PATTERN_TYPE_NAMES[type];
}

int feature_dim(int wordlen){
    return 5 + wordlen + NUM_PATTERN_TYPES;
}

static std::vector<double> slot_entropy(const wordlist_t &candidates, int wordlen){
    std::vector<double> out(wordlen, 0.0);
    if(candidates.empty()) return out;
    position_counts_t counts = position_counts(candidates, wordlen);
    double n = static_cast<double>(candidates.size());
    for(int i = 0; i < wordlen; i++){
        for(double c : counts[i]){
            if(c <= 0.0) continue;
            double p = c / n;
            out[i] -= p * std::log(p + 1e-12);
        }
    }
    return out;
}

static double dup_ratio(const wordlist_t &candidates){
    if(candidates.empty()) return 0.0;
    long dup = std::count_if(candidates.begin(), candidates.end(), has_repeated_letter);
    return static_cast<double>(dup) / candidates.size();
}

features_t make_features(int turn, int wordlen, const wordlist_t &candidates,
    long prev_size, int last_pattern){
    features_t out;
    double size = static_cast<double>(candidates.size());
    double shrink = 0.0;
    if(prev_size > 0)
        shrink = (prev_size - size) / prev_size;

    out.values = { static_cast<double>(turn), static_cast<double>(wordlen),
        std::log2(std::max(size, 1.0)), shrink, dup_ratio(candidates) };
    out.names = { "turn", "N", "log2_c", "shrink", "dup_ratio" };

    std::vector<double> entropies = slot_entropy(candidates, wordlen);
    for(int i = 0; i < wordlen; i++){
        out.values.push_back(entropies[i]);
        out.names.push_back("H" + std::to_string(i));
    }

    pattern_type_t type = pattern_type(last_pattern, wordlen);
    for(int k = 0; k < NUM_PATTERN_TYPES; k++){
        out.values.push_back(k == type ? 1.0 : 0.0);
        out.names.push_back(std::string("pt_") + PATTERN_TYPE_NAMES[k]);
    }
    return out;
}
