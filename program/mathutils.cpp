#include "mathutils.h"

bool is_zero(double x){
    return std::fabs(x) <= PRECISION;
}

static double entropy(double prob){
    if(is_zero(prob)) return 0.0;
    return prob * std::log2(1.0 / prob);
}

static double normalize_entropy(double in, double total){
    return(entropy(in/total));
}

void scatter_reduce(const std::vector<index_t> &index, const std::vector<double> &in,
    std::vector<double> &out){
    size_t n = index.size();
    index_t j;
    for(size_t i = 0; i < n; i++){
        j = index[i];
        out[j] += in[i];
    }
}

std::vector<index_t> compute_patterns(const word_t &guess, const wordlist_t &answers){
    std::vector<index_t> out(answers.size());
    for(size_t i = 0; i < answers.size(); i++){
        out[i] = word_cmp(guess, answers[i]);
    }
    return out;
}

std::vector<unsigned> bucket_counts(const word_t &guess, const wordlist_t &answers){
    std::vector<unsigned> out(get_num_patterns(static_cast<int>(guess.size())), 0);
    for(const auto &answer : answers){
        out[word_cmp(guess, answer)] ++;
    }
    return out;
}

double entropy_compute(const std::vector<double> &floats, double normalize){
    double out = 0.0;
    for(size_t i = 0; i < floats.size(); i++){
        out += normalize_entropy(floats[i], normalize);
    }
    return out;
}

double bucket_entropy(const std::vector<unsigned> &counts, unsigned total){
    if(total <= 1) return 0.0;
    double out = 0.0;
    for(unsigned c : counts){
        if(c == 0) continue;
        out += normalize_entropy(static_cast<double>(c), static_cast<double>(total));
    }
    return out;
}

unsigned worst_bucket(const std::vector<unsigned> &counts){
    if(counts.empty()) return 0;
    return counts[arg_max(counts)];
}
