#include "word.h"
#include <cctype>
#include <stdexcept>

// Printing Color Codes: https://stackoverflow.com/questions/9158150/colored-output-in-c/9158263
#define RESET   "\033[0m"
#define BLACK   "\033[30m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"

unsigned long get_num_patterns(int wordlen){
    unsigned long out = 1;
    for(int i = 0; i < wordlen; i++)
        out *= NUMCOLORS;
    return out;
}

bool is_correct_guess(coloring_t c, int wordlen){
    return (c == get_num_patterns(wordlen) - 1);
}

coloring_t word_cmp(const word_t &query, const word_t &answer){
    if(query.size() != answer.size())
        throw std::invalid_argument("word_cmp: length mismatch between '" +
            query + "' and '" + answer + "'");
    if(query.size() > MAXLEN)
        throw std::invalid_argument("word_cmp: word longer than MAXLEN: " + query);

    int wordlen = static_cast<int>(query.size());
    bool green[MAXLEN] = { 0 };
    // Unmatched answer letters, available to become yellows
    int remaining[NUMLETTERS] = { 0 };

    coloring_t out = 0;
    coloring_t mult = 1;
    // Check for green boxes first
    for(int i = 0; i < wordlen; i++){
        if(query[i] == answer[i]){
            out += (2 * mult);
            green[i] = true;
        }
        else if(answer[i] >= 'a' && answer[i] <= 'z'){
            remaining[answer[i] - 'a'] ++;
        }
        mult *= NUMCOLORS;
    }

    // reset multiplier
    mult = 1;
    // Check for yellow boxes
    for(int i = 0; i < wordlen; i++){
        if(!green[i] && query[i] >= 'a' && query[i] <= 'z'
            && remaining[query[i] - 'a'] > 0){
            out += mult;
            remaining[query[i] - 'a'] --;
        }
        mult *= NUMCOLORS;
    }
    return out;
}

std::string pattern_str(coloring_t c, int wordlen){
    std::string out(wordlen, '-');
    for(int i = 0; i < wordlen; i++){
        if(c % NUMCOLORS == 2) out[i] = 'G';
        else if(c % NUMCOLORS == 1) out[i] = 'Y';
        c = c / NUMCOLORS;
    }
    return out;
}

coloring_t parse_pattern(const std::string &text){
    if(text.size() > MAXLEN)
        throw std::invalid_argument("parse_pattern: pattern too long: " + text);
    coloring_t out = 0;
    coloring_t mult = 1;
    for(char ch : text){
        if(ch == 'G') out += 2 * mult;
        else if(ch == 'Y') out += mult;
        else if(ch != '-')
            throw std::invalid_argument("parse_pattern: bad symbol in " + text);
        mult *= NUMCOLORS;
    }
    return out;
}

word_t str2word(const std::string &source){
    size_t start = 0;
    size_t end = source.size();
    while(start < end && std::isspace(static_cast<unsigned char>(source[start])))
        start++;
    while(end > start && std::isspace(static_cast<unsigned char>(source[end - 1])))
        end--;
    word_t out = source.substr(start, end - start);
    for(auto &ch : out)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

bool is_valid_word(const word_t &word, int wordlen){
    if(static_cast<int>(word.size()) != wordlen) return false;
    for(char ch : word){
        if(ch < 'a' || ch > 'z') return false;
    }
    return true;
}

word_t placeholder_word(int wordlen){
    return word_t(wordlen, 'a');
}

void word_print(const word_t &word, coloring_t coloring, char delim){
    for(size_t i = 0; i < word.size(); i ++){
        if(coloring % 3 == 2)
            std::cout << GREEN << word[i] << RESET;
        else if (coloring % 3 == 1)
            std::cout << YELLOW << word[i] << RESET;
        else
            std::cout << BLACK << word[i] << RESET;
        coloring = coloring / NUMCOLORS;
    }
    std::cout << delim;
}
