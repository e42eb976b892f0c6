/**
 * Header File for letter statistics used to score and pre-rank guesses
 * #include "letterstats.h"
*/

#ifndef LETTERSTATS_H
#define LETTERSTATS_H

#include <vector>
#include "word.h"

// One slot per letter a-z
typedef std::vector<double> letter_counts_t;

// [position][letter]
typedef std::vector<letter_counts_t> position_counts_t;

/**
 * Number of occurrences of each letter over all words (a word with a
 * repeated letter counts it twice).
*/
letter_counts_t letter_counts(const wordlist_t &words);

/**
 * Number of words containing each letter at least once.
*/
letter_counts_t alphabet_counts(const wordlist_t &words);

/**
 * Per position letter histogram.
*/
position_counts_t position_counts(const wordlist_t &words, int wordlen);

/**
 * Coverage score: sum of counts over the distinct letters of the word.
 * @param banned Letters that contribute nothing (optional)
*/
double distinct_letter_score(const word_t &word, const letter_counts_t &counts,
    const std::vector<bool> *banned = nullptr);

/**
 * Sum of per-position counts, minus penalty for each repeated letter
 * occurrence beyond the first.
*/
double positional_score(const word_t &word, const position_counts_t &counts,
    double penalty);

/**
 * True if some letter occurs more than once.
*/
bool has_repeated_letter(const word_t &word);

/**
 * Stable ranking: the k highest scoring words, equal scores keep list order.
 * @param scores scores[i] belongs to words[i]
*/
wordlist_t top_k(const wordlist_t &words, const std::vector<double> &scores,
    size_t k);

/**
 * top_k ranked by distinct-letter coverage.
*/
wordlist_t top_k_by_coverage(const wordlist_t &words, const letter_counts_t &counts,
    size_t k);

/**
 * Concatenation of first and second without duplicates, first occurrence wins.
*/
wordlist_t stable_union(const wordlist_t &first, const wordlist_t &second);

#endif /* LETTERSTATS_H */
