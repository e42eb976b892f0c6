/**
 * Header File for the consistency filter and guess validation
 * #include "filter.h"
*/

#ifndef FILTER_H
#define FILTER_H

#include <unordered_set>
#include "word.h"

typedef std::unordered_set<word_t> wordset_t;

/**
 * Keeps the words that could still be the answer.
 * @param pool Words to test, order is preserved in the output
 * @param history Every (guess, coloring) observed so far
 * @param wordlen Words of any other length (or with non a-z letters) are dropped
 * @returns The words w with word_cmp(guess, w) == coloring for every entry.
 * History entries whose guess has the wrong length are ignored.
*/
wordlist_t filter_candidates(const wordlist_t &pool, const history_t &history,
    int wordlen);

/**
 * A guess is valid if it has wordlen letters a-z (case insensitive)
 * and is in the allowed set.
*/
bool validate_guess(const word_t &guess, const wordset_t &allowed, int wordlen);

#endif /* FILTER_H */
