/**
 * Header File for Word Data Structure and Word wise Operations
 * #include "word.h"
*/

#ifndef WORD_H
#define WORD_H

#include <iostream>
#include <string>
#include <vector>
#include <utility>

#define MAXLEN 8 // Maximum supported word length.
#define NUMCOLORS 3 // Number of Board Colors
#define NUMLETTERS 26
#define PTN_DEFAULT 0

/** A lowercase word over a-z. All words of one game share the same length. */
typedef std::string word_t;

// Word List
typedef std::vector<word_t> wordlist_t;

typedef unsigned short coloring_t;

// (guess, feedback) pairs of one game, in turn order
typedef std::vector<std::pair<word_t, coloring_t>> history_t;

/**
 * Coloring is coded by a base-3 representation of an integer.
 * The right most 3-digit represent the coloring of the 0th letter
 * Digit 0: Represents Grey in Wordle
 * Digit 1: Represents Yellow in Wordle
 * Digit 2: Represents Green in Wordle
*/

/**
 * Obtain the number of coloring patterns for words of length wordlen.
*/
unsigned long get_num_patterns(int wordlen);

/**
 * Determines if a specific pattern corresponds to a correct guess.
*/
bool is_correct_guess(coloring_t c, int wordlen);

/**
 * Word comparison function based on the wordle rules.
 * Green letters are consumed first, the remaining letters of the answer are
 * then matched left to right as yellows, so repeated letters are never
 * credited more often than the answer contains them.
 * @param query The query word you would input into the wordle board
 * @param answer The underlying answer
 * @returns The coloring of the board.
 * @throws std::invalid_argument if the lengths differ or exceed MAXLEN.
*/
coloring_t word_cmp(const word_t &query, const word_t &answer);

/**
 * Text form of a coloring: 'G' green, 'Y' yellow, '-' grey.
*/
std::string pattern_str(coloring_t c, int wordlen);

/**
 * Inverse of pattern_str.
 * @throws std::invalid_argument on any other symbol or an over-long pattern.
*/
coloring_t parse_pattern(const std::string &text);

/**
 * Normalize a raw token: strips surrounding whitespace and lowercases.
*/
word_t str2word(const std::string &source);

/**
 * True if the word has length wordlen and only contains a-z.
*/
bool is_valid_word(const word_t &word, int wordlen);

/**
 * Placeholder guess used when no pool has any word left.
*/
word_t placeholder_word(int wordlen);

void word_print(const word_t &word, coloring_t coloring = PTN_DEFAULT,
    char delim = '\n');

#endif /* WORD_H */
