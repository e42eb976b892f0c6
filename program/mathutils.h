/**
 * Header File for all math operations used in the wordle solver
 * #include "mathutils.h"
*/

#include <cmath>
#include <vector>
#include <algorithm>
#include <iterator>
#include "word.h"

#ifndef MATH_H
#define MATH_H

#define PRECISION 1e-12
typedef coloring_t index_t;

template <typename T, typename A>
int arg_max(std::vector<T, A> const& vec) {
  return static_cast<int>(std::distance(vec.begin(), max_element(vec.begin(), vec.end())));
}

/**
 * Test if a floating point number is 0.
*/
bool is_zero(double x);

/**
 * Generic Scatter Reduce Function: out[index[i]] += in[i]
 * @param index An array of indices
 * @param in The input floating point array (in.size() == index.size())
 * @param out The output floating point array, sized by the caller
*/
void scatter_reduce(const std::vector<index_t> &index, const std::vector<double> &in,
    std::vector<double> &out);

/**
 * Colors every answer against one guess.
 * @returns patterns[i] = word_cmp(guess, answers[i])
*/
std::vector<index_t> compute_patterns(const word_t &guess, const wordlist_t &answers);

/**
 * Bucket sizes of the partition induced by a guess: the result has
 * get_num_patterns(wordlen) slots, most of them zero.
*/
std::vector<unsigned> bucket_counts(const word_t &guess, const wordlist_t &answers);

/**
 * Computes the entropy (in bits) via a map reduce operation
 * @param floats - Either a probability or a pooled weights
 * @param normalize - The constant multiple applied to each term to normalize
 * into a probability distribution.
*/
double entropy_compute(const std::vector<double> &floats, double normalize = 1.0);

/**
 * Entropy (in bits) of a partition given by bucket sizes.
*/
double bucket_entropy(const std::vector<unsigned> &counts, unsigned total);

/**
 * Size of the largest bucket.
*/
unsigned worst_bucket(const std::vector<unsigned> &counts);

#endif /* MATH_H */
