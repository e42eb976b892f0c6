/**
 * Header File for I/O Functions: word lists, run reports and console output
 * #include "utils.h"
*/

#ifndef UTILS_H
#define UTILS_H

#include <vector>
#include <string>
#include <chrono>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "word.h"
#include "simulator.h"

// Macros for Timing Measurements
#define timestamp std::chrono::steady_clock::now()
#define TIME(start, end) std::chrono::duration_cast<std::chrono::duration<double>>(end - start).count()
#define TIME_MS(start, end) (1000.0 * TIME(start, end))

/**
 * File Formatting:
 * One word per line. Surrounding whitespace is stripped, words are
 * lowercased and blank lines are skipped.
*/

/**
 * I/O function for word list.
 * @param out The words, in file order
 * @returns 0 on success. On failure the reason is printed to cerr.
*/
int read_words_from_file(std::string input_filename, wordlist_t &out);

/**
 * Reads every line of a file as is (line terminators removed).
 * @returns 0 on success
*/
int read_lines_from_file(std::string input_filename, std::vector<std::string> &out);

/**
 * Word List Validation Report
*/
struct list_report_t{
    std::string path;
    bool exists;
    long count;          // valid words
    long unique_count;   // distinct valid words
    long invalid_lines;  // blank, wrong length, non a-z or not lowercase
};

struct wordlist_report_t{
    int wordlen;
    list_report_t answers;
    list_report_t allowed;
    bool answers_subset_allowed;
    bool passed;
    std::vector<std::string> issues;
};

/**
 * Checks a pair of raw word lists: every line must be one lowercase word of
 * length wordlen, the answers must all be allowed.
 * passed requires non empty lists, no invalid line and the subset property.
 * Duplicates are reported as issues but do not fail the check.
*/
wordlist_report_t validate_wordlists(int wordlen,
    const std::vector<std::string> &answer_lines,
    const std::vector<std::string> &allowed_lines);

/**
 * Same check on files. A missing file is reported, not fatal.
*/
wordlist_report_t validate_wordlist_files(int wordlen,
    const std::string &answers_path, const std::string &allowed_path);

/**
 * One line summary, e.g.
 * N=5 | answers=2315 (uniq=2315) | allowed=12972 (uniq=12972) | answers<=allowed=true | OK
*/
std::string pretty_summary(const wordlist_report_t &report);

nlohmann::json report_to_json(const wordlist_report_t &report);

/**
 * Serializes game results, one row per game:
 * solver, N, answer, success, guesses, time_ms, guess_i, patt_i, policy_i
 * for i = 1 .. MAX_TURNS. Patterns get a leading apostrophe so spreadsheet
 * tools keep them as text.
*/
void write_csv(std::ostream &out, const std::vector<episode_result_t> &results, int wordlen);

/**
 * write_csv into a file, creating the parent directory.
 * @returns 0 on success
*/
int write_csv_file(const std::string &output_filename,
    const std::vector<episode_result_t> &results, int wordlen);

/**
 * Writes a pretty printed JSON document, creating the parent directory.
 * @returns 0 on success
*/
int write_manifest(const std::string &output_filename, const nlohmann::json &manifest);

/**
 * Compact UTC run id, e.g. 20250820T024121Z
*/
std::string timestamp_id();

/**
 * Per solver win rate, mean guesses over wins and mean time.
*/
void report_results(const std::vector<episode_result_t> &results);

/**
 * Used in verbose mode: prints every guess of a game in color.
*/
void report_game(const episode_result_t &result);

void print_progress_bar(size_t progress, size_t total);

#endif /* UTILS_H */
