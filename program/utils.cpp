#include "utils.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <unordered_set>

/*******************************
 * File I/O Functions
********************************/

int read_lines_from_file(std::string input_filename, std::vector<std::string> &out){
    std::ifstream file(input_filename);
    if(!file.is_open()){
        std::cerr << "Unable to open file: " << input_filename << " .\n";
        return 1;
    }
    out.clear();
    std::string line;
    while (getline(file, line)) {
        if(!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    file.close();
    return 0;
}

int read_words_from_file(std::string input_filename, wordlist_t &out){
    std::vector<std::string> lines;
    if(read_lines_from_file(input_filename, lines)) return 1;
    out.clear();
    for(const auto &line : lines){
        word_t word = str2word(line);
        if(!word.empty()) out.push_back(word);
    }
    if(out.empty()){
        std::cerr << "Unsupported File Format: " << input_filename
            << " [Err: No Words]\n";
        return 1;
    }
    return 0;
}

/*******************************
 * Word List Validation
********************************/

static list_report_t check_lines(const std::vector<std::string> &lines, int wordlen,
    std::unordered_set<word_t> &unique){
    list_report_t out;
    out.exists = true;
    out.count = 0;
    out.invalid_lines = 0;
    for(const auto &line : lines){
        word_t word = str2word(line);
        // Uppercase input is rejected here even though str2word would accept it
        bool lowercase = true;
        for(char ch : line){
            if(ch >= 'A' && ch <= 'Z') lowercase = false;
        }
        if(word.empty() || !lowercase || !is_valid_word(word, wordlen)){
            out.invalid_lines ++;
            continue;
        }
        out.count ++;
        unique.insert(word);
    }
    out.unique_count = unique.size();
    return out;
}

wordlist_report_t validate_wordlists(int wordlen,
    const std::vector<std::string> &answer_lines,
    const std::vector<std::string> &allowed_lines){
    wordlist_report_t report;
    report.wordlen = wordlen;
    std::unordered_set<word_t> answers;
    std::unordered_set<word_t> allowed;
    report.answers = check_lines(answer_lines, wordlen, answers);
    report.allowed = check_lines(allowed_lines, wordlen, allowed);

    std::vector<word_t> missing;
    for(const auto &word : answers){
        if(!allowed.count(word)) missing.push_back(word);
    }
    report.answers_subset_allowed = missing.empty();
    if(!missing.empty()){
        std::sort(missing.begin(), missing.end());
        std::string example;
        for(size_t i = 0; i < missing.size() && i < 5; i++){
            if(i) example += ", ";
            example += missing[i];
        }
        report.issues.push_back("answers not subset of allowed (e.g., " + example + ")");
    }
    if(report.answers.count == 0)
        report.issues.push_back("answers file contains 0 valid words");
    if(report.allowed.count == 0)
        report.issues.push_back("allowed file contains 0 valid words");
    if(report.answers.invalid_lines)
        report.issues.push_back("answers has " + std::to_string(report.answers.invalid_lines) + " invalid line(s)");
    if(report.allowed.invalid_lines)
        report.issues.push_back("allowed has " + std::to_string(report.allowed.invalid_lines) + " invalid line(s)");
    if(report.answers.count != report.answers.unique_count)
        report.issues.push_back("answers contains duplicate lines");
    if(report.allowed.count != report.allowed.unique_count)
        report.issues.push_back("allowed contains duplicate lines");

    report.passed = report.answers_subset_allowed
        && report.answers.invalid_lines == 0 && report.allowed.invalid_lines == 0
        && report.answers.count > 0 && report.allowed.count > 0;
    return report;
}

wordlist_report_t validate_wordlist_files(int wordlen,
    const std::string &answers_path, const std::string &allowed_path){
    std::vector<std::string> answer_lines, allowed_lines;
    bool answers_exist = std::filesystem::exists(answers_path)
        && read_lines_from_file(answers_path, answer_lines) == 0;
    bool allowed_exist = std::filesystem::exists(allowed_path)
        && read_lines_from_file(allowed_path, allowed_lines) == 0;

    wordlist_report_t report = validate_wordlists(wordlen, answer_lines, allowed_lines);
    report.answers.path = answers_path;
    report.allowed.path = allowed_path;
    report.answers.exists = answers_exist;
    report.allowed.exists = allowed_exist;
    if(!answers_exist || !allowed_exist){
        report.issues.clear();
        if(!answers_exist) report.issues.push_back("answers file not found: " + answers_path);
        if(!allowed_exist) report.issues.push_back("allowed file not found: " + allowed_path);
        report.answers_subset_allowed = false;
        report.passed = false;
    }
    return report;
}

std::string pretty_summary(const wordlist_report_t &report){
    std::ostringstream out;
    out << "N=" << report.wordlen
        << " | answers=" << report.answers.count << " (uniq=" << report.answers.unique_count << ")"
        << " | allowed=" << report.allowed.count << " (uniq=" << report.allowed.unique_count << ")"
        << " | answers<=allowed=" << (report.answers_subset_allowed ? "true" : "false")
        << " | " << (report.passed ? "OK" : "FAIL");
    return out.str();
}

static nlohmann::json list_to_json(const list_report_t &list){
    return {
        {"path", list.path},
        {"exists", list.exists},
        {"count", list.count},
        {"unique_count", list.unique_count},
        {"invalid_lines", list.invalid_lines}
    };
}

nlohmann::json report_to_json(const wordlist_report_t &report){
    return {
        {"N", report.wordlen},
        {"answers", list_to_json(report.answers)},
        {"allowed", list_to_json(report.allowed)},
        {"answers_subset_allowed", report.answers_subset_allowed},
        {"passed", report.passed},
        {"issues", report.issues}
    };
}

/*******************************
 * Run Reports
********************************/

static int make_parent_dir(const std::string &output_filename){
    std::filesystem::path parent = std::filesystem::path(output_filename).parent_path();
    if(parent.empty()) return 0;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if(ec){
        std::cerr << "Unable to create directory: " << parent.string()
            << " [Err: " << ec.message() << "]\n";
        return 1;
    }
    return 0;
}

void write_csv(std::ostream &out, const std::vector<episode_result_t> &results, int wordlen){
    out << "solver,N,answer,success,guesses,time_ms";
    for(int i = 1; i <= MAX_TURNS; i++)
        out << ",guess_" << i << ",patt_" << i << ",policy_" << i;
    out << "\n";
    for(const auto &r : results){
        out << r.solver << "," << wordlen << "," << r.answer << ","
            << (r.success ? "True" : "False") << "," << r.guesses << ","
            << std::fixed << std::setprecision(3) << r.time_ms;
        out.unsetf(std::ios_base::floatfield);
        for(int i = 0; i < MAX_TURNS; i++){
            if(i < static_cast<int>(r.history.size())){
                out << "," << r.history[i].first << ",'"
                    << pattern_str(r.history[i].second, wordlen) << ","
                    << (i < static_cast<int>(r.policies.size()) ? r.policies[i] : "");
            }
            else{
                out << ",,,";
            }
        }
        out << "\n";
    }
}

int write_csv_file(const std::string &output_filename,
    const std::vector<episode_result_t> &results, int wordlen){
    if(make_parent_dir(output_filename)) return 1;
    std::ofstream file(output_filename);
    if(!file.is_open()){
        std::cerr << "Unable to open file: " << output_filename << " .\n";
        return 1;
    }
    write_csv(file, results, wordlen);
    file.close();
    return 0;
}

int write_manifest(const std::string &output_filename, const nlohmann::json &manifest){
    if(make_parent_dir(output_filename)) return 1;
    std::ofstream file(output_filename);
    if(!file.is_open()){
        std::cerr << "Unable to open file: " << output_filename << " .\n";
        return 1;
    }
    file << manifest.dump(2) << "\n";
    file.close();
    return 0;
}

std::string timestamp_id(){
    std::time_t now = std::time(nullptr);
    std::tm utc = *std::gmtime(&now);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
    return buffer;
}

/*******************************
 * Console Output
********************************/

void report_results(const std::vector<episode_result_t> &results){
    std::vector<std::string> order;
    std::map<std::string, std::vector<const episode_result_t *>> by_solver;
    for(const auto &r : results){
        if(!by_solver.count(r.solver)) order.push_back(r.solver);
        by_solver[r.solver].push_back(&r);
    }
    for(const auto &solver : order){
        const auto &games = by_solver[solver];
        long wins = 0;
        long guesses = 0;
        double time_ms = 0.0;
        for(const auto *r : games){
            if(r->success){
                wins ++;
                guesses += r->guesses;
            }
            time_ms += r->time_ms;
        }
        std::cout << solver << ": games=" << games.size()
            << " win_rate=" << static_cast<double>(wins) / games.size()
            << " avg_guesses=" << (wins ? static_cast<double>(guesses) / wins : 0.0)
            << " avg_time_ms=" << time_ms / games.size() << "\n";
    }
}

void report_game(const episode_result_t &result){
    std::cout << "Answer: ";
    word_print(result.answer, PTN_DEFAULT, ' ');
    std::cout << "[" << result.solver << "]\n";
    for(size_t i = 0; i < result.history.size(); i++){
        word_print(result.history[i].first, result.history[i].second, ' ');
        if(i < result.policies.size()) std::cout << "(" << result.policies[i] << ")";
        std::cout << "\n";
    }
    std::cout << (result.success ? "Solved" : "Failed") << " in "
        << result.guesses << " guesses, " << result.time_ms << " ms\n";
}

void print_progress_bar(size_t progress, size_t total) {
    const int bar_width = 70;
    float percent = total ? static_cast<float>(progress) / total : 1.0f;
    std::cout << "[";
    int pos = bar_width * percent;
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << int(percent * 100.0) << " %\r";
    std::cout.flush();
}
