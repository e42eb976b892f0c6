#include "word.h"
#include "utils.h"
#include "policy.h"
#include "linucb.h"
#include "simulator.h"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>
#include <omp.h>

#define DEFAULT_WORDLEN 5
#define DEFAULT_SEED 123
#define DEFAULT_EPISODES 50000
#define DEFAULT_EVAL_SAMPLE 200
#define LOG_EVERY 1000

void usage(char *exec_name){
    std::cout << "Usage:\n" << exec_name << " -a <answers list> -g <allowed list> [-x <mode> -s <solver ids> -m <word length> -k <sample> -r <seed> -o <output dir> -n <thread count> -v]\n";
    std::cout << "-x: run (default), multi, train or eval\n";
    std::cout << "-s: solver id (run) or comma separated ids (multi, and the bandit actions for train)\n";
    std::cout << "-m: word length. Must be in between 1 and " << MAXLEN << " (default " << DEFAULT_WORDLEN << ")\n";
    std::cout << "-k: number of answers to play (run: the first k, multi and eval: a seeded sample)\n";
    std::cout << "-e: training episodes (train, default " << DEFAULT_EPISODES << ")\n";
    std::cout << "-M: bandit model file (eval)\n";
    std::cout << "-u: LinUCB exploration strength (train, default " << UCB_ALPHA << ")\n";
    std::cout << "-t: compute time weight in the bandit reward (default " << TIME_PENALTY << ")\n";
    std::cout << "-v: verbose mode\n";
    std::cout << "Known solvers:";
    for(const auto &id : default_registry().ids()) std::cout << " " << id;
    std::cout << "\n";
    return;
}

static std::vector<std::string> split_ids(const std::string &text){
    std::vector<std::string> out;
    std::stringstream stream(text);
    std::string id;
    while(std::getline(stream, id, ',')){
        if(!id.empty()) out.push_back(id);
    }
    return out;
}

static std::string join_path(const std::string &dir, const std::string &file){
    if(dir.empty()) return file;
    return dir.back() == '/' ? dir + file : dir + "/" + file;
}

int main(int argc, char **argv) {
    auto init_start = timestamp;

    // Initialization Stage
    std::string answers_filename;
    std::string allowed_filename;
    std::string model_filename;
    std::string output_dir;
    std::string solvers;
    std::string mode = "run";
    int wordlen = DEFAULT_WORDLEN;
    int num_threads = 1;
    long sample = 0;
    long episodes = DEFAULT_EPISODES;
    unsigned seed = DEFAULT_SEED;
    double ucb_alpha = UCB_ALPHA;
    double alpha_time = TIME_PENALTY;
    bool verbose = false;
    int opt;
    // Read program parameters
    while ((opt = getopt(argc, argv, "a:g:s:x:m:k:r:o:n:e:M:u:t:v")) != -1) {
        switch (opt) {
        case 'a':
            answers_filename = optarg;
            break;
        case 'g':
            allowed_filename = optarg;
            break;
        case 's':
            solvers = optarg;
            break;
        case 'x':
            mode = optarg;
            break;
        case 'm':
            wordlen = atoi(optarg);
            break;
        case 'k':
            sample = atol(optarg);
            break;
        case 'r':
            seed = static_cast<unsigned>(atol(optarg));
            break;
        case 'o':
            output_dir = optarg;
            break;
        case 'n':
            num_threads = atoi(optarg);
            break;
        case 'e':
            episodes = atol(optarg);
            break;
        case 'M':
            model_filename = optarg;
            break;
        case 'u':
            ucb_alpha = atof(optarg);
            break;
        case 't':
            alpha_time = atof(optarg);
            break;
        case 'v':
            verbose = true;
            break;
        default:
            usage(argv[0]);
            exit(1);
        }
    }
    if(answers_filename.empty() || allowed_filename.empty() || num_threads <= 0){
        usage(argv[0]);
        exit(1);
    }
    if(wordlen <= 0 || wordlen > MAXLEN){
        std::cerr << "Invalid Wordlen Parameter [" << wordlen << "]\n";
        exit(1);
    }
    if(mode != "run" && mode != "multi" && mode != "train" && mode != "eval"){
        std::cerr << "Invalid Mode Parameter [" << mode << "]\n";
        usage(argv[0]);
        exit(1);
    }
    if(mode == "eval" && model_filename.empty()){
        std::cerr << "Evaluation requires a model file (-M)\n";
        exit(1);
    }
    if(output_dir.empty()){
        if(mode == "run") output_dir = "reports";
        else if(mode == "multi") output_dir = "reports/batch";
        else if(mode == "train") output_dir = "reports/bandit_train";
        else output_dir = "reports/bandit_eval";
    }

    omp_set_num_threads(num_threads);

    try{
        // Validate and load the word lists
        wordlist_report_t report = validate_wordlist_files(wordlen, answers_filename, allowed_filename);
        std::cout << pretty_summary(report) << "\n";
        for(const auto &issue : report.issues) std::cout << "  " << issue << "\n";

        wordlist_t answers, allowed;
        if(read_words_from_file(answers_filename, answers)) exit(1);
        if(read_words_from_file(allowed_filename, allowed)) exit(1);
        word_pools_t pools = make_pools(answers, allowed, wordlen);
        if(pools.answers.empty()){
            std::cerr << "No answer of length " << wordlen << " in " << answers_filename << "\n";
            exit(1);
        }

        auto init_end = timestamp;
        std::cout << "IO Initialization: " << TIME(init_start, init_end) << "\n";

        std::string run_id = timestamp_id();
        nlohmann::json config = {
            {"mode", mode}, {"N", wordlen}, {"answers", answers_filename},
            {"allowed", allowed_filename}, {"seed", seed}, {"sample", sample},
            {"outdir", output_dir}, {"threads", num_threads}
        };

        auto run_start = timestamp;
        if(mode == "run" || mode == "multi"){
            std::vector<std::string> ids = split_ids(solvers.empty() ? "random_consistent" : solvers);
            if(mode == "run" && ids.size() != 1){
                std::cerr << "Run mode takes a single solver id, use -x multi for several\n";
                exit(1);
            }
            wordlist_t cases = (mode == "run") ? first_cases(pools.answers, sample)
                : sample_cases(pools.answers, sample, seed);
            for(const auto &id : ids){
                std::cout << "=== Running " << id << " on " << cases.size()
                    << " cases (N=" << wordlen << ") ===\n";
                std::vector<episode_result_t> results = run_batch(id, cases, pools, seed, !verbose);
                if(verbose){
                    for(const auto &r : results) report_game(r);
                }
                report_results(results);

                std::string dir = (mode == "multi") ? join_path(output_dir, id) : output_dir;
                std::string csv_path = join_path(dir, "run_" + run_id + ".csv");
                std::string manifest_path = join_path(dir, "run_" + run_id + "_manifest.json");
                nlohmann::json manifest = {
                    {"run_id", run_id}, {"solver", id}, {"config", config},
                    {"wordlists", report_to_json(report)}, {"num_cases", results.size()}
                };
                if(write_csv_file(csv_path, results, wordlen)) exit(1);
                if(write_manifest(manifest_path, manifest)) exit(1);
                std::cout << "Wrote: " << csv_path << "\n";
                std::cout << "Wrote: " << manifest_path << "\n";
            }
        }
        else if(mode == "train"){
            std::vector<std::string> actions = solvers.empty()
                ? std::vector<std::string>{"positional_freq", "expected_left", "max_patterns", "letter_freq"}
                : split_ids(solvers);
            BanditEnv env(pools, actions, alpha_time, seed);
            LinUCB bandit(actions, env.feature_dim(), ucb_alpha);
            train_stats_t stats = train_bandit(env, bandit, episodes, LOG_EVERY);

            std::string model_path = join_path(output_dir, "linucb_model.json");
            nlohmann::json manifest = config;
            manifest["episodes"] = episodes;
            manifest["actions"] = actions;
            manifest["alpha_time"] = alpha_time;
            manifest["ucb_alpha"] = ucb_alpha;
            manifest["train_steps"] = stats.steps;
            manifest["avg_reward_per_step"] = stats.steps ? stats.total_reward / stats.steps : 0.0;
            manifest["win_rate_estimate"] = episodes ? static_cast<double>(stats.wins) / episodes : 0.0;
            manifest["avg_time_ms_per_step"] = stats.steps ? stats.total_time_ms / stats.steps : 0.0;
            manifest["model_path"] = model_path;
            if(write_manifest(join_path(output_dir, "train_manifest.json"), manifest)) exit(1);
            if(save_model(bandit, model_path)) exit(1);
            std::cout << "Saved model -> " << model_path << "\n";
        }
        else{
            LinUCB bandit;
            if(load_model(model_filename, bandit)) exit(1);
            BanditEnv env(pools, bandit.actions(), alpha_time, seed);
            if(env.feature_dim() != bandit.dim()){
                std::cerr << "Model expects " << bandit.dim() << " features, word length "
                    << wordlen << " gives " << env.feature_dim() << "\n";
                exit(1);
            }
            wordlist_t cases = sample_cases(pools.answers, sample > 0 ? sample : DEFAULT_EVAL_SAMPLE, seed);
            std::vector<episode_result_t> results = eval_bandit(env, bandit, cases);
            if(verbose){
                for(const auto &r : results) report_game(r);
            }
            report_results(results);
            std::string csv_path = join_path(output_dir, "bandit_eval.csv");
            if(write_csv_file(csv_path, results, wordlen)) exit(1);
            std::cout << "Wrote " << csv_path << "\n";
        }
        auto run_end = timestamp;
        std::cout << "Total time: " << TIME(run_start, run_end) << " sec\n";
    }
    catch(const std::exception& e){
        std::cerr << "Error: " << e.what() << "\n";
        exit(1);
    }
    return 0;
}
