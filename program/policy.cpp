#include "policy.h"
#include "heuristics.h"
#include "partition.h"
#include "two_ply.h"
#include <stdexcept>

void Policy::reset(const wordlist_t &allowed, const wordlist_t &answers,
    int wordlen, unsigned seed){
    (void)allowed;
    (void)answers;
    wordlen_ = wordlen;
    rng_.seed(seed);
}

std::mt19937 &Policy::rng(const game_state_t &state){
    if(state.rng != nullptr) return *state.rng;
    return rng_;
}

word_t Policy::pick(const wordlist_t &tied, const game_state_t &state){
    if(tied.empty()) return placeholder_word(state.wordlen);
    std::uniform_int_distribution<size_t> dist(0, tied.size() - 1);
    return tied[dist(rng(state))];
}

void PolicyRegistry::add(const std::string &id, policy_factory_t factory){
    if(factories_.count(id))
        throw std::logic_error("Duplicate policy id: " + id);
    factories_[id] = factory;
}

std::unique_ptr<Policy> PolicyRegistry::create(const std::string &id) const{
    auto it = factories_.find(id);
    if(it == factories_.end()){
        std::string known;
        for(const auto &name : ids()){
            if(!known.empty()) known += ", ";
            known += name;
        }
        throw std::invalid_argument("Unknown policy id: " + id + ". Known: [" + known + "]");
    }
    return it->second();
}

bool PolicyRegistry::contains(const std::string &id) const{
    return factories_.count(id) > 0;
}

std::vector<std::string> PolicyRegistry::ids() const{
    std::vector<std::string> out;
    for(const auto &entry : factories_) out.push_back(entry.first);
    return out;
}

static PolicyRegistry build_default_registry(){
    PolicyRegistry registry;
    registry.add("random_consistent", []{ return std::make_unique<RandomConsistent>(); });
    registry.add("letter_freq", []{ return std::make_unique<LetterFrequency>(); });
    registry.add("positional_freq", []{ return std::make_unique<PositionalFrequency>(); });
    registry.add("two_stage_probe", []{ return std::make_unique<TwoStageProbe>(); });
    registry.add("entropy", []{ return std::make_unique<EntropyPolicy>(); });
    registry.add("entropy_weighted", []{ return std::make_unique<WeightedEntropyPolicy>(); });
    registry.add("expected_left", []{ return std::make_unique<ExpectedRemaining>(); });
    registry.add("max_patterns", []{ return std::make_unique<MaxPatternDiversity>(); });
    registry.add("two_ply_mc", []{ return std::make_unique<TwoPlyMC>(); });
    return registry;
}

const PolicyRegistry &default_registry(){
    static const PolicyRegistry registry = build_default_registry();
    return registry;
}

std::unique_ptr<Policy> create_policy(const std::string &id){
    return default_registry().create(id);
}
