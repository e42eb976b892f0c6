/**
 * Header File for the guess selection interface and the policy registry
 * #include "policy.h"
*/

#ifndef POLICY_H
#define POLICY_H

#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <functional>
#include "word.h"

// Candidate sets at most this large are searched directly
#define CAND_POOL_LIMIT 200
// Cap on the number of allowed words scored when the candidate set is large
#define POOL_CAP 400

/**
 * Everything a policy may look at when choosing a guess.
 * turn is 1-based. When rng is null the policy uses the generator seeded
 * by its last reset.
*/
struct game_state_t{
    int turn;
    const history_t &history;
    const wordlist_t &candidates;
    const wordlist_t &allowed;
    int wordlen;
    std::mt19937 *rng;
};

class Policy{
public:
    virtual ~Policy() {}

    /**
     * Prepare for a new game. Subclasses with per-game statistics override
     * this and call Policy::reset first.
    */
    virtual void reset(const wordlist_t &allowed, const wordlist_t &answers,
        int wordlen, unsigned seed);

    /**
     * @returns a lowercase word of length state.wordlen, never throws on an
     * empty pool.
    */
    virtual word_t next_guess(const game_state_t &state) = 0;

    virtual std::string id() const = 0;

protected:
    std::mt19937 &rng(const game_state_t &state);

    /**
     * Uniform pick among tied words. Falls back to the placeholder when
     * nothing is tied.
    */
    word_t pick(const wordlist_t &tied, const game_state_t &state);

    int wordlen_ = 0;
    std::mt19937 rng_;
};

typedef std::function<std::unique_ptr<Policy>()> policy_factory_t;

/**
 * Maps policy ids to factories. Built explicitly at startup.
*/
class PolicyRegistry{
public:
    /**
     * @throws std::logic_error if id is already registered
    */
    void add(const std::string &id, policy_factory_t factory);

    /**
     * @throws std::invalid_argument for an unknown id, listing the known ones
    */
    std::unique_ptr<Policy> create(const std::string &id) const;

    bool contains(const std::string &id) const;

    // Sorted
    std::vector<std::string> ids() const;

private:
    std::map<std::string, policy_factory_t> factories_;
};

/**
 * Registry holding every built in policy.
*/
const PolicyRegistry &default_registry();

std::unique_ptr<Policy> create_policy(const std::string &id);

#endif /* POLICY_H */
