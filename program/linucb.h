/**
 * Header File for the LinUCB contextual bandit choosing among policies
 * #include "linucb.h"
*/

#ifndef LINUCB_H
#define LINUCB_H

#include <map>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#define UCB_ALPHA 0.5 // Default exploration strength
#define UCB_RIDGE 1.0 // Default ridge regularization

/**
 * Per-action linear UCB. For action a with statistics (A_a, b_a):
 *   score_a(x) = x^T A_a^-1 b_a + alpha * sqrt(x^T A_a^-1 x)
 * The inverse is kept up to date with the Sherman-Morrison identity, so
 * neither select nor update inverts a matrix.
*/
class LinUCB{
public:
    LinUCB() : dim_(0), alpha_(UCB_ALPHA) {}

    /**
     * @param actions Policy ids, their order breaks ties in select
     * @param dim Feature dimension
     * @param ridge A starts as ridge * I
     * @throws std::invalid_argument for dim <= 0, ridge <= 0, no or repeated actions
    */
    LinUCB(const std::vector<std::string> &actions, int dim,
        double alpha = UCB_ALPHA, double ridge = UCB_RIDGE);

    /**
     * UCB score of every action, in action order.
     * @throws std::invalid_argument if x.size() != dim
    */
    std::vector<double> ucb_scores(const std::vector<double> &x) const;

    /**
     * Action with the highest UCB score, the first one listed on ties.
    */
    const std::string &select(const std::vector<double> &x) const;

    /**
     * A += x x^T, b += reward * x for the chosen action.
     * @throws std::invalid_argument for an unknown action or a wrong dimension
    */
    void update(const std::string &action, const std::vector<double> &x, double reward);

    /**
     * Snapshot with A, b and the maintained inverse of every action.
    */
    nlohmann::json to_json() const;

    /**
     * Rebuilds a model from to_json output. The stored inverses are used as
     * is, a snapshot without "A_inv" gets them recomputed from A.
     * @throws std::invalid_argument if the snapshot is inconsistent
    */
    static LinUCB from_json(const nlohmann::json &snapshot);

    const std::vector<std::string> &actions() const { return actions_; }
    int dim() const { return dim_; }
    double alpha() const { return alpha_; }
    const Eigen::MatrixXd &A(const std::string &action) const;
    const Eigen::MatrixXd &A_inv(const std::string &action) const;
    const Eigen::VectorXd &b(const std::string &action) const;

private:
    struct arm_t{
        Eigen::MatrixXd A;
        Eigen::MatrixXd A_inv;
        Eigen::VectorXd b;
    };

    size_t arm_index(const std::string &action) const;
    Eigen::VectorXd to_vector(const std::vector<double> &x) const;

    std::vector<std::string> actions_;
    std::map<std::string, size_t> index_;
    std::vector<arm_t> arms_;
    int dim_;
    double alpha_;
};

/**
 * Writes the JSON snapshot of a model.
 * @returns 0 on success
*/
int save_model(const LinUCB &model, const std::string &output_filename);

/**
 * Reads a JSON snapshot written by save_model.
 * @returns 0 on success, the reason for a failure is printed to cerr
*/
int load_model(const std::string &input_filename, LinUCB &model);

#endif /* LINUCB_H */
