#include "linucb.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

LinUCB::LinUCB(const std::vector<std::string> &actions, int dim,
    double alpha, double ridge) : actions_(actions), dim_(dim), alpha_(alpha){
    if(actions.empty())
        throw std::invalid_argument("LinUCB: no actions");
    if(dim <= 0)
        throw std::invalid_argument("LinUCB: feature dimension must be positive");
    if(ridge <= 0.0)
        throw std::invalid_argument("LinUCB: ridge must be positive");
    for(size_t i = 0; i < actions_.size(); i++){
        if(index_.count(actions_[i]))
            throw std::invalid_argument("LinUCB: repeated action " + actions_[i]);
        index_[actions_[i]] = i;
        arm_t arm;
        arm.A = ridge * Eigen::MatrixXd::Identity(dim, dim);
        arm.A_inv = (1.0 / ridge) * Eigen::MatrixXd::Identity(dim, dim);
        arm.b = Eigen::VectorXd::Zero(dim);
        arms_.push_back(arm);
    }
}

size_t LinUCB::arm_index(const std::string &action) const{
    auto it = index_.find(action);
    if(it == index_.end())
        throw std::invalid_argument("LinUCB: unknown action " + action);
    return it->second;
}

Eigen::VectorXd LinUCB::to_vector(const std::vector<double> &x) const{
    if(static_cast<int>(x.size()) != dim_)
        throw std::invalid_argument("LinUCB: expected " + std::to_string(dim_) +
            " features, got " + std::to_string(x.size()));
    return Eigen::Map<const Eigen::VectorXd>(x.data(), dim_);
}

std::vector<double> LinUCB::ucb_scores(const std::vector<double> &x) const{
    Eigen::VectorXd v = to_vector(x);
    std::vector<double> out(arms_.size());
    for(size_t i = 0; i < arms_.size(); i++){
        const arm_t &arm = arms_[i];
        Eigen::VectorXd Ainv_x = arm.A_inv * v;
        double mean = Ainv_x.dot(arm.b); // x^T A^-1 b, A^-1 is symmetric
        double quad = v.dot(Ainv_x);
        out[i] = mean + alpha_ * std::sqrt(std::max(quad, 0.0));
    }
    return out;
}

const std::string &LinUCB::select(const std::vector<double> &x) const{
    std::vector<double> scores = ucb_scores(x);
    size_t best = 0;
    for(size_t i = 1; i < scores.size(); i++){
        if(scores[i] > scores[best]) best = i;
    }
    return actions_[best];
}

void LinUCB::update(const std::string &action, const std::vector<double> &x, double reward){
    arm_t &arm = arms_[arm_index(action)];
    Eigen::VectorXd v = to_vector(x);
    arm.A.noalias() += v * v.transpose();
    arm.b += reward * v;
    // Sherman-Morrison: (A + vv^T)^-1 = A^-1 - (A^-1 v)(A^-1 v)^T / (1 + v^T A^-1 v)
    Eigen::VectorXd Ainv_v = arm.A_inv * v;
    double denom = 1.0 + v.dot(Ainv_v);
    arm.A_inv.noalias() -= (Ainv_v * Ainv_v.transpose()) / denom;
}

const Eigen::MatrixXd &LinUCB::A(const std::string &action) const{
    return arms_[arm_index(action)].A;
}

const Eigen::MatrixXd &LinUCB::A_inv(const std::string &action) const{
    return arms_[arm_index(action)].A_inv;
}

const Eigen::VectorXd &LinUCB::b(const std::string &action) const{
    return arms_[arm_index(action)].b;
}

static nlohmann::json matrix_to_json(const Eigen::MatrixXd &m){
    nlohmann::json rows = nlohmann::json::array();
    for(Eigen::Index r = 0; r < m.rows(); r++){
        std::vector<double> row(m.cols());
        for(Eigen::Index c = 0; c < m.cols(); c++) row[c] = m(r, c);
        rows.push_back(row);
    }
    return rows;
}

static Eigen::MatrixXd matrix_from_json(const nlohmann::json &rows, int dim,
    const std::string &what){
    auto values = rows.get<std::vector<std::vector<double>>>();
    if(static_cast<int>(values.size()) != dim)
        throw std::invalid_argument("LinUCB snapshot: wrong dimension for " + what);
    Eigen::MatrixXd out(dim, dim);
    for(int r = 0; r < dim; r++){
        if(static_cast<int>(values[r].size()) != dim)
            throw std::invalid_argument("LinUCB snapshot: " + what + " is not square");
        for(int c = 0; c < dim; c++) out(r, c) = values[r][c];
    }
    return out;
}

nlohmann::json LinUCB::to_json() const{
    nlohmann::json out;
    out["actions"] = actions_;
    out["d"] = dim_;
    out["alpha"] = alpha_;
    out["A"] = nlohmann::json::object();
    out["A_inv"] = nlohmann::json::object();
    out["b"] = nlohmann::json::object();
    for(size_t i = 0; i < actions_.size(); i++){
        const arm_t &arm = arms_[i];
        out["A"][actions_[i]] = matrix_to_json(arm.A);
        out["A_inv"][actions_[i]] = matrix_to_json(arm.A_inv);
        out["b"][actions_[i]] = std::vector<double>(arm.b.data(), arm.b.data() + dim_);
    }
    return out;
}

LinUCB LinUCB::from_json(const nlohmann::json &snapshot){
    std::vector<std::string> actions = snapshot.at("actions").get<std::vector<std::string>>();
    int dim = snapshot.at("d").get<int>();
    double alpha = snapshot.at("alpha").get<double>();
    LinUCB model(actions, dim, alpha);
    bool has_inverse = snapshot.contains("A_inv");
    for(size_t i = 0; i < actions.size(); i++){
        const std::string &action = actions[i];
        arm_t &arm = model.arms_[i];
        arm.A = matrix_from_json(snapshot.at("A").at(action), dim, "A of " + action);
        auto b = snapshot.at("b").at(action).get<std::vector<double>>();
        if(static_cast<int>(b.size()) != dim)
            throw std::invalid_argument("LinUCB snapshot: wrong dimension for b of " + action);
        arm.b = Eigen::Map<const Eigen::VectorXd>(b.data(), dim);
        // Keep the incrementally updated inverse so scores match bit for bit
        if(has_inverse)
            arm.A_inv = matrix_from_json(snapshot.at("A_inv").at(action), dim, "A_inv of " + action);
        else
            arm.A_inv = arm.A.inverse();
    }
    return model;
}

int save_model(const LinUCB &model, const std::string &output_filename){
    std::ofstream file(output_filename);
    if(!file.is_open()){
        std::cerr << "Unable to open file: " << output_filename << " .\n";
        return 1;
    }
    file << model.to_json().dump();
    file.close();
    return 0;
}

int load_model(const std::string &input_filename, LinUCB &model){
    std::ifstream file(input_filename);
    if(!file.is_open()){
        std::cerr << "Unable to open file: " << input_filename << " .\n";
        return 1;
    }
    try{
        nlohmann::json snapshot = nlohmann::json::parse(file);
        model = LinUCB::from_json(snapshot);
    }
    catch(const std::exception& e){
        std::cerr << "Unsupported Model Format: " << input_filename
            << " [Err: " << e.what() << "]\n";
        return 1;
    }
    return 0;
}
