#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "linucb.h"

namespace {

const std::vector<std::string> ACTIONS = {"positional_freq", "expected_left", "max_patterns"};

LinUCB trained_model(){
    LinUCB model(ACTIONS, 4, 0.7, 2.0);
    model.update("expected_left", {1.0, 0.5, -0.25, 2.0}, -1.5);
    model.update("max_patterns", {0.0, 1.0, 1.0, -1.0}, -2.0);
    model.update("expected_left", {3.0, 0.0, 1.0, 0.5}, -1.0);
    model.update("positional_freq", {1.0, 1.0, 1.0, 1.0}, -1.2);
    return model;
}

}

TEST(LinUCB, FreshModelIsPureExploration){
    LinUCB model(ACTIONS, 3);
    std::vector<double> x = {1.0, -2.0, 2.0};
    std::vector<double> flipped = {-1.0, 2.0, -2.0};
    std::vector<double> scores = model.ucb_scores(x);
    std::vector<double> flipped_scores = model.ucb_scores(flipped);
    for(size_t i = 0; i < ACTIONS.size(); i++){
        EXPECT_NEAR(scores[i], UCB_ALPHA * 3.0, 1e-12);
        EXPECT_NEAR(flipped_scores[i], scores[i], 1e-12);
    }
    // all tied: the first action wins
    EXPECT_EQ(model.select(x), ACTIONS[0]);
    EXPECT_EQ(model.select(flipped), model.select(x));
}

TEST(LinUCB, LearnsFromReward){
    LinUCB model(ACTIONS, 2, 0.1);
    std::vector<double> x = {1.0, 0.0};
    for(int i = 0; i < 20; i++){
        model.update("positional_freq", x, -2.0);
        model.update("expected_left", x, -1.0);
        model.update("max_patterns", x, -3.0);
    }
    EXPECT_EQ(model.select(x), "expected_left");
}

TEST(LinUCB, IncrementalInverseMatchesDirectInverse){
    LinUCB model = trained_model();
    for(const auto &action : ACTIONS){
        Eigen::MatrixXd direct = model.A(action).inverse();
        EXPECT_TRUE(model.A_inv(action).isApprox(direct, 1e-10)) << action;
    }
    Eigen::MatrixXd expected = 2.0 * Eigen::MatrixXd::Identity(4, 4);
    expected += Eigen::Vector4d(1.0, 1.0, 1.0, 1.0) * Eigen::RowVector4d(1.0, 1.0, 1.0, 1.0);
    EXPECT_TRUE(model.A("positional_freq").isApprox(expected));
    EXPECT_NEAR(model.b("max_patterns")(3), 2.0, 1e-12);
}

TEST(LinUCB, SnapshotRoundTripKeepsScores){
    LinUCB model = trained_model();
    nlohmann::json snapshot = nlohmann::json::parse(model.to_json().dump());
    EXPECT_EQ(snapshot["d"], 4);
    EXPECT_EQ(snapshot["actions"].size(), ACTIONS.size());
    EXPECT_EQ(snapshot["A"]["expected_left"].size(), 4u);
    EXPECT_EQ(snapshot["A_inv"]["expected_left"].size(), 4u);

    LinUCB restored = LinUCB::from_json(snapshot);
    EXPECT_EQ(restored.actions(), ACTIONS);
    EXPECT_DOUBLE_EQ(restored.alpha(), 0.7);
    std::vector<double> x = {0.3, -1.0, 2.0, 0.25};
    std::vector<double> before = model.ucb_scores(x);
    std::vector<double> after = restored.ucb_scores(x);
    ASSERT_EQ(before.size(), after.size());
    EXPECT_EQ(before, after);
    EXPECT_EQ(restored.select(x), model.select(x));
    for(const auto &action : ACTIONS){
        EXPECT_EQ(restored.A_inv(action), model.A_inv(action)) << action;
    }
}

TEST(LinUCB, SnapshotWithoutInverseIsRebuilt){
    LinUCB model = trained_model();
    nlohmann::json snapshot = model.to_json();
    snapshot.erase("A_inv");
    LinUCB restored = LinUCB::from_json(snapshot);
    std::vector<double> x = {0.3, -1.0, 2.0, 0.25};
    std::vector<double> before = model.ucb_scores(x);
    std::vector<double> after = restored.ucb_scores(x);
    for(size_t i = 0; i < before.size(); i++){
        EXPECT_NEAR(before[i], after[i], 1e-9);
    }
    EXPECT_TRUE(restored.A_inv("expected_left").isApprox(model.A("expected_left").inverse(), 1e-12));
}

TEST(LinUCB, RejectsBadInput){
    LinUCB model(ACTIONS, 3);
    EXPECT_THROW(model.update("entropy", {1.0, 2.0, 3.0}, -1.0), std::invalid_argument);
    EXPECT_THROW(model.update("expected_left", {1.0, 2.0}, -1.0), std::invalid_argument);
    EXPECT_THROW(model.select({1.0}), std::invalid_argument);
    EXPECT_THROW(LinUCB(ACTIONS, 0), std::invalid_argument);
    EXPECT_THROW(LinUCB({"a", "a"}, 2), std::invalid_argument);

    nlohmann::json snapshot = model.to_json();
    snapshot["b"]["expected_left"] = {1.0};
    EXPECT_THROW(LinUCB::from_json(snapshot), std::invalid_argument);
}
