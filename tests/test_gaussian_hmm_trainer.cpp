#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <Eigen/Core>

#include "hmmselect/hmm_trainer.h"
#include "hmmselect/logger.h"
#include "test_support.h"

using namespace hmmselect;
using namespace hmmselect::hmm;
using namespace hmmselect_test;
using namespace testing;

namespace {

double gaussian_log_pdf(double x, double mean, double variance) {
    return -0.5 * (std::log(2.0 * M_PI * variance) + (x - mean) * (x - mean) / variance);
}

} // namespace

class GaussianHmmTest : public ::testing::Test {
protected:
    void SetUp() override {
        diagnostics::Logger::instance().set_level(diagnostics::LogLevel::FATAL);
    }

    void TearDown() override {
        diagnostics::Logger::instance().set_level(diagnostics::LogLevel::INFO);
    }

    // Two well separated states with sticky transitions
    GaussianHmm make_two_state_model() {
        GaussianHmm model(2, 1);
        Eigen::VectorXd start(2);
        start << 0.6, 0.4;
        Eigen::MatrixXd trans(2, 2);
        trans << 0.9, 0.1,
                 0.2, 0.8;
        Eigen::MatrixXd means(2, 1);
        means << 0.0, 4.0;
        model.set_start_probabilities(start);
        model.set_transition_matrix(trans);
        model.set_means(means);
        model.set_variances(Eigen::MatrixXd::Ones(2, 1));
        return model;
    }
};

TEST(LogSumExpTest, MatchesDirectComputation) {
    Eigen::VectorXd values(3);
    values << std::log(1.0), std::log(2.0), std::log(3.0);
    EXPECT_NEAR(log_sum_exp(values), std::log(6.0), 1e-12);
}

TEST(LogSumExpTest, AllNegativeInfinity) {
    Eigen::VectorXd values = Eigen::VectorXd::Constant(2, -std::numeric_limits<double>::infinity());
    EXPECT_TRUE(std::isinf(log_sum_exp(values)));
    EXPECT_TRUE(std::isinf(log_sum_exp(Eigen::VectorXd())));
}

TEST_F(GaussianHmmTest, FreeParametersForDiagonalModel) {
    EXPECT_EQ(GaussianHmm(3, 2).free_parameters(), 20);
    EXPECT_EQ(GaussianHmm(1, 4).free_parameters(), 8);
}

TEST_F(GaussianHmmTest, ConstructorRejectsEmptyShape) {
    EXPECT_THROW(GaussianHmm(0, 2), std::invalid_argument);
    EXPECT_THROW(GaussianHmm(2, 0), std::invalid_argument);
}

TEST_F(GaussianHmmTest, SingleStateScoreIsSumOfGaussianDensities) {
    GaussianHmm model(1, 1);
    Eigen::MatrixXd means(1, 1);
    means << 1.0;
    Eigen::MatrixXd variances(1, 1);
    variances << 2.0;
    model.set_means(means);
    model.set_variances(variances);

    Eigen::MatrixXd frames(3, 1);
    frames << 0.5, 1.0, 3.0;

    double expected = gaussian_log_pdf(0.5, 1.0, 2.0) + gaussian_log_pdf(1.0, 1.0, 2.0) +
                      gaussian_log_pdf(3.0, 1.0, 2.0);
    EXPECT_NEAR(model.score(frames, {3}), expected, 1e-10);
}

TEST_F(GaussianHmmTest, ScoreSumsIndependentSequences) {
    GaussianHmm model = make_two_state_model();

    Eigen::MatrixXd first(3, 1);
    first << 0.1, 0.2, 3.9;
    Eigen::MatrixXd second(2, 1);
    second << 4.1, -0.3;
    Eigen::MatrixXd stacked(5, 1);
    stacked << first, second;

    double separate = model.sequence_log_likelihood(first) + model.sequence_log_likelihood(second);
    EXPECT_NEAR(model.score(stacked, {3, 2}), separate, 1e-10);

    // Treated as one sequence the transition between the two is counted
    EXPECT_GT(std::abs(model.score(stacked, {5}) - separate), 1e-6);
}

TEST_F(GaussianHmmTest, ForwardBackwardPosteriorsSumToOne) {
    GaussianHmm model = make_two_state_model();
    Eigen::MatrixXd frames(4, 1);
    frames << 0.0, 0.3, 4.2, 3.8;

    ForwardBackwardResult fb = model.forward_backward(frames);

    ASSERT_EQ(fb.gamma.rows(), 4);
    for (Eigen::Index t = 0; t < fb.gamma.rows(); ++t) {
        EXPECT_NEAR(fb.gamma.row(t).sum(), 1.0, 1e-9);
    }
    EXPECT_NEAR(fb.log_likelihood, model.sequence_log_likelihood(frames), 1e-10);
    EXPECT_GT(fb.gamma(0, 0), 0.9);
    EXPECT_GT(fb.gamma(3, 1), 0.9);
}

TEST_F(GaussianHmmTest, ScoreRejectsWrongWidth) {
    GaussianHmm model = make_two_state_model();
    EXPECT_THROW(model.score(Eigen::MatrixXd::Zero(3, 2), {3}), ScoringFailure);
}

TEST_F(GaussianHmmTest, ScoreRejectsInconsistentLengths) {
    GaussianHmm model = make_two_state_model();
    EXPECT_THROW(model.score(Eigen::MatrixXd::Zero(3, 1), {2}), ScoringFailure);
    EXPECT_THROW(model.score(Eigen::MatrixXd::Zero(3, 1), {}), ScoringFailure);
}

TEST_F(GaussianHmmTest, SettersRejectWrongShapes) {
    GaussianHmm model(2, 1);
    EXPECT_THROW(model.set_means(Eigen::MatrixXd::Zero(3, 1)), std::invalid_argument);
    EXPECT_THROW(model.set_transition_matrix(Eigen::MatrixXd::Zero(2, 3)), std::invalid_argument);
}

class GaussianHmmTrainerTest : public GaussianHmmTest {
protected:
    void SetUp() override {
        GaussianHmmTest::SetUp();
        rng_.seed(42);
        sequences_ = two_phase_sequences(point(0.0, 0.0), point(5.0, 5.0), 6, 20, 0.3, rng_);

        std::vector<size_t> all(sequences_.size());
        for (size_t i = 0; i < all.size(); ++i) all[i] = i;
        batch_ = data::combine_sequences(all, sequences_);
    }

    std::mt19937 rng_;
    std::vector<data::Sequence> sequences_;
    data::FeatureBatch batch_;
};

TEST_F(GaussianHmmTrainerTest, RecoversTwoPhaseMeans) {
    GaussianHmmTrainer trainer;
    TrainingStats stats;
    GaussianHmm model = trainer.train_model(batch_.features, batch_.lengths, 2, 14, stats);

    std::vector<double> first_dim = {model.means()(0, 0), model.means()(1, 0)};
    std::sort(first_dim.begin(), first_dim.end());
    EXPECT_NEAR(first_dim[0], 0.0, 0.3);
    EXPECT_NEAR(first_dim[1], 5.0, 0.3);

    EXPECT_TRUE(stats.converged);
    EXPECT_TRUE(std::isfinite(stats.final_log_likelihood));
    EXPECT_NEAR(stats.final_log_likelihood, model.score(batch_.features, batch_.lengths), 1e-9);
    ASSERT_GE(stats.log_likelihoods.size(), 2u);
    EXPECT_GE(stats.log_likelihoods.back(), stats.log_likelihoods.front());
}

TEST_F(GaussianHmmTrainerTest, SameSeedGivesSameModel) {
    GaussianHmmTrainer trainer;
    ModelPtr a = trainer.fit(batch_.features, batch_.lengths, 3, 7);
    ModelPtr b = trainer.fit(batch_.features, batch_.lengths, 3, 7);

    EXPECT_DOUBLE_EQ(a->score(batch_), b->score(batch_));
    EXPECT_EQ(a->num_states(), 3);
    EXPECT_EQ(a->num_features(), 2);
}

TEST_F(GaussianHmmTrainerTest, TrainedModelIsValid) {
    GaussianHmmTrainer trainer;
    TrainingStats stats;
    GaussianHmm model = trainer.train_model(batch_.features, batch_.lengths, 3, 14, stats);

    EXPECT_TRUE(model.is_valid());
    EXPECT_NEAR(model.start_probabilities().sum(), 1.0, 1e-6);
    for (int i = 0; i < model.num_states(); ++i) {
        EXPECT_NEAR(model.transition_matrix().row(i).sum(), 1.0, 1e-6);
    }
    EXPECT_GE(model.variances().minCoeff(), trainer.get_config().min_variance);
}

TEST_F(GaussianHmmTrainerTest, RejectsNonPositiveStateCount) {
    GaussianHmmTrainer trainer;
    EXPECT_THROW(trainer.fit(batch_.features, batch_.lengths, 0, 14), TrainingFailure);
}

TEST_F(GaussianHmmTrainerTest, RejectsMoreStatesThanFrames) {
    GaussianHmmTrainer trainer;
    Eigen::MatrixXd few = Eigen::MatrixXd::Random(3, 2);
    EXPECT_THROW(trainer.fit(few, {3}, 4, 14), TrainingFailure);
}

TEST_F(GaussianHmmTrainerTest, RejectsMalformedLengths) {
    GaussianHmmTrainer trainer;
    std::vector<int> lengths = batch_.lengths;
    lengths.back() += 1;
    EXPECT_THROW(trainer.fit(batch_.features, lengths, 2, 14), TrainingFailure);
}

TEST_F(GaussianHmmTrainerTest, RejectsNonFiniteData) {
    GaussianHmmTrainer trainer;
    Eigen::MatrixXd features = batch_.features;
    features(5, 1) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(trainer.fit(features, batch_.lengths, 2, 14), TrainingFailure);
}

TEST_F(GaussianHmmTrainerTest, RequiredConvergenceFailsWhenIterationsRunOut) {
    TrainingConfig config;
    config.max_iterations = 1;
    config.require_convergence = true;
    GaussianHmmTrainer trainer(config);

    try {
        trainer.fit(batch_.features, batch_.lengths, 2, 14);
        FAIL() << "Expected TrainingFailure";
    } catch (const TrainingFailure& e) {
        EXPECT_THAT(e.what(), HasSubstr("did not converge"));
        EXPECT_EQ(e.get_error_info().num_states, 2);
    }
}
