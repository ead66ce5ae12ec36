#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hmmselect/multi_class_selector.h"
#include "hmmselect/logger.h"
#include "test_support.h"

using namespace hmmselect;
using namespace hmmselect::selection;
using namespace hmmselect_test;
using namespace testing;
using diagnostics::DiagnosticRecorder;
using diagnostics::ErrorCode;

class MultiClassSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        diagnostics::Logger::instance().set_level(diagnostics::LogLevel::FATAL);

        dataset_ = data::make_dataset({
            {"one", marker_sequences(1.0, 4)},
            {"two", marker_sequences(2.0, 4)},
            {"three", marker_sequences(3.0, 4)},
            {"four", marker_sequences(4.0, 4)}
        });

        config_.min_states = 2;
        config_.max_states = 4;
        config_.constant_states = 3;

        // Each class prefers a different state count under BIC
        trainer_.set_score_fn([](int n, double marker, const Eigen::MatrixXd&) {
            int preferred = 2 + static_cast<int>(marker) % 3;
            return n == preferred ? -10.0 : -1000.0;
        });
    }

    void TearDown() override {
        diagnostics::Logger::instance().set_level(diagnostics::LogLevel::INFO);
    }

    data::Dataset dataset_;
    ScriptedTrainer trainer_;
    SelectorConfig config_;
};

TEST_F(MultiClassSelectorTest, ModelMapFollowsDatasetOrder) {
    MultiClassSelector selector(SelectorType::BIC, trainer_, config_);
    MultiClassResult result = selector.select_all(dataset_);

    ASSERT_EQ(result.models.size(), 4u);
    EXPECT_EQ(result.models[0].label, "four");
    EXPECT_EQ(result.models[1].label, "one");
    EXPECT_EQ(result.models[2].label, "three");
    EXPECT_EQ(result.models[3].label, "two");
    EXPECT_EQ(result.num_without_model(), 0u);
}

TEST_F(MultiClassSelectorTest, ParallelMatchesSequential) {
    MultiClassResult sequential = MultiClassSelector(SelectorType::BIC, trainer_, config_, 1).select_all(dataset_);
    MultiClassResult parallel = MultiClassSelector(SelectorType::BIC, trainer_, config_, 3).select_all(dataset_);

    ASSERT_EQ(sequential.summaries.size(), parallel.summaries.size());
    for (size_t i = 0; i < sequential.summaries.size(); ++i) {
        EXPECT_EQ(sequential.summaries[i].label, parallel.summaries[i].label);
        EXPECT_EQ(sequential.summaries[i].chosen_states.value_or(-1), parallel.summaries[i].chosen_states.value_or(-1));
        EXPECT_EQ(sequential.summaries[i].model_states, parallel.summaries[i].model_states);
        EXPECT_EQ(parallel.models[i].label, parallel.summaries[i].label);
    }

    // marker 1 -> 3 states, 2 -> 4, 3 -> 2, 4 -> 3
    EXPECT_EQ(*parallel.summaries[0].chosen_states, 3);
    EXPECT_EQ(*parallel.summaries[1].chosen_states, 3);
    EXPECT_EQ(*parallel.summaries[2].chosen_states, 2);
    EXPECT_EQ(*parallel.summaries[3].chosen_states, 4);
}

TEST_F(MultiClassSelectorTest, FailingClassDoesNotAffectOthers) {
    // Class "two" cannot be trained at any state count
    trainer_.set_fail_fn([](int, const Eigen::MatrixXd& features) {
        return features(0, 0) == 2.0;
    });

    DiagnosticRecorder recorder;
    MultiClassSelector selector(SelectorType::BIC, trainer_, config_, 0);
    selector.set_diagnostic_callback(recorder.as_callback());
    MultiClassResult result = selector.select_all(dataset_);

    EXPECT_EQ(result.num_without_model(), 1u);
    EXPECT_EQ(result.models[3].label, "two");
    EXPECT_EQ(result.models[3].model.get(), nullptr);
    EXPECT_TRUE(result.summaries[3].used_fallback);

    for (size_t i = 0; i < 3; ++i) {
        EXPECT_NE(result.models[i].model.get(), nullptr);
        EXPECT_FALSE(result.summaries[i].used_fallback);
    }

    EXPECT_EQ(recorder.count(ErrorCode::FALLBACK_FAILED), 1u);
    EXPECT_EQ(recorder.count_for_class("one"), 0u);
}

TEST_F(MultiClassSelectorTest, ConstantSelectorTrainsEveryClassOnce) {
    recognition::ModelMap models = train_all_classes(dataset_, SelectorType::CONSTANT, trainer_, config_, 2);

    ASSERT_EQ(models.size(), 4u);
    EXPECT_THAT(trainer_.requested_states(), Each(3));
    EXPECT_EQ(trainer_.fit_count(), 4u);
}

TEST_F(MultiClassSelectorTest, RejectsNegativeThreadCount) {
    EXPECT_THROW(MultiClassSelector(SelectorType::BIC, trainer_, config_, -1), diagnostics::ConfigurationError);
}

TEST_F(MultiClassSelectorTest, MalformedClassKeepsOtherModels) {
    // "zero" claims two sequences of four frames over twelve rows
    data::ClassData malformed = data::make_class_data("zero", marker_sequences(5.0, 3));
    malformed.lengths = {4, 4};
    ASSERT_FALSE(malformed.is_consistent());
    dataset_.emplace("zero", malformed);

    for (int threads : {1, 3}) {
        DiagnosticRecorder recorder;
        MultiClassSelector selector(SelectorType::BIC, trainer_, config_, threads);
        selector.set_diagnostic_callback(recorder.as_callback());

        MultiClassResult result;
        ASSERT_NO_THROW(result = selector.select_all(dataset_));

        ASSERT_EQ(result.models.size(), 5u);
        EXPECT_EQ(result.models[4].label, "zero");
        EXPECT_EQ(result.models[4].model.get(), nullptr);
        EXPECT_FALSE(result.summaries[4].chosen_states.has_value());
        EXPECT_EQ(result.num_without_model(), 1u);

        for (size_t i = 0; i < 4; ++i) {
            EXPECT_NE(result.models[i].model.get(), nullptr) << result.models[i].label;
        }

        EXPECT_EQ(recorder.count(ErrorCode::INVALID_DATA), 1u);
        EXPECT_EQ(recorder.count_for_class("zero"), 1u);
    }
}
