#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <limits>

#include "hmmselect/recognizer.h"
#include "hmmselect/logger.h"
#include "test_support.h"

using namespace hmmselect;
using namespace hmmselect::recognition;
using namespace hmmselect_test;
using namespace testing;

class RecognizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        diagnostics::Logger::instance().set_level(diagnostics::LogLevel::FATAL);
        items_.push_back(data::make_test_item(marker_sequence(1.0)));
    }

    void TearDown() override {
        diagnostics::Logger::instance().set_level(diagnostics::LogLevel::INFO);
    }

    std::vector<data::TestItem> items_;
};

TEST_F(RecognizerTest, PicksHighestScoringClass) {
    ModelMap models;
    models.emplace_back("low", make_constant_model(-50.0));
    models.emplace_back("high", make_constant_model(-5.0));

    RecognitionResult result = recognize(models, items_);

    ASSERT_EQ(result.size(), 1u);
    ASSERT_TRUE(result.guesses[0].has_value());
    EXPECT_EQ(*result.guesses[0], "high");
    EXPECT_DOUBLE_EQ(result.probabilities[0].at("low"), -50.0);
    EXPECT_DOUBLE_EQ(result.probabilities[0].at("high"), -5.0);
}

TEST_F(RecognizerTest, TieGoesToFirstInsertedClass) {
    ModelMap forward;
    forward.emplace_back("alpha", make_constant_model(-7.0));
    forward.emplace_back("beta", make_constant_model(-7.0));

    ModelMap reversed;
    reversed.emplace_back("beta", make_constant_model(-7.0));
    reversed.emplace_back("alpha", make_constant_model(-7.0));

    EXPECT_EQ(*recognize(forward, items_).guesses[0], "alpha");
    EXPECT_EQ(*recognize(reversed, items_).guesses[0], "beta");
}

TEST_F(RecognizerTest, ClearWinnerDoesNotDependOnInsertionOrder) {
    ModelMap forward;
    forward.emplace_back("alpha", make_constant_model(-3.0));
    forward.emplace_back("beta", make_constant_model(-9.0));

    ModelMap reversed;
    reversed.emplace_back("beta", make_constant_model(-9.0));
    reversed.emplace_back("alpha", make_constant_model(-3.0));

    RecognitionResult first = recognize(forward, items_);
    RecognitionResult second = recognize(reversed, items_);

    ASSERT_TRUE(first.guesses[0].has_value());
    ASSERT_TRUE(second.guesses[0].has_value());
    EXPECT_EQ(*first.guesses[0], "alpha");
    EXPECT_EQ(*second.guesses[0], "alpha");
    EXPECT_DOUBLE_EQ(first.probabilities[0].at("beta"), second.probabilities[0].at("beta"));
}

TEST_F(RecognizerTest, MissingModelScoresNegativeInfinity) {
    ModelMap models;
    models.emplace_back("absent", nullptr);
    models.emplace_back("present", make_constant_model(-1e6));

    RecognitionResult result = recognize(models, items_);

    double absent = result.probabilities[0].at("absent");
    EXPECT_TRUE(std::isinf(absent));
    EXPECT_LT(absent, 0.0);
    EXPECT_EQ(*result.guesses[0], "present");
}

TEST_F(RecognizerTest, ScoringFailureScoresNegativeInfinity) {
    ModelMap models;
    models.emplace_back("broken", make_failing_model());
    models.emplace_back("wrong_width", make_constant_model(0.0, 1, 3));

    RecognitionResult result;
    ASSERT_NO_THROW(result = recognize(models, items_));

    EXPECT_EQ(result.probabilities[0].at("broken"), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(result.probabilities[0].at("wrong_width"), -std::numeric_limits<double>::infinity());
    EXPECT_FALSE(result.guesses[0].has_value());
    EXPECT_EQ(result.num_without_guess(), 1u);
}

TEST_F(RecognizerTest, EveryItemListsEveryClass) {
    items_.push_back(data::make_test_item(marker_sequence(2.0, 6)));

    ModelMap models;
    models.emplace_back("a", make_constant_model(-1.0));
    models.emplace_back("b", nullptr);
    models.emplace_back("c", make_failing_model());

    RecognitionResult result = recognize(models, items_);

    ASSERT_EQ(result.probabilities.size(), 2u);
    for (const auto& scores : result.probabilities) {
        EXPECT_EQ(scores.size(), 3u);
    }
}

TEST_F(RecognizerTest, EmptyModelMapLeavesItemsWithoutGuess) {
    RecognitionResult result = recognize(ModelMap(), items_);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_TRUE(result.probabilities[0].empty());
    EXPECT_FALSE(result.guesses[0].has_value());
}

TEST(RecognitionErrorRateTest, CountsAbsentAndWrongGuesses) {
    std::vector<std::optional<std::string>> guesses = {
        std::string("a"), std::nullopt, std::string("b"), std::string("c")
    };
    std::vector<std::string> expected = {"a", "b", "b", "a"};

    EXPECT_DOUBLE_EQ(recognition_error_rate(guesses, expected), 0.5);
}

TEST(RecognitionErrorRateTest, RejectsSizeMismatch) {
    std::vector<std::optional<std::string>> guesses = {std::string("a")};
    std::vector<std::string> expected = {"a", "b"};

    EXPECT_THROW(recognition_error_rate(guesses, expected), diagnostics::InvalidDataError);
}

TEST(RecognitionErrorRateTest, EmptyInputHasZeroRate) {
    EXPECT_DOUBLE_EQ(recognition_error_rate({}, {}), 0.0);
}

TEST(RecognitionReportTest, ListsMisrecognizedItems) {
    RecognitionResult result;
    result.guesses = {std::string("a"), std::string("x"), std::nullopt};
    result.probabilities.resize(3);

    RecognitionReport report = build_report(result, {"a", "b", "c"});

    EXPECT_EQ(report.correct, 1u);
    EXPECT_EQ(report.total, 3u);
    EXPECT_THAT(report.misrecognized, ElementsAre(1, 2));

    std::string text = format_report(report);
    EXPECT_THAT(text, HasSubstr("Total correct: 1 out of 3"));
    EXPECT_THAT(text, HasSubstr("Misrecognized items: 1 2"));
}

TEST(RecognitionReportTest, FindModelByLabel) {
    ModelMap models;
    models.emplace_back("a", make_constant_model(0.0, 4));
    models.emplace_back("b", nullptr);

    const hmm::SequenceModel* a = find_model(models, "a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->num_states(), 4);
    EXPECT_EQ(find_model(models, "b"), nullptr);
    EXPECT_EQ(find_model(models, "zzz"), nullptr);
}
