#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hmmselect/sequence_data.h"
#include "hmmselect/errors.h"
#include "test_support.h"

using namespace hmmselect;
using namespace hmmselect::data;
using namespace hmmselect_test;
using namespace testing;

TEST(SequenceDataTest, ClassDataStacksSequencesInOrder) {
    std::vector<data::Sequence> sequences = {marker_sequence(1.0, 2, 3), marker_sequence(2.0, 4, 3)};
    ClassData data = make_class_data("word", sequences);

    EXPECT_EQ(data.label, "word");
    EXPECT_EQ(data.num_sequences(), 2u);
    EXPECT_EQ(data.num_frames(), 6);
    EXPECT_EQ(data.num_features(), 3);
    EXPECT_THAT(data.lengths, ElementsAre(2, 4));
    EXPECT_DOUBLE_EQ(data.features(1, 0), 1.0);
    EXPECT_DOUBLE_EQ(data.features(2, 0), 2.0);
    EXPECT_TRUE(data.is_consistent());
}

TEST(SequenceDataTest, CombineFollowsIndexOrder) {
    std::vector<data::Sequence> sequences = {marker_sequence(0.0, 1), marker_sequence(1.0, 2), marker_sequence(2.0, 3)};
    FeatureBatch batch = combine_sequences({2, 0}, sequences);

    EXPECT_THAT(batch.lengths, ElementsAre(3, 1));
    EXPECT_EQ(batch.num_frames(), 4);
    EXPECT_DOUBLE_EQ(batch.features(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(batch.features(3, 0), 0.0);
    EXPECT_TRUE(batch.is_consistent());
}

TEST(SequenceDataTest, CombineRejectsBadIndex) {
    std::vector<data::Sequence> sequences = {marker_sequence(0.0)};
    EXPECT_THROW(combine_sequences({1}, sequences), diagnostics::InvalidDataError);
}

TEST(SequenceDataTest, CombineRejectsMixedWidths) {
    std::vector<data::Sequence> sequences = {marker_sequence(0.0, 2, 1), marker_sequence(0.0, 2, 2)};
    EXPECT_THROW(combine_sequences({0, 1}, sequences), diagnostics::InvalidDataError);
}

TEST(SequenceDataTest, EmptyClassIsRejected) {
    EXPECT_THROW(make_class_data("empty", {}), diagnostics::InvalidDataError);
    EXPECT_THROW(make_class_data("blank", {data::Sequence(0, 2)}), diagnostics::InvalidDataError);
}

TEST(SequenceDataTest, DatasetRequiresCommonWidth) {
    EXPECT_THROW(make_dataset({{"a", {marker_sequence(0.0, 2, 1)}}, {"b", {marker_sequence(0.0, 2, 2)}}}),
                 diagnostics::InvalidDataError);
}

TEST(SequenceDataTest, DatasetLabelsAreSorted) {
    Dataset dataset = make_dataset({{"zeta", marker_sequences(0.0, 1)}, {"alpha", marker_sequences(1.0, 1)}});
    EXPECT_THAT(class_labels(dataset), ElementsAre("alpha", "zeta"));
}

TEST(SequenceDataTest, InconsistentLengthsAreDetected) {
    FeatureBatch batch(Eigen::MatrixXd::Zero(5, 1), {2, 2});
    EXPECT_FALSE(batch.is_consistent());

    FeatureBatch zero_length(Eigen::MatrixXd::Zero(2, 1), {2, 0});
    EXPECT_FALSE(zero_length.is_consistent());

    ClassData data = make_class_data("x", marker_sequences(1.0, 2));
    data.lengths.pop_back();
    EXPECT_FALSE(data.is_consistent());
}

TEST(SequenceDataTest, TestItemIsSingleSequence) {
    TestItem item = make_test_item(marker_sequence(3.0, 7, 2));
    EXPECT_THAT(item.lengths, ElementsAre(7));
    EXPECT_EQ(item.num_features(), 2);
}
