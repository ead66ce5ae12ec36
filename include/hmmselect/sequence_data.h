#pragma once

#include <vector>
#include <string>
#include <map>
#include <utility>
#include <Eigen/Core>
#include <Eigen/Dense>

namespace hmmselect {
namespace data {

    /**
     * @brief One observation sequence, frames x features
     */
    using Sequence = Eigen::MatrixXd;

    /**
     * @brief Stacked frames of several sequences plus per-sequence frame counts
     */
    struct FeatureBatch {
        Eigen::MatrixXd features;       // sum(lengths) x feature_dim
        std::vector<int> lengths;       // Frame count per sequence

        FeatureBatch() = default;
        FeatureBatch(Eigen::MatrixXd f, std::vector<int> l)
            : features(std::move(f)), lengths(std::move(l)) {}

        int num_frames() const { return static_cast<int>(features.rows()); }
        int num_features() const { return static_cast<int>(features.cols()); }
        bool is_consistent() const;
    };

    /**
     * @brief All training data of one class
     *
     * features/lengths hold the same frames as sequences, concatenated in
     * order. Build with make_class_data() to keep both views in sync.
     */
    struct ClassData {
        std::string label;
        std::vector<Sequence> sequences;
        Eigen::MatrixXd features;
        std::vector<int> lengths;

        size_t num_sequences() const { return sequences.size(); }
        int num_frames() const { return static_cast<int>(features.rows()); }
        int num_features() const { return static_cast<int>(features.cols()); }

        // sum(lengths) == rows, one length per sequence, matching widths
        bool is_consistent() const;

        FeatureBatch as_batch() const { return FeatureBatch(features, lengths); }
    };

    using Dataset = std::map<std::string, ClassData>;

    /**
     * @brief One unlabeled item to recognize
     */
    using TestItem = FeatureBatch;

    /**
     * @brief Concatenate the selected sequences in the given index order
     *
     * Throws InvalidDataError on an out-of-range index or mismatched
     * feature widths.
     */
    FeatureBatch combine_sequences(const std::vector<size_t>& indices,
                                   const std::vector<Sequence>& sequences);

    /**
     * @brief Build a ClassData, stacking every sequence into one matrix
     *
     * Throws InvalidDataError for an empty sequence list, an empty
     * sequence or inconsistent feature widths.
     */
    ClassData make_class_data(const std::string& label, const std::vector<Sequence>& sequences);

    Dataset make_dataset(const std::map<std::string, std::vector<Sequence>>& sequences_by_class);

    TestItem make_test_item(const Sequence& sequence);

    std::vector<std::string> class_labels(const Dataset& dataset);

} // namespace data
} // namespace hmmselect
