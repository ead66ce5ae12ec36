#include "hmmselect/sequence_data.h"
#include "hmmselect/errors.h"
#include <numeric>

namespace hmmselect {
namespace data {

    bool FeatureBatch::is_consistent() const {
        if (lengths.empty()) {
            return features.rows() == 0;
        }
        long total = 0;
        for (int length : lengths) {
            if (length <= 0) {
                return false;
            }
            total += length;
        }
        return total == features.rows();
    }

    bool ClassData::is_consistent() const {
        if (lengths.size() != sequences.size()) {
            return false;
        }

        long total = 0;
        for (size_t i = 0; i < sequences.size(); ++i) {
            if (sequences[i].rows() != lengths[i]) {
                return false;
            }
            if (sequences[i].cols() != features.cols()) {
                return false;
            }
            total += lengths[i];
        }
        return total == features.rows();
    }

    FeatureBatch combine_sequences(const std::vector<size_t>& indices,
                                   const std::vector<Sequence>& sequences) {
        FeatureBatch batch;
        if (indices.empty()) {
            return batch;
        }

        long total_frames = 0;
        Eigen::Index width = -1;
        for (size_t idx : indices) {
            if (idx >= sequences.size()) {
                throw diagnostics::InvalidDataError("Sequence index out of range: " + std::to_string(idx));
            }
            if (width < 0) {
                width = sequences[idx].cols();
            } else if (sequences[idx].cols() != width) {
                throw diagnostics::InvalidDataError("Feature width mismatch between sequences");
            }
            total_frames += sequences[idx].rows();
        }

        batch.features.resize(total_frames, width);
        batch.lengths.reserve(indices.size());

        Eigen::Index row = 0;
        for (size_t idx : indices) {
            const Sequence& seq = sequences[idx];
            batch.features.middleRows(row, seq.rows()) = seq;
            batch.lengths.push_back(static_cast<int>(seq.rows()));
            row += seq.rows();
        }

        return batch;
    }

    ClassData make_class_data(const std::string& label, const std::vector<Sequence>& sequences) {
        if (sequences.empty()) {
            throw diagnostics::InvalidDataError("Class '" + label + "' has no sequences");
        }
        for (const auto& seq : sequences) {
            if (seq.rows() == 0 || seq.cols() == 0) {
                throw diagnostics::InvalidDataError("Class '" + label + "' contains an empty sequence");
            }
        }

        std::vector<size_t> all(sequences.size());
        std::iota(all.begin(), all.end(), 0);
        FeatureBatch batch = combine_sequences(all, sequences);

        ClassData class_data;
        class_data.label = label;
        class_data.sequences = sequences;
        class_data.features = std::move(batch.features);
        class_data.lengths = std::move(batch.lengths);
        return class_data;
    }

    Dataset make_dataset(const std::map<std::string, std::vector<Sequence>>& sequences_by_class) {
        Dataset dataset;
        Eigen::Index width = -1;

        for (const auto& entry : sequences_by_class) {
            ClassData class_data = make_class_data(entry.first, entry.second);
            if (width < 0) {
                width = class_data.features.cols();
            } else if (class_data.features.cols() != width) {
                throw diagnostics::InvalidDataError("Class '" + entry.first + "' has a different feature width");
            }
            dataset.emplace(entry.first, std::move(class_data));
        }

        return dataset;
    }

    TestItem make_test_item(const Sequence& sequence) {
        return TestItem(sequence, {static_cast<int>(sequence.rows())});
    }

    std::vector<std::string> class_labels(const Dataset& dataset) {
        std::vector<std::string> labels;
        labels.reserve(dataset.size());
        for (const auto& entry : dataset) {
            labels.push_back(entry.first);
        }
        return labels;
    }

} // namespace data
} // namespace hmmselect
