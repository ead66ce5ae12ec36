#pragma once

#include <memory>
#include <vector>
#include <Eigen/Core>
#include "sequence_data.h"
#include "errors.h"

namespace hmmselect {
namespace hmm {

    using diagnostics::TrainingFailure;
    using diagnostics::ScoringFailure;

    /**
     * @brief A fitted generative sequence model
     *
     * score() returns the total log-likelihood of the stacked sequences
     * and throws ScoringFailure when the data cannot be evaluated.
     */
    class SequenceModel {
    public:
        virtual ~SequenceModel() = default;

        virtual double score(const Eigen::MatrixXd& features, const std::vector<int>& lengths) const = 0;

        double score(const data::FeatureBatch& batch) const {
            return score(batch.features, batch.lengths);
        }

        virtual int num_states() const = 0;
        virtual int num_features() const = 0;
    };

    using ModelPtr = std::unique_ptr<SequenceModel>;

    /**
     * @brief Fits a SequenceModel for a given state count
     *
     * fit() throws TrainingFailure when the state count cannot produce a
     * usable model. Implementations must be safe to call concurrently.
     */
    class ModelTrainer {
    public:
        virtual ~ModelTrainer() = default;

        virtual ModelPtr fit(const Eigen::MatrixXd& features,
                             const std::vector<int>& lengths,
                             int num_states,
                             unsigned int seed) const = 0;
    };

} // namespace hmm
} // namespace hmmselect
