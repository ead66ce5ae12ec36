#pragma once

#include <vector>
#include <limits>
#include <Eigen/Core>
#include <Eigen/Dense>
#include "sequence_model.h"

namespace hmmselect {
namespace hmm {

    /**
     * @brief Forward-Backward matrices for one sequence, all in log space
     */
    struct ForwardBackwardResult {
        Eigen::MatrixXd log_forward;             // log alpha [T x N]
        Eigen::MatrixXd log_backward;            // log beta [T x N]
        Eigen::MatrixXd gamma;                   // State posteriors [T x N]
        Eigen::MatrixXd log_emissions;           // log b_j(o_t) [T x N]
        double log_likelihood;                   // log P(O | model)

        ForwardBackwardResult() : log_likelihood(-std::numeric_limits<double>::infinity()) {}
    };

    /**
     * @brief Ergodic HMM with one diagonal-covariance Gaussian per state
     *
     * Parameters: start probabilities (N), transition matrix (N x N,
     * row-stochastic), means and variances (N x D each).
     */
    class GaussianHmm : public SequenceModel {
    public:
        GaussianHmm(int num_states, int num_features);

        using SequenceModel::score;
        double score(const Eigen::MatrixXd& features, const std::vector<int>& lengths) const override;

        int num_states() const override { return static_cast<int>(start_prob_.size()); }
        int num_features() const override { return static_cast<int>(means_.cols()); }

        // Parameter access
        const Eigen::VectorXd& start_probabilities() const { return start_prob_; }
        const Eigen::MatrixXd& transition_matrix() const { return transmat_; }
        const Eigen::MatrixXd& means() const { return means_; }
        const Eigen::MatrixXd& variances() const { return variances_; }

        // Parameter modification, throws std::invalid_argument on bad shapes
        void set_start_probabilities(const Eigen::VectorXd& start_prob);
        void set_transition_matrix(const Eigen::MatrixXd& transmat);
        void set_means(const Eigen::MatrixXd& means);
        void set_variances(const Eigen::MatrixXd& variances);

        // Per-sequence evaluation
        Eigen::MatrixXd log_emission_matrix(const Eigen::MatrixXd& sequence) const;
        double sequence_log_likelihood(const Eigen::MatrixXd& sequence) const;
        ForwardBackwardResult forward_backward(const Eigen::MatrixXd& sequence) const;

        // n^2 + 2*d*n - 1
        int free_parameters() const;

        bool is_valid() const;

        static constexpr double MIN_VARIANCE = 1e-6;

    private:
        Eigen::VectorXd start_prob_;
        Eigen::MatrixXd transmat_;
        Eigen::MatrixXd means_;
        Eigen::MatrixXd variances_;

        Eigen::MatrixXd compute_log_forward(const Eigen::MatrixXd& log_emissions) const;
        Eigen::MatrixXd compute_log_backward(const Eigen::MatrixXd& log_emissions) const;
    };

    /// Numerically stable log(sum(exp(values))); -inf for an empty or all -inf input.
    double log_sum_exp(const Eigen::VectorXd& log_values);

} // namespace hmm
} // namespace hmmselect
