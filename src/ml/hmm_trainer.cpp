#include "hmmselect/hmm_trainer.h"
#include "hmmselect/logger.h"
#include <algorithm>
#include <numeric>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <sstream>

namespace hmmselect {
namespace hmm {

    GaussianHmmTrainer::GaussianHmmTrainer(const TrainingConfig& config) : config_(config) {
        if (config_.min_variance <= 0.0) {
            config_.min_variance = GaussianHmm::MIN_VARIANCE;
        }
    }

    ModelPtr GaussianHmmTrainer::fit(const Eigen::MatrixXd& features,
                                     const std::vector<int>& lengths,
                                     int num_states,
                                     unsigned int seed) const {
        TrainingStats stats;
        return std::make_unique<GaussianHmm>(train_model(features, lengths, num_states, seed, stats));
    }

    GaussianHmm GaussianHmmTrainer::train_model(const Eigen::MatrixXd& features,
                                                const std::vector<int>& lengths,
                                                int num_states,
                                                unsigned int seed,
                                                TrainingStats& stats) const {
        validate_training_data(features, lengths, num_states);

        GaussianHmm model = initialize_model(features, num_states, seed);

        for (int iteration = 0; iteration < config_.max_iterations; ++iteration) {
            double log_likelihood;
            try {
                log_likelihood = em_iteration(model, features, lengths);
            } catch (const std::invalid_argument& e) {
                throw TrainingFailure(std::string("Invalid parameters during EM: ") + e.what(), num_states);
            }

            stats.log_likelihoods.push_back(log_likelihood);
            stats.final_iteration = iteration + 1;

            if (config_.verbose) {
                log_iteration_info(iteration, stats);
            }

            if (check_convergence(stats)) {
                stats.converged = true;
                stats.convergence_reason = "Log-likelihood gain below threshold";
                break;
            }
        }

        if (!stats.converged) {
            stats.convergence_reason = "Maximum iterations reached";
            if (config_.require_convergence) {
                throw TrainingFailure("EM did not converge in " + std::to_string(config_.max_iterations) +
                                      " iterations", num_states);
            }
        }

        try {
            stats.final_log_likelihood = model.score(features, lengths);
        } catch (const ScoringFailure& e) {
            throw TrainingFailure(std::string("Trained model cannot score its own data: ") + e.what(), num_states);
        }

        if (config_.verbose) {
            log_convergence_info(stats, num_states);
        }

        return model;
    }

    void GaussianHmmTrainer::validate_training_data(const Eigen::MatrixXd& features,
                                                    const std::vector<int>& lengths,
                                                    int num_states) const {
        if (num_states < 1) {
            throw TrainingFailure("State count must be positive", num_states);
        }

        if (features.rows() == 0 || features.cols() == 0) {
            throw TrainingFailure("No training data provided", num_states);
        }

        data::FeatureBatch batch(features, lengths);
        if (lengths.empty() || !batch.is_consistent()) {
            throw TrainingFailure("Sequence lengths do not match the feature matrix", num_states);
        }

        if (features.rows() < num_states) {
            throw TrainingFailure("Insufficient data: " + std::to_string(features.rows()) +
                                  " frames for " + std::to_string(num_states) + " states", num_states);
        }

        if (!features.allFinite()) {
            throw TrainingFailure("Training data contains non-finite values", num_states);
        }
    }

    GaussianHmm GaussianHmmTrainer::initialize_model(const Eigen::MatrixXd& features,
                                                     int num_states,
                                                     unsigned int seed) const {
        const int D = static_cast<int>(features.cols());
        GaussianHmm model(num_states, D);

        Eigen::MatrixXd centers(num_states, D);
        kmeans_clustering(features, centers, seed);
        model.set_means(centers);

        // Every state starts from the global per-dimension variance
        Eigen::RowVectorXd mean = features.colwise().mean();
        Eigen::RowVectorXd variance = (features.rowwise() - mean).array().square().colwise().mean().matrix();
        variance = variance.cwiseMax(config_.min_variance);
        model.set_variances(variance.replicate(num_states, 1));

        return model;
    }

    std::vector<int> GaussianHmmTrainer::kmeans_clustering(const Eigen::MatrixXd& features,
                                                           Eigen::MatrixXd& centers,
                                                           unsigned int seed) const {
        const Eigen::Index num_frames = features.rows();
        const Eigen::Index k = centers.rows();

        std::mt19937 gen(seed);
        std::vector<Eigen::Index> indices(num_frames);
        std::iota(indices.begin(), indices.end(), 0);
        std::shuffle(indices.begin(), indices.end(), gen);

        for (Eigen::Index c = 0; c < k; ++c) {
            centers.row(c) = features.row(indices[c]);
        }

        std::vector<int> assignments(num_frames, -1);

        for (int iter = 0; iter < config_.kmeans_iterations; ++iter) {
            bool changed = false;

            for (Eigen::Index t = 0; t < num_frames; ++t) {
                Eigen::Index best = 0;
                (centers.rowwise() - features.row(t)).rowwise().squaredNorm().minCoeff(&best);
                if (assignments[t] != static_cast<int>(best)) {
                    assignments[t] = static_cast<int>(best);
                    changed = true;
                }
            }

            if (!changed) {
                break;
            }

            Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(k, features.cols());
            std::vector<int> counts(k, 0);
            for (Eigen::Index t = 0; t < num_frames; ++t) {
                sums.row(assignments[t]) += features.row(t);
                counts[assignments[t]]++;
            }

            // Empty clusters keep their previous center
            for (Eigen::Index c = 0; c < k; ++c) {
                if (counts[c] > 0) {
                    centers.row(c) = sums.row(c) / counts[c];
                }
            }
        }

        return assignments;
    }

    double GaussianHmmTrainer::em_iteration(GaussianHmm& model,
                                            const Eigen::MatrixXd& features,
                                            const std::vector<int>& lengths) const {
        const int N = model.num_states();
        const int D = model.num_features();
        const Eigen::MatrixXd log_a = model.transition_matrix().array().log().matrix();

        Eigen::VectorXd start_counts = Eigen::VectorXd::Zero(N);
        Eigen::MatrixXd transition_counts = Eigen::MatrixXd::Zero(N, N);
        Eigen::VectorXd gamma_sum = Eigen::VectorXd::Zero(N);
        Eigen::MatrixXd weighted_x = Eigen::MatrixXd::Zero(N, D);
        Eigen::MatrixXd weighted_xx = Eigen::MatrixXd::Zero(N, D);

        // E-step
        double total_log_likelihood = 0.0;
        Eigen::Index row = 0;
        for (int length : lengths) {
            const Eigen::MatrixXd sequence = features.middleRows(row, length);
            row += length;

            ForwardBackwardResult fb = model.forward_backward(sequence);
            if (!std::isfinite(fb.log_likelihood)) {
                throw TrainingFailure("Non-finite log-likelihood in E-step", N);
            }
            total_log_likelihood += fb.log_likelihood;

            start_counts += fb.gamma.row(0).transpose();

            for (int t = 0; t + 1 < length; ++t) {
                for (int i = 0; i < N; ++i) {
                    for (int j = 0; j < N; ++j) {
                        double log_xi = fb.log_forward(t, i) + log_a(i, j) +
                                        fb.log_emissions(t + 1, j) + fb.log_backward(t + 1, j) -
                                        fb.log_likelihood;
                        transition_counts(i, j) += std::exp(log_xi);
                    }
                }
            }

            gamma_sum += fb.gamma.colwise().sum().transpose();
            weighted_x += fb.gamma.transpose() * sequence;
            weighted_xx += fb.gamma.transpose() * sequence.array().square().matrix();
        }

        // M-step
        double start_total = start_counts.sum();
        if (start_total > 0.0) {
            model.set_start_probabilities(start_counts / start_total);
        }

        Eigen::MatrixXd transmat = model.transition_matrix();
        for (int i = 0; i < N; ++i) {
            double row_total = transition_counts.row(i).sum();
            if (row_total > 0.0) {
                transmat.row(i) = transition_counts.row(i) / row_total;
            }
        }
        model.set_transition_matrix(transmat);

        // States with no responsibility keep their previous emission parameters
        Eigen::MatrixXd means = model.means();
        Eigen::MatrixXd variances = model.variances();
        for (int i = 0; i < N; ++i) {
            if (gamma_sum[i] > 1e-10) {
                means.row(i) = weighted_x.row(i) / gamma_sum[i];
                variances.row(i) = ((weighted_xx.row(i) / gamma_sum[i]).array() -
                                    means.row(i).array().square()).matrix();
            }
        }
        model.set_means(means);
        model.set_variances(variances.cwiseMax(config_.min_variance));

        if (!model.is_valid()) {
            throw TrainingFailure("Degenerate parameters after M-step", N);
        }

        return total_log_likelihood;
    }

    bool GaussianHmmTrainer::check_convergence(const TrainingStats& stats) const {
        const auto& ll = stats.log_likelihoods;
        if (ll.size() < 2) {
            return false;
        }
        return (ll.back() - ll[ll.size() - 2]) < config_.convergence_threshold;
    }

    void GaussianHmmTrainer::log_iteration_info(int iteration, const TrainingStats& stats) const {
        std::ostringstream oss;
        oss << "Iteration " << iteration + 1;
        if (!stats.log_likelihoods.empty()) {
            oss << ", Log-likelihood: " << stats.log_likelihoods.back();
        }
        LOG_DEBUG(oss.str());
    }

    void GaussianHmmTrainer::log_convergence_info(const TrainingStats& stats, int num_states) const {
        LOG_DEBUG_F("Training (%d states) completed after %d iterations, log-likelihood %.4f: %s",
                    num_states, stats.final_iteration, stats.final_log_likelihood,
                    stats.convergence_reason.c_str());
    }

} // namespace hmm
} // namespace hmmselect
