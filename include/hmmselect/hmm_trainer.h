#pragma once

#include "gaussian_hmm.h"
#include <vector>
#include <memory>
#include <string>
#include <limits>
#include <Eigen/Core>
#include <Eigen/Dense>

namespace hmmselect {
namespace hmm {

    /**
     * @brief Training configuration for Baum-Welch
     */
    struct TrainingConfig {
        int max_iterations;             // Maximum EM iterations
        double convergence_threshold;   // Log-likelihood delta that counts as converged
        double min_variance;            // Variance floor applied after each M-step
        int kmeans_iterations;          // Iterations of the k-means initialisation
        bool require_convergence;       // Treat hitting max_iterations as a failure
        bool verbose;                   // Log every iteration at DEBUG level

        TrainingConfig()
            : max_iterations(1000)
            , convergence_threshold(1e-2)
            , min_variance(1e-3)
            , kmeans_iterations(50)
            , require_convergence(false)
            , verbose(false) {}
    };

    /**
     * @brief Training statistics and convergence information
     */
    struct TrainingStats {
        std::vector<double> log_likelihoods;     // Total log-likelihood per iteration
        int final_iteration;                     // Final iteration count
        bool converged;                          // Did training converge?
        double final_log_likelihood;             // Log-likelihood of the returned model
        std::string convergence_reason;          // Reason for stopping

        TrainingStats()
            : final_iteration(0)
            , converged(false)
            , final_log_likelihood(-std::numeric_limits<double>::infinity()) {}
    };

    /**
     * @brief Baum-Welch trainer for GaussianHmm
     *
     * Initialises means with seeded k-means over all frames, then runs EM
     * over every sequence until the log-likelihood gain drops below the
     * threshold. Throws TrainingFailure for fewer frames than states,
     * malformed lengths or a non-finite log-likelihood.
     */
    class GaussianHmmTrainer : public ModelTrainer {
    public:
        explicit GaussianHmmTrainer(const TrainingConfig& config = TrainingConfig());

        ModelPtr fit(const Eigen::MatrixXd& features,
                     const std::vector<int>& lengths,
                     int num_states,
                     unsigned int seed) const override;

        GaussianHmm train_model(const Eigen::MatrixXd& features,
                                const std::vector<int>& lengths,
                                int num_states,
                                unsigned int seed,
                                TrainingStats& stats) const;

        void set_config(const TrainingConfig& config) { config_ = config; }
        const TrainingConfig& get_config() const { return config_; }

    private:
        TrainingConfig config_;

        void validate_training_data(const Eigen::MatrixXd& features,
                                    const std::vector<int>& lengths,
                                    int num_states) const;

        GaussianHmm initialize_model(const Eigen::MatrixXd& features, int num_states, unsigned int seed) const;

        std::vector<int> kmeans_clustering(const Eigen::MatrixXd& features,
                                           Eigen::MatrixXd& centers,
                                           unsigned int seed) const;

        // One E-step plus M-step; returns the log-likelihood under the model before the update
        double em_iteration(GaussianHmm& model,
                            const Eigen::MatrixXd& features,
                            const std::vector<int>& lengths) const;

        bool check_convergence(const TrainingStats& stats) const;

        void log_iteration_info(int iteration, const TrainingStats& stats) const;
        void log_convergence_info(const TrainingStats& stats, int num_states) const;
    };

} // namespace hmm
} // namespace hmmselect
