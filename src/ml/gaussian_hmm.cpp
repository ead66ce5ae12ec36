#include "hmmselect/gaussian_hmm.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace hmmselect {
namespace hmm {

    namespace {
        constexpr double NEG_INF = -std::numeric_limits<double>::infinity();
        const double LOG_2PI = std::log(2.0 * M_PI);
    }

    double log_sum_exp(const Eigen::VectorXd& log_values) {
        if (log_values.size() == 0) {
            return NEG_INF;
        }

        double max_val = log_values.maxCoeff();
        if (max_val == NEG_INF) {
            return max_val;
        }

        double sum = 0.0;
        for (Eigen::Index i = 0; i < log_values.size(); ++i) {
            sum += std::exp(log_values[i] - max_val);
        }

        return max_val + std::log(sum);
    }

    GaussianHmm::GaussianHmm(int num_states, int num_features) {
        if (num_states < 1 || num_features < 1) {
            throw std::invalid_argument("GaussianHmm needs at least one state and one feature");
        }

        start_prob_ = Eigen::VectorXd::Constant(num_states, 1.0 / num_states);
        transmat_ = Eigen::MatrixXd::Constant(num_states, num_states, 1.0 / num_states);
        means_ = Eigen::MatrixXd::Zero(num_states, num_features);
        variances_ = Eigen::MatrixXd::Ones(num_states, num_features);
    }

    void GaussianHmm::set_start_probabilities(const Eigen::VectorXd& start_prob) {
        if (start_prob.size() != start_prob_.size()) {
            throw std::invalid_argument("Start probability size mismatch");
        }
        start_prob_ = start_prob;
    }

    void GaussianHmm::set_transition_matrix(const Eigen::MatrixXd& transmat) {
        if (transmat.rows() != transmat_.rows() || transmat.cols() != transmat_.cols()) {
            throw std::invalid_argument("Transition matrix dimension mismatch");
        }
        transmat_ = transmat;
    }

    void GaussianHmm::set_means(const Eigen::MatrixXd& means) {
        if (means.rows() != means_.rows() || means.cols() != means_.cols()) {
            throw std::invalid_argument("Means dimension mismatch");
        }
        means_ = means;
    }

    void GaussianHmm::set_variances(const Eigen::MatrixXd& variances) {
        if (variances.rows() != variances_.rows() || variances.cols() != variances_.cols()) {
            throw std::invalid_argument("Variances dimension mismatch");
        }
        if ((variances.array() <= 0.0).any()) {
            throw std::invalid_argument("Variances must be positive");
        }
        variances_ = variances;
    }

    Eigen::MatrixXd GaussianHmm::log_emission_matrix(const Eigen::MatrixXd& sequence) const {
        const Eigen::Index T = sequence.rows();
        const int N = num_states();
        const double D = static_cast<double>(num_features());

        Eigen::MatrixXd log_b(T, N);
        for (int j = 0; j < N; ++j) {
            const Eigen::ArrayXd var = variances_.row(j).transpose().array();
            const double log_norm = -0.5 * (D * LOG_2PI + var.log().sum());
            const Eigen::ArrayXd inv_var = var.inverse();

            for (Eigen::Index t = 0; t < T; ++t) {
                Eigen::ArrayXd diff = (sequence.row(t) - means_.row(j)).transpose().array();
                log_b(t, j) = log_norm - 0.5 * (diff.square() * inv_var).sum();
            }
        }
        return log_b;
    }

    Eigen::MatrixXd GaussianHmm::compute_log_forward(const Eigen::MatrixXd& log_emissions) const {
        const Eigen::Index T = log_emissions.rows();
        const int N = num_states();
        const Eigen::MatrixXd log_a = transmat_.array().log().matrix();
        const Eigen::VectorXd log_pi = start_prob_.array().log().matrix();

        Eigen::MatrixXd alpha(T, N);
        for (int j = 0; j < N; ++j) {
            alpha(0, j) = log_pi[j] + log_emissions(0, j);
        }

        Eigen::VectorXd terms(N);
        for (Eigen::Index t = 1; t < T; ++t) {
            for (int j = 0; j < N; ++j) {
                for (int i = 0; i < N; ++i) {
                    terms[i] = alpha(t - 1, i) + log_a(i, j);
                }
                alpha(t, j) = log_sum_exp(terms) + log_emissions(t, j);
            }
        }
        return alpha;
    }

    Eigen::MatrixXd GaussianHmm::compute_log_backward(const Eigen::MatrixXd& log_emissions) const {
        const Eigen::Index T = log_emissions.rows();
        const int N = num_states();
        const Eigen::MatrixXd log_a = transmat_.array().log().matrix();

        Eigen::MatrixXd beta(T, N);
        beta.row(T - 1).setZero();

        Eigen::VectorXd terms(N);
        for (Eigen::Index t = T - 2; t >= 0; --t) {
            for (int i = 0; i < N; ++i) {
                for (int j = 0; j < N; ++j) {
                    terms[j] = log_a(i, j) + log_emissions(t + 1, j) + beta(t + 1, j);
                }
                beta(t, i) = log_sum_exp(terms);
            }
        }
        return beta;
    }

    double GaussianHmm::sequence_log_likelihood(const Eigen::MatrixXd& sequence) const {
        if (sequence.rows() == 0) {
            return 0.0;
        }
        Eigen::MatrixXd alpha = compute_log_forward(log_emission_matrix(sequence));
        return log_sum_exp(alpha.row(alpha.rows() - 1).transpose());
    }

    ForwardBackwardResult GaussianHmm::forward_backward(const Eigen::MatrixXd& sequence) const {
        ForwardBackwardResult result;
        const Eigen::Index T = sequence.rows();
        const int N = num_states();

        if (T == 0) {
            return result;
        }

        result.log_emissions = log_emission_matrix(sequence);
        result.log_forward = compute_log_forward(result.log_emissions);
        result.log_backward = compute_log_backward(result.log_emissions);
        result.log_likelihood = log_sum_exp(result.log_forward.row(T - 1).transpose());

        result.gamma = Eigen::MatrixXd::Zero(T, N);
        if (!std::isfinite(result.log_likelihood)) {
            return result;
        }

        for (Eigen::Index t = 0; t < T; ++t) {
            for (int i = 0; i < N; ++i) {
                double log_post = result.log_forward(t, i) + result.log_backward(t, i) - result.log_likelihood;
                result.gamma(t, i) = (log_post == NEG_INF) ? 0.0 : std::exp(log_post);
            }
        }

        return result;
    }

    double GaussianHmm::score(const Eigen::MatrixXd& features, const std::vector<int>& lengths) const {
        if (features.cols() != num_features()) {
            throw ScoringFailure("Feature dimension " + std::to_string(features.cols()) +
                                 " does not match model dimension " + std::to_string(num_features()));
        }

        data::FeatureBatch batch(features, lengths);
        if (lengths.empty() || !batch.is_consistent()) {
            throw ScoringFailure("Sequence lengths do not match the feature matrix");
        }

        double total = 0.0;
        Eigen::Index row = 0;
        for (int length : lengths) {
            total += sequence_log_likelihood(features.middleRows(row, length));
            row += length;
        }

        if (!std::isfinite(total)) {
            throw ScoringFailure("Non-finite log-likelihood");
        }
        return total;
    }

    int GaussianHmm::free_parameters() const {
        const int n = num_states();
        const int d = num_features();
        return n * n + 2 * d * n - 1;
    }

    bool GaussianHmm::is_valid() const {
        if (!start_prob_.allFinite() || !transmat_.allFinite() ||
            !means_.allFinite() || !variances_.allFinite()) {
            return false;
        }

        if ((variances_.array() <= 0.0).any()) {
            return false;
        }

        if (std::abs(start_prob_.sum() - 1.0) > 1e-6) {
            return false;
        }

        for (Eigen::Index i = 0; i < transmat_.rows(); ++i) {
            if (std::abs(transmat_.row(i).sum() - 1.0) > 1e-6) {
                return false;
            }
        }
        return true;
    }

} // namespace hmm
} // namespace hmmselect
