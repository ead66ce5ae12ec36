#pragma once

#include <vector>
#include <memory>
#include <string>
#include <optional>
#include <limits>
#include "sequence_data.h"
#include "sequence_model.h"
#include "errors.h"

namespace hmmselect {
namespace selection {

    /**
     * @brief Candidate range and fallback settings shared by all selectors
     */
    struct SelectorConfig {
        int min_states;                 // Smallest candidate state count (inclusive)
        int max_states;                 // Largest candidate state count (inclusive)
        int constant_states;            // Default / fallback state count
        unsigned int random_seed;       // Passed to every fit for reproducibility
        int cv_folds;                   // Fold count for SelectorCV
        bool verbose;                   // Log every candidate at INFO instead of DEBUG

        SelectorConfig()
            : min_states(2)
            , max_states(10)
            , constant_states(3)
            , random_seed(14)
            , cv_folds(3)
            , verbose(false) {}
    };

    /**
     * @brief Tagged result of one fit attempt
     */
    struct FitOutcome {
        hmm::ModelPtr model;            // Null when the fit failed
        std::string failure_reason;

        bool ok() const { return model != nullptr; }
    };

    /**
     * @brief Tagged result of one scoring attempt
     */
    struct ScoreOutcome {
        bool success;
        double log_likelihood;
        std::string failure_reason;

        ScoreOutcome() : success(false), log_likelihood(-std::numeric_limits<double>::infinity()) {}

        bool ok() const { return success; }
    };

    /**
     * @brief Criterion value recorded for one candidate state count
     *
     * successful_parts counts the folds (CV) or other classes (DIC) that
     * contributed; it is 1 for BIC and Constant when evaluated.
     */
    struct CandidateScore {
        int num_states;
        bool evaluated;
        double criterion;
        int successful_parts;

        CandidateScore(int n, bool eval = false, double value = 0.0, int parts = 0)
            : num_states(n), evaluated(eval), criterion(value), successful_parts(parts) {}
    };

    /**
     * @brief Outcome of one select() call
     *
     * chosen_states is empty when no candidate survived; model then holds
     * the fallback model trained at constant_states, or null when that
     * failed too.
     */
    struct SelectionResult {
        std::optional<int> chosen_states;
        hmm::ModelPtr model;
        bool used_fallback;
        std::vector<CandidateScore> candidates;

        SelectionResult() : used_fallback(false) {}

        bool has_model() const { return model != nullptr; }
        int model_states() const { return model ? model->num_states() : -1; }
    };

    // Pure helpers shared by the selectors

    FitOutcome fit_class(const hmm::ModelTrainer& trainer,
                         const Eigen::MatrixXd& features,
                         const std::vector<int>& lengths,
                         int num_states,
                         unsigned int seed);

    FitOutcome fit_class(const hmm::ModelTrainer& trainer,
                         const data::FeatureBatch& batch,
                         int num_states,
                         unsigned int seed);

    /// Fails on ScoringFailure and on any non-finite log-likelihood.
    ScoreOutcome score_batch(const hmm::SequenceModel& model,
                             const Eigen::MatrixXd& features,
                             const std::vector<int>& lengths);

    ScoreOutcome score_batch(const hmm::SequenceModel& model, const data::FeatureBatch& batch);

    /// Total log-likelihood of a class's stacked data under a model fitted elsewhere.
    ScoreOutcome score_under(const hmm::SequenceModel& model, const data::ClassData& class_data);

    /// n^2 + 2*d*n - 1 for a diagonal Gaussian HMM.
    int free_parameter_count(int num_states, int num_features);

    /// -2 * logL + p * ln(N); lower is better.
    double bic_score(double log_likelihood, int num_states, int num_features, int num_frames);

    /**
     * @brief Contiguous k-fold partition of [0, num_items)
     *
     * Returns the held-out index set of each fold. The first
     * num_items % num_folds folds hold one extra item.
     */
    std::vector<std::vector<size_t>> kfold_split(size_t num_items, int num_folds);

    std::vector<size_t> complement_indices(const std::vector<size_t>& held_out, size_t num_items);

    /**
     * @brief Base class for model-order selection strategies
     *
     * Keeps references to the dataset and trainer; both must outlive the
     * selector. select() absorbs every TrainingFailure and ScoringFailure,
     * reports it through the diagnostic callback and applies the shared
     * fallback when no candidate survives.
     */
    class ModelSelector {
    public:
        ModelSelector(const data::Dataset& dataset,
                      const std::string& class_label,
                      const hmm::ModelTrainer& trainer,
                      const SelectorConfig& config = SelectorConfig());
        virtual ~ModelSelector() = default;

        virtual SelectionResult select() = 0;
        virtual std::string name() const = 0;

        void set_diagnostic_callback(diagnostics::DiagnosticCallback callback) {
            diagnostic_callback_ = std::move(callback);
        }

        const data::ClassData& class_data() const { return class_data_; }
        const SelectorConfig& config() const { return config_; }

    protected:
        const data::Dataset& dataset_;
        const data::ClassData& class_data_;
        const hmm::ModelTrainer& trainer_;
        SelectorConfig config_;
        diagnostics::DiagnosticCallback diagnostic_callback_;

        // Fit the target class's full data at num_states
        FitOutcome fit_candidate(int num_states) const;

        // Fit an arbitrary batch (CV training folds, other classes in DIC)
        FitOutcome fit_batch(const Eigen::MatrixXd& features, const std::vector<int>& lengths,
                             int num_states, const std::string& other_class = "") const;

        ScoreOutcome score_candidate(const hmm::SequenceModel& model,
                                     const Eigen::MatrixXd& features, const std::vector<int>& lengths,
                                     int num_states, const std::string& other_class = "") const;

        SelectionResult finish(int chosen_states, hmm::ModelPtr model,
                               std::vector<CandidateScore> candidates) const;

        // Shared fallback: train at constant_states, or return no model
        SelectionResult fallback(std::vector<CandidateScore> candidates) const;

        void report(diagnostics::ErrorCode code, int num_states, const std::string& message,
                    const std::string& other_class = "") const;

        void log_candidate(const CandidateScore& candidate) const;

        static const data::ClassData& resolve_class(const data::Dataset& dataset, const std::string& class_label);
    };

    /**
     * @brief Always trains at constant_states
     */
    class SelectorConstant : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        SelectionResult select() override;
        std::string name() const override { return "SelectorConstant"; }
    };

    /**
     * @brief Minimum Bayesian Information Criterion over the candidate range
     *
     * BIC(n) = -2 logL(n) + p(n) ln(N), N = frames of the class.
     */
    class SelectorBIC : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        SelectionResult select() override;
        std::string name() const override { return "SelectorBIC"; }
    };

    /**
     * @brief Maximum Discriminative Information Criterion
     *
     * DIC(n) = log P(X_i | m_i) - mean over other classes j of log P(X_j | m_i).
     * An other class only contributes when it can be fitted at n itself and
     * scored under the target model; the mean divides by the number that
     * contributed. A candidate with no contributing class is skipped.
     */
    class SelectorDIC : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        SelectionResult select() override;
        std::string name() const override { return "SelectorDIC"; }
    };

    /**
     * @brief Maximum mean held-out log-likelihood over k sequence folds
     *
     * The winner is refitted on the full class data.
     */
    class SelectorCV : public ModelSelector {
    public:
        using ModelSelector::ModelSelector;

        SelectionResult select() override;
        std::string name() const override { return "SelectorCV"; }
    };

    enum class SelectorType {
        CONSTANT,
        BIC,
        DIC,
        CV
    };

    /// Accepts "constant", "bic", "dic", "cv" in any case; throws ConfigurationError otherwise.
    SelectorType parse_selector_type(const std::string& name);
    std::string selector_type_name(SelectorType type);

    std::unique_ptr<ModelSelector> create_selector(SelectorType type,
                                                   const data::Dataset& dataset,
                                                   const std::string& class_label,
                                                   const hmm::ModelTrainer& trainer,
                                                   const SelectorConfig& config = SelectorConfig());

} // namespace selection
} // namespace hmmselect
