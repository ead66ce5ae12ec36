#include "hmmselect/model_selector.h"
#include "hmmselect/logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace hmmselect {
namespace selection {

    using diagnostics::ErrorCode;

    FitOutcome fit_class(const hmm::ModelTrainer& trainer,
                         const Eigen::MatrixXd& features,
                         const std::vector<int>& lengths,
                         int num_states,
                         unsigned int seed) {
        FitOutcome outcome;
        try {
            outcome.model = trainer.fit(features, lengths, num_states, seed);
            if (!outcome.model) {
                outcome.failure_reason = "Trainer returned no model";
            }
        } catch (const hmm::TrainingFailure& e) {
            outcome.model.reset();
            outcome.failure_reason = e.what();
        }
        return outcome;
    }

    FitOutcome fit_class(const hmm::ModelTrainer& trainer,
                         const data::FeatureBatch& batch,
                         int num_states,
                         unsigned int seed) {
        return fit_class(trainer, batch.features, batch.lengths, num_states, seed);
    }

    ScoreOutcome score_batch(const hmm::SequenceModel& model,
                             const Eigen::MatrixXd& features,
                             const std::vector<int>& lengths) {
        ScoreOutcome outcome;
        try {
            double value = model.score(features, lengths);
            // Infinite log-likelihoods count as scoring failures
            if (!std::isfinite(value)) {
                outcome.failure_reason = "Model returned a non-finite log-likelihood";
                return outcome;
            }
            outcome.log_likelihood = value;
            outcome.success = true;
        } catch (const hmm::ScoringFailure& e) {
            outcome.failure_reason = e.what();
        }
        return outcome;
    }

    ScoreOutcome score_batch(const hmm::SequenceModel& model, const data::FeatureBatch& batch) {
        return score_batch(model, batch.features, batch.lengths);
    }

    ScoreOutcome score_under(const hmm::SequenceModel& model, const data::ClassData& class_data) {
        return score_batch(model, class_data.features, class_data.lengths);
    }

    int free_parameter_count(int num_states, int num_features) {
        return num_states * num_states + 2 * num_features * num_states - 1;
    }

    double bic_score(double log_likelihood, int num_states, int num_features, int num_frames) {
        const double p = static_cast<double>(free_parameter_count(num_states, num_features));
        return -2.0 * log_likelihood + p * std::log(static_cast<double>(num_frames));
    }

    std::vector<std::vector<size_t>> kfold_split(size_t num_items, int num_folds) {
        if (num_folds < 2) {
            throw std::invalid_argument("k-fold split needs at least two folds");
        }
        if (num_items < static_cast<size_t>(num_folds)) {
            throw std::invalid_argument("Fewer items than folds");
        }

        const size_t k = static_cast<size_t>(num_folds);
        const size_t base = num_items / k;
        const size_t extra = num_items % k;

        std::vector<std::vector<size_t>> folds;
        folds.reserve(k);

        size_t start = 0;
        for (size_t f = 0; f < k; ++f) {
            size_t size = base + (f < extra ? 1 : 0);
            std::vector<size_t> fold(size);
            for (size_t i = 0; i < size; ++i) {
                fold[i] = start + i;
            }
            folds.push_back(std::move(fold));
            start += size;
        }
        return folds;
    }

    std::vector<size_t> complement_indices(const std::vector<size_t>& held_out, size_t num_items) {
        std::vector<bool> excluded(num_items, false);
        for (size_t idx : held_out) {
            if (idx < num_items) {
                excluded[idx] = true;
            }
        }

        std::vector<size_t> remaining;
        remaining.reserve(num_items);
        for (size_t i = 0; i < num_items; ++i) {
            if (!excluded[i]) {
                remaining.push_back(i);
            }
        }
        return remaining;
    }

    // ModelSelector implementation
    ModelSelector::ModelSelector(const data::Dataset& dataset,
                                 const std::string& class_label,
                                 const hmm::ModelTrainer& trainer,
                                 const SelectorConfig& config)
        : dataset_(dataset)
        , class_data_(resolve_class(dataset, class_label))
        , trainer_(trainer)
        , config_(config) {

        if (config_.min_states < 1) {
            throw diagnostics::ConfigurationError("min_states must be at least 1");
        }
        if (config_.max_states < config_.min_states) {
            throw diagnostics::ConfigurationError("max_states must not be below min_states");
        }
        if (config_.constant_states < 1) {
            throw diagnostics::ConfigurationError("constant_states must be at least 1");
        }
        if (config_.cv_folds < 2) {
            throw diagnostics::ConfigurationError("cv_folds must be at least 2");
        }
        if (!class_data_.is_consistent()) {
            throw diagnostics::InvalidDataError("Class '" + class_label + "' lengths do not match its features");
        }
    }

    const data::ClassData& ModelSelector::resolve_class(const data::Dataset& dataset,
                                                        const std::string& class_label) {
        auto it = dataset.find(class_label);
        if (it == dataset.end()) {
            throw diagnostics::ConfigurationError("Unknown class label: " + class_label);
        }
        return it->second;
    }

    FitOutcome ModelSelector::fit_candidate(int num_states) const {
        return fit_batch(class_data_.features, class_data_.lengths, num_states);
    }

    FitOutcome ModelSelector::fit_batch(const Eigen::MatrixXd& features, const std::vector<int>& lengths,
                                        int num_states, const std::string& other_class) const {
        FitOutcome outcome = fit_class(trainer_, features, lengths, num_states, config_.random_seed);
        if (!outcome.ok()) {
            report(ErrorCode::TRAINING_FAILURE, num_states, outcome.failure_reason, other_class);
        }
        return outcome;
    }

    ScoreOutcome ModelSelector::score_candidate(const hmm::SequenceModel& model,
                                                const Eigen::MatrixXd& features, const std::vector<int>& lengths,
                                                int num_states, const std::string& other_class) const {
        ScoreOutcome outcome = score_batch(model, features, lengths);
        if (!outcome.ok()) {
            report(ErrorCode::SCORING_FAILURE, num_states, outcome.failure_reason, other_class);
        }
        return outcome;
    }

    SelectionResult ModelSelector::finish(int chosen_states, hmm::ModelPtr model,
                                          std::vector<CandidateScore> candidates) const {
        SelectionResult result;
        result.chosen_states = chosen_states;
        result.model = std::move(model);
        result.candidates = std::move(candidates);
        diagnostics::Logger::instance().log_selection(name(), class_data_.label, chosen_states, false);
        return result;
    }

    SelectionResult ModelSelector::fallback(std::vector<CandidateScore> candidates) const {
        report(ErrorCode::SELECTION_EXHAUSTED, -1,
               "No candidate in [" + std::to_string(config_.min_states) + ", " +
               std::to_string(config_.max_states) + "] produced a usable model");

        SelectionResult result;
        result.used_fallback = true;
        result.candidates = std::move(candidates);

        FitOutcome outcome = fit_candidate(config_.constant_states);
        if (outcome.ok()) {
            result.model = std::move(outcome.model);
            diagnostics::Logger::instance().log_selection(name(), class_data_.label,
                                                          config_.constant_states, true);
        } else {
            report(ErrorCode::FALLBACK_FAILED, config_.constant_states, outcome.failure_reason);
            diagnostics::Logger::instance().log_selection(name(), class_data_.label, -1, true);
        }
        return result;
    }

    void ModelSelector::report(ErrorCode code, int num_states, const std::string& message,
                               const std::string& other_class) const {
        diagnostics::SelectionDiagnostic diagnostic(code, class_data_.label, num_states, message, other_class);
        LOG_DEBUG(name() + ": " + diagnostics::format_diagnostic(diagnostic));
        if (diagnostic_callback_) {
            diagnostic_callback_(diagnostic);
        }
    }

    void ModelSelector::log_candidate(const CandidateScore& candidate) const {
        auto& logger = diagnostics::Logger::instance();
        if (config_.verbose && candidate.evaluated) {
            logger.info_f("%s: class '%s' n=%d criterion=%.4f", name().c_str(),
                          class_data_.label.c_str(), candidate.num_states, candidate.criterion);
        } else {
            logger.log_candidate(name(), class_data_.label, candidate.num_states,
                                 candidate.evaluated, candidate.criterion);
        }
    }

    // SelectorConstant implementation
    SelectionResult SelectorConstant::select() {
        const int n = config_.constant_states;
        FitOutcome outcome = fit_candidate(n);

        std::vector<CandidateScore> candidates;
        candidates.emplace_back(n, outcome.ok(), 0.0, outcome.ok() ? 1 : 0);

        if (outcome.ok()) {
            return finish(n, std::move(outcome.model), std::move(candidates));
        }

        report(ErrorCode::FALLBACK_FAILED, n, outcome.failure_reason);
        diagnostics::Logger::instance().log_selection(name(), class_data_.label, -1, false);

        SelectionResult result;
        result.candidates = std::move(candidates);
        return result;
    }

    // Factory
    SelectorType parse_selector_type(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "constant") return SelectorType::CONSTANT;
        if (lower == "bic") return SelectorType::BIC;
        if (lower == "dic") return SelectorType::DIC;
        if (lower == "cv") return SelectorType::CV;

        throw diagnostics::ConfigurationError("Unknown selector type: " + name);
    }

    std::string selector_type_name(SelectorType type) {
        switch (type) {
            case SelectorType::CONSTANT: return "constant";
            case SelectorType::BIC: return "bic";
            case SelectorType::DIC: return "dic";
            case SelectorType::CV: return "cv";
            default: return "unknown";
        }
    }

    std::unique_ptr<ModelSelector> create_selector(SelectorType type,
                                                   const data::Dataset& dataset,
                                                   const std::string& class_label,
                                                   const hmm::ModelTrainer& trainer,
                                                   const SelectorConfig& config) {
        switch (type) {
            case SelectorType::CONSTANT:
                return std::make_unique<SelectorConstant>(dataset, class_label, trainer, config);
            case SelectorType::BIC:
                return std::make_unique<SelectorBIC>(dataset, class_label, trainer, config);
            case SelectorType::DIC:
                return std::make_unique<SelectorDIC>(dataset, class_label, trainer, config);
            case SelectorType::CV:
                return std::make_unique<SelectorCV>(dataset, class_label, trainer, config);
        }
        throw diagnostics::ConfigurationError("Unsupported selector type");
    }

} // namespace selection
} // namespace hmmselect
