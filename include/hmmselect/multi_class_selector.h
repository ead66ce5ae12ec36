#pragma once

#include <vector>
#include <string>
#include <optional>
#include "model_selector.h"
#include "recognizer.h"

namespace hmmselect {
namespace selection {

    /**
     * @brief Selection summary for one class
     */
    struct ClassSummary {
        std::string label;
        std::optional<int> chosen_states;   // Empty when no candidate survived
        int model_states;                   // -1 when the class has no model
        bool used_fallback;
        std::vector<CandidateScore> candidates;

        ClassSummary() : model_states(-1), used_fallback(false) {}
    };

    struct MultiClassResult {
        recognition::ModelMap models;       // Dataset order, null for classes without a model
        std::vector<ClassSummary> summaries;

        size_t num_without_model() const;
        size_t num_fallbacks() const;
    };

    /**
     * @brief Runs one selector strategy over every class of a dataset
     *
     * num_threads: 1 runs classes one after another, 0 uses the hardware
     * concurrency, larger values cap the number of worker tasks. Results
     * are identical for any thread count. The trainer and the diagnostic
     * callback are shared by all workers and must be thread-safe. A class
     * whose data is malformed is reported as INVALID_DATA and gets a null
     * model; the other classes are still selected.
     */
    class MultiClassSelector {
    public:
        MultiClassSelector(SelectorType type,
                           const hmm::ModelTrainer& trainer,
                           const SelectorConfig& config = SelectorConfig(),
                           int num_threads = 1);

        MultiClassResult select_all(const data::Dataset& dataset) const;

        void set_diagnostic_callback(diagnostics::DiagnosticCallback callback) {
            diagnostic_callback_ = std::move(callback);
        }

        SelectorType type() const { return type_; }
        int num_threads() const { return num_threads_; }

    private:
        SelectorType type_;
        const hmm::ModelTrainer& trainer_;
        SelectorConfig config_;
        int num_threads_;
        diagnostics::DiagnosticCallback diagnostic_callback_;

        SelectionResult select_class(const data::Dataset& dataset, const std::string& label) const;
        int effective_threads(size_t num_classes) const;
    };

    /// Convenience wrapper returning only the model map.
    recognition::ModelMap train_all_classes(const data::Dataset& dataset,
                                            SelectorType type,
                                            const hmm::ModelTrainer& trainer,
                                            const SelectorConfig& config = SelectorConfig(),
                                            int num_threads = 1);

} // namespace selection
} // namespace hmmselect
