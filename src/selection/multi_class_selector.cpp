#include "hmmselect/multi_class_selector.h"
#include "hmmselect/logger.h"
#include <algorithm>
#include <future>
#include <thread>

namespace hmmselect {
namespace selection {

    size_t MultiClassResult::num_without_model() const {
        size_t count = 0;
        for (const auto& entry : models) {
            if (!entry.model) ++count;
        }
        return count;
    }

    size_t MultiClassResult::num_fallbacks() const {
        size_t count = 0;
        for (const auto& summary : summaries) {
            if (summary.used_fallback) ++count;
        }
        return count;
    }

    MultiClassSelector::MultiClassSelector(SelectorType type,
                                           const hmm::ModelTrainer& trainer,
                                           const SelectorConfig& config,
                                           int num_threads)
        : type_(type)
        , trainer_(trainer)
        , config_(config)
        , num_threads_(num_threads) {
        if (num_threads_ < 0) {
            throw diagnostics::ConfigurationError("num_threads cannot be negative");
        }
    }

    int MultiClassSelector::effective_threads(size_t num_classes) const {
        int threads = num_threads_;
        if (threads == 0) {
            threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
        }
        return std::max(1, std::min(threads, static_cast<int>(num_classes)));
    }

    SelectionResult MultiClassSelector::select_class(const data::Dataset& dataset,
                                                     const std::string& label) const {
        try {
            auto selector = create_selector(type_, dataset, label, trainer_, config_);
            if (diagnostic_callback_) {
                selector->set_diagnostic_callback(diagnostic_callback_);
            }
            return selector->select();
        } catch (const diagnostics::InvalidDataError& e) {
            // A malformed class gets no model; the other classes carry on
            diagnostics::SelectionDiagnostic diagnostic(diagnostics::ErrorCode::INVALID_DATA, label, -1, e.what());
            LOG_ERROR(diagnostics::format_diagnostic(diagnostic));
            if (diagnostic_callback_) {
                diagnostic_callback_(diagnostic);
            }
            return SelectionResult();
        }
    }

    MultiClassResult MultiClassSelector::select_all(const data::Dataset& dataset) const {
        const std::vector<std::string> labels = data::class_labels(dataset);
        std::vector<SelectionResult> results(labels.size());

        const int num_threads = effective_threads(labels.size());
        LOG_INFO_F("Selecting models for %zu classes with %s (%d thread(s))",
                   labels.size(), selector_type_name(type_).c_str(), num_threads);

        if (num_threads <= 1) {
            for (size_t i = 0; i < labels.size(); ++i) {
                results[i] = select_class(dataset, labels[i]);
            }
        } else {
            // Each worker owns a contiguous slice of result slots
            auto worker = [this, &dataset, &labels, &results](size_t begin, size_t end) {
                for (size_t i = begin; i < end; ++i) {
                    results[i] = select_class(dataset, labels[i]);
                }
            };

            std::vector<std::future<void>> futures;
            size_t per_thread = (labels.size() + num_threads - 1) / num_threads;
            for (int t = 0; t < num_threads; ++t) {
                size_t begin = t * per_thread;
                size_t end = std::min(begin + per_thread, labels.size());
                if (begin < end) {
                    futures.emplace_back(std::async(std::launch::async, worker, begin, end));
                }
            }

            // get() rethrows configuration errors raised inside a worker
            for (auto& future : futures) {
                future.wait();
            }
            for (auto& future : futures) {
                future.get();
            }
        }

        MultiClassResult result;
        result.models.reserve(labels.size());
        result.summaries.reserve(labels.size());
        for (size_t i = 0; i < labels.size(); ++i) {
            ClassSummary summary;
            summary.label = labels[i];
            summary.chosen_states = results[i].chosen_states;
            summary.model_states = results[i].model_states();
            summary.used_fallback = results[i].used_fallback;
            summary.candidates = results[i].candidates;

            result.summaries.push_back(std::move(summary));
            result.models.emplace_back(labels[i], std::move(results[i].model));
        }

        size_t missing = result.num_without_model();
        if (missing > 0) {
            LOG_ERROR_F("%zu of %zu classes have no model", missing, labels.size());
        }
        return result;
    }

    recognition::ModelMap train_all_classes(const data::Dataset& dataset,
                                            SelectorType type,
                                            const hmm::ModelTrainer& trainer,
                                            const SelectorConfig& config,
                                            int num_threads) {
        MultiClassSelector selector(type, trainer, config, num_threads);
        return selector.select_all(dataset).models;
    }

} // namespace selection
} // namespace hmmselect
