#pragma once

#include <vector>
#include <map>
#include <string>
#include <optional>
#include "sequence_data.h"
#include "sequence_model.h"

namespace hmmselect {
namespace recognition {

    /**
     * @brief A class label paired with its selected model
     *
     * model is null when selection left the class without a model.
     */
    struct ClassModel {
        std::string label;
        hmm::ModelPtr model;

        ClassModel() = default;
        ClassModel(std::string l, hmm::ModelPtr m)
            : label(std::move(l)), model(std::move(m)) {}
    };

    /**
     * @brief Insertion-ordered label -> model map
     *
     * Order decides recognition tie-breaks: the earlier class wins.
     */
    using ModelMap = std::vector<ClassModel>;

    /**
     * @brief Per-item class scores and best guesses
     *
     * probabilities[i] holds the log-likelihood of item i under every
     * class, -infinity where the model was absent or scoring failed.
     * guesses[i] is empty when no class produced a finite score.
     */
    struct RecognitionResult {
        std::vector<std::map<std::string, double>> probabilities;
        std::vector<std::optional<std::string>> guesses;

        size_t size() const { return guesses.size(); }
        size_t num_without_guess() const;
    };

    /**
     * @brief Score every test item under every class model
     *
     * Never throws for a failing model; ScoringFailure is absorbed as
     * -infinity for that (item, class) pair.
     */
    RecognitionResult recognize(const ModelMap& models, const std::vector<data::TestItem>& test_items);

    /**
     * @brief Fraction of items whose guess is absent or wrong
     *
     * Throws InvalidDataError when the sizes differ. Returns 0 for empty input.
     */
    double recognition_error_rate(const std::vector<std::optional<std::string>>& guesses,
                                  const std::vector<std::string>& expected);

    struct RecognitionReport {
        size_t correct;
        size_t total;
        std::vector<size_t> misrecognized;      // Item indices with a missing or wrong guess

        RecognitionReport() : correct(0), total(0) {}

        double error_rate() const {
            return total == 0 ? 0.0 : static_cast<double>(total - correct) / static_cast<double>(total);
        }
    };

    RecognitionReport build_report(const RecognitionResult& result, const std::vector<std::string>& expected);

    std::string format_report(const RecognitionReport& report);

    /// Finds a model by label; nullptr when absent or null.
    const hmm::SequenceModel* find_model(const ModelMap& models, const std::string& label);

} // namespace recognition
} // namespace hmmselect
