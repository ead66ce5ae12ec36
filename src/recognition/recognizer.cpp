#include "hmmselect/recognizer.h"
#include "hmmselect/logger.h"
#include "hmmselect/errors.h"
#include <limits>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace hmmselect {
namespace recognition {

    size_t RecognitionResult::num_without_guess() const {
        size_t count = 0;
        for (const auto& guess : guesses) {
            if (!guess) ++count;
        }
        return count;
    }

    RecognitionResult recognize(const ModelMap& models, const std::vector<data::TestItem>& test_items) {
        const double neg_inf = -std::numeric_limits<double>::infinity();

        RecognitionResult result;
        result.probabilities.reserve(test_items.size());
        result.guesses.reserve(test_items.size());

        for (size_t i = 0; i < test_items.size(); ++i) {
            const data::TestItem& item = test_items[i];
            std::map<std::string, double> scores;
            std::optional<std::string> guess;
            double best = neg_inf;

            for (const auto& entry : models) {
                double value = neg_inf;
                if (entry.model) {
                    try {
                        value = entry.model->score(item.features, item.lengths);
                        if (std::isnan(value)) {
                            value = neg_inf;
                        }
                    } catch (const hmm::ScoringFailure& e) {
                        LOG_DEBUG_F("Item %zu could not be scored by '%s': %s",
                                    i, entry.label.c_str(), e.what());
                        value = neg_inf;
                    }
                }
                scores[entry.label] = value;

                // First class to reach the maximum keeps it
                if (value > best) {
                    best = value;
                    guess = entry.label;
                }
            }

            result.probabilities.push_back(std::move(scores));
            result.guesses.push_back(std::move(guess));
        }

        diagnostics::Logger::instance().log_recognition(test_items.size(), models.size(),
                                                        result.num_without_guess());
        return result;
    }

    double recognition_error_rate(const std::vector<std::optional<std::string>>& guesses,
                                  const std::vector<std::string>& expected) {
        if (guesses.size() != expected.size()) {
            throw diagnostics::InvalidDataError("Guess count " + std::to_string(guesses.size()) +
                                                " does not match expected count " +
                                                std::to_string(expected.size()));
        }
        if (guesses.empty()) {
            return 0.0;
        }

        size_t misses = 0;
        for (size_t i = 0; i < guesses.size(); ++i) {
            if (!guesses[i] || *guesses[i] != expected[i]) {
                ++misses;
            }
        }
        return static_cast<double>(misses) / static_cast<double>(guesses.size());
    }

    RecognitionReport build_report(const RecognitionResult& result, const std::vector<std::string>& expected) {
        if (result.guesses.size() != expected.size()) {
            throw diagnostics::InvalidDataError("Recognition result and expected labels differ in size");
        }

        RecognitionReport report;
        report.total = expected.size();
        for (size_t i = 0; i < expected.size(); ++i) {
            const auto& guess = result.guesses[i];
            if (guess && *guess == expected[i]) {
                ++report.correct;
            } else {
                report.misrecognized.push_back(i);
            }
        }
        return report;
    }

    std::string format_report(const RecognitionReport& report) {
        std::ostringstream oss;
        oss << "WER = " << std::fixed << std::setprecision(4) << report.error_rate() << "\n";
        oss << "Total correct: " << report.correct << " out of " << report.total;
        if (!report.misrecognized.empty()) {
            oss << "\nMisrecognized items:";
            for (size_t index : report.misrecognized) {
                oss << " " << index;
            }
        }
        return oss.str();
    }

    const hmm::SequenceModel* find_model(const ModelMap& models, const std::string& label) {
        for (const auto& entry : models) {
            if (entry.label == label) {
                return entry.model.get();
            }
        }
        return nullptr;
    }

} // namespace recognition
} // namespace hmmselect
