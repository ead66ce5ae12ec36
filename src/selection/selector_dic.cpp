#include "hmmselect/model_selector.h"

namespace hmmselect {
namespace selection {

    SelectionResult SelectorDIC::select() {
        std::vector<CandidateScore> candidates;
        std::optional<int> best_states;
        hmm::ModelPtr best_model;
        double best_dic = 0.0;

        for (int n = config_.min_states; n <= config_.max_states; ++n) {
            FitOutcome fit = fit_candidate(n);
            if (!fit.ok()) {
                candidates.emplace_back(n);
                log_candidate(candidates.back());
                continue;
            }

            ScoreOutcome own = score_candidate(*fit.model, class_data_.features, class_data_.lengths, n);
            if (!own.ok()) {
                candidates.emplace_back(n);
                log_candidate(candidates.back());
                continue;
            }

            double anti_likelihood_sum = 0.0;
            int contributing = 0;

            for (const auto& entry : dataset_) {
                const data::ClassData& other = entry.second;
                if (entry.first == class_data_.label) {
                    continue;
                }

                // The other class must itself be trainable at n to take part
                FitOutcome other_fit = fit_batch(other.features, other.lengths, n, other.label);
                if (!other_fit.ok()) {
                    continue;
                }

                ScoreOutcome cross = score_under(*fit.model, other);
                if (!cross.ok()) {
                    report(diagnostics::ErrorCode::SCORING_FAILURE, n, cross.failure_reason, other.label);
                    continue;
                }

                anti_likelihood_sum += cross.log_likelihood;
                ++contributing;
            }

            if (contributing == 0) {
                report(diagnostics::ErrorCode::SELECTION_EXHAUSTED, n,
                       "No other class could be fitted and scored");
                candidates.emplace_back(n);
                log_candidate(candidates.back());
                continue;
            }

            double dic = own.log_likelihood - anti_likelihood_sum / contributing;
            candidates.emplace_back(n, true, dic, contributing);
            log_candidate(candidates.back());

            if (!best_states || dic > best_dic) {
                best_dic = dic;
                best_states = n;
                best_model = std::move(fit.model);
            }
        }

        if (!best_states) {
            return fallback(std::move(candidates));
        }
        return finish(*best_states, std::move(best_model), std::move(candidates));
    }

} // namespace selection
} // namespace hmmselect
