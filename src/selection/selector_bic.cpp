#include "hmmselect/model_selector.h"

namespace hmmselect {
namespace selection {

    SelectionResult SelectorBIC::select() {
        const int num_frames = class_data_.num_frames();
        const int num_features = class_data_.num_features();

        std::vector<CandidateScore> candidates;
        std::optional<int> best_states;
        hmm::ModelPtr best_model;
        double best_score = 0.0;

        for (int n = config_.min_states; n <= config_.max_states; ++n) {
            FitOutcome fit = fit_candidate(n);
            if (!fit.ok()) {
                candidates.emplace_back(n);
                log_candidate(candidates.back());
                continue;
            }

            ScoreOutcome scored = score_candidate(*fit.model, class_data_.features, class_data_.lengths, n);
            if (!scored.ok()) {
                candidates.emplace_back(n);
                log_candidate(candidates.back());
                continue;
            }

            double bic = bic_score(scored.log_likelihood, n, num_features, num_frames);
            candidates.emplace_back(n, true, bic, 1);
            log_candidate(candidates.back());

            // Strict comparison keeps the smallest n among equal scores
            if (!best_states || bic < best_score) {
                best_score = bic;
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
