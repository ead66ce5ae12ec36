#include "hmmselect/model_selector.h"
#include "hmmselect/logger.h"
#include <algorithm>

namespace hmmselect {
namespace selection {

    SelectionResult SelectorCV::select() {
        const size_t num_sequences = class_data_.num_sequences();
        const int num_folds = static_cast<int>(std::min<size_t>(config_.cv_folds, num_sequences));

        std::vector<CandidateScore> candidates;

        if (num_folds < 2) {
            LOG_WARN_F("%s: class '%s' has %zu sequence(s), cross-validation needs at least 2",
                       name().c_str(), class_data_.label.c_str(), num_sequences);
            return fallback(std::move(candidates));
        }

        // Training and held-out batches do not depend on n
        struct Fold {
            data::FeatureBatch train;
            data::FeatureBatch test;
        };
        std::vector<Fold> folds;
        for (const auto& held_out : kfold_split(num_sequences, num_folds)) {
            Fold fold;
            fold.train = data::combine_sequences(complement_indices(held_out, num_sequences),
                                                 class_data_.sequences);
            fold.test = data::combine_sequences(held_out, class_data_.sequences);
            folds.push_back(std::move(fold));
        }

        std::optional<int> best_states;
        double best_mean = 0.0;

        for (int n = config_.min_states; n <= config_.max_states; ++n) {
            double sum_log_likelihood = 0.0;
            int successful_folds = 0;

            for (const auto& fold : folds) {
                FitOutcome fit = fit_batch(fold.train.features, fold.train.lengths, n);
                if (!fit.ok()) {
                    continue;
                }

                ScoreOutcome held_out = score_candidate(*fit.model, fold.test.features, fold.test.lengths, n);
                if (!held_out.ok()) {
                    continue;
                }

                sum_log_likelihood += held_out.log_likelihood;
                ++successful_folds;
            }

            if (successful_folds == 0) {
                candidates.emplace_back(n);
                log_candidate(candidates.back());
                continue;
            }

            double mean = sum_log_likelihood / successful_folds;
            candidates.emplace_back(n, true, mean, successful_folds);
            log_candidate(candidates.back());

            if (!best_states || mean > best_mean) {
                best_mean = mean;
                best_states = n;
            }
        }

        if (!best_states) {
            return fallback(std::move(candidates));
        }

        FitOutcome final_fit = fit_candidate(*best_states);
        if (!final_fit.ok()) {
            return fallback(std::move(candidates));
        }
        return finish(*best_states, std::move(final_fit.model), std::move(candidates));
    }

} // namespace selection
} // namespace hmmselect
