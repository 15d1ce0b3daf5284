#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/scored_document.h>

#include <vector>

namespace ranklab::search {

/**
 * @brief Score given to every entry of a list that cannot discriminate.
 *
 * A source whose scores are all equal (including empty and single-element
 * lists) normalizes to 1.0 for every entry, so it keeps its full weight in the
 * blend instead of collapsing to 0. The complementary rule lives in
 * ResultFusion: a document absent from a source receives 0 from that source.
 */
inline constexpr double kUniformWinnerScore = 1.0;

/**
 * @brief Min-max rescale a source's raw scores into [0, 1].
 *
 * score' = (score - min) / (max - min), or kUniformWinnerScore when max == min.
 * The raw score is preserved in rawScores[list.source()]. Order is unchanged
 * because min-max scaling is monotonic.
 *
 * @return The rescaled list, or ScoringError for non-finite input.
 */
Result<RankedList> normalize(const RankedList& list);

/**
 * @brief Min-max rescale a bare score vector with the same degenerate-case rule.
 */
std::vector<double> normalizeScores(const std::vector<double>& scores);

} // namespace ranklab::search
