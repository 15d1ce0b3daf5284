#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/fusion_config.h>
#include <ranklab/search/scored_document.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ranklab::search {

// Per-source ranked lists keyed by source name. std::map keeps the fold order
// (and therefore floating-point summation order) identical across runs.
using SourceLists = std::map<std::string, RankedList>;

/**
 * @brief What one source adds to one document during fusion.
 */
struct SourceContribution {
    double evidence = 0.0; // Recorded in rawScores[source] (normalized score or RRF term)
    double score = 0.0;    // Added to the fused score
};

/**
 * @brief Merges per-source lists into one doc_id-keyed record set.
 *
 * Each source's list is folded in turn; a document seen for the first time
 * starts at 0. A document that a source never returned simply receives no
 * contribution from it, which is the missing-score-as-0 policy: absence is
 * "no evidence" and is never imputed from another source.
 */
class FusionAccumulator {
public:
    template <typename ContributionFn>
    void fold(const RankedList& list, ContributionFn&& contributionFn) {
        size_t rank = 0;
        for (const auto& doc : list) {
            ++rank; // 1-based, positional
            auto [it, inserted] = records_.try_emplace(doc.docId);
            if (inserted) {
                it->second.docId = doc.docId;
                it->second.score = 0.0;
            }
            const SourceContribution c = contributionFn(doc, rank);
            it->second.score += c.score;
            it->second.rawScores[list.source()] = c.evidence;
        }
    }

    size_t size() const { return records_.size(); }

    /// Drain the records into a vector sorted by rankedBefore().
    std::vector<ScoredDocument> finish();

private:
    std::map<std::string, ScoredDocument> records_;
};

/**
 * @brief Result fusion engine
 *
 * Fuses per-source ranked lists with the configured strategy. The output holds
 * the union of every input docId, sorted by score descending then docId
 * ascending, so identical inputs always give an identical ordering.
 */
class ResultFusion {
public:
    explicit ResultFusion(const FusionConfig& config);

    Result<std::vector<ScoredDocument>> fuse(const SourceLists& lists) const;

    /// fuse() truncated to the first n entries of the deterministic order.
    Result<std::vector<ScoredDocument>> fuseTopN(const SourceLists& lists, size_t n) const;

    /// 1 / (rrfK + rank) for a 1-based rank.
    static double reciprocalRankContribution(int rrfK, size_t rank) noexcept;

private:
    Result<std::vector<ScoredDocument>> fuseWeightedSum(const SourceLists& lists) const;
    Result<std::vector<ScoredDocument>> fuseReciprocalRank(const SourceLists& lists) const;

    const FusionConfig& config_;
};

/// Convenience wrapper: ResultFusion(config).fuse(lists).
Result<std::vector<ScoredDocument>> fuse(const SourceLists& lists, const FusionConfig& config);

} // namespace ranklab::search
