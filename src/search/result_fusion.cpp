#include <ranklab/search/result_fusion.h>
#include <ranklab/search/score_normalizer.h>

#include <spdlog/spdlog.h>

#include <cmath>

namespace ranklab::search {

// ============================================================================
// FusionAccumulator
// ============================================================================

std::vector<ScoredDocument> FusionAccumulator::finish() {
    std::vector<ScoredDocument> fused;
    fused.reserve(records_.size());
    for (auto& [docId, record] : records_) {
        fused.push_back(std::move(record));
    }
    records_.clear();

    sortByRank(fused);
    return fused;
}

// ============================================================================
// ResultFusion
// ============================================================================

ResultFusion::ResultFusion(const FusionConfig& config) : config_(config) {}

double ResultFusion::reciprocalRankContribution(int rrfK, size_t rank) noexcept {
    return 1.0 / (static_cast<double>(rrfK) + static_cast<double>(rank));
}

Result<std::vector<ScoredDocument>> ResultFusion::fuse(const SourceLists& lists) const {
    if (auto valid = config_.validate(); !valid) {
        return valid.error();
    }

    Result<std::vector<ScoredDocument>> fused = std::vector<ScoredDocument>{};
    switch (config_.strategy) {
        case FusionConfig::Strategy::WEIGHTED_SUM:
            fused = fuseWeightedSum(lists);
            break;
        case FusionConfig::Strategy::RECIPROCAL_RANK:
            fused = fuseReciprocalRank(lists);
            break;
    }
    if (!fused) {
        return fused;
    }

    for (const auto& doc : fused.value()) {
        if (!std::isfinite(doc.score)) {
            return Error{ErrorCode::ScoringError,
                         "Fused score for '" + doc.docId + "' is not finite"};
        }
    }

    spdlog::debug("Fused {} sources into {} documents ({})", lists.size(), fused.value().size(),
                  FusionConfig::strategyToString(config_.strategy));
    return fused;
}

Result<std::vector<ScoredDocument>> ResultFusion::fuseTopN(const SourceLists& lists,
                                                           size_t n) const {
    auto fused = fuse(lists);
    if (!fused) {
        return fused;
    }
    auto& results = fused.value();
    if (results.size() > n) {
        results.resize(n);
    }
    return fused;
}

Result<std::vector<ScoredDocument>>
ResultFusion::fuseWeightedSum(const SourceLists& lists) const {
    FusionAccumulator accumulator;

    for (const auto& [source, list] : lists) {
        if (config_.weights.find(source) == config_.weights.end()) {
            spdlog::debug("Source '{}' has no fusion weight; it contributes 0", source);
        }
        const double weight = config_.weightFor(source);

        auto normalized = normalize(list);
        if (!normalized) {
            return normalized.error();
        }

        accumulator.fold(normalized.value(), [weight](const ScoredDocument& doc, size_t) {
            return SourceContribution{doc.score, weight * doc.score};
        });
    }

    return accumulator.finish();
}

Result<std::vector<ScoredDocument>>
ResultFusion::fuseReciprocalRank(const SourceLists& lists) const {
    FusionAccumulator accumulator;
    const int k = config_.rrfK;

    for (const auto& [source, list] : lists) {
        // Rank is positional: the list is already in the source's own order,
        // ties resolved by docId.
        accumulator.fold(list, [k](const ScoredDocument&, size_t rank) {
            const double rr = reciprocalRankContribution(k, rank);
            return SourceContribution{rr, rr};
        });
    }

    return accumulator.finish();
}

Result<std::vector<ScoredDocument>> fuse(const SourceLists& lists, const FusionConfig& config) {
    return ResultFusion(config).fuse(lists);
}

} // namespace ranklab::search
