#include <ranklab/search/score_normalizer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace ranklab::search {

std::vector<double> normalizeScores(const std::vector<double>& scores) {
    if (scores.empty()) {
        return {};
    }

    auto [minIt, maxIt] = std::minmax_element(scores.begin(), scores.end());
    const double minScore = *minIt;
    const double maxScore = *maxIt;

    if (maxScore == minScore) {
        return std::vector<double>(scores.size(), kUniformWinnerScore);
    }

    std::vector<double> normalized;
    normalized.reserve(scores.size());
    const double range = maxScore - minScore;
    for (double score : scores) {
        normalized.push_back((score - minScore) / range);
    }
    return normalized;
}

Result<RankedList> normalize(const RankedList& list) {
    std::vector<double> raw;
    raw.reserve(list.size());
    for (const auto& doc : list) {
        if (!std::isfinite(doc.score)) {
            return Error{ErrorCode::ScoringError,
                         "Cannot normalize non-finite score for '" + doc.docId + "'"};
        }
        raw.push_back(doc.score);
    }

    const auto scaled = normalizeScores(raw);

    std::vector<ScoredDocument> documents;
    documents.reserve(list.size());
    size_t i = 0;
    for (const auto& doc : list) {
        ScoredDocument out = doc;
        out.score = std::clamp(scaled[i++], 0.0, 1.0);
        documents.push_back(std::move(out));
    }

    spdlog::debug("Normalized {} scores from source '{}'", documents.size(), list.source());
    return RankedList::build(list.source(), std::move(documents));
}

} // namespace ranklab::search
