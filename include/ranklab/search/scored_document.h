#pragma once

#include <ranklab/core/types.h>

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ranklab::search {

/**
 * @brief A single document with its score for one ranking.
 *
 * docId is an opaque join key shared by every retrieval source. It is compared
 * only as a string (for the deterministic tie-break), never parsed.
 */
struct ScoredDocument {
    std::string docId;
    double score = 0.0;
    std::map<std::string, double> rawScores; // source name -> per-source evidence

    ScoredDocument() = default;
    ScoredDocument(std::string id, double s) : docId(std::move(id)), score(s) {}
};

/**
 * @brief Ranking order used everywhere: score descending, then docId ascending.
 *
 * Because docId is unique within a ranking this is a strict total order.
 */
inline bool rankedBefore(const ScoredDocument& a, const ScoredDocument& b) noexcept {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.docId < b.docId;
}

void sortByRank(std::vector<ScoredDocument>& documents);

std::vector<std::string> docIdsOf(const std::vector<ScoredDocument>& documents);

/**
 * @brief Ranked results produced by exactly one retrieval source.
 *
 * Only constructible through build()/fromPairs()/empty(), which guarantee:
 * - every score is finite
 * - each docId appears at most once
 * - documents are sorted by rankedBefore()
 */
class RankedList {
public:
    RankedList() = default;

    static Result<RankedList> build(std::string source, std::vector<ScoredDocument> documents);

    static Result<RankedList> fromPairs(std::string source,
                                        const std::vector<std::pair<std::string, double>>& pairs);

    static RankedList empty(std::string source);

    const std::string& source() const { return source_; }
    const std::vector<ScoredDocument>& documents() const { return documents_; }

    size_t size() const { return documents_.size(); }
    bool isEmpty() const { return documents_.empty(); }

    std::vector<ScoredDocument>::const_iterator begin() const { return documents_.begin(); }
    std::vector<ScoredDocument>::const_iterator end() const { return documents_.end(); }

private:
    RankedList(std::string source, std::vector<ScoredDocument> documents)
        : source_(std::move(source)), documents_(std::move(documents)) {}

    std::string source_;
    std::vector<ScoredDocument> documents_;
};

} // namespace ranklab::search
