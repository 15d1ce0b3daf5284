#include <ranklab/search/scored_document.h>

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace ranklab::search {

void sortByRank(std::vector<ScoredDocument>& documents) {
    std::sort(documents.begin(), documents.end(), rankedBefore);
}

std::vector<std::string> docIdsOf(const std::vector<ScoredDocument>& documents) {
    std::vector<std::string> ids;
    ids.reserve(documents.size());
    for (const auto& doc : documents) {
        ids.push_back(doc.docId);
    }
    return ids;
}

Result<RankedList> RankedList::build(std::string source, std::vector<ScoredDocument> documents) {
    std::unordered_set<std::string> seen;
    seen.reserve(documents.size());

    for (auto& doc : documents) {
        if (!std::isfinite(doc.score)) {
            return Error{ErrorCode::ScoringError,
                         "Non-finite score for document '" + doc.docId + "' from source '" +
                             source + "'"};
        }
        if (!seen.insert(doc.docId).second) {
            return Error{ErrorCode::InvalidArgument,
                         "Duplicate document '" + doc.docId + "' in ranked list from source '" +
                             source + "'"};
        }
        // Keep the source's own score as evidence once it has been rescaled downstream
        doc.rawScores.try_emplace(source, doc.score);
    }

    sortByRank(documents);
    return RankedList(std::move(source), std::move(documents));
}

Result<RankedList>
RankedList::fromPairs(std::string source, const std::vector<std::pair<std::string, double>>& pairs) {
    std::vector<ScoredDocument> documents;
    documents.reserve(pairs.size());
    for (const auto& [id, score] : pairs) {
        documents.emplace_back(id, score);
    }
    return build(std::move(source), std::move(documents));
}

RankedList RankedList::empty(std::string source) {
    return RankedList(std::move(source), {});
}

} // namespace ranklab::search
