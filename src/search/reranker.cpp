#include <ranklab/search/reranker.h>
#include <ranklab/search/tokenizer.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <unordered_set>

namespace ranklab::search {

// ============================================================================
// IReranker adapters
// ============================================================================

ScoreFn makeScoreFn(std::shared_ptr<IReranker> reranker) {
    return [reranker = std::move(reranker)](const std::string& query,
                                            const std::string& docText) -> Result<double> {
        if (!reranker || !reranker->isReady()) {
            return Error{ErrorCode::ScoringError, "Reranker not available"};
        }
        auto scores = reranker->scoreDocuments(query, {docText});
        if (!scores) {
            return scores.error();
        }
        if (scores.value().size() != 1) {
            return Error{ErrorCode::ScoringError, "Reranker returned " +
                                                      std::to_string(scores.value().size()) +
                                                      " scores for 1 document"};
        }
        return static_cast<double>(scores.value().front());
    };
}

Result<std::vector<float>>
TermOverlapReranker::scoreDocuments(const std::string& query,
                                    const std::vector<std::string>& documents) {
    const auto queryTokens = tokenize(query);
    const std::unordered_set<std::string> queryTerms(queryTokens.begin(), queryTokens.end());

    std::string normalizedQuery;
    for (const auto& token : queryTokens) {
        if (!normalizedQuery.empty())
            normalizedQuery.push_back(' ');
        normalizedQuery += token;
    }

    std::vector<float> scores;
    scores.reserve(documents.size());
    for (const auto& doc : documents) {
        if (queryTerms.empty()) {
            scores.push_back(0.0f);
            continue;
        }

        const auto docTokens = tokenize(doc);
        const std::unordered_set<std::string> docTerms(docTokens.begin(), docTokens.end());
        size_t matched = 0;
        for (const auto& term : queryTerms) {
            if (docTerms.count(term))
                ++matched;
        }

        std::string normalizedDoc;
        for (const auto& token : docTokens) {
            if (!normalizedDoc.empty())
                normalizedDoc.push_back(' ');
            normalizedDoc += token;
        }

        float score = static_cast<float>(matched) / static_cast<float>(queryTerms.size());
        if (queryTerms.size() > 1 && normalizedDoc.find(normalizedQuery) != std::string::npos) {
            score += 0.25f;
        }
        scores.push_back(score);
    }
    return scores;
}

// ============================================================================
// Reranker
// ============================================================================

Reranker::Reranker(ScoreFn scoreFn, TextResolver textResolver, size_t parallelism)
    : scoreFn_(std::move(scoreFn)), textResolver_(std::move(textResolver)),
      parallelism_(std::max<size_t>(parallelism, 1)) {}

Result<double> Reranker::scoreOne(const std::string& query,
                                  const ScoredDocument& candidate) const {
    try {
        const std::string text = textResolver_ ? textResolver_(candidate.docId) : candidate.docId;
        auto score = scoreFn_(query, text);
        if (!score) {
            return Error{ErrorCode::ScoringError, "Reranker failed for '" + candidate.docId +
                                                      "': " + score.error().message};
        }
        if (!std::isfinite(score.value())) {
            return Error{ErrorCode::ScoringError,
                         "Reranker returned a non-finite score for '" + candidate.docId + "'"};
        }
        return score.value();
    } catch (const std::exception& e) {
        return Error{ErrorCode::ScoringError,
                     "Reranker threw for '" + candidate.docId + "': " + e.what()};
    } catch (...) {
        return Error{ErrorCode::ScoringError,
                     "Reranker threw a non-standard exception for '" + candidate.docId + "'"};
    }
}

Result<std::vector<ScoredDocument>>
Reranker::rerank(const std::string& query, const std::vector<ScoredDocument>& candidates) const {
    if (!scoreFn_) {
        return Error{ErrorCode::ScoringError, "No score function configured for reranking"};
    }
    if (candidates.empty()) {
        return std::vector<ScoredDocument>{};
    }

    std::vector<Result<double>> scores(candidates.size(),
                                       Result<double>(Error{ErrorCode::InternalError, "unscored"}));

    const size_t workers = std::min(parallelism_, candidates.size());
    if (workers > 1) {
        boost::asio::thread_pool pool(workers);
        for (size_t i = 0; i < candidates.size(); ++i) {
            boost::asio::post(pool, [this, &query, &candidates, &scores, i]() {
                scores[i] = scoreOne(query, candidates[i]);
            });
        }
        pool.join();
    } else {
        for (size_t i = 0; i < candidates.size(); ++i) {
            scores[i] = scoreOne(query, candidates[i]);
        }
    }

    std::vector<ScoredDocument> reranked;
    reranked.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!scores[i]) {
            spdlog::warn("Rerank aborted: {}", scores[i].error().message);
            return scores[i].error();
        }
        ScoredDocument doc = candidates[i];
        doc.rawScores[kFusedScoreKey] = doc.score;
        doc.score = scores[i].value();
        reranked.push_back(std::move(doc));
    }

    sortByRank(reranked);
    spdlog::debug("Reranked {} candidates on {} worker(s)", reranked.size(), workers);
    return reranked;
}

Result<std::vector<ScoredDocument>> rerank(const std::string& query,
                                           const std::vector<ScoredDocument>& candidates,
                                           const ScoreFn& scoreFn,
                                           const TextResolver& textResolver) {
    return Reranker(scoreFn, textResolver).rerank(query, candidates);
}

} // namespace ranklab::search
