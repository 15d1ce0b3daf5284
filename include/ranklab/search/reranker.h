#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/scored_document.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ranklab::search {

/// Pairwise relevance: (query, document text) -> score, higher is more relevant.
using ScoreFn = std::function<Result<double>(const std::string& query, const std::string& docText)>;

/// Maps a docId to the text handed to the score function.
using TextResolver = std::function<std::string(const std::string& docId)>;

// Key under which the pre-rerank (fused) score is kept in rawScores
inline constexpr const char* kFusedScoreKey = "fused";

/**
 * @brief Interface for cross-encoder document reranking
 *
 * Cross-encoders score query-document pairs jointly. They are typically more
 * accurate than the first-stage retrieval scores and much more expensive, so
 * they only see the top of the fused ranking.
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    /**
     * @brief Score documents against a query
     *
     * @param query The search query
     * @param documents The document texts to score
     * @return One relevance score per document, or error
     */
    virtual Result<std::vector<float>> scoreDocuments(const std::string& query,
                                                      const std::vector<std::string>& documents) = 0;

    virtual bool isReady() const = 0;
};

/**
 * @brief Wrap an IReranker as a per-pair ScoreFn.
 */
ScoreFn makeScoreFn(std::shared_ptr<IReranker> reranker);

/**
 * @brief Deterministic lexical stand-in for a cross-encoder.
 *
 * Scores the fraction of distinct query terms present in the document,
 * plus a small bonus for the query appearing verbatim.
 */
class TermOverlapReranker : public IReranker {
public:
    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override;

    bool isReady() const override { return true; }
};

/**
 * @brief Second-stage reorder of fused candidates.
 *
 * Replaces each candidate's score with scoreFn(query, text), keeps the old
 * score in rawScores["fused"], and re-sorts with the docId tie-break. The
 * candidate set is taken as given: the pool is never expanded.
 *
 * Candidates are scored on up to `parallelism` workers; the reorder waits for
 * every score. Any failure (error result, exception, non-finite score) fails
 * the whole call with ScoringError and no partial ranking is returned.
 */
class Reranker {
public:
    explicit Reranker(ScoreFn scoreFn, TextResolver textResolver = {}, size_t parallelism = 1);

    Result<std::vector<ScoredDocument>> rerank(const std::string& query,
                                               const std::vector<ScoredDocument>& candidates) const;

private:
    Result<double> scoreOne(const std::string& query, const ScoredDocument& candidate) const;

    ScoreFn scoreFn_;
    TextResolver textResolver_;
    size_t parallelism_;
};

/// Sequential convenience form of Reranker::rerank().
Result<std::vector<ScoredDocument>> rerank(const std::string& query,
                                           const std::vector<ScoredDocument>& candidates,
                                           const ScoreFn& scoreFn,
                                           const TextResolver& textResolver = {});

} // namespace ranklab::search
