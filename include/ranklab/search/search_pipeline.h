#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/fusion_config.h>
#include <ranklab/search/reranker.h>
#include <ranklab/search/result_fusion.h>
#include <ranklab/search/retrieval_source.h>
#include <ranklab/vector/embedder.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ranklab::search {

/**
 * @brief Settings for one retrieve -> fuse -> rerank pipeline.
 */
struct PipelineConfig {
    FusionConfig fusion;

    size_t candidatePool = 50; // top_k requested from each source
    size_t topN = 10;          // results returned to the caller
    size_t rerankPool = 0;     // fused candidates handed to the reranker (0 = candidatePool)

    FieldWeights fieldWeights = {{"title", 3.0}, {"body", 1.0}};

    // Per-source wait; zero waits for the source to finish
    std::chrono::milliseconds sourceTimeout{0};

    bool enableParallelRetrieval = true;
    size_t rerankParallelism = 4;

    size_t effectiveRerankPool() const { return rerankPool > 0 ? rerankPool : candidatePool; }

    /// ConfigurationError when fusion settings are invalid, topN or
    /// candidatePool is zero, or a field weight is negative.
    Result<void> validate() const;

    /// ConfigurationError when the rerank pool is smaller than topN. Checked
    /// only for pipelines that have a rerank stage.
    Result<void> validateRerankPool() const;
};

/**
 * @brief Ranked results plus what happened to each source.
 */
struct SearchResponse {
    std::vector<ScoredDocument> results;
    std::vector<std::string> contributingSources;
    std::vector<std::string> failedSources;
    std::vector<std::string> timedOutSources;
    int64_t executionTimeMs = 0;
    bool reranked = false;
    bool isDegraded = false;

    [[nodiscard]] bool hasResults() const { return !results.empty(); }
    [[nodiscard]] bool isComplete() const {
        return timedOutSources.empty() && failedSources.empty();
    }
};

/// A post-fusion stage: reorders (or passes through) the fused candidates.
using Stage = std::function<Result<std::vector<ScoredDocument>>(
    const std::string& query, std::vector<ScoredDocument> candidates)>;

Stage identityStage();

/// Reranks the fused candidates with the given reranker.
Stage rerankStage(std::shared_ptr<const Reranker> reranker);

/**
 * @brief Hybrid search over a lexical and a vector source.
 *
 * Both sources are queried concurrently and joined before fusion, so latency
 * tracks the slower source rather than the sum. A source that errors, throws
 * or misses its timeout is replaced by an empty list and reported in the
 * response; malformed query syntax, invalid scores and configuration problems
 * fail the request instead.
 *
 * Usage:
 * @code
 *   auto pipeline = SearchPipeline::create(config, lexical, vectors, embedder);
 *   if (pipeline) {
 *       auto response = pipeline.value()->search("login fails after reset");
 *   }
 * @endcode
 */
class SearchPipeline {
public:
    /**
     * @brief Validate the configuration and wire the sources.
     *
     * Either source may be null (that source is skipped) but not both. A vector
     * source requires an embedder of the same dimension. With a rerank stage
     * the rerank pool must hold at least topN candidates.
     */
    static Result<std::unique_ptr<SearchPipeline>>
    create(PipelineConfig config, std::shared_ptr<const ILexicalSource> lexical,
           std::shared_ptr<const IVectorSource> vectors,
           std::shared_ptr<const vector::IEmbedder> embedder, Stage rerank = {});

    SearchPipeline(const SearchPipeline&) = delete;
    SearchPipeline& operator=(const SearchPipeline&) = delete;

    Result<SearchResponse> search(const std::string& query) const;

    /// Ranked results only; lets the pipeline be passed where a query -> ranking
    /// function is expected.
    Result<std::vector<ScoredDocument>> operator()(const std::string& query) const;

    const PipelineConfig& config() const { return config_; }

private:
    using SourceCall = std::function<Result<RankedList>()>;

    SearchPipeline(PipelineConfig config, std::shared_ptr<const ILexicalSource> lexical,
                   std::shared_ptr<const IVectorSource> vectors,
                   std::shared_ptr<const vector::IEmbedder> embedder, Stage rerank);

    Result<SourceLists> retrieve(const std::string& query, SearchResponse& response) const;

    PipelineConfig config_;
    std::shared_ptr<const ILexicalSource> lexical_;
    std::shared_ptr<const IVectorSource> vectors_;
    std::shared_ptr<const vector::IEmbedder> embedder_;
    Stage rerank_;
    bool reranks_ = false;
};

} // namespace ranklab::search
