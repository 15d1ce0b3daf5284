#include <ranklab/search/search_pipeline.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>
#include <future>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace ranklab::search {

namespace {

// Errors that mean the request itself is bad, as opposed to a source being down
bool failsRequest(const Error& error) {
    return error.code == ErrorCode::InvalidArgument ||
           error.code == ErrorCode::ConfigurationError || error.code == ErrorCode::ScoringError;
}

} // namespace

// ============================================================================
// PipelineConfig
// ============================================================================

Result<void> PipelineConfig::validate() const {
    if (auto valid = fusion.validate(); !valid) {
        return valid;
    }
    if (topN == 0) {
        return Error{ErrorCode::ConfigurationError, "top_n must be positive"};
    }
    if (candidatePool == 0) {
        return Error{ErrorCode::ConfigurationError, "candidate_pool must be positive"};
    }
    for (const auto& [field, weight] : fieldWeights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return Error{ErrorCode::ConfigurationError,
                         "Field weight for '" + field + "' must be a non-negative number"};
        }
    }
    return Result<void>();
}

Result<void> PipelineConfig::validateRerankPool() const {
    if (effectiveRerankPool() < topN) {
        return Error{ErrorCode::ConfigurationError,
                     "rerank_pool (" + std::to_string(effectiveRerankPool()) +
                         ") must be at least top_n (" + std::to_string(topN) + ")"};
    }
    return Result<void>();
}

// ============================================================================
// Stages
// ============================================================================

Stage identityStage() {
    return [](const std::string&, std::vector<ScoredDocument> candidates)
               -> Result<std::vector<ScoredDocument>> { return candidates; };
}

Stage rerankStage(std::shared_ptr<const Reranker> reranker) {
    return [reranker = std::move(reranker)](const std::string& query,
                                            std::vector<ScoredDocument> candidates)
               -> Result<std::vector<ScoredDocument>> {
        if (!reranker) {
            return Error{ErrorCode::ScoringError, "Rerank stage has no reranker"};
        }
        return reranker->rerank(query, candidates);
    };
}

// ============================================================================
// SearchPipeline
// ============================================================================

SearchPipeline::SearchPipeline(PipelineConfig config,
                               std::shared_ptr<const ILexicalSource> lexical,
                               std::shared_ptr<const IVectorSource> vectors,
                               std::shared_ptr<const vector::IEmbedder> embedder, Stage rerank)
    : config_(std::move(config)), lexical_(std::move(lexical)), vectors_(std::move(vectors)),
      embedder_(std::move(embedder)), rerank_(std::move(rerank)) {
    reranks_ = static_cast<bool>(rerank_);
    if (!rerank_) {
        rerank_ = identityStage();
    }
}

Result<std::unique_ptr<SearchPipeline>>
SearchPipeline::create(PipelineConfig config, std::shared_ptr<const ILexicalSource> lexical,
                       std::shared_ptr<const IVectorSource> vectors,
                       std::shared_ptr<const vector::IEmbedder> embedder, Stage rerank) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (rerank) {
        if (auto pool = config.validateRerankPool(); !pool) {
            return pool.error();
        }
    }
    if (!lexical && !vectors) {
        return Error{ErrorCode::ConfigurationError, "Pipeline needs at least one source"};
    }
    if (vectors) {
        if (!embedder) {
            return Error{ErrorCode::ConfigurationError, "Vector source requires an embedder"};
        }
        if (embedder->dimension() != vectors->dimension()) {
            return Error{ErrorCode::ConfigurationError,
                         "Embedding dimension mismatch: embedder produces " +
                             std::to_string(embedder->dimension()) +
                             ", vector source expects " + std::to_string(vectors->dimension())};
        }
    }

    spdlog::debug("Search pipeline: strategy={}, candidate_pool={}, top_n={}, rerank={}",
                  FusionConfig::strategyToString(config.fusion.strategy), config.candidatePool,
                  config.topN, static_cast<bool>(rerank));

    return std::unique_ptr<SearchPipeline>(
        new SearchPipeline(std::move(config), std::move(lexical), std::move(vectors),
                           std::move(embedder), std::move(rerank)));
}

Result<SourceLists> SearchPipeline::retrieve(const std::string& query,
                                             SearchResponse& response) const {
    std::vector<std::pair<std::string, SourceCall>> calls;

    if (lexical_) {
        calls.emplace_back(kLexicalSource, [lexical = lexical_, query,
                                            fieldWeights = config_.fieldWeights,
                                            topK = config_.candidatePool]() {
            return lexical->search(query, fieldWeights, topK);
        });
    }
    if (vectors_) {
        calls.emplace_back(kVectorSource, [vectors = vectors_, embedder = embedder_, query,
                                           topK = config_.candidatePool]() -> Result<RankedList> {
            auto embedding = embedder->embed(query);
            if (!embedding) {
                return embedding.error();
            }
            if (embedding.value().size() != vectors->dimension()) {
                return Error{ErrorCode::ConfigurationError,
                             "Query embedding has dimension " +
                                 std::to_string(embedding.value().size()) +
                                 ", vector source expects " +
                                 std::to_string(vectors->dimension())};
            }
            return vectors->search(embedding.value(), topK);
        });
    }

    auto guarded = [](const SourceCall& call) -> Result<RankedList> {
        try {
            return call();
        } catch (const std::exception& e) {
            return Error{ErrorCode::SourceUnavailable, e.what()};
        } catch (...) {
            return Error{ErrorCode::SourceUnavailable, "Source threw a non-standard exception"};
        }
    };

    // nullopt marks a source that missed its timeout
    std::vector<std::optional<Result<RankedList>>> outcomes;
    outcomes.reserve(calls.size());

    if (config_.enableParallelRetrieval) {
        // One thread per source call. A call that misses the deadline is
        // detached and left to finish on its own; it owns everything it touches,
        // so it never holds up this query's other source or any later query.
        std::vector<std::thread> workers;
        std::vector<std::future<Result<RankedList>>> futures;
        workers.reserve(calls.size());
        futures.reserve(calls.size());
        for (const auto& entry : calls) {
            auto promise = std::make_shared<std::promise<Result<RankedList>>>();
            futures.push_back(promise->get_future());
            try {
                workers.emplace_back([promise, call = entry.second, guarded]() {
                    promise->set_value(guarded(call));
                });
            } catch (const std::system_error& e) {
                for (auto& worker : workers) {
                    worker.join();
                }
                return Error{ErrorCode::InternalError,
                             "Failed to start " + entry.first + " source: " + e.what()};
            }
        }

        // One deadline for all sources, so the join costs at most one timeout
        const bool bounded = config_.sourceTimeout.count() > 0;
        const auto deadline = std::chrono::steady_clock::now() + config_.sourceTimeout;
        for (size_t i = 0; i < futures.size(); ++i) {
            if (bounded && futures[i].wait_until(deadline) != std::future_status::ready) {
                workers[i].detach();
                outcomes.emplace_back(std::nullopt);
                continue;
            }
            workers[i].join();
            outcomes.emplace_back(futures[i].get());
        }
    } else {
        for (const auto& entry : calls) {
            outcomes.emplace_back(guarded(entry.second));
        }
    }

    SourceLists lists;
    for (size_t i = 0; i < calls.size(); ++i) {
        const std::string& name = calls[i].first;
        auto& outcome = outcomes[i];

        if (!outcome) {
            spdlog::warn("{} source timed out after {} ms; continuing without it", name,
                         config_.sourceTimeout.count());
            response.timedOutSources.push_back(name);
            lists.emplace(name, RankedList::empty(name));
            continue;
        }

        if (!*outcome) {
            const Error& error = outcome->error();
            if (failsRequest(error)) {
                return error;
            }
            spdlog::warn("{} source unavailable: {}", name, error.message);
            response.failedSources.push_back(name);
            lists.emplace(name, RankedList::empty(name));
            continue;
        }

        RankedList list = std::move(*outcome).value();
        if (list.source() != name) {
            auto renamed = RankedList::build(name, list.documents());
            if (!renamed) {
                return renamed.error();
            }
            list = std::move(renamed).value();
        }
        if (!list.isEmpty()) {
            response.contributingSources.push_back(name);
        }
        spdlog::debug("{} source returned {} candidates", name, list.size());
        lists.emplace(name, std::move(list));
    }
    return lists;
}

Result<SearchResponse> SearchPipeline::search(const std::string& query) const {
    const auto start = std::chrono::steady_clock::now();
    SearchResponse response;

    auto lists = retrieve(query, response);
    if (!lists) {
        return lists.error();
    }

    // Only a rerank stage works on a pool wider than the final cut
    ResultFusion fusion(config_.fusion);
    const size_t cut = reranks_ ? config_.effectiveRerankPool() : config_.topN;
    auto fused = fusion.fuseTopN(lists.value(), cut);
    if (!fused) {
        return fused.error();
    }

    auto ranked = rerank_(query, std::move(fused).value());
    if (!ranked) {
        return ranked.error();
    }

    response.results = std::move(ranked).value();
    if (response.results.size() > config_.topN) {
        response.results.resize(config_.topN);
    }
    response.reranked = reranks_;
    response.isDegraded = !response.isComplete();
    response.executionTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - start)
                                   .count();

    if (response.isDegraded) {
        spdlog::info("Search for '{}' degraded: {} failed, {} timed out", query,
                     response.failedSources.size(), response.timedOutSources.size());
    }
    return response;
}

Result<std::vector<ScoredDocument>> SearchPipeline::operator()(const std::string& query) const {
    auto response = search(query);
    if (!response) {
        return response.error();
    }
    return std::move(response.value().results);
}

} // namespace ranklab::search
