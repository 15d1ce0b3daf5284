#include <ranklab/search/evaluator.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace ranklab::search {

// ============================================================================
// Metrics
// ============================================================================

double reciprocalRank(const std::vector<std::string>& ranked,
                      const std::set<std::string>& relevant) {
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (relevant.count(ranked[i])) {
            return 1.0 / static_cast<double>(i + 1);
        }
    }
    return 0.0;
}

std::optional<double> recallAt(const std::vector<std::string>& ranked,
                               const std::set<std::string>& relevant) {
    if (relevant.empty()) {
        return std::nullopt;
    }
    // A pipeline may repeat an id; count each relevant id once
    std::set<std::string> found;
    for (const auto& id : ranked) {
        if (relevant.count(id))
            found.insert(id);
    }
    return static_cast<double>(found.size()) / static_cast<double>(relevant.size());
}

LatencyStats LatencyStats::compute(const std::vector<double>& samples) {
    LatencyStats stats;
    if (samples.empty()) {
        return stats;
    }

    stats.sampleCount = samples.size();

    std::vector<double> sorted = samples;
    std::sort(sorted.begin(), sorted.end());

    stats.minMs = sorted.front();
    stats.maxMs = sorted.back();
    stats.meanMs =
        std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(sorted.size());

    size_t mid = sorted.size() / 2;
    stats.medianMs = sorted.size() % 2 == 0 ? (sorted[mid - 1] + sorted[mid]) / 2.0 : sorted[mid];

    // Linear interpolation between closest ranks
    double idx = 0.95 * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(idx));
    size_t upper = std::min(static_cast<size_t>(std::ceil(idx)), sorted.size() - 1);
    double frac = idx - static_cast<double>(lower);
    stats.p95Ms = sorted[lower] * (1.0 - frac) + sorted[upper] * frac;

    return stats;
}

// ============================================================================
// Serialization
// ============================================================================

nlohmann::json QueryEvaluation::toJson() const {
    nlohmann::json j{{"query", query},
                     {"mrr", reciprocalRank},
                     {"recall", recall ? nlohmann::json(*recall) : nlohmann::json(nullptr)},
                     {"top_ids", topIds},
                     {"latency_ms", latencyMs}};
    if (flag) {
        j["flag"] = queryFlagToString(*flag);
    }
    if (!error.empty()) {
        j["error"] = error;
    }
    if (errorCode != ErrorCode::Success) {
        j["error_code"] = errorToString(errorCode);
    }
    return j;
}

nlohmann::json EvalResult::toJson() const {
    nlohmann::json perQueryJson = nlohmann::json::array();
    for (const auto& q : perQuery) {
        perQueryJson.push_back(q.toJson());
    }
    return nlohmann::json{{"n", n},
                          {"per_query", std::move(perQueryJson)},
                          {"aggregate", aggregate.toJson()},
                          {"latency", latency.toJson()},
                          {"flagged_queries", flaggedQueries},
                          {"total_time_ms", totalTime.count()}};
}

std::string EvalResult::summary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);

    oss << "Evaluation Results (" << perQuery.size() << " queries, n=" << n << ")\n";
    oss << "----------------------------------------\n";
    oss << "  MRR@" << n << ":      " << aggregate.mrrAtN << " (" << aggregate.mrrQueries
        << " queries)\n";
    oss << "  Recall@" << n << ":   " << aggregate.recallAtN << " (" << aggregate.recallQueries
        << " queries)\n";

    oss << "\nLatency (ms):\n";
    oss << std::setprecision(2);
    oss << "  Mean:        " << latency.meanMs << "\n";
    oss << "  Median:      " << latency.medianMs << "\n";
    oss << "  P95:         " << latency.p95Ms << "\n";

    if (flaggedQueries > 0) {
        oss << "\nFlagged queries: " << flaggedQueries << "\n";
        for (const auto& q : perQuery) {
            if (q.flag) {
                oss << "  [" << queryFlagToString(*q.flag) << "] " << q.query;
                if (!q.error.empty()) {
                    oss << ": " << q.error;
                }
                oss << "\n";
            }
        }
    }
    oss << "\nTotal time:  " << totalTime.count() << " ms\n";
    return oss.str();
}

// ============================================================================
// Evaluator
// ============================================================================

Evaluator::Evaluator(EvaluatorConfig config) : config_(config) {}

QueryEvaluation Evaluator::evaluateOne(const RelevanceJudgment& judgment,
                                       const PipelineFn& pipeline, size_t n) const {
    QueryEvaluation eval;
    eval.query = judgment.query;

    if (judgment.inputError) {
        eval.flag = QueryFlag::MALFORMED_JUDGMENT;
        eval.error = *judgment.inputError;
        eval.errorCode = ErrorCode::EvaluationInputError;
        return eval;
    }

    const auto start = std::chrono::steady_clock::now();
    Result<std::vector<ScoredDocument>> ranked = std::vector<ScoredDocument>{};
    try {
        ranked = pipeline(judgment.query);
    } catch (const std::exception& e) {
        ranked = Error{ErrorCode::InternalError, e.what()};
    } catch (...) {
        ranked = Error{ErrorCode::InternalError, "Pipeline threw a non-standard exception"};
    }
    eval.latencyMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                               start)
                         .count();

    if (!ranked) {
        spdlog::warn("Evaluation query '{}' failed: {}", judgment.query, ranked.error().message);
        eval.flag = QueryFlag::PIPELINE_ERROR;
        eval.error = ranked.error().message;
        eval.errorCode = ranked.error().code;
        return eval;
    }

    const auto& docs = ranked.value();
    const size_t limit = std::min(n, docs.size());
    eval.topIds.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        eval.topIds.push_back(docs[i].docId);
    }

    eval.reciprocalRank = reciprocalRank(eval.topIds, judgment.relevantDocIds);
    eval.recall = recallAt(eval.topIds, judgment.relevantDocIds);
    if (!eval.recall) {
        eval.flag = QueryFlag::EMPTY_RELEVANT_SET;
        eval.errorCode = ErrorCode::EvaluationInputError;
    }
    return eval;
}

EvalAggregate Evaluator::aggregate(const std::vector<QueryEvaluation>& perQuery) {
    EvalAggregate agg;
    double mrrSum = 0.0;
    double recallSum = 0.0;
    for (const auto& q : perQuery) {
        if (q.countsTowardMrr()) {
            mrrSum += q.reciprocalRank;
            ++agg.mrrQueries;
        }
        if (q.countsTowardRecall()) {
            recallSum += *q.recall;
            ++agg.recallQueries;
        }
    }
    if (agg.mrrQueries > 0) {
        agg.mrrAtN = mrrSum / static_cast<double>(agg.mrrQueries);
    }
    if (agg.recallQueries > 0) {
        agg.recallAtN = recallSum / static_cast<double>(agg.recallQueries);
    }
    return agg;
}

Result<EvalResult> Evaluator::evaluate(const std::vector<RelevanceJudgment>& judgments,
                                       const PipelineFn& pipeline, int n) const {
    if (n <= 0) {
        return Error{ErrorCode::InvalidArgument, "n must be positive, got " + std::to_string(n)};
    }
    if (!pipeline) {
        return Error{ErrorCode::InvalidArgument, "No pipeline to evaluate"};
    }

    const auto start = std::chrono::steady_clock::now();
    const size_t topN = static_cast<size_t>(n);

    EvalResult result;
    result.n = topN;
    result.perQuery.resize(judgments.size());

    const size_t workers = std::min(std::max<size_t>(config_.parallelism, 1), judgments.size());
    if (workers > 1) {
        boost::asio::thread_pool pool(workers);
        for (size_t i = 0; i < judgments.size(); ++i) {
            boost::asio::post(pool, [this, &judgments, &pipeline, &result, topN, i]() {
                result.perQuery[i] = evaluateOne(judgments[i], pipeline, topN);
            });
        }
        pool.join();
    } else {
        for (size_t i = 0; i < judgments.size(); ++i) {
            result.perQuery[i] = evaluateOne(judgments[i], pipeline, topN);
        }
    }

    std::vector<double> latencies;
    for (const auto& q : result.perQuery) {
        if (q.flag) {
            ++result.flaggedQueries;
        }
        if (!q.flag || *q.flag != QueryFlag::MALFORMED_JUDGMENT) {
            latencies.push_back(q.latencyMs);
        }
    }

    result.aggregate = aggregate(result.perQuery);
    result.latency = LatencyStats::compute(latencies);
    result.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::debug("Evaluated {} queries: MRR@{}={:.4f} Recall@{}={:.4f} ({} flagged)",
                  result.perQuery.size(), topN, result.aggregate.mrrAtN, topN,
                  result.aggregate.recallAtN, result.flaggedQueries);
    return result;
}

EvalComparison Evaluator::compare(const EvalResult& baseline, const EvalResult& current,
                                  double regressionThreshold) {
    EvalComparison cmp;
    cmp.mrrDelta = current.aggregate.mrrAtN - baseline.aggregate.mrrAtN;
    cmp.recallDelta = current.aggregate.recallAtN - baseline.aggregate.recallAtN;
    cmp.latencyDelta = current.latency.meanMs - baseline.latency.meanMs;

    cmp.isRegression = cmp.mrrDelta < -regressionThreshold;
    cmp.isImprovement = cmp.mrrDelta > regressionThreshold;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    if (cmp.isRegression) {
        oss << "REGRESSION: ";
    } else if (cmp.isImprovement) {
        oss << "IMPROVEMENT: ";
    } else {
        oss << "No significant change: ";
    }
    oss << "MRR " << (cmp.mrrDelta >= 0 ? "+" : "") << cmp.mrrDelta;
    oss << ", Recall " << (cmp.recallDelta >= 0 ? "+" : "") << cmp.recallDelta;
    oss << ", Latency " << (cmp.latencyDelta >= 0 ? "+" : "") << cmp.latencyDelta << "ms";
    cmp.summary = oss.str();

    return cmp;
}

Result<EvalResult> evaluate(const std::vector<RelevanceJudgment>& judgments,
                            const PipelineFn& pipeline, int n) {
    return Evaluator().evaluate(judgments, pipeline, n);
}

} // namespace ranklab::search
