#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/scored_document.h>

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ranklab::search {

/// query -> ranking, e.g. a SearchPipeline or a stub in tests.
using PipelineFn = std::function<Result<std::vector<ScoredDocument>>(const std::string& query)>;

/**
 * @brief A labelled query.
 *
 * inputError is set when the judgment record itself was malformed; the query
 * is then flagged and not run.
 */
struct RelevanceJudgment {
    std::string query;
    std::set<std::string> relevantDocIds;
    std::optional<std::string> inputError;
};

enum class QueryFlag {
    EMPTY_RELEVANT_SET, // No relevant ids: excluded from the recall mean
    MALFORMED_JUDGMENT, // Bad record: excluded from both means
    PIPELINE_ERROR      // Pipeline failed: excluded from both means
};

[[nodiscard]] constexpr const char* queryFlagToString(QueryFlag flag) noexcept {
    switch (flag) {
        case QueryFlag::EMPTY_RELEVANT_SET:
            return "empty_relevant_set";
        case QueryFlag::MALFORMED_JUDGMENT:
            return "malformed_judgment";
        case QueryFlag::PIPELINE_ERROR:
            return "pipeline_error";
    }
    return "unknown";
}

/**
 * @brief Metrics for one judgment.
 */
struct QueryEvaluation {
    std::string query;
    double reciprocalRank = 0.0;
    std::optional<double> recall;    // Unset when excluded from the recall mean
    std::vector<std::string> topIds; // Top-n doc ids as returned
    std::optional<QueryFlag> flag;
    std::string error; // Pipeline or input error message, if any
    ErrorCode errorCode = ErrorCode::Success; // Category behind flag, Success when unflagged
    double latencyMs = 0.0;

    [[nodiscard]] bool countsTowardMrr() const {
        return !flag || *flag == QueryFlag::EMPTY_RELEVANT_SET;
    }
    [[nodiscard]] bool countsTowardRecall() const { return recall.has_value(); }

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Latency statistics over per-query pipeline calls.
 */
struct LatencyStats {
    double minMs = 0.0;
    double maxMs = 0.0;
    double meanMs = 0.0;
    double medianMs = 0.0;
    double p95Ms = 0.0;
    size_t sampleCount = 0;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"min_ms", minMs},       {"max_ms", maxMs},
                              {"mean_ms", meanMs},     {"median_ms", medianMs},
                              {"p95_ms", p95Ms},       {"sample_count", sampleCount}};
    }

    static LatencyStats compute(const std::vector<double>& samples);
};

struct EvalAggregate {
    double mrrAtN = 0.0;
    double recallAtN = 0.0;
    size_t mrrQueries = 0;    // Queries averaged into mrrAtN
    size_t recallQueries = 0; // Queries averaged into recallAtN

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"mrr_at_n", mrrAtN},
                              {"recall_at_n", recallAtN},
                              {"mrr_queries", mrrQueries},
                              {"recall_queries", recallQueries}};
    }
};

/**
 * @brief Per-query metrics in judgment order plus their means.
 */
struct EvalResult {
    size_t n = 10;
    std::vector<QueryEvaluation> perQuery;
    EvalAggregate aggregate;
    LatencyStats latency;
    size_t flaggedQueries = 0;
    std::chrono::milliseconds totalTime{0};

    [[nodiscard]] nlohmann::json toJson() const;

    /// Human-readable report for console output.
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Difference between two evaluation runs.
 */
struct EvalComparison {
    double mrrDelta = 0.0;     // Positive = improvement
    double recallDelta = 0.0;  // Positive = improvement
    double latencyDelta = 0.0; // Negative = improvement (faster)
    bool isRegression = false;
    bool isImprovement = false;
    std::string summary;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"mrr_delta", mrrDelta},
                              {"recall_delta", recallDelta},
                              {"latency_delta_ms", latencyDelta},
                              {"is_regression", isRegression},
                              {"is_improvement", isImprovement},
                              {"summary", summary}};
    }
};

struct EvaluatorConfig {
    size_t parallelism = 1; // Judgments evaluated concurrently
};

/// 1 / (1-based position of the first relevant id in ranked), or 0.
double reciprocalRank(const std::vector<std::string>& ranked,
                      const std::set<std::string>& relevant);

/// |relevant ∩ ranked| / |relevant|; nullopt when relevant is empty.
std::optional<double> recallAt(const std::vector<std::string>& ranked,
                               const std::set<std::string>& relevant);

/**
 * @brief Replays a pipeline over labelled queries and scores the rankings.
 *
 * Each judgment is run independently; a bad record or a failing pipeline call
 * flags that query and the batch continues. Results keep the input order no
 * matter how many workers run them.
 *
 * Usage:
 * @code
 *   Evaluator evaluator;
 *   auto result = evaluator.evaluate(judgments, std::ref(*pipeline), 10);
 *   if (result) {
 *       std::cout << result.value().summary();
 *   }
 * @endcode
 */
class Evaluator {
public:
    explicit Evaluator(EvaluatorConfig config = {});

    /// InvalidArgument for n <= 0 or a missing pipeline; otherwise never fails.
    [[nodiscard]] Result<EvalResult> evaluate(const std::vector<RelevanceJudgment>& judgments,
                                              const PipelineFn& pipeline, int n) const;

    [[nodiscard]] static EvalComparison compare(const EvalResult& baseline,
                                                const EvalResult& current,
                                                double regressionThreshold = 0.05);

private:
    QueryEvaluation evaluateOne(const RelevanceJudgment& judgment, const PipelineFn& pipeline,
                                size_t n) const;

    static EvalAggregate aggregate(const std::vector<QueryEvaluation>& perQuery);

    EvaluatorConfig config_;
};

/// Sequential convenience form of Evaluator::evaluate().
Result<EvalResult> evaluate(const std::vector<RelevanceJudgment>& judgments,
                            const PipelineFn& pipeline, int n);

} // namespace ranklab::search
