#pragma once

#include <ranklab/core/types.h>

#include <map>
#include <string>
#include <string_view>

namespace ranklab::search {

// Source names used by the hybrid pipeline
inline constexpr const char* kLexicalSource = "lexical";
inline constexpr const char* kVectorSource = "vector";

/**
 * @brief Immutable fusion settings threaded through every fuse() call.
 *
 * Loaded once at startup and validated before any query runs; concurrent
 * queries only ever read it.
 */
struct FusionConfig {
    enum class Strategy {
        WEIGHTED_SUM,   // Weighted sum of min-max normalized scores
        RECIPROCAL_RANK // Reciprocal Rank Fusion over positional ranks
    };

    static constexpr int kDefaultRrfK = 60;

    Strategy strategy = Strategy::WEIGHTED_SUM;

    // Relative weights per source name; they need not sum to 1.
    // A source with no entry contributes nothing under WEIGHTED_SUM.
    std::map<std::string, double> weights = {{kLexicalSource, 0.6}, {kVectorSource, 0.4}};

    // RRF constant: contribution of rank r is 1 / (rrfK + r)
    int rrfK = kDefaultRrfK;

    [[nodiscard]] static constexpr const char* strategyToString(Strategy strategy) noexcept {
        switch (strategy) {
            case Strategy::WEIGHTED_SUM:
                return "weighted_sum";
            case Strategy::RECIPROCAL_RANK:
                return "rrf";
        }
        return "unknown";
    }

    /// Accepts "weighted", "weighted_sum" and "rrf" (case-insensitive).
    static Result<Strategy> parseStrategy(std::string_view name);

    /// ConfigurationError for non-positive rrfK, negative or non-finite
    /// weights, or a WEIGHTED_SUM config whose weights are all zero.
    Result<void> validate() const;

    double weightFor(const std::string& source) const {
        auto it = weights.find(source);
        return it != weights.end() ? it->second : 0.0;
    }
};

} // namespace ranklab::search
