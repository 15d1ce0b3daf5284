#include <ranklab/search/fusion_config.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace ranklab::search {

Result<FusionConfig::Strategy> FusionConfig::parseStrategy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "weighted" || lower == "weighted_sum" || lower == "weighted-sum") {
        return Strategy::WEIGHTED_SUM;
    }
    if (lower == "rrf" || lower == "reciprocal_rank") {
        return Strategy::RECIPROCAL_RANK;
    }
    return Error{ErrorCode::ConfigurationError,
                 "Unknown fusion strategy '" + std::string(name) + "' (expected weighted|rrf)"};
}

Result<void> FusionConfig::validate() const {
    if (rrfK <= 0) {
        return Error{ErrorCode::ConfigurationError,
                     "rrf_k must be positive, got " + std::to_string(rrfK)};
    }

    double total = 0.0;
    for (const auto& [source, weight] : weights) {
        if (!std::isfinite(weight)) {
            return Error{ErrorCode::ConfigurationError,
                         "Weight for source '" + source + "' is not finite"};
        }
        if (weight < 0.0) {
            return Error{ErrorCode::ConfigurationError,
                         "Weight for source '" + source + "' is negative"};
        }
        total += weight;
    }

    if (strategy == Strategy::WEIGHTED_SUM && total <= 0.0) {
        return Error{ErrorCode::ConfigurationError,
                     "weighted_sum fusion needs at least one positive source weight"};
    }
    return {};
}

} // namespace ranklab::search
