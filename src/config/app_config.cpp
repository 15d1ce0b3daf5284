#include <ranklab/config/app_config.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <system_error>

namespace ranklab::config {

namespace {

Result<size_t> parse_count(const std::string& key, const std::string& value, bool allowZero) {
    auto parsed = parse_int(key, value);
    if (!parsed) {
        return parsed.error();
    }
    if (parsed.value() < 0 || (!allowZero && parsed.value() == 0)) {
        return Error{ErrorCode::ConfigurationError,
                     key + " must be " + (allowZero ? "non-negative" : "positive") + ", got " +
                         value};
    }
    return static_cast<size_t>(parsed.value());
}

} // namespace

Result<void> AppConfig::validate() const {
    if (embeddingDim == 0) {
        return Error{ErrorCode::ConfigurationError, "embedding.dim must be positive"};
    }
    return pipeline.validate();
}

Result<void> applyConfigValues(const ConfigValues& values, AppConfig& config) {
    auto& pipeline = config.pipeline;

    for (const auto& [key, value] : values) {
        if (key == "fusion.strategy") {
            auto strategy = search::FusionConfig::parseStrategy(value);
            if (!strategy) {
                return strategy.error();
            }
            pipeline.fusion.strategy = strategy.value();
        } else if (key == "fusion.rrf_k") {
            auto k = parse_int(key, value);
            if (!k) {
                return k.error();
            }
            pipeline.fusion.rrfK = static_cast<int>(k.value());
        } else if (key == "fusion.w_bm25" || key == "fusion.w_vec") {
            auto w = parse_double(key, value);
            if (!w) {
                return w.error();
            }
            const char* source =
                key == "fusion.w_bm25" ? search::kLexicalSource : search::kVectorSource;
            pipeline.fusion.weights[source] = w.value();
        } else if (key == "search.candidate_pool" || key == "search.top_n" ||
                   key == "search.rerank_pool" || key == "search.source_timeout_ms") {
            const bool allowZero = key == "search.rerank_pool" || key == "search.source_timeout_ms";
            auto count = parse_count(key, value, allowZero);
            if (!count) {
                return count.error();
            }
            if (key == "search.candidate_pool") {
                pipeline.candidatePool = count.value();
            } else if (key == "search.top_n") {
                pipeline.topN = count.value();
            } else if (key == "search.rerank_pool") {
                pipeline.rerankPool = count.value();
            } else {
                pipeline.sourceTimeout = std::chrono::milliseconds(count.value());
            }
        } else if (key == "corpus.path") {
            config.corpusPath = expand_tilde(value);
        } else if (key == "embedding.dim") {
            auto dim = parse_count(key, value, false);
            if (!dim) {
                return dim.error();
            }
            config.embeddingDim = dim.value();
        } else if (key == "lexical.title_boost" || key == "lexical.body_boost") {
            auto boost = parse_double(key, value);
            if (!boost) {
                return boost.error();
            }
            pipeline.fieldWeights[key == "lexical.title_boost" ? "title" : "body"] =
                boost.value();
        } else {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }
    return Result<void>();
}

Result<AppConfig> loadAppConfig(const std::filesystem::path& path, bool required) {
    AppConfig config;

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
        }
        spdlog::debug("No config file at '{}'; using defaults", path.string());
        return config;
    }

    auto values = parse_config_file(path);
    if (!values) {
        return Error{ErrorCode::ConfigurationError, values.error().message};
    }
    if (auto applied = applyConfigValues(values.value(), config); !applied) {
        return applied.error();
    }
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }

    spdlog::debug("Loaded config from {}", path.string());
    return config;
}

} // namespace ranklab::config
