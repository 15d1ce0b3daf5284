#pragma once

#include <ranklab/config/config_helpers.h>
#include <ranklab/core/types.h>
#include <ranklab/search/search_pipeline.h>

#include <cstddef>
#include <filesystem>

namespace ranklab::config {

/**
 * @brief Everything the CLI needs to build a pipeline.
 *
 * Read once at startup; command-line flags are layered on top and the result
 * is validated before any query runs.
 */
struct AppConfig {
    std::filesystem::path corpusPath;
    size_t embeddingDim = 384;
    search::PipelineConfig pipeline;

    /// pipeline.validate() plus a positive embedding dimension.
    Result<void> validate() const;
};

/**
 * @brief Apply parsed "section.key" values onto config.
 *
 * Recognised keys:
 *   [fusion]    strategy, rrf_k, w_bm25, w_vec
 *   [search]    candidate_pool, top_n, rerank_pool, source_timeout_ms
 *   [corpus]    path
 *   [embedding] dim
 *   [lexical]   title_boost, body_boost
 * Unknown keys are logged and ignored; bad values are ConfigurationError.
 */
Result<void> applyConfigValues(const ConfigValues& values, AppConfig& config);

/**
 * @brief Load and validate the config file at path.
 *
 * A missing file yields the defaults unless required is set, in which case it
 * is FileNotFound. Parse failures are reported as ConfigurationError.
 */
Result<AppConfig> loadAppConfig(const std::filesystem::path& path, bool required = false);

} // namespace ranklab::config
