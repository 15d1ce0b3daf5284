#pragma once

#include <ranklab/config/app_config.h>
#include <ranklab/core/types.h>

#include <CLI/CLI.hpp>
#include <cstddef>
#include <string>

namespace ranklab::cli {

/**
 * @brief Fusion and retrieval flags shared by `search` and `eval`.
 *
 * Values only override the loaded config when the flag was given.
 */
class PipelineOptions {
public:
    void addOptions(CLI::App* cmd);

    /// Layer the given flags onto config and re-validate it.
    Result<void> applyTo(config::AppConfig& config) const;

    bool rerank() const { return rerank_; }

private:
    std::string blend_;
    size_t topN_ = 10;
    size_t candidatePool_ = 50;
    size_t rerankPool_ = 0;
    double wBm25_ = 0.6;
    double wVec_ = 0.4;
    int rrfK_ = 60;
    bool rerank_ = false;

    CLI::Option* blendOpt_{nullptr};
    CLI::Option* topNOpt_{nullptr};
    CLI::Option* candidatePoolOpt_{nullptr};
    CLI::Option* rerankPoolOpt_{nullptr};
    CLI::Option* wBm25Opt_{nullptr};
    CLI::Option* wVecOpt_{nullptr};
    CLI::Option* rrfKOpt_{nullptr};
};

} // namespace ranklab::cli
