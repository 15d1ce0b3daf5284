#include <ranklab/cli/pipeline_options.h>

namespace ranklab::cli {

void PipelineOptions::addOptions(CLI::App* cmd) {
    blendOpt_ = cmd->add_option("--blend", blend_, "Fusion strategy: weighted or rrf")
                    ->check(CLI::IsMember({"weighted", "weighted_sum", "rrf"}));
    topNOpt_ = cmd->add_option("--top-n", topN_, "Number of results to return")
                   ->check(CLI::PositiveNumber);
    candidatePoolOpt_ = cmd->add_option("--k", candidatePool_, "Candidates fetched per source")
                            ->check(CLI::PositiveNumber);
    rerankPoolOpt_ =
        cmd->add_option("--rerank-pool", rerankPool_, "Fused candidates passed to the reranker");
    wBm25Opt_ = cmd->add_option("--w-bm25", wBm25_, "Lexical weight for weighted fusion")
                    ->check(CLI::NonNegativeNumber);
    wVecOpt_ = cmd->add_option("--w-vec", wVec_, "Vector weight for weighted fusion")
                   ->check(CLI::NonNegativeNumber);
    rrfKOpt_ = cmd->add_option("--rrf-k", rrfK_, "RRF constant k")->check(CLI::PositiveNumber);
    cmd->add_flag("--rerank", rerank_, "Rerank the fused candidates");
}

Result<void> PipelineOptions::applyTo(config::AppConfig& config) const {
    auto& pipeline = config.pipeline;

    if (blendOpt_ && blendOpt_->count() > 0) {
        auto strategy = search::FusionConfig::parseStrategy(blend_);
        if (!strategy) {
            return strategy.error();
        }
        pipeline.fusion.strategy = strategy.value();
    }
    if (topNOpt_ && topNOpt_->count() > 0) {
        pipeline.topN = topN_;
    }
    if (candidatePoolOpt_ && candidatePoolOpt_->count() > 0) {
        pipeline.candidatePool = candidatePool_;
    }
    if (rerankPoolOpt_ && rerankPoolOpt_->count() > 0) {
        pipeline.rerankPool = rerankPool_;
    }
    if (wBm25Opt_ && wBm25Opt_->count() > 0) {
        pipeline.fusion.weights[search::kLexicalSource] = wBm25_;
    }
    if (wVecOpt_ && wVecOpt_->count() > 0) {
        pipeline.fusion.weights[search::kVectorSource] = wVec_;
    }
    if (rrfKOpt_ && rrfKOpt_->count() > 0) {
        pipeline.fusion.rrfK = rrfK_;
    }

    return config.validate();
}

} // namespace ranklab::cli
