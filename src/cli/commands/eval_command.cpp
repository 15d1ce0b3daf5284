#include <ranklab/cli/command.h>
#include <ranklab/cli/pipeline_options.h>
#include <ranklab/cli/ranklab_cli.h>
#include <ranklab/corpus/corpus.h>
#include <ranklab/search/evaluator.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <functional>
#include <iostream>

namespace ranklab::cli {

class EvalCommand : public ICommand {
public:
    std::string getName() const override { return "eval"; }

    std::string getDescription() const override {
        return "Measure MRR@n and Recall@n against labelled queries";
    }

    void registerCommand(CLI::App& app, RankLabCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("eval", getDescription());
        cmd->add_option("--queries", queriesPath_, "JSONL file of {query, relevant} records")
            ->required();
        options_.addOptions(cmd);
        cmd->add_option("--parallel", parallelism_, "Queries evaluated concurrently")
            ->check(CLI::PositiveNumber);
        cmd->add_flag("--json", jsonOutput_, "Output the evaluation as JSON");
        cmd->add_option("--output", outputPath_, "Also write the JSON evaluation to this file");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto config = cli_->loadConfig();
        if (!config) {
            return config.error();
        }
        if (auto applied = options_.applyTo(config.value()); !applied) {
            return applied;
        }

        auto judgments = corpus::loadJudgments(queriesPath_);
        if (!judgments) {
            return judgments.error();
        }
        if (judgments.value().empty()) {
            spdlog::warn("No judgments found in {}", queriesPath_);
        }

        auto pipeline = cli_->buildPipeline(config.value(), options_.rerank());
        if (!pipeline) {
            return pipeline.error();
        }

        search::Evaluator evaluator(search::EvaluatorConfig{parallelism_});
        const auto& searchPipeline = *pipeline.value();
        auto result = evaluator.evaluate(judgments.value(), std::cref(searchPipeline),
                                         static_cast<int>(config.value().pipeline.topN));
        if (!result) {
            return result.error();
        }

        const auto report = result.value().toJson();
        if (!outputPath_.empty()) {
            std::ofstream out(outputPath_);
            if (!out) {
                return Error{ErrorCode::FileNotFound, "Cannot write " + outputPath_};
            }
            out << report.dump(2) << "\n";
            if (!out) {
                return Error{ErrorCode::InternalError, "Failed writing " + outputPath_};
            }
        }

        if (jsonOutput_) {
            std::cout << report.dump(2) << std::endl;
        } else {
            std::cout << result.value().summary();
        }
        return Result<void>();
    }

private:
    RankLabCLI* cli_ = nullptr;
    std::string queriesPath_;
    std::string outputPath_;
    PipelineOptions options_;
    size_t parallelism_ = 1;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createEvalCommand() {
    return std::make_unique<EvalCommand>();
}

} // namespace ranklab::cli
