#include <ranklab/cli/command.h>
#include <ranklab/cli/pipeline_options.h>
#include <ranklab/cli/ranklab_cli.h>
#include <ranklab/search/tokenizer.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace ranklab::cli {

using json = nlohmann::json;

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override {
        return "Run a hybrid lexical + vector search over the corpus";
    }

    void registerCommand(CLI::App& app, RankLabCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("search", getDescription());
        cmd->add_option("query", queryParts_, "Search query")->required();
        options_.addOptions(cmd);
        cmd->add_flag("--json", jsonOutput_, "Output results as JSON");

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

        auto pipeline = cli_->buildPipeline(config.value(), options_.rerank());
        if (!pipeline) {
            return pipeline.error();
        }

        const std::string query = joinedQuery();
        auto response = pipeline.value()->search(query);
        if (!response) {
            return response.error();
        }

        if (jsonOutput_) {
            std::cout << renderJson(query, response.value()).dump(2) << std::endl;
        } else {
            std::cout << renderText(query, response.value());
        }
        return Result<void>();
    }

private:
    std::string joinedQuery() const {
        std::string query;
        for (const auto& part : queryParts_) {
            if (!query.empty())
                query += ' ';
            query += part;
        }
        return query;
    }

    json renderJson(const std::string& query, const search::SearchResponse& response) const {
        json results = json::array();
        size_t rank = 0;
        for (const auto& doc : response.results) {
            json entry{{"rank", ++rank},
                       {"doc_id", doc.docId},
                       {"score", doc.score},
                       {"raw_scores", doc.rawScores}};
            if (const auto* d = cli_->getCorpus()->find(doc.docId)) {
                entry["title"] = d->title;
                entry["snippet"] = search::snippet(d->body);
            }
            results.push_back(std::move(entry));
        }
        return json{{"query", query},
                     {"results", std::move(results)},
                     {"contributing_sources", response.contributingSources},
                     {"failed_sources", response.failedSources},
                     {"timed_out_sources", response.timedOutSources},
                     {"degraded", response.isDegraded},
                     {"reranked", response.reranked},
                     {"execution_time_ms", response.executionTimeMs}};
    }

    std::string renderText(const std::string& query,
                           const search::SearchResponse& response) const {
        std::ostringstream oss;
        if (response.results.empty()) {
            oss << "No results for \"" << query << "\"\n";
        }

        size_t rank = 0;
        for (const auto& doc : response.results) {
            oss << std::setw(3) << ++rank << ". " << doc.docId << "  " << std::fixed
                << std::setprecision(4) << doc.score;
            for (const auto& [source, raw] : doc.rawScores) {
                oss << "  " << source << "=" << raw;
            }
            oss << "\n";
            if (const auto* d = cli_->getCorpus()->find(doc.docId)) {
                if (!d->title.empty()) {
                    oss << "     " << d->title << "\n";
                }
                if (!d->body.empty()) {
                    oss << "     " << search::snippet(d->body) << "\n";
                }
            }
        }

        if (response.isDegraded) {
            oss << "\n(degraded:";
            for (const auto& s : response.failedSources)
                oss << " " << s << " failed";
            for (const auto& s : response.timedOutSources)
                oss << " " << s << " timed out";
            oss << ")\n";
        }
        return oss.str();
    }

    RankLabCLI* cli_ = nullptr;
    std::vector<std::string> queryParts_;
    PipelineOptions options_;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace ranklab::cli
