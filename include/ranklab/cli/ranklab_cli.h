#pragma once

#include <ranklab/cli/command.h>
#include <ranklab/config/app_config.h>
#include <ranklab/corpus/corpus.h>
#include <ranklab/corpus/corpus_index.h>
#include <ranklab/search/search_pipeline.h>

#include <CLI/CLI.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ranklab::cli {

/**
 * Main CLI application class
 */
class RankLabCLI {
public:
    RankLabCLI();
    ~RankLabCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Get verbose flag
     */
    bool getVerbose() const { return verbose_; }

    /**
     * Load the config file (--config, $RANKLAB_CONFIG or the XDG default) with
     * --corpus applied on top
     */
    Result<config::AppConfig> loadConfig() const;

    /**
     * Load the corpus once and index it (lazy)
     */
    Result<void> ensureCorpusLoaded(const config::AppConfig& config);

    std::shared_ptr<const corpus::Corpus> getCorpus() const { return corpus_; }

    /**
     * Build a pipeline over the loaded corpus; --rerank adds the term-overlap reranker
     */
    Result<std::unique_ptr<search::SearchPipeline>> buildPipeline(const config::AppConfig& config,
                                                                  bool rerank);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing
     */
    void setPendingCommand(ICommand* cmd);

private:
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string configPath_;
    std::string corpusPath_;
    bool verbose_{false};

    std::shared_ptr<const corpus::Corpus> corpus_;
    std::filesystem::path loadedCorpusPath_;
    corpus::CorpusIndex index_;
};

} // namespace ranklab::cli
