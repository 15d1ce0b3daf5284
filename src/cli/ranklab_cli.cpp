#include <ranklab/cli/command_registry.h>
#include <ranklab/cli/ranklab_cli.h>
#include <ranklab/config/config_helpers.h>
#include <ranklab/search/reranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>

namespace ranklab::cli {

RankLabCLI::RankLabCLI() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);
}

RankLabCLI::~RankLabCLI() = default;

void RankLabCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void RankLabCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

Result<config::AppConfig> RankLabCLI::loadConfig() const {
    const char* envConfig = std::getenv("RANKLAB_CONFIG");
    const bool explicitPath = !configPath_.empty() || (envConfig && *envConfig);

    auto loaded = config::loadAppConfig(config::get_config_path(configPath_), explicitPath);
    if (!loaded) {
        return loaded.error();
    }

    auto cfg = std::move(loaded).value();
    if (!corpusPath_.empty()) {
        cfg.corpusPath = config::expand_tilde(corpusPath_);
    }
    return cfg;
}

Result<void> RankLabCLI::ensureCorpusLoaded(const config::AppConfig& config) {
    if (corpus_ && loadedCorpusPath_ == config.corpusPath) {
        return Result<void>();
    }
    if (config.corpusPath.empty()) {
        return Error{ErrorCode::ConfigurationError,
                     "No corpus configured; pass --corpus or set [corpus] path"};
    }

    auto loaded = corpus::Corpus::loadJsonl(config.corpusPath);
    if (!loaded) {
        return loaded.error();
    }
    auto corpus = std::make_shared<const corpus::Corpus>(std::move(loaded).value());
    if (corpus->empty()) {
        spdlog::warn("Corpus {} contains no documents", config.corpusPath.string());
    }

    auto index = corpus::buildCorpusIndex(*corpus, config.embeddingDim);
    if (!index) {
        return index.error();
    }

    corpus_ = std::move(corpus);
    index_ = std::move(index).value();
    loadedCorpusPath_ = config.corpusPath;
    return Result<void>();
}

Result<std::unique_ptr<search::SearchPipeline>>
RankLabCLI::buildPipeline(const config::AppConfig& config, bool rerank) {
    if (auto loaded = ensureCorpusLoaded(config); !loaded) {
        return loaded.error();
    }

    search::Stage stage;
    if (rerank) {
        search::TextResolver resolver = [corpus = corpus_](const std::string& docId) {
            const auto* doc = corpus->find(docId);
            return doc ? doc->text() : docId;
        };
        auto reranker = std::make_shared<const search::Reranker>(
            search::makeScoreFn(std::make_shared<search::TermOverlapReranker>()),
            std::move(resolver), config.pipeline.rerankParallelism);
        stage = search::rerankStage(std::move(reranker));
    }

    return search::SearchPipeline::create(config.pipeline, index_.lexical, index_.vectors,
                                          index_.embedder, std::move(stage));
}

int RankLabCLI::run(int argc, char* argv[]) {
    try {
        app_ = std::make_unique<CLI::App>("ranklab - hybrid lexical and vector search with "
                                          "result fusion");
        app_->require_subcommand(1);

        app_->add_option("--config", configPath_,
                         "Config file (default: $RANKLAB_CONFIG or "
                         "$XDG_CONFIG_HOME/ranklab/config.toml)");
        app_->add_option("--corpus", corpusPath_, "JSONL corpus (overrides [corpus] path)");
        app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");

        CommandRegistry::registerAllCommands(this);

        app_->parse(argc, argv);

        // Logging level: --verbose wins, then RANKLAB_LOG_LEVEL, then warn
        auto parseLevel = [](std::string s) -> std::optional<spdlog::level::level_enum> {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (s == "trace")
                return spdlog::level::trace;
            if (s == "debug")
                return spdlog::level::debug;
            if (s == "info")
                return spdlog::level::info;
            if (s == "warn" || s == "warning")
                return spdlog::level::warn;
            if (s == "error" || s == "err")
                return spdlog::level::err;
            if (s == "off")
                return spdlog::level::off;
            return std::nullopt;
        };
        if (verbose_) {
            spdlog::set_level(spdlog::level::debug);
        } else if (const char* envLvl = std::getenv("RANKLAB_LOG_LEVEL"); envLvl && *envLvl) {
            if (auto lvl = parseLevel(envLvl)) {
                spdlog::set_level(*lvl);
            }
        }

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                spdlog::error("{} failed: {}", pendingCommand_->getName(),
                              result.error().message);
                std::cerr << "Error (" << errorToString(result.error().code)
                          << "): " << result.error().message << "\n";
                return 1;
            }
        }

        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace ranklab::cli
