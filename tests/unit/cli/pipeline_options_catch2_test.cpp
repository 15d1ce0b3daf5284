#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ranklab/cli/pipeline_options.h>
#include <ranklab/cli/ranklab_cli.h>

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>
#include <vector>

#include "../../common/test_helpers_catch2.h"

using Catch::Approx;
using ranklab::cli::PipelineOptions;
using ranklab::config::AppConfig;
using ranklab::search::FusionConfig;
using ranklab::test::ScopedEnvVar;
using ranklab::test::TempDir;

namespace {

void parse(CLI::App& app, std::vector<const char*> args) {
    app.parse(static_cast<int>(args.size()), const_cast<char**>(args.data()));
}

int runCli(std::vector<const char*> args) {
    ranklab::cli::RankLabCLI cli;
    return cli.run(static_cast<int>(args.size()), const_cast<char**>(args.data()));
}

constexpr const char* kCorpus =
    "{\"doc_id\": \"kb-1\", \"title\": \"Reset your password\", \"body\": \"Open settings "
    "and choose reset password.\"}\n"
    "{\"doc_id\": \"kb-2\", \"title\": \"Login troubleshooting\", \"body\": \"If login fails "
    "after a password reset, clear cookies.\"}\n"
    "{\"doc_id\": \"kb-3\", \"title\": \"Billing overview\", \"body\": \"Invoices are sent "
    "monthly.\"}\n";

} // namespace

TEST_CASE("PipelineOptions only overrides flags that were given", "[cli][options][catch2]") {
    CLI::App app("Test");
    PipelineOptions options;
    options.addOptions(&app);
    parse(app, {"test", "--blend", "rrf", "--top-n", "5"});

    AppConfig config;
    config.pipeline.candidatePool = 80;
    config.pipeline.fusion.weights[ranklab::search::kLexicalSource] = 0.9;

    REQUIRE(options.applyTo(config));
    CHECK(config.pipeline.fusion.strategy == FusionConfig::Strategy::RECIPROCAL_RANK);
    CHECK(config.pipeline.topN == 5);
    CHECK(config.pipeline.candidatePool == 80);
    CHECK(config.pipeline.fusion.weightFor(ranklab::search::kLexicalSource) == Approx(0.9));
    CHECK_FALSE(options.rerank());
}

TEST_CASE("PipelineOptions applies weights and rerank flags", "[cli][options][catch2]") {
    CLI::App app("Test");
    PipelineOptions options;
    options.addOptions(&app);
    parse(app, {"test", "--w-bm25", "0.2", "--w-vec", "0.8", "--rerank", "--rerank-pool", "30",
                "--k", "30"});

    AppConfig config;
    REQUIRE(options.applyTo(config));
    CHECK(config.pipeline.fusion.weightFor(ranklab::search::kLexicalSource) == Approx(0.2));
    CHECK(config.pipeline.fusion.weightFor(ranklab::search::kVectorSource) == Approx(0.8));
    CHECK(config.pipeline.effectiveRerankPool() == 30);
    CHECK(options.rerank());
}

TEST_CASE("PipelineOptions re-validates the merged config", "[cli][options][catch2]") {
    CLI::App app("Test");
    PipelineOptions options;
    options.addOptions(&app);
    parse(app, {"test", "--w-bm25", "0", "--w-vec", "0"});

    AppConfig config;
    auto applied = options.applyTo(config);
    REQUIRE_FALSE(applied);
    CHECK(applied.error().code == ranklab::ErrorCode::ConfigurationError);
}

TEST_CASE("PipelineOptions rejects unknown strategies at parse time", "[cli][options][catch2]") {
    CLI::App app("Test");
    PipelineOptions options;
    options.addOptions(&app);
    CHECK_THROWS_AS(parse(app, {"test", "--blend", "max"}), CLI::ValidationError);
}

TEST_CASE("ranklab eval writes a JSON report", "[cli][eval][catch2]") {
    TempDir dir;
    ScopedEnvVar noConfig("RANKLAB_CONFIG", std::nullopt);
    ScopedEnvVar xdg("XDG_CONFIG_HOME", dir.path().string());

    const auto corpus = dir.write("corpus.jsonl", kCorpus).string();
    const auto queries = dir.write("queries.jsonl",
                                   "{\"query\": \"invoices monthly\", \"relevant\": [\"kb-3\"]}\n"
                                   "{\"query\": \"login cookies\", \"relevant\": [\"kb-2\"]}\n"
                                   "{\"query\": \"orphan\", \"relevant\": []}\n")
                             .string();
    const auto report = (dir.path() / "report.json").string();

    REQUIRE(runCli({"ranklab", "--corpus", corpus.c_str(), "eval", "--queries", queries.c_str(),
                    "--blend", "rrf", "--output", report.c_str()}) == 0);

    std::ifstream in(report);
    REQUIRE(in.good());
    const auto j = nlohmann::json::parse(in);
    CHECK(j["per_query"].size() == 3);
    CHECK(j["aggregate"]["mrr_queries"] == 3);
    CHECK(j["aggregate"]["recall_queries"] == 2);
    CHECK(j["per_query"][0]["top_ids"][0] == "kb-3");
    CHECK(j["per_query"][2]["flag"] == "empty_relevant_set");
}

TEST_CASE("ranklab reports failures through the exit code", "[cli][catch2]") {
    TempDir dir;
    ScopedEnvVar noConfig("RANKLAB_CONFIG", std::nullopt);
    ScopedEnvVar xdg("XDG_CONFIG_HOME", dir.path().string());
    const auto corpus = dir.write("corpus.jsonl", kCorpus).string();
    const auto missing = (dir.path() / "missing.jsonl").string();
    const auto missingConfig = (dir.path() / "missing.toml").string();

    CHECK(runCli({"ranklab", "--corpus", corpus.c_str(), "search", "password", "reset"}) == 0);
    CHECK(runCli({"ranklab", "--corpus", corpus.c_str(), "search", "--rerank", "--json",
                  "password"}) == 0);
    CHECK(runCli({"ranklab", "--corpus", corpus.c_str(), "search", "--top-n", "60",
                  "password"}) == 0);
    CHECK(runCli({"ranklab", "--corpus", corpus.c_str(), "search", "--rerank", "--top-n", "60",
                  "password"}) == 1);
    CHECK(runCli({"ranklab", "--corpus", missing.c_str(), "search", "password"}) == 1);
    CHECK(runCli({"ranklab", "--config", missingConfig.c_str(), "--corpus", corpus.c_str(),
                  "search", "password"}) == 1);
    CHECK(runCli({"ranklab", "--corpus", corpus.c_str(), "search", "\"unbalanced"}) == 1);
    CHECK(runCli({"ranklab"}) != 0);
}
