#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ranklab/config/app_config.h>
#include <ranklab/config/config_helpers.h>

#include "../../common/test_helpers_catch2.h"

using Catch::Approx;
using ranklab::ErrorCode;
using ranklab::search::FusionConfig;
using ranklab::test::ScopedEnvVar;
using ranklab::test::TempDir;
using namespace ranklab::config;

TEST_CASE("Config string helpers", "[config][catch2]") {
    std::string s = "  value \t";
    trim(s);
    CHECK(s == "value");
    CHECK(unquote(" \"rrf\" ") == "rrf");
    CHECK(unquote("'weighted_sum'") == "weighted_sum");
    CHECK(unquote("\"") == "\"");

    ScopedEnvVar home("HOME", std::string("/home/tester"));
    CHECK(expand_tilde("~/corpus.jsonl") == std::filesystem::path("/home/tester/corpus.jsonl"));
    CHECK(expand_tilde("~") == std::filesystem::path("/home/tester"));
    CHECK(expand_tilde("data/c.jsonl") == std::filesystem::path("data/c.jsonl"));
}

TEST_CASE("parse_config_file flattens sections", "[config][catch2]") {
    TempDir dir;
    auto file = dir.write("config.toml", "# ranklab\n"
                                         "top = 1\n"
                                         "[fusion]\n"
                                         "strategy = \"rrf\"   # reciprocal rank\n"
                                         "note = \"a # not a comment\"\n"
                                         "[ search ]\n"
                                         "top_n=5\n");

    auto values = parse_config_file(file);
    REQUIRE(values);
    const auto& v = values.value();
    CHECK(v.at("top") == "1");
    CHECK(v.at("fusion.strategy") == "rrf");
    CHECK(v.at("fusion.note") == "a # not a comment");
    CHECK(v.at("search.top_n") == "5");
}

TEST_CASE("parse_config_file reports errors", "[config][catch2]") {
    TempDir dir;

    auto missing = parse_config_file(dir.path() / "none.toml");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);

    auto header = parse_config_file(dir.write("a.toml", "[fusion\nstrategy = rrf\n"));
    REQUIRE_FALSE(header);
    CHECK(header.error().code == ErrorCode::ParseError);

    auto noEquals = parse_config_file(dir.write("b.toml", "[fusion]\nstrategy rrf\n"));
    REQUIRE_FALSE(noEquals);
    CHECK(noEquals.error().message.find(":2:") != std::string::npos);
}

TEST_CASE("Typed value parsing", "[config][catch2]") {
    CHECK(parse_double("w", "0.25").value() == Approx(0.25));
    CHECK(parse_int("k", "60").value() == 60);

    auto badDouble = parse_double("fusion.w_vec", "0.4x");
    REQUIRE_FALSE(badDouble);
    CHECK(badDouble.error().code == ErrorCode::ConfigurationError);
    CHECK(badDouble.error().message.find("fusion.w_vec") != std::string::npos);

    CHECK_FALSE(parse_int("k", "sixty"));
    CHECK_FALSE(parse_int("k", ""));
}

TEST_CASE("Config path resolution order", "[config][catch2]") {
    ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/xdg"));

    SECTION("explicit override") {
        ScopedEnvVar env("RANKLAB_CONFIG", std::string("/env/config.toml"));
        CHECK(get_config_path("/cli/config.toml") == std::filesystem::path("/cli/config.toml"));
    }

    SECTION("environment") {
        ScopedEnvVar env("RANKLAB_CONFIG", std::string("/env/config.toml"));
        CHECK(get_config_path() == std::filesystem::path("/env/config.toml"));
    }

    SECTION("config dir") {
        ScopedEnvVar env("RANKLAB_CONFIG", std::nullopt);
        CHECK(get_config_dir() == std::filesystem::path("/xdg/ranklab"));
        CHECK(get_config_path() == std::filesystem::path("/xdg/ranklab/config.toml"));
    }
}

TEST_CASE("loadAppConfig applies file values", "[config][catch2]") {
    TempDir dir;
    auto file = dir.write("config.toml", "[fusion]\n"
                                         "strategy = \"rrf\"\n"
                                         "rrf_k = 30\n"
                                         "w_bm25 = 0.7\n"
                                         "w_vec = 0.3\n"
                                         "[search]\n"
                                         "candidate_pool = 80\n"
                                         "top_n = 20\n"
                                         "rerank_pool = 40\n"
                                         "source_timeout_ms = 250\n"
                                         "[corpus]\n"
                                         "path = \"/data/kb.jsonl\"\n"
                                         "[embedding]\n"
                                         "dim = 128\n"
                                         "[lexical]\n"
                                         "title_boost = 2.5\n"
                                         "[unknown]\n"
                                         "key = ignored\n");

    auto loaded = loadAppConfig(file);
    REQUIRE(loaded);
    const auto& cfg = loaded.value();
    CHECK(cfg.pipeline.fusion.strategy == FusionConfig::Strategy::RECIPROCAL_RANK);
    CHECK(cfg.pipeline.fusion.rrfK == 30);
    CHECK(cfg.pipeline.fusion.weightFor(ranklab::search::kLexicalSource) == Approx(0.7));
    CHECK(cfg.pipeline.fusion.weightFor(ranklab::search::kVectorSource) == Approx(0.3));
    CHECK(cfg.pipeline.candidatePool == 80);
    CHECK(cfg.pipeline.topN == 20);
    CHECK(cfg.pipeline.effectiveRerankPool() == 40);
    CHECK(cfg.pipeline.sourceTimeout == std::chrono::milliseconds(250));
    CHECK(cfg.corpusPath == std::filesystem::path("/data/kb.jsonl"));
    CHECK(cfg.embeddingDim == 128);
    CHECK(cfg.pipeline.fieldWeights.at("title") == Approx(2.5));
    CHECK(cfg.pipeline.fieldWeights.at("body") == Approx(1.0));
}

TEST_CASE("loadAppConfig rejects invalid settings", "[config][catch2]") {
    TempDir dir;

    SECTION("missing file") {
        auto defaults = loadAppConfig(dir.path() / "none.toml");
        REQUIRE(defaults);
        CHECK(defaults.value().pipeline.topN == 10);
        CHECK(defaults.value().pipeline.fusion.strategy == FusionConfig::Strategy::WEIGHTED_SUM);

        auto required = loadAppConfig(dir.path() / "none.toml", true);
        REQUIRE_FALSE(required);
        CHECK(required.error().code == ErrorCode::FileNotFound);
    }

    SECTION("unknown strategy") {
        auto r = loadAppConfig(dir.write("c.toml", "[fusion]\nstrategy = \"max\"\n"));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ConfigurationError);
    }

    SECTION("rerank pool below top_n is left to the rerank stage") {
        auto r = loadAppConfig(dir.write("c.toml", "[search]\ntop_n = 10\nrerank_pool = 5\n"));
        REQUIRE(r);
        CHECK_FALSE(r.value().pipeline.validateRerankPool());
    }

    SECTION("top_n above candidate_pool") {
        auto r = loadAppConfig(dir.write("c.toml", "[search]\ncandidate_pool = 50\ntop_n = 60\n"));
        REQUIRE(r);
        CHECK(r.value().pipeline.topN == 60);
    }

    SECTION("zero top_n") {
        auto r = loadAppConfig(dir.write("c.toml", "[search]\ntop_n = 0\n"));
        REQUIRE_FALSE(r);
    }

    SECTION("negative weight") {
        auto r = loadAppConfig(dir.write("c.toml", "[fusion]\nw_bm25 = -1\n"));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ConfigurationError);
    }

    SECTION("malformed file") {
        auto r = loadAppConfig(dir.write("c.toml", "[search\n"));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ConfigurationError);
    }
}
