#include <catch2/catch_test_macros.hpp>

#include <ranklab/corpus/corpus.h>
#include <ranklab/corpus/corpus_index.h>

#include "../../common/test_helpers_catch2.h"

using ranklab::ErrorCode;
using ranklab::corpus::Corpus;
using ranklab::corpus::Document;
using ranklab::test::TempDir;

TEST_CASE("Corpus loads JSONL documents", "[corpus][catch2]") {
    TempDir dir;
    auto file = dir.write("corpus.jsonl",
                          "{\"doc_id\": \"kb-1\", \"title\": \"Reset password\", \"body\": \"Open "
                          "settings.\"}\n"
                          "\n"
                          "{\"doc_id\": \"kb-2\", \"title\": \"Billing\", \"body\": \"Invoices.\"}\n"
                          "{\"title\": \"no id\", \"body\": \"skipped\"}\n"
                          "{\"doc_id\": \"kb-1\", \"title\": \"Reset your password\"}\n");

    auto corpus = Corpus::loadJsonl(file);
    REQUIRE(corpus);
    REQUIRE(corpus.value().size() == 2);

    // The later kb-1 record replaces the first, keeping its position
    const auto& docs = corpus.value().documents();
    CHECK(docs[0].docId == "kb-1");
    CHECK(docs[0].title == "Reset your password");
    CHECK(docs[0].body.empty());
    CHECK(docs[1].docId == "kb-2");

    const Document* billing = corpus.value().find("kb-2");
    REQUIRE(billing != nullptr);
    CHECK(billing->text() == "Billing\nInvoices.");
    CHECK(corpus.value().find("kb-9") == nullptr);
}

TEST_CASE("Corpus load reports missing files and bad JSON", "[corpus][catch2]") {
    TempDir dir;

    auto missing = Corpus::loadJsonl(dir.path() / "absent.jsonl");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);

    auto file = dir.write("broken.jsonl", "{\"doc_id\": \"a\"}\n{not json\n");
    auto broken = Corpus::loadJsonl(file);
    REQUIRE_FALSE(broken);
    CHECK(broken.error().code == ErrorCode::ParseError);
    CHECK(broken.error().message.find(":2:") != std::string::npos);
}

TEST_CASE("Judgments keep malformed lines as flagged records", "[corpus][judgments][catch2]") {
    TempDir dir;
    auto file = dir.write("queries.jsonl",
                          "{\"query\": \"reset password\", \"relevant\": [\"kb-1\", \"kb-4\"]}\n"
                          "{\"text\": \"billing\", \"relevant\": []}\n"
                          "{\"query\": \"bad\", \"relevant\": \"kb-1\"}\n"
                          "not json at all\n"
                          "\n"
                          "{\"relevant\": [\"kb-2\"]}\n");

    auto judgments = ranklab::corpus::loadJudgments(file);
    REQUIRE(judgments);
    const auto& j = judgments.value();
    REQUIRE(j.size() == 5);

    CHECK(j[0].query == "reset password");
    CHECK(j[0].relevantDocIds == std::set<std::string>{"kb-1", "kb-4"});
    CHECK_FALSE(j[0].inputError);

    CHECK(j[1].query == "billing");
    CHECK(j[1].relevantDocIds.empty());
    CHECK_FALSE(j[1].inputError);

    CHECK(j[2].inputError);
    CHECK(j[3].inputError);
    REQUIRE(j[4].inputError);
    CHECK(j[4].inputError->find("line 6") != std::string::npos);

    auto missing = ranklab::corpus::loadJudgments(dir.path() / "absent.jsonl");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);
}

TEST_CASE("Numeric ids match across corpus and judgments", "[corpus][judgments][catch2]") {
    TempDir dir;
    auto corpusFile = dir.write("corpus.jsonl",
                                "{\"doc_id\": 123, \"title\": \"Numbered\"}\n"
                                "{\"doc_id\": \"kb-1\", \"title\": \"Named\"}\n"
                                "{\"doc_id\": true, \"title\": \"skipped\"}\n");
    auto corpus = Corpus::loadJsonl(corpusFile);
    REQUIRE(corpus);
    REQUIRE(corpus.value().size() == 2);
    REQUIRE(corpus.value().find("123") != nullptr);
    CHECK(corpus.value().find("123")->title == "Numbered");

    auto queriesFile = dir.write("queries.jsonl",
                                 "{\"query\": \"numbered\", \"relevant\": [123, \"kb-1\"]}\n"
                                 "{\"query\": \"nested\", \"relevant\": [[\"kb-1\"]]}\n");
    auto judgments = ranklab::corpus::loadJudgments(queriesFile);
    REQUIRE(judgments);
    const auto& j = judgments.value();
    REQUIRE(j.size() == 2);
    CHECK_FALSE(j[0].inputError);
    CHECK(j[0].relevantDocIds == std::set<std::string>{"123", "kb-1"});
    CHECK(j[1].inputError);
}

TEST_CASE("Corpus index feeds both retrieval sources", "[corpus][index][catch2]") {
    Corpus corpus;
    corpus.add({"kb-1", "Reset password", "Open settings and choose reset."});
    corpus.add({"kb-2", "Billing", "Invoices are monthly."});

    auto index = ranklab::corpus::buildCorpusIndex(corpus, 32);
    REQUIRE(index);
    CHECK(index.value().lexical->size() == 2);
    CHECK(index.value().vectors->size() == 2);
    CHECK(index.value().embedder->dimension() == index.value().vectors->dimension());

    auto lexical = index.value().lexical->search("invoices", {}, 10);
    REQUIRE(lexical);
    REQUIRE(lexical.value().size() == 1);
    CHECK(lexical.value().documents()[0].docId == "kb-2");

    // A document's own text embeds to distance zero from itself
    auto query = index.value().embedder->embed(corpus.find("kb-1")->text());
    REQUIRE(query);
    auto nearest = index.value().vectors->search(query.value(), 1);
    REQUIRE(nearest);
    CHECK(nearest.value().documents()[0].docId == "kb-1");

    auto zero = ranklab::corpus::buildCorpusIndex(corpus, 0);
    REQUIRE_FALSE(zero);
    CHECK(zero.error().code == ErrorCode::ConfigurationError);
}
