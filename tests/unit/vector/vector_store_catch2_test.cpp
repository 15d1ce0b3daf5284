#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ranklab/vector/vector_store.h>

#include <cmath>

using Catch::Approx;
using ranklab::ErrorCode;
using ranklab::vector::InMemoryVectorStore;

TEST_CASE("Vector store ranks by ascending distance", "[vector][store][catch2]") {
    InMemoryVectorStore store(2);
    REQUIRE(store.add("near", {1.0f, 0.0f}));
    REQUIRE(store.add("mid", {0.0f, 1.0f}));
    REQUIRE(store.add("far", {-3.0f, 0.0f}));
    CHECK(store.size() == 3);

    auto result = store.search({1.0f, 0.0f}, 10);
    REQUIRE(result);
    const auto& docs = result.value().documents();
    REQUIRE(docs.size() == 3);
    CHECK(result.value().source() == ranklab::search::kVectorSource);
    CHECK(docs[0].docId == "near");
    CHECK(docs[1].docId == "mid");
    CHECK(docs[2].docId == "far");

    CHECK(docs[0].score == Approx(1.0));
    CHECK(docs[1].score == Approx(1.0 / (1.0 + std::sqrt(2.0))));
    CHECK(docs[2].score == Approx(0.2));
}

TEST_CASE("Vector store honours top_k and replaces vectors", "[vector][store][catch2]") {
    InMemoryVectorStore store(2);
    REQUIRE(store.add("a", {0.0f, 0.0f}));
    REQUIRE(store.add("b", {5.0f, 5.0f}));
    REQUIRE(store.add("a", {9.0f, 9.0f}));
    CHECK(store.size() == 2);

    auto result = store.search({5.0f, 5.0f}, 1);
    REQUIRE(result);
    REQUIRE(result.value().size() == 1);
    CHECK(result.value().documents()[0].docId == "b");
}

TEST_CASE("Vector store rejects mismatched dimensions", "[vector][store][catch2]") {
    InMemoryVectorStore store(3);

    auto add = store.add("x", {1.0f, 2.0f});
    REQUIRE_FALSE(add);
    CHECK(add.error().code == ErrorCode::ConfigurationError);

    auto noId = store.add("", {1.0f, 2.0f, 3.0f});
    REQUIRE_FALSE(noId);
    CHECK(noId.error().code == ErrorCode::InvalidArgument);

    auto query = store.search({1.0f}, 5);
    REQUIRE_FALSE(query);
    CHECK(query.error().code == ErrorCode::ConfigurationError);

    auto empty = store.search({0.0f, 0.0f, 0.0f}, 5);
    REQUIRE(empty);
    CHECK(empty.value().isEmpty());
}

TEST_CASE("Similarity from distance is bounded", "[vector][store][catch2]") {
    CHECK(ranklab::search::similarityFromDistance(0.0) == 1.0);
    CHECK(ranklab::search::similarityFromDistance(1.0) == Approx(0.5));
    CHECK(ranklab::search::similarityFromDistance(1e9) > 0.0);
}
