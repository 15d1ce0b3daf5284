#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ranklab/vector/embedder.h>

#include <cmath>

using Catch::Approx;
using ranklab::vector::HashingEmbedder;

namespace {

double l2(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return std::sqrt(sum);
}

} // namespace

TEST_CASE("HashingEmbedder produces unit vectors of the configured size",
          "[vector][embedder][catch2]") {
    HashingEmbedder embedder(64);
    auto v = embedder.embed("reset password after login failure");
    REQUIRE(v);
    CHECK(v.value().size() == 64);
    CHECK(l2(v.value()) == Approx(1.0).epsilon(1e-5));
    CHECK(embedder.dimension() == 64);
}

TEST_CASE("HashingEmbedder is deterministic and case-insensitive", "[vector][embedder][catch2]") {
    HashingEmbedder a;
    HashingEmbedder b;
    auto x = a.embed("Password Reset");
    auto y = b.embed("password reset");
    REQUIRE(x);
    REQUIRE(y);
    CHECK(x.value() == y.value());
    CHECK(HashingEmbedder::fnv1a("") == 14695981039346656037ULL);
}

TEST_CASE("HashingEmbedder handles empty text and zero dimension", "[vector][embedder][catch2]") {
    HashingEmbedder embedder(16);
    auto empty = embedder.embed("");
    REQUIRE(empty);
    CHECK(l2(empty.value()) == 0.0);

    HashingEmbedder broken(0);
    auto v = broken.embed("text");
    REQUIRE_FALSE(v);
    CHECK(v.error().code == ranklab::ErrorCode::ConfigurationError);
}
