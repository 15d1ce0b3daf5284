#pragma once

#include <ranklab/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ranklab::vector {

/**
 * @brief Text -> fixed-length embedding.
 *
 * The same embedder (and therefore the same dimension) must be used at
 * ingestion and at query time.
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) const = 0;

    virtual size_t dimension() const = 0;
};

/**
 * @brief Feature-hashing embedder.
 *
 * Each token is hashed (64-bit FNV-1a) into one of `dim` buckets and the bucket
 * counts are L2-normalised. Stable across processes and platforms.
 */
class HashingEmbedder : public IEmbedder {
public:
    static constexpr size_t kDefaultDimension = 384;

    explicit HashingEmbedder(size_t dim = kDefaultDimension);

    Result<std::vector<float>> embed(const std::string& text) const override;

    size_t dimension() const override { return dim_; }

    static uint64_t fnv1a(const std::string& token) noexcept;

private:
    size_t dim_;
};

} // namespace ranklab::vector
