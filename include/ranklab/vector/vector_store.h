#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/fusion_config.h>
#include <ranklab/search/retrieval_source.h>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace ranklab::vector {

/**
 * @brief Brute-force Euclidean nearest-neighbour store.
 *
 * search() scans every stored vector, orders by ascending distance and reports
 * similarity 1 / (1 + distance) under the source name "vector".
 */
class InMemoryVectorStore : public search::IVectorSource {
public:
    explicit InMemoryVectorStore(size_t dimension);

    /// Insert or replace the vector stored for docId.
    Result<void> add(const std::string& docId, std::vector<float> embedding);

    Result<search::RankedList> search(const std::vector<float>& queryVector,
                                      size_t topK) const override;

    size_t dimension() const override { return dimension_; }
    size_t size() const { return vectors_.size(); }

    static double euclideanDistance(const std::vector<float>& a, const std::vector<float>& b);

private:
    size_t dimension_;
    std::unordered_map<std::string, std::vector<float>> vectors_;
};

} // namespace ranklab::vector
