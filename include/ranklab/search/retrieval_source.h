#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/scored_document.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ranklab::search {

// Field name -> boost applied to that field's term frequency
using FieldWeights = std::map<std::string, double>;

/**
 * @brief Term-frequency retrieval over text fields (BM25 family).
 *
 * Implementations return an empty list when nothing matches and an
 * InvalidArgument error when the query syntax is malformed.
 */
class ILexicalSource {
public:
    virtual ~ILexicalSource() = default;

    virtual Result<RankedList> search(const std::string& query, const FieldWeights& fieldWeights,
                                      size_t topK) const = 0;
};

/**
 * @brief Nearest-neighbour retrieval over dense embeddings.
 *
 * Scores are similarities derived from distance, see similarityFromDistance().
 */
class IVectorSource {
public:
    virtual ~IVectorSource() = default;

    virtual Result<RankedList> search(const std::vector<float>& queryVector,
                                      size_t topK) const = 0;

    virtual size_t dimension() const = 0;
};

inline double similarityFromDistance(double distance) {
    return 1.0 / (1.0 + distance);
}

} // namespace ranklab::search
