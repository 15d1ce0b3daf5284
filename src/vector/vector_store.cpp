#include <ranklab/vector/vector_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace ranklab::vector {

InMemoryVectorStore::InMemoryVectorStore(size_t dimension) : dimension_(dimension) {}

Result<void> InMemoryVectorStore::add(const std::string& docId, std::vector<float> embedding) {
    if (docId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Vector id must not be empty"};
    }
    if (embedding.size() != dimension_) {
        return Error{ErrorCode::ConfigurationError,
                     "Embedding dimension mismatch for '" + docId + "': expected " +
                         std::to_string(dimension_) + ", got " +
                         std::to_string(embedding.size())};
    }
    vectors_[docId] = std::move(embedding);
    return Result<void>();
}

double InMemoryVectorStore::euclideanDistance(const std::vector<float>& a,
                                              const std::vector<float>& b) {
    double sum = 0.0;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

Result<search::RankedList> InMemoryVectorStore::search(const std::vector<float>& queryVector,
                                                       size_t topK) const {
    if (queryVector.size() != dimension_) {
        return Error{ErrorCode::ConfigurationError,
                     "Query vector has dimension " + std::to_string(queryVector.size()) +
                         ", store expects " + std::to_string(dimension_)};
    }
    if (topK == 0 || vectors_.empty()) {
        return search::RankedList::empty(search::kVectorSource);
    }

    std::vector<search::ScoredDocument> hits;
    hits.reserve(vectors_.size());
    for (const auto& [docId, embedding] : vectors_) {
        const double distance = euclideanDistance(queryVector, embedding);
        hits.emplace_back(docId, search::similarityFromDistance(distance));
    }

    search::sortByRank(hits);
    if (hits.size() > topK) {
        hits.resize(topK);
    }

    spdlog::debug("Vector search scanned {} vectors, returning {}", vectors_.size(), hits.size());
    return search::RankedList::build(search::kVectorSource, std::move(hits));
}

} // namespace ranklab::vector
