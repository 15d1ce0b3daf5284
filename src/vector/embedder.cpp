#include <ranklab/search/tokenizer.h>
#include <ranklab/vector/embedder.h>

#include <cmath>

namespace ranklab::vector {

HashingEmbedder::HashingEmbedder(size_t dim) : dim_(dim) {}

uint64_t HashingEmbedder::fnv1a(const std::string& token) noexcept {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : token) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

Result<std::vector<float>> HashingEmbedder::embed(const std::string& text) const {
    if (dim_ == 0) {
        return Error{ErrorCode::ConfigurationError, "Embedding dimension must be positive"};
    }

    std::vector<float> embedding(dim_, 0.0f);
    for (const auto& token : search::tokenize(text)) {
        embedding[fnv1a(token) % dim_] += 1.0f;
    }

    double norm = 0.0;
    for (float v : embedding) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const double inv = 1.0 / std::sqrt(norm);
        for (auto& v : embedding) {
            v = static_cast<float>(v * inv);
        }
    }
    return embedding;
}

} // namespace ranklab::vector
