#pragma once

#include <ranklab/core/types.h>
#include <ranklab/corpus/corpus.h>
#include <ranklab/search/lexical_index.h>
#include <ranklab/vector/embedder.h>
#include <ranklab/vector/vector_store.h>

#include <cstddef>
#include <memory>

namespace ranklab::corpus {

/**
 * @brief The three collaborators a hybrid pipeline needs, built from one corpus.
 */
struct CorpusIndex {
    std::shared_ptr<search::InMemoryLexicalSource> lexical;
    std::shared_ptr<vector::InMemoryVectorStore> vectors;
    std::shared_ptr<vector::HashingEmbedder> embedder;
};

/**
 * @brief Index every document: title and body into the lexical index, and the
 * embedding of title + "\n" + body into the vector store.
 *
 * The same embedder is returned for query-time use, so the dimension always
 * matches the store.
 */
Result<CorpusIndex> buildCorpusIndex(const Corpus& corpus, size_t embeddingDim);

} // namespace ranklab::corpus
