#include <ranklab/corpus/corpus_index.h>

#include <spdlog/spdlog.h>

#include <chrono>

namespace ranklab::corpus {

Result<CorpusIndex> buildCorpusIndex(const Corpus& corpus, size_t embeddingDim) {
    if (embeddingDim == 0) {
        return Error{ErrorCode::ConfigurationError, "Embedding dimension must be positive"};
    }

    const auto start = std::chrono::steady_clock::now();

    CorpusIndex index;
    index.lexical = std::make_shared<search::InMemoryLexicalSource>();
    index.vectors = std::make_shared<vector::InMemoryVectorStore>(embeddingDim);
    index.embedder = std::make_shared<vector::HashingEmbedder>(embeddingDim);

    for (const auto& doc : corpus.documents()) {
        index.lexical->addDocument(doc.docId,
                                   {{search::InMemoryLexicalSource::kTitleField, doc.title},
                                    {search::InMemoryLexicalSource::kBodyField, doc.body}});

        auto embedding = index.embedder->embed(doc.text());
        if (!embedding) {
            return embedding.error();
        }
        if (auto added = index.vectors->add(doc.docId, std::move(embedding).value()); !added) {
            return added.error();
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("Indexed {} documents (dim={}) in {} ms", corpus.size(), embeddingDim,
                  elapsed.count());
    return index;
}

} // namespace ranklab::corpus
