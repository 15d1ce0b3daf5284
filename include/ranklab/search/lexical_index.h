#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/retrieval_source.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace ranklab::search {

struct Bm25Params {
    double k1 = 1.2;
    double b = 0.75;
};

/**
 * @brief In-memory BM25F index over named text fields.
 *
 * Per-field term frequencies are length-normalised against that field's
 * average length, boosted by the caller's field weights, summed, and then
 * saturated once with k1. Fields missing from a non-empty weight map do not
 * contribute.
 */
class InMemoryLexicalSource : public ILexicalSource {
public:
    static constexpr const char* kTitleField = "title";
    static constexpr const char* kBodyField = "body";

    explicit InMemoryLexicalSource(Bm25Params params = {});

    /// Index (or re-index) a document; fields maps field name -> text.
    void addDocument(const std::string& docId, const std::map<std::string, std::string>& fields);

    Result<RankedList> search(const std::string& query, const FieldWeights& fieldWeights,
                              size_t topK) const override;

    size_t size() const { return docs_.size(); }

    /// Query terms, or InvalidArgument for unbalanced double quotes.
    static Result<std::vector<std::string>> parseQuery(const std::string& query);

    double idf(const std::string& term) const;

private:
    struct FieldStats {
        std::unordered_map<std::string, uint32_t> termFreqs;
        uint32_t length = 0;
    };

    struct DocEntry {
        std::string docId;
        std::map<std::string, FieldStats> fields;
    };

    void removeStats(const DocEntry& entry);
    void addStats(const DocEntry& entry);
    double averageFieldLength(const std::string& field) const;

    Bm25Params params_;
    std::vector<DocEntry> docs_;
    std::unordered_map<std::string, size_t> byId_;
    std::unordered_map<std::string, size_t> docFreq_;
    std::map<std::string, uint64_t> fieldLengthTotals_;
};

} // namespace ranklab::search
