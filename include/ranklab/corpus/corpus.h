#pragma once

#include <ranklab/core/types.h>
#include <ranklab/search/evaluator.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace ranklab::corpus {

struct Document {
    std::string docId;
    std::string title;
    std::string body;

    // Text handed to the embedder and the reranker: title, newline, body
    std::string text() const { return title + "\n" + body; }
};

/**
 * @brief Documents keyed by docId, in first-seen order.
 */
class Corpus {
public:
    /**
     * @brief Load a JSONL corpus: one {"doc_id", "title", "body"} object per line.
     *
     * Blank lines and records without a non-empty doc_id are skipped. A later
     * record with the same doc_id replaces the earlier one in place.
     * A line that is not valid JSON fails the load with ParseError.
     */
    static Result<Corpus> loadJsonl(const std::filesystem::path& path);

    /// Insert, or replace an existing document with the same docId.
    void add(Document doc);

    const Document* find(const std::string& docId) const;

    const std::vector<Document>& documents() const { return documents_; }
    size_t size() const { return documents_.size(); }
    bool empty() const { return documents_.empty(); }

private:
    std::vector<Document> documents_;
    std::map<std::string, size_t> index_;
};

/**
 * @brief Read JSONL judgments: {"query": "...", "relevant": ["doc", ...]}.
 *
 * "text" is accepted as an alias for "query". Blank lines are skipped. A
 * malformed line becomes a judgment with inputError set, so evaluation can
 * flag it instead of the line silently disappearing. Only a missing or
 * unreadable file is an error.
 */
Result<std::vector<search::RelevanceJudgment>> loadJudgments(const std::filesystem::path& path);

} // namespace ranklab::corpus
