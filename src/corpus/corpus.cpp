#include <ranklab/corpus/corpus.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>

namespace ranklab::corpus {

using json = nlohmann::json;

namespace {

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string stringField(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

// Ids may be written as JSON numbers; they match by their textual form
std::optional<std::string> idText(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    return std::nullopt;
}

} // namespace

void Corpus::add(Document doc) {
    auto it = index_.find(doc.docId);
    if (it != index_.end()) {
        documents_[it->second] = std::move(doc);
        return;
    }
    index_.emplace(doc.docId, documents_.size());
    documents_.push_back(std::move(doc));
}

const Document* Corpus::find(const std::string& docId) const {
    auto it = index_.find(docId);
    return it != index_.end() ? &documents_[it->second] : nullptr;
}

Result<Corpus> Corpus::loadJsonl(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open corpus file: " + path.string()};
    }

    Corpus corpus;
    std::string line;
    size_t lineNo = 0;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (isBlank(line)) {
            continue;
        }

        json record;
        try {
            record = json::parse(line);
        } catch (const json::parse_error& e) {
            return Error{ErrorCode::ParseError, path.string() + ":" + std::to_string(lineNo) +
                                                    ": " + e.what()};
        }
        if (!record.is_object()) {
            ++skipped;
            continue;
        }

        Document doc;
        if (auto it = record.find("doc_id"); it != record.end()) {
            doc.docId = idText(*it).value_or("");
        }
        if (doc.docId.empty()) {
            ++skipped;
            continue;
        }
        doc.title = stringField(record, "title");
        doc.body = stringField(record, "body");
        corpus.add(std::move(doc));
    }

    if (skipped > 0) {
        spdlog::warn("Skipped {} corpus records without a doc_id in {}", skipped, path.string());
    }
    spdlog::debug("Loaded {} documents from {}", corpus.size(), path.string());
    return corpus;
}

Result<std::vector<search::RelevanceJudgment>> loadJudgments(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open queries file: " + path.string()};
    }

    std::vector<search::RelevanceJudgment> judgments;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (isBlank(line)) {
            continue;
        }

        search::RelevanceJudgment judgment;
        const std::string where = "line " + std::to_string(lineNo);
        try {
            const json record = json::parse(line);
            if (!record.is_object()) {
                judgment.inputError = where + ": expected a JSON object";
            } else {
                judgment.query = stringField(record, "query");
                if (judgment.query.empty()) {
                    judgment.query = stringField(record, "text");
                }

                auto relevant = record.find("relevant");
                if (judgment.query.empty()) {
                    judgment.inputError = where + ": missing \"query\"";
                } else if (relevant == record.end() || !relevant->is_array()) {
                    judgment.inputError = where + ": \"relevant\" must be an array";
                } else {
                    for (const auto& id : *relevant) {
                        auto text = idText(id);
                        if (!text) {
                            judgment.inputError =
                                where + ": \"relevant\" entries must be strings or numbers";
                            break;
                        }
                        judgment.relevantDocIds.insert(std::move(*text));
                    }
                }
            }
        } catch (const json::parse_error& e) {
            judgment.inputError = where + ": " + e.what();
        }

        if (judgment.inputError) {
            spdlog::warn("Malformed judgment in {}: {}", path.string(), *judgment.inputError);
        }
        judgments.push_back(std::move(judgment));
    }
    return judgments;
}

} // namespace ranklab::corpus
