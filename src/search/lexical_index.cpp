#include <ranklab/search/fusion_config.h>
#include <ranklab/search/lexical_index.h>
#include <ranklab/search/tokenizer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace ranklab::search {

InMemoryLexicalSource::InMemoryLexicalSource(Bm25Params params) : params_(params) {}

void InMemoryLexicalSource::addDocument(const std::string& docId,
                                        const std::map<std::string, std::string>& fields) {
    DocEntry entry;
    entry.docId = docId;
    for (const auto& [field, text] : fields) {
        FieldStats stats;
        for (auto& token : tokenize(text)) {
            ++stats.termFreqs[token];
            ++stats.length;
        }
        entry.fields.emplace(field, std::move(stats));
    }

    auto it = byId_.find(docId);
    if (it != byId_.end()) {
        removeStats(docs_[it->second]);
        addStats(entry);
        docs_[it->second] = std::move(entry);
        return;
    }

    addStats(entry);
    byId_.emplace(docId, docs_.size());
    docs_.push_back(std::move(entry));
}

void InMemoryLexicalSource::addStats(const DocEntry& entry) {
    std::set<std::string> seen;
    for (const auto& [field, stats] : entry.fields) {
        fieldLengthTotals_[field] += stats.length;
        for (const auto& [term, tf] : stats.termFreqs) {
            if (seen.insert(term).second) {
                ++docFreq_[term];
            }
        }
    }
}

void InMemoryLexicalSource::removeStats(const DocEntry& entry) {
    std::set<std::string> seen;
    for (const auto& [field, stats] : entry.fields) {
        fieldLengthTotals_[field] -= stats.length;
        for (const auto& [term, tf] : stats.termFreqs) {
            if (seen.insert(term).second) {
                auto it = docFreq_.find(term);
                if (it != docFreq_.end() && --it->second == 0) {
                    docFreq_.erase(it);
                }
            }
        }
    }
}

double InMemoryLexicalSource::averageFieldLength(const std::string& field) const {
    auto it = fieldLengthTotals_.find(field);
    if (it == fieldLengthTotals_.end() || docs_.empty()) {
        return 0.0;
    }
    return static_cast<double>(it->second) / static_cast<double>(docs_.size());
}

double InMemoryLexicalSource::idf(const std::string& term) const {
    auto it = docFreq_.find(term);
    if (it == docFreq_.end() || it->second == 0) {
        return 0.0;
    }
    const double n = static_cast<double>(docs_.size());
    const double df = static_cast<double>(it->second);
    // IDF = log(1 + (N - df + 0.5) / (df + 0.5))
    return std::log(1.0 + (n - df + 0.5) / (df + 0.5));
}

Result<std::vector<std::string>> InMemoryLexicalSource::parseQuery(const std::string& query) {
    if (std::count(query.begin(), query.end(), '"') % 2 != 0) {
        return Error{ErrorCode::InvalidArgument, "Unbalanced quote in query: " + query};
    }
    auto tokens = tokenize(query);
    std::vector<std::string> terms;
    std::set<std::string> seen;
    for (auto& token : tokens) {
        if (seen.insert(token).second) {
            terms.push_back(std::move(token));
        }
    }
    return terms;
}

Result<RankedList> InMemoryLexicalSource::search(const std::string& query,
                                                 const FieldWeights& fieldWeights,
                                                 size_t topK) const {
    for (const auto& [field, weight] : fieldWeights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return Error{ErrorCode::InvalidArgument,
                         "Field weight for '" + field + "' must be a non-negative number"};
        }
    }

    auto terms = parseQuery(query);
    if (!terms) {
        return terms.error();
    }
    if (terms.value().empty() || topK == 0 || docs_.empty()) {
        return RankedList::empty(kLexicalSource);
    }

    std::map<std::string, double> avgLengths;
    for (const auto& [field, total] : fieldLengthTotals_) {
        avgLengths[field] = averageFieldLength(field);
    }

    std::vector<ScoredDocument> hits;
    for (const auto& doc : docs_) {
        double score = 0.0;
        bool matched = false;
        for (const auto& term : terms.value()) {
            double weightedTf = 0.0;
            for (const auto& [field, stats] : doc.fields) {
                double boost = 1.0;
                if (!fieldWeights.empty()) {
                    auto w = fieldWeights.find(field);
                    if (w == fieldWeights.end())
                        continue;
                    boost = w->second;
                }
                auto tf = stats.termFreqs.find(term);
                if (tf == stats.termFreqs.end())
                    continue;

                const double avg = avgLengths[field];
                const double lengthNorm =
                    avg > 0.0 ? 1.0 - params_.b + params_.b * (stats.length / avg) : 1.0;
                weightedTf += boost * static_cast<double>(tf->second) / lengthNorm;
            }
            if (weightedTf > 0.0) {
                matched = true;
                score += idf(term) * weightedTf * (params_.k1 + 1.0) / (weightedTf + params_.k1);
            }
        }
        if (matched) {
            hits.emplace_back(doc.docId, score);
        }
    }

    sortByRank(hits);
    if (hits.size() > topK) {
        hits.resize(topK);
    }

    spdlog::debug("Lexical search for '{}' matched {} of {} documents", query, hits.size(),
                  docs_.size());
    return RankedList::build(kLexicalSource, std::move(hits));
}

} // namespace ranklab::search
