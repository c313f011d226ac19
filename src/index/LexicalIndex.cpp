#include "groundwork/LexicalIndex.hpp"

#include <algorithm>
#include <cmath>
#include "groundwork/Analyzer.hpp"

namespace groundwork {

LexicalIndex LexicalIndex::build(const std::vector<Chunk>& chunks, Params params) {
    LexicalIndex idx(params);
    idx.chunkIds_.reserve(chunks.size());
    idx.docLengths_.reserve(chunks.size());
    for (const auto& chunk : chunks) idx.addDocument(chunk);
    idx.refreshAverages();
    return idx;
}

void LexicalIndex::addDocument(const Chunk& chunk) {
    const auto doc = static_cast<uint32_t>(chunkIds_.size());
    const auto tokens = Analyzer::tokenize(chunk.content);

    // First-occurrence order keeps posting construction deterministic.
    std::vector<std::string> order;
    std::unordered_map<std::string, uint32_t> tf;
    for (const auto& t : tokens) {
        if (tf[t]++ == 0) order.push_back(t);
    }
    for (const auto& term : order) {
        postings_[term].push_back({doc, tf[term]});
    }

    chunkIds_.push_back(chunk.id);
    docLengths_.push_back(static_cast<uint32_t>(tokens.size()));
}

void LexicalIndex::refreshAverages() {
    if (docLengths_.empty()) {
        avgDocLen_ = 0.0;
        return;
    }
    uint64_t total = 0;
    for (auto len : docLengths_) total += len;
    avgDocLen_ = static_cast<double>(total) / static_cast<double>(docLengths_.size());
}

std::size_t LexicalIndex::documentFrequency(const std::string& term) const {
    auto it = postings_.find(Analyzer::toLower(term));
    return it != postings_.end() ? it->second.size() : 0;
}

std::vector<LexicalHit> LexicalIndex::search(const std::string& query, std::size_t n) const {
    if (chunkIds_.empty() || n == 0) return {};
    const auto terms = Analyzer::tokenize(query);
    if (terms.empty()) return {};

    const double k1 = params_.k1;
    const double b = params_.b;
    const double avgLen = avgDocLen_ > 0 ? avgDocLen_ : 1.0;
    const double N = static_cast<double>(chunkIds_.size());

    std::vector<double> scores(chunkIds_.size(), 0.0);
    for (const auto& term : terms) {
        auto it = postings_.find(term);
        if (it == postings_.end()) continue;
        const auto& plist = it->second;
        const double df = static_cast<double>(plist.size());
        const double idf = std::log((N - df + 0.5) / (df + 0.5) + 1.0);
        for (const auto& p : plist) {
            const double tf = static_cast<double>(p.tf);
            const double dl = static_cast<double>(docLengths_[p.doc]);
            const double denom = tf + k1 * (1.0 - b + b * (dl / avgLen));
            scores[p.doc] += idf * (tf * (k1 + 1.0)) / denom;
        }
    }

    std::vector<uint32_t> matched;
    for (uint32_t doc = 0; doc < scores.size(); ++doc) {
        if (scores[doc] > 0.0) matched.push_back(doc);
    }
    std::stable_sort(matched.begin(), matched.end(), [&scores](uint32_t lhs, uint32_t rhs) {
        return scores[lhs] > scores[rhs];
    });
    if (matched.size() > n) matched.resize(n);

    std::vector<LexicalHit> hits;
    hits.reserve(matched.size());
    for (auto doc : matched) hits.push_back({chunkIds_[doc], scores[doc]});
    return hits;
}

} // namespace groundwork
