#include "groundwork/algorithms/ScoreFusion.hpp"

#include <algorithm>

namespace groundwork::algo {

LexicalScores normalizeScores(const std::vector<LexicalHit>& hits) {
    if (hits.empty()) return {};
    double maxScore = 0.0;
    for (const auto& h : hits) maxScore = std::max(maxScore, h.score);
    if (maxScore <= 0.0) return {};

    LexicalScores out;
    out.reserve(hits.size());
    for (const auto& h : hits) {
        out[h.chunkId] = std::clamp(h.score / maxScore, 0.0, 1.0);
    }
    return out;
}

std::vector<SearchResult> fuseScores(std::vector<SearchResult> dense,
                                     const LexicalScores& lexical,
                                     double semanticWeight,
                                     double lexicalWeight,
                                     std::size_t maxResults) {
    if (lexical.empty()) {
        for (auto& r : dense) r.hybridScore = r.similarityScore;
    } else {
        for (auto& r : dense) {
            auto it = lexical.find(r.chunkId);
            const double lex = it != lexical.end() ? it->second : 0.0;
            r.lexicalScore = lex;
            r.hybridScore = semanticWeight * r.similarityScore + lexicalWeight * lex;
        }
    }

    std::stable_sort(dense.begin(), dense.end(), [](const SearchResult& a, const SearchResult& b) {
        return *a.hybridScore > *b.hybridScore;
    });
    if (dense.size() > maxResults) dense.erase(dense.begin() + static_cast<std::ptrdiff_t>(maxResults), dense.end());
    return dense;
}

} // namespace groundwork::algo
