#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "groundwork/LexicalIndex.hpp"
#include "groundwork/Types.hpp"

namespace groundwork::algo {

using LexicalScores = std::unordered_map<std::string, double>;

// Divides every score by the batch maximum. Empty or all-zero input yields {}.
LexicalScores normalizeScores(const std::vector<LexicalHit>& hits);

// hybrid = semanticWeight * similarity + lexicalWeight * lexical[chunkId].
// An empty lexical map means no lexical signal: hybrid falls back to similarity.
// Stable descending sort by hybrid score, truncated to maxResults.
std::vector<SearchResult> fuseScores(std::vector<SearchResult> dense,
                                     const LexicalScores& lexical,
                                     double semanticWeight,
                                     double lexicalWeight,
                                     std::size_t maxResults);

} // namespace groundwork::algo
