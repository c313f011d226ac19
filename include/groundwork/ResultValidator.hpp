#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "groundwork/Types.hpp"

namespace groundwork {

struct ResultValidationOptions {
    double similarityThreshold = 0.01;
    std::size_t minKeywordMatches = 1;
    // At or above this similarity the keyword check is skipped.
    double highSimilarityThreshold = 0.4;
};

struct ResultValidation {
    std::vector<SearchResult> accepted;
    std::vector<std::string> warnings;
};

// Post-retrieval relevance check. Keywords are hints: strong semantic matches
// are kept even when no keyword appears in the text.
ResultValidation validateSearchResults(const std::vector<SearchResult>& results,
                                       const std::vector<std::string>& expectedKeywords,
                                       const ResultValidationOptions& options = ResultValidationOptions{});

// Number of keywords present in the content. A hyphenated keyword also counts
// when each of its parts appears.
std::size_t countKeywordMatches(const std::string& content, const std::vector<std::string>& keywords);

} // namespace groundwork
