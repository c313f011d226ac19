#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "groundwork/Outline.hpp"
#include "groundwork/Types.hpp"

namespace groundwork {

// Retrieval used for coverage checks: (query, maxResults) -> ranked results.
using QueryFn = std::function<std::vector<SearchResult>(const std::string&, std::size_t)>;

// Measures how much corpus material supports each outline section.
//
// analyze() mutates the section in place (coveragePct, sourceCount, notes) and
// then every subsection independently with the same keywords; nothing is
// inherited from the parent. Exceptions thrown by the retrieval function
// propagate to the caller. Sections of one tree must not be analyzed from two
// threads at once; disjoint subtrees may be.
class CoverageAnalyzer {
public:
    static constexpr std::size_t kResultsPerSection = 10;
    static constexpr std::size_t kQueryKeywords = 2;

    explicit CoverageAnalyzer(QueryFn retrieve, std::size_t minSources = 3);

    void analyze(OutlineSection& section, const std::vector<std::string>& keywords) const;
    void analyzeAll(std::vector<OutlineSection>& sections, const std::vector<std::string>& keywords) const;

    // Title, description and up to two keywords.
    static std::string buildQuery(const OutlineSection& section, const std::vector<std::string>& keywords);

    // Distinct non-empty owning-document ids.
    static std::size_t countSources(const std::vector<SearchResult>& results);

    // 0-100 from the best and mean positive similarity and the positive-result count.
    static double coveragePercent(const std::vector<SearchResult>& results);

    std::size_t minSources() const { return minSources_; }

private:
    QueryFn retrieve_;
    std::size_t minSources_;
};

} // namespace groundwork
