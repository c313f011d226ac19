#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "groundwork/CoverageAnalyzer.hpp"
#include "groundwork/Outline.hpp"
#include "groundwork/Types.hpp"

namespace groundwork {

// Grounding queries for an outline request, most specific first, without duplicates.
std::vector<std::string> buildSearchQueries(const std::string& title,
                                            const std::vector<std::string>& keywords,
                                            const std::string& thesis = "");

// Runs every query and keeps the first occurrence of each chunk.
std::vector<SearchResult> collectUniqueResults(const std::vector<std::string>& queries,
                                               const QueryFn& retrieve,
                                               std::size_t perQuery = 3);

// Sections taken straight from retrieved material, used when a generated
// outline does not match its keywords.
std::vector<OutlineSection> sectionsFromResults(const std::vector<SearchResult>& results,
                                                std::size_t maxSections = 5);

} // namespace groundwork
