#include "groundwork/CoverageAnalyzer.hpp"

#include <algorithm>
#include <unordered_set>
#include "groundwork/Analyzer.hpp"
#include "groundwork/Errors.hpp"

namespace groundwork {

namespace {
// Effective similarity at which a section counts as fully covered.
constexpr double kFullCoverageSimilarity = 0.25;
// Positive results needed for the count factor to saturate.
constexpr double kFullCoverageResults = 2.0;
constexpr double kBestWeight = 0.9;
constexpr double kMeanWeight = 0.1;
}

CoverageAnalyzer::CoverageAnalyzer(QueryFn retrieve, std::size_t minSources)
    : retrieve_(std::move(retrieve)), minSources_(minSources) {
    if (!retrieve_) throw ConfigurationError("coverage analysis needs a retrieval function");
}

std::string CoverageAnalyzer::buildQuery(const OutlineSection& section, const std::vector<std::string>& keywords) {
    std::string query;
    auto append = [&query](const std::string& part) {
        const auto t = Analyzer::trim(part);
        if (t.empty()) return;
        if (!query.empty()) query.push_back(' ');
        query += t;
    };
    append(section.title);
    append(section.description);
    const std::size_t n = std::min(keywords.size(), kQueryKeywords);
    for (std::size_t i = 0; i < n; ++i) append(keywords[i]);
    return query;
}

std::size_t CoverageAnalyzer::countSources(const std::vector<SearchResult>& results) {
    std::unordered_set<std::string> docs;
    for (const auto& r : results) {
        if (!r.metadata.documentId.empty()) docs.insert(r.metadata.documentId);
    }
    return docs.size();
}

double CoverageAnalyzer::coveragePercent(const std::vector<SearchResult>& results) {
    if (results.empty()) return 0.0;

    double best = 0.0;
    double positiveSum = 0.0;
    std::size_t positiveCount = 0;
    for (const auto& r : results) {
        const double s = std::max(0.0, r.similarityScore);
        best = std::max(best, s);
        if (s > 0.0) {
            positiveSum += s;
            ++positiveCount;
        }
    }
    const double mean = positiveCount ? positiveSum / static_cast<double>(positiveCount) : 0.0;
    const double effective = kBestWeight * best + kMeanWeight * mean;
    const double normalized = std::min(effective / kFullCoverageSimilarity, 1.0);
    const double resultFactor = std::min(static_cast<double>(positiveCount) / kFullCoverageResults, 1.0);
    return std::clamp(resultFactor * normalized * 100.0, 0.0, 100.0);
}

void CoverageAnalyzer::analyze(OutlineSection& section, const std::vector<std::string>& keywords) const {
    const auto results = retrieve_(buildQuery(section, keywords), kResultsPerSection);

    if (results.empty()) {
        section.coveragePct = 0.0;
        section.sourceCount = 0;
        section.notes = "No corpus coverage found for this topic";
    } else {
        section.coveragePct = coveragePercent(results);
        section.sourceCount = countSources(results);
        if (section.sourceCount < minSources_) {
            section.notes = "Limited sources (" + std::to_string(section.sourceCount) + " documents)";
        } else {
            section.notes.clear();
        }
    }

    for (auto& sub : section.subsections) analyze(sub, keywords);
}

void CoverageAnalyzer::analyzeAll(std::vector<OutlineSection>& sections, const std::vector<std::string>& keywords) const {
    for (auto& s : sections) analyze(s, keywords);
}

} // namespace groundwork
