#include "groundwork/ResultValidator.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include "groundwork/Analyzer.hpp"

namespace groundwork {

namespace {

constexpr std::size_t kPreviewChars = 50;

std::string preview(const std::string& content) {
    return content.substr(0, kPreviewChars) + "...";
}

} // namespace

std::size_t countKeywordMatches(const std::string& content, const std::vector<std::string>& keywords) {
    const std::string text = Analyzer::toLower(content);
    std::size_t matches = 0;
    for (const auto& kw : keywords) {
        const std::string k = Analyzer::toLower(kw);
        if (k.empty()) continue;
        if (text.find(k) != std::string::npos) {
            ++matches;
            continue;
        }
        if (k.find('-') == std::string::npos) continue;

        bool allParts = true;
        std::istringstream parts(k);
        std::string part;
        while (std::getline(parts, part, '-')) {
            if (text.find(part) == std::string::npos) {
                allParts = false;
                break;
            }
        }
        if (allParts) ++matches;
    }
    return matches;
}

ResultValidation validateSearchResults(const std::vector<SearchResult>& results,
                                       const std::vector<std::string>& expectedKeywords,
                                       const ResultValidationOptions& options) {
    ResultValidation out;
    for (const auto& r : results) {
        if (r.similarityScore < options.similarityThreshold) {
            std::ostringstream w;
            w << "Low similarity (" << std::fixed << std::setprecision(3) << r.similarityScore
              << ") for: " << preview(r.content);
            out.warnings.push_back(w.str());
            continue;
        }
        if (r.similarityScore >= options.highSimilarityThreshold) {
            out.accepted.push_back(r);
            continue;
        }
        const auto matches = countKeywordMatches(r.content, expectedKeywords);
        if (matches < options.minKeywordMatches) {
            out.warnings.push_back("Insufficient keyword matches (" + std::to_string(matches) + "/" +
                                   std::to_string(options.minKeywordMatches) + ") in: " + preview(r.content));
            continue;
        }
        out.accepted.push_back(r);
    }

    if (out.accepted.size() * 2 < results.size()) {
        std::cerr << "ResultValidator: search quality concern: " << out.accepted.size() << "/"
                  << results.size() << " results passed validation\n";
    }
    return out;
}

} // namespace groundwork
