#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "groundwork/Outline.hpp"

namespace groundwork {

struct KeywordMatch {
    std::size_t matched = 0;
    std::size_t total = 0;
    double ratio = 0.0;
};

// Counts sections (subsections included) whose title or description mentions a keyword.
KeywordMatch keywordMatchRatio(const std::vector<OutlineSection>& sections,
                               const std::vector<std::string>& keywords);

// Keeps sections whose title + description mentions a keyword, recursively.
std::vector<OutlineSection> filterByKeywordMatch(std::vector<OutlineSection> sections,
                                                 const std::vector<std::string>& keywords);

// Drops sections with 0 < coverage < threshold whose title carries no keyword,
// at any depth. Titles of dropped sections are appended to pruned.
std::vector<OutlineSection> pruneLowCoverage(std::vector<OutlineSection> sections,
                                             const std::vector<std::string>& keywords,
                                             double threshold,
                                             std::vector<std::string>& pruned);

// Corpus-wide grounding policy applied to a finished outline.
//
// 1. Keyword gate: fewer than half of the sections mentioning a keyword rejects
//    the outline; only the matching sections are kept.
// 2. Remaining sections under 5% coverage without a keyword in the title are pruned.
// 3. A mean coverage under 15% adds an advisory.
// Notes accumulate in Outline::validationNotes; statistics are recomputed after
// every stage that changes the sections.
class GroundingValidator {
public:
    static constexpr double kRejectionMatchRatio = 0.5;
    static constexpr double kVeryLowCoveragePct = 5.0;
    static constexpr double kLowOutlineCoveragePct = 15.0;
    static constexpr std::size_t kRejectedTitlePreview = 5;
    static constexpr std::size_t kPrunedTitlePreview = 3;

    struct Summary {
        KeywordMatch match;
        bool rejected = false;
        std::size_t pruned = 0;
        bool lowCoverageWarning = false;
    };

    Summary validate(Outline& outline) const;
};

} // namespace groundwork
