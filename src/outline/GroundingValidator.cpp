#include "groundwork/GroundingValidator.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include "groundwork/Analyzer.hpp"

namespace groundwork {

namespace {

bool sectionMentions(const OutlineSection& s, const std::vector<std::string>& keywords) {
    return Analyzer::containsAny(s.title + " " + s.description, keywords);
}

std::string joinKeywords(const std::vector<std::string>& keywords) {
    std::string out;
    for (const auto& k : keywords) {
        if (!out.empty()) out += ", ";
        out += k;
    }
    return out;
}

std::string rejectionNote(const KeywordMatch& match,
                          const std::vector<std::string>& keywords,
                          const std::vector<OutlineSection>& generated,
                          std::size_t preview) {
    std::ostringstream out;
    out << "OUTLINE REJECTED: Only " << match.matched << "/" << match.total << " sections ("
        << std::fixed << std::setprecision(0) << match.ratio * 100.0
        << "%) match provided keywords.\n\n"
        << "The outline appears to be hallucinated (not grounded in your corpus).\n\n"
        << "Keywords provided: " << joinKeywords(keywords) << "\n\n"
        << "Outline generated:\n";
    for (std::size_t i = 0; i < generated.size() && i < preview; ++i) {
        if (i > 0) out << "\n";
        out << "  - " << generated[i].title;
    }
    if (generated.size() > preview) out << "...";
    out << "\n\nRECOMMENDATION:\n"
        << "1. Search corpus manually for: " << keywords.front() << "\n"
        << "2. Verify corpus actually contains material about this topic\n"
        << "3. Try with different keywords that better match corpus content\n"
        << "4. Add more source documents if corpus is too sparse";
    return out.str();
}

} // namespace

KeywordMatch keywordMatchRatio(const std::vector<OutlineSection>& sections,
                               const std::vector<std::string>& keywords) {
    KeywordMatch m;
    for (const auto& top : sections) {
        for (const auto* s : top.flatten()) {
            ++m.total;
            if (sectionMentions(*s, keywords)) ++m.matched;
        }
    }
    m.ratio = m.total ? static_cast<double>(m.matched) / static_cast<double>(m.total) : 0.0;
    return m;
}

std::vector<OutlineSection> filterByKeywordMatch(std::vector<OutlineSection> sections,
                                                 const std::vector<std::string>& keywords) {
    std::vector<OutlineSection> kept;
    for (auto& s : sections) {
        if (!sectionMentions(s, keywords)) continue;
        s.subsections = filterByKeywordMatch(std::move(s.subsections), keywords);
        kept.push_back(std::move(s));
    }
    return kept;
}

std::vector<OutlineSection> pruneLowCoverage(std::vector<OutlineSection> sections,
                                             const std::vector<std::string>& keywords,
                                             double threshold,
                                             std::vector<std::string>& pruned) {
    std::vector<OutlineSection> kept;
    for (auto& s : sections) {
        const bool veryLow = s.coveragePct > 0.0 && s.coveragePct < threshold;
        if (veryLow && !Analyzer::containsAny(s.title, keywords)) {
            pruned.push_back(s.title);
            continue;
        }
        s.subsections = pruneLowCoverage(std::move(s.subsections), keywords, threshold, pruned);
        kept.push_back(std::move(s));
    }
    return kept;
}

GroundingValidator::Summary GroundingValidator::validate(Outline& outline) const {
    Summary summary;
    const auto& keywords = outline.keywords;
    outline.calculateStats();

    // Stage 1: keyword gate.
    summary.match = keywordMatchRatio(outline.sections, keywords);
    if (keywords.empty()) {
        std::cerr << "GroundingValidator: no keywords for '" << outline.title << "', keyword gate skipped\n";
    } else if (summary.match.total > 0 && summary.match.ratio < kRejectionMatchRatio) {
        outline.appendNote(rejectionNote(summary.match, keywords, outline.sections, kRejectedTitlePreview));
        outline.sections = filterByKeywordMatch(std::move(outline.sections), keywords);
        outline.rejected = true;
        outline.calculateStats();
        summary.rejected = true;
        std::cerr << "GroundingValidator: rejected '" << outline.title << "' matched="
                  << summary.match.matched << "/" << summary.match.total
                  << " kept=" << outline.sectionCount << "\n";
    }

    // Stage 2: prune near-empty sections unrelated to the keywords.
    std::vector<std::string> pruned;
    const std::size_t beforePrune = outline.sectionCount;
    outline.sections = pruneLowCoverage(std::move(outline.sections), keywords, kVeryLowCoveragePct, pruned);
    if (!pruned.empty()) {
        outline.calculateStats();
        // Dropped sections take their subsections with them.
        summary.pruned = beforePrune - outline.sectionCount;
        std::ostringstream note;
        note << "REMOVED " << summary.pruned << " additional sections with very low coverage (<"
             << std::fixed << std::setprecision(0) << kVeryLowCoveragePct << "%) unrelated to keywords:\n";
        for (std::size_t i = 0; i < pruned.size() && i < kPrunedTitlePreview; ++i) {
            if (i > 0) note << "\n";
            note << "  - " << pruned[i];
        }
        if (pruned.size() > kPrunedTitlePreview) {
            note << "\n  ... and " << (pruned.size() - kPrunedTitlePreview) << " more";
        }
        outline.appendNote(note.str());
        std::cerr << "GroundingValidator: pruned " << summary.pruned << " low-coverage sections from '"
                  << outline.title << "'\n";
    }

    // Stage 3: advisory on what is left.
    if (outline.avgCoverage > 0.0 && outline.avgCoverage < kLowOutlineCoveragePct) {
        std::ostringstream note;
        note << "COVERAGE WARNING: Remaining outline still has low corpus coverage ("
             << std::fixed << std::setprecision(1) << outline.avgCoverage << "%). Consider:\n"
             << "  1. Adding more source documents to corpus\n"
             << "  2. Refining keywords to better match corpus content\n"
             << "  3. Verifying section titles directly relate to the topic";
        outline.appendNote(note.str());
        summary.lowCoverageWarning = true;
    }

    return summary;
}

} // namespace groundwork
