#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace groundwork {

struct OutlineSection {
    std::string title;
    std::string description;
    double coveragePct = 0.0; // 0-100
    std::size_t sourceCount = 0;
    std::string notes;
    std::vector<OutlineSection> subsections;

    bool hasLowCoverage(double threshold = 50.0) const { return coveragePct < threshold; }

    // This section followed by all descendants, pre-order.
    std::vector<const OutlineSection*> flatten() const;
};

struct Outline {
    static constexpr double kLowCoverageThreshold = 50.0;

    std::string title;
    std::string thesis;
    std::vector<std::string> keywords;
    std::vector<OutlineSection> sections;

    std::string validationNotes;
    bool rejected = false;

    double avgCoverage = 0.0;
    std::size_t lowCoverageSections = 0;
    std::size_t sectionCount = 0;

    // Recomputes the aggregate fields from the current section tree.
    void calculateStats(double lowCoverageThreshold = kLowCoverageThreshold);
    std::vector<const OutlineSection*> allSections() const;

    // Appends a paragraph to validationNotes, separated by a blank line.
    void appendNote(const std::string& note);
};

} // namespace groundwork
