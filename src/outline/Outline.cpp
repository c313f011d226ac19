#include "groundwork/Outline.hpp"

namespace groundwork {

namespace {

void collect(const OutlineSection& section, std::vector<const OutlineSection*>& out) {
    out.push_back(&section);
    for (const auto& sub : section.subsections) collect(sub, out);
}

} // namespace

std::vector<const OutlineSection*> OutlineSection::flatten() const {
    std::vector<const OutlineSection*> out;
    collect(*this, out);
    return out;
}

std::vector<const OutlineSection*> Outline::allSections() const {
    std::vector<const OutlineSection*> out;
    for (const auto& s : sections) collect(s, out);
    return out;
}

void Outline::calculateStats(double lowCoverageThreshold) {
    const auto all = allSections();
    sectionCount = all.size();
    if (all.empty()) {
        avgCoverage = 0.0;
        lowCoverageSections = 0;
        return;
    }
    double total = 0.0;
    std::size_t low = 0;
    for (const auto* s : all) {
        total += s->coveragePct;
        if (s->hasLowCoverage(lowCoverageThreshold)) ++low;
    }
    avgCoverage = total / static_cast<double>(all.size());
    lowCoverageSections = low;
}

void Outline::appendNote(const std::string& note) {
    if (note.empty()) return;
    if (!validationNotes.empty()) validationNotes += "\n\n";
    validationNotes += note;
}

} // namespace groundwork
