#include "groundwork/QueryPlanner.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>
#include "groundwork/Analyzer.hpp"

namespace groundwork {

namespace {

constexpr std::size_t kThesisSnippetChars = 50;
constexpr std::size_t kHeadingScanLines = 5;
constexpr std::size_t kMaxTitleChars = 80;
constexpr std::size_t kDescriptionSourceChars = 150;
constexpr std::size_t kMaxDescriptionChars = 100;

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::string stripHashes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    for (char c : line) {
        if (c != '#') out.push_back(c);
    }
    return Analyzer::trim(out);
}

std::string titleFrom(const std::string& content) {
    const auto lines = splitLines(content);
    for (std::size_t i = 0; i < lines.size() && i < kHeadingScanLines; ++i) {
        if (!lines[i].empty() && lines[i][0] == '#') return stripHashes(lines[i]);
    }
    for (const auto& line : lines) {
        if (Analyzer::trim(line).empty()) continue;
        if (line[0] == '[' || line[0] == '>') continue;
        return Analyzer::trim(line).substr(0, kMaxTitleChars);
    }
    return "Untitled Section";
}

std::string descriptionFrom(const std::string& content) {
    std::string d = content.substr(0, kDescriptionSourceChars);
    std::replace(d.begin(), d.end(), '\n', ' ');
    d = Analyzer::trim(d);
    if (d.size() > kMaxDescriptionChars) d = d.substr(0, kMaxDescriptionChars) + "...";
    return d;
}

} // namespace

std::vector<std::string> buildSearchQueries(const std::string& title,
                                            const std::vector<std::string>& keywords,
                                            const std::string& thesis) {
    std::vector<std::string> candidates;
    candidates.push_back(title);

    if (keywords.size() >= 2) {
        candidates.push_back(title + " " + keywords[0] + " " + keywords[1]);
    }
    if (!thesis.empty() && !keywords.empty()) {
        const std::string second = keywords.size() > 1 ? keywords[1] : "";
        candidates.push_back(keywords[0] + " " + second + " " + Analyzer::trim(thesis.substr(0, kThesisSnippetChars)));
    }
    if (keywords.size() >= 3) {
        candidates.push_back(keywords[0] + " " + keywords[1] + " " + keywords[2]);
    } else if (keywords.size() == 2) {
        candidates.push_back(keywords[0] + " " + keywords[1] + " practices");
    }

    std::vector<std::string> queries;
    std::unordered_set<std::string> seen;
    for (const auto& c : candidates) {
        auto q = Analyzer::trim(c);
        if (q.empty() || !seen.insert(q).second) continue;
        queries.push_back(std::move(q));
    }
    return queries;
}

std::vector<SearchResult> collectUniqueResults(const std::vector<std::string>& queries,
                                               const QueryFn& retrieve,
                                               std::size_t perQuery) {
    std::vector<SearchResult> out;
    std::unordered_set<std::string> seen;
    for (const auto& q : queries) {
        if (Analyzer::trim(q).empty()) continue;
        for (auto& r : retrieve(q, perQuery)) {
            if (!seen.insert(r.chunkId).second) continue;
            out.push_back(std::move(r));
        }
    }
    return out;
}

std::vector<OutlineSection> sectionsFromResults(const std::vector<SearchResult>& results,
                                                std::size_t maxSections) {
    std::vector<OutlineSection> sections;
    for (const auto& r : results) {
        if (sections.size() >= maxSections) break;
        OutlineSection s;
        s.title = titleFrom(r.content);
        s.description = descriptionFrom(r.content);
        sections.push_back(std::move(s));
    }
    return sections;
}

} // namespace groundwork
