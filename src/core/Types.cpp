#include "groundwork/Types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include "groundwork/Analyzer.hpp"

namespace groundwork {

const char* toString(QualityRating rating) {
    switch (rating) {
        case QualityRating::Deprecated: return "deprecated";
        case QualityRating::Supplemental: return "supplemental";
        case QualityRating::Reference: return "reference";
        case QualityRating::Preferred: return "preferred";
    }
    return "reference";
}

QualityRating parseQualityRating(const std::string& name) {
    const std::string v = Analyzer::toLower(Analyzer::trim(name));
    if (v == "preferred") return QualityRating::Preferred;
    if (v == "supplemental") return QualityRating::Supplemental;
    if (v == "deprecated") return QualityRating::Deprecated;
    return QualityRating::Reference;
}

std::optional<TimePoint> parseIsoDate(const std::string& text) {
    std::string s = Analyzer::trim(text);
    if (s.empty()) return std::nullopt;
    if (s.back() == 'Z' || s.back() == 'z') s.pop_back();

    std::tm tm{};
    std::istringstream in(s);
    if (s.size() > 10) {
        in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (in.fail()) {
            in.clear();
            in.str(s);
            tm = std::tm{};
            in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        }
    } else {
        in >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (in.fail()) return std::nullopt;

    const std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t);
}

std::string formatIsoDate(const TimePoint& tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return out.str();
}

std::vector<std::string> parseTags(const std::string& text) {
    std::vector<std::string> tags;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        auto tag = Analyzer::toLower(Analyzer::trim(item));
        if (!tag.empty()) tags.push_back(std::move(tag));
    }
    return tags;
}

bool MetadataFilter::matchesTags(const ChunkMetadata& metadata) const {
    if (tags.empty()) return true;
    for (const auto& wanted : tags) {
        const auto w = Analyzer::toLower(Analyzer::trim(wanted));
        for (const auto& have : metadata.tags) {
            if (Analyzer::toLower(have) == w) return true;
        }
    }
    return false;
}

bool MetadataFilter::matches(const ChunkMetadata& metadata) const {
    if (quality && metadata.quality != *quality) return false;
    if (format && metadata.format != *format) return false;
    return matchesTags(metadata);
}

SearchResult::SearchResult(std::string chunkId, std::string content, ChunkMetadata metadata, double distance)
    : chunkId(std::move(chunkId)),
      content(std::move(content)),
      metadata(std::move(metadata)),
      distance(distance),
      similarityScore(1.0 - distance) {}

} // namespace groundwork
