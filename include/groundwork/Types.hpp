#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace groundwork {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Embedding = std::vector<float>;

// Curator-assigned tier, ordered from least to most trusted.
enum class QualityRating { Deprecated = 0, Supplemental = 1, Reference = 2, Preferred = 3 };

const char* toString(QualityRating rating);

// Unknown names fall back to Reference.
QualityRating parseQualityRating(const std::string& name);

// Accepts YYYY-MM-DD and YYYY-MM-DDTHH:MM:SS (UTC, optional trailing Z).
std::optional<TimePoint> parseIsoDate(const std::string& text);
std::string formatIsoDate(const TimePoint& tp);

// Splits a comma-separated tag string; entries are trimmed and lowercased.
std::vector<std::string> parseTags(const std::string& text);

struct ChunkMetadata {
    std::string documentId;
    QualityRating quality = QualityRating::Reference;
    std::vector<std::string> tags;
    std::string format;
    std::optional<TimePoint> createdDate;
    std::optional<TimePoint> modifiedDate;
    std::string filename;
};

// Immutable unit of indexed text.
struct Chunk {
    std::string id;
    std::string content;
    std::string documentId;
    ChunkMetadata metadata;
};

// Conjunction over quality, format and tag membership; unset clauses match everything.
struct MetadataFilter {
    std::optional<QualityRating> quality;
    std::optional<std::string> format;
    std::vector<std::string> tags; // any-of

    bool empty() const { return !quality && !format && tags.empty(); }
    bool matches(const ChunkMetadata& metadata) const;
    bool matchesTags(const ChunkMetadata& metadata) const;
};

class SearchResult {
public:
    SearchResult(std::string chunkId, std::string content, ChunkMetadata metadata, double distance);

    std::string chunkId;
    std::string content;
    ChunkMetadata metadata;
    double distance;
    // Always 1 - distance; negative when distance exceeds 1.
    double similarityScore;

    std::optional<double> recencyScore;
    std::optional<double> qualityScore;
    std::optional<double> combinedScore;
    std::optional<double> lexicalScore;
    std::optional<double> hybridScore;
};

} // namespace groundwork
