#include "groundwork/JsonCodec.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace groundwork {

namespace {

std::optional<TimePoint> readDate(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) {
        std::cerr << "JsonCodec: " << key << " is not a string; treating as missing\n";
        return std::nullopt;
    }
    const auto raw = j.at(key).get<std::string>();
    if (raw.empty()) return std::nullopt;
    auto parsed = parseIsoDate(raw);
    if (!parsed) std::cerr << "JsonCodec: unparseable " << key << " '" << raw << "'; treating as missing\n";
    return parsed;
}

json writeDate(const std::optional<TimePoint>& tp) {
    return tp ? json(formatIsoDate(*tp)) : json(nullptr);
}

} // namespace

void to_json(json& j, const ChunkMetadata& m) {
    j = json{
        {"document_id", m.documentId},
        {"quality_rating", toString(m.quality)},
        {"tags", m.tags},
        {"format", m.format},
        {"created_date", writeDate(m.createdDate)},
        {"modified_date", writeDate(m.modifiedDate)},
        {"filename", m.filename}
    };
}

void from_json(const json& j, ChunkMetadata& m) {
    m.documentId = j.value("document_id", "");
    m.quality = parseQualityRating(j.value("quality_rating", "reference"));
    m.tags.clear();
    if (j.contains("tags")) {
        const auto& t = j.at("tags");
        if (t.is_string()) {
            m.tags = parseTags(t.get<std::string>());
        } else if (t.is_array()) {
            for (const auto& e : t) {
                if (e.is_string()) {
                    auto parsed = parseTags(e.get<std::string>());
                    m.tags.insert(m.tags.end(), parsed.begin(), parsed.end());
                }
            }
        }
    }
    m.format = j.value("format", "");
    m.createdDate = readDate(j, "created_date");
    m.modifiedDate = readDate(j, "modified_date");
    m.filename = j.value("filename", "");
}

void to_json(json& j, const Chunk& c) {
    j = json{{"id", c.id}, {"content", c.content}, {"document_id", c.documentId}, {"metadata", c.metadata}};
}

void from_json(const json& j, Chunk& c) {
    c.id = j.at("id").get<std::string>();
    c.content = j.value("content", "");
    c.documentId = j.value("document_id", "");
    c.metadata = j.contains("metadata") ? j.at("metadata").get<ChunkMetadata>() : ChunkMetadata{};
    if (c.documentId.empty()) c.documentId = c.metadata.documentId;
    if (c.metadata.documentId.empty()) c.metadata.documentId = c.documentId;
}

void to_json(json& j, const MetadataFilter& f) {
    j = json::object();
    if (f.quality) j["quality_rating"] = toString(*f.quality);
    if (f.format) j["format"] = *f.format;
    if (!f.tags.empty()) j["tags"] = f.tags;
}

void from_json(const json& j, MetadataFilter& f) {
    f = MetadataFilter{};
    if (j.contains("quality_rating")) f.quality = parseQualityRating(j.at("quality_rating").get<std::string>());
    if (j.contains("format")) f.format = j.at("format").get<std::string>();
    if (j.contains("tags")) f.tags = j.at("tags").get<std::vector<std::string>>();
}

void to_json(json& j, const SearchResult& r) {
    auto opt = [](const std::optional<double>& v) { return v ? json(*v) : json(nullptr); };
    j = json{
        {"chunk_id", r.chunkId},
        {"content", r.content},
        {"metadata", r.metadata},
        {"distance", r.distance},
        {"similarity_score", r.similarityScore},
        {"recency_score", opt(r.recencyScore)},
        {"quality_score", opt(r.qualityScore)},
        {"combined_score", opt(r.combinedScore)},
        {"lexical_score", opt(r.lexicalScore)},
        {"hybrid_score", opt(r.hybridScore)}
    };
}

void to_json(json& j, const OutlineSection& s) {
    j = json{
        {"title", s.title},
        {"description", s.description},
        {"coverage_pct", s.coveragePct},
        {"source_count", s.sourceCount},
        {"notes", s.notes},
        {"subsections", s.subsections}
    };
}

void from_json(const json& j, OutlineSection& s) {
    s.title = j.at("title").get<std::string>();
    s.description = j.value("description", "");
    s.coveragePct = j.value("coverage_pct", 0.0);
    s.sourceCount = j.value("source_count", static_cast<std::size_t>(0));
    s.notes = j.value("notes", "");
    s.subsections = j.value("subsections", std::vector<OutlineSection>{});
}

void to_json(json& j, const Outline& o) {
    j = json{
        {"title", o.title},
        {"thesis", o.thesis},
        {"keywords", o.keywords},
        {"sections", o.sections},
        {"validation_notes", o.validationNotes},
        {"rejected", o.rejected},
        {"avg_coverage", o.avgCoverage},
        {"low_coverage_sections", o.lowCoverageSections},
        {"section_count", o.sectionCount}
    };
}

void from_json(const json& j, Outline& o) {
    o.title = j.value("title", "");
    o.thesis = j.value("thesis", "");
    o.keywords = j.value("keywords", std::vector<std::string>{});
    o.sections = j.value("sections", std::vector<OutlineSection>{});
    o.validationNotes = j.value("validation_notes", "");
    o.rejected = j.value("rejected", false);
    o.calculateStats();
}

std::vector<Chunk> loadChunks(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open corpus file " + path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw std::runtime_error("corpus file " + path + " is not valid JSON");
    const json& list = j.is_object() ? j.at("chunks") : j;
    if (!list.is_array()) throw std::runtime_error("corpus file " + path + " has no chunk array");
    return list.get<std::vector<Chunk>>();
}

} // namespace groundwork
