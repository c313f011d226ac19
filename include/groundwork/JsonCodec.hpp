#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "groundwork/Outline.hpp"
#include "groundwork/Types.hpp"

namespace groundwork {

void to_json(nlohmann::json& j, const ChunkMetadata& m);
void from_json(const nlohmann::json& j, ChunkMetadata& m);

void to_json(nlohmann::json& j, const Chunk& c);
void from_json(const nlohmann::json& j, Chunk& c);

void to_json(nlohmann::json& j, const MetadataFilter& f);
void from_json(const nlohmann::json& j, MetadataFilter& f);

void to_json(nlohmann::json& j, const SearchResult& r);

void to_json(nlohmann::json& j, const OutlineSection& s);
void from_json(const nlohmann::json& j, OutlineSection& s);

void to_json(nlohmann::json& j, const Outline& o);
void from_json(const nlohmann::json& j, Outline& o);

// Reads {"chunks": [...]} or a bare array of chunks. Throws std::runtime_error.
std::vector<Chunk> loadChunks(const std::string& path);

} // namespace groundwork
