#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "CorpusSearcher.hpp"

// Dispatches JSON requests against one loaded corpus and wraps every answer in
// a {"status": ...} envelope.
class CorpusRequestHandler {
public:
    CorpusRequestHandler(std::vector<groundwork::Chunk> chunks, groundwork::EngineConfig config);

    nlohmann::json handle(const nlohmann::json& request) const;

private:
    nlohmann::json handleSearch(const nlohmann::json& request) const;
    nlohmann::json handleHybrid(const nlohmann::json& request) const;
    nlohmann::json handleWeighted(const nlohmann::json& request) const;
    nlohmann::json handleBatch(const nlohmann::json& request) const;
    nlohmann::json handleOutline(const nlohmann::json& request) const;

    std::shared_ptr<groundwork::CorpusSearcher> searcher_;
};
