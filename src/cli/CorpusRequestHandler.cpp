#include "CorpusRequestHandler.hpp"

#include <iostream>
#include "groundwork/CoverageAnalyzer.hpp"
#include "groundwork/Errors.hpp"
#include "groundwork/GroundingValidator.hpp"
#include "groundwork/HashedTermEmbedder.hpp"
#include "groundwork/InMemoryVectorStore.hpp"
#include "groundwork/JsonCodec.hpp"
#include "groundwork/QueryPlanner.hpp"

using json = nlohmann::json;
using namespace groundwork;

namespace {

json ok(const json& data) {
    return json{
        {"status", "ok"},
        {"data", data}
    };
}

json err(int code, const std::string& message) {
    return json{
        {"status", "error"},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

std::optional<MetadataFilter> filterFrom(const json& request) {
    if (!request.contains("filter") || request.at("filter").is_null()) return std::nullopt;
    return request.at("filter").get<MetadataFilter>();
}

} // namespace

CorpusRequestHandler::CorpusRequestHandler(std::vector<Chunk> chunks, EngineConfig config) {
    auto embedder = std::make_shared<HashedTermEmbedder>();
    auto store = std::make_shared<InMemoryVectorStore>();

    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& c : chunks) texts.push_back(c.content);
    const auto embeddings = embedder->embed(texts);
    for (size_t i = 0; i < chunks.size(); ++i) store->add(chunks[i], embeddings[i]);

    searcher_ = std::make_shared<CorpusSearcher>(embedder, store, std::move(config));
    searcher_->buildLexicalIndex(chunks);
    std::cerr << "CorpusRequestHandler: loaded chunks=" << store->count() << "\n";
}

json CorpusRequestHandler::handle(const json& request) const {
    if (!request.is_object()) return err(400, "request must be a JSON object");
    const auto mode = request.value("mode", "");
    try {
        if (mode == "search") return ok(handleSearch(request));
        if (mode == "hybrid") return ok(handleHybrid(request));
        if (mode == "weighted") return ok(handleWeighted(request));
        if (mode == "batch") return ok(handleBatch(request));
        if (mode == "outline") return ok(handleOutline(request));
        if (mode == "stats") return ok(searcher_->stats());
    } catch (const ConfigurationError& e) {
        return err(422, e.what());
    } catch (const json::exception& e) {
        return err(400, std::string("Invalid request: ") + e.what());
    }
    return err(400, "Unknown mode '" + mode + "'");
}

json CorpusRequestHandler::handleSearch(const json& request) const {
    const auto query = request.at("query").get<std::string>();
    const auto n = request.value("n_results", static_cast<size_t>(10));
    return searcher_->search(query, n, filterFrom(request));
}

json CorpusRequestHandler::handleHybrid(const json& request) const {
    const auto& defaults = searcher_->config().search;
    const auto query = request.at("query").get<std::string>();
    const auto n = request.value("n_results", static_cast<size_t>(10));
    return searcher_->searchHybrid(query, n,
                                   request.value("semantic_weight", defaults.semanticWeight),
                                   request.value("lexical_weight", defaults.lexicalWeight),
                                   filterFrom(request));
}

json CorpusRequestHandler::handleWeighted(const json& request) const {
    const auto& defaults = searcher_->config().search;
    const auto query = request.at("query").get<std::string>();
    const auto n = request.value("n_results", static_cast<size_t>(10));
    return searcher_->searchWithWeights(query, n,
                                        request.value("recency_weight", defaults.recencyWeight),
                                        request.value("quality_weight", defaults.qualityWeight),
                                        filterFrom(request));
}

json CorpusRequestHandler::handleBatch(const json& request) const {
    const auto queries = request.at("queries").get<std::vector<std::string>>();
    const auto n = request.value("n_results", static_cast<size_t>(10));
    return searcher_->searchBatch(queries, n, filterFrom(request));
}

json CorpusRequestHandler::handleOutline(const json& request) const {
    Outline outline = request.at("outline").get<Outline>();
    if (request.contains("keywords")) outline.keywords = request.at("keywords").get<std::vector<std::string>>();

    const auto searcher = searcher_;
    QueryFn retrieve = [searcher](const std::string& q, size_t n) { return searcher->search(q, n); };

    // Sections are optional; without them the outline is derived from the corpus.
    if (outline.sections.empty()) {
        const auto queries = buildSearchQueries(outline.title, outline.keywords, outline.thesis);
        outline.sections = sectionsFromResults(collectUniqueResults(queries, retrieve));
    }

    CoverageAnalyzer analyzer(retrieve, searcher_->config().search.minCoverageSources);
    analyzer.analyzeAll(outline.sections, outline.keywords);

    GroundingValidator validator;
    const auto summary = validator.validate(outline);
    return json{
        {"outline", outline},
        {"keyword_match_ratio", summary.match.ratio},
        {"pruned_sections", summary.pruned}
    };
}
