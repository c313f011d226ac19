//CorpusSearcher.cpp
#include "CorpusSearcher.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include "groundwork/Errors.hpp"
#include "groundwork/algorithms/AttributeWeighting.hpp"
#include "groundwork/algorithms/ScoreFusion.hpp"

using json = nlohmann::json;

namespace groundwork {

CorpusSearcher::CorpusSearcher(std::shared_ptr<EmbeddingClient> embedder,
                               std::shared_ptr<VectorStore> store,
                               EngineConfig config)
    : embedder_(std::move(embedder)), store_(std::move(store)), config_(std::move(config)) {
    if (!embedder_) throw ConfigurationError("embedding client is required");
    if (!store_) throw ConfigurationError("vector store is required");
    config_.validate();
}

void CorpusSearcher::buildLexicalIndex(const std::vector<Chunk>& chunks) {
    auto built = std::make_shared<const LexicalIndex>(LexicalIndex::build(chunks));
    std::cerr << "CorpusSearcher: built lexical index chunks=" << built->documentCount()
              << " terms=" << built->termCount()
              << " avgDocLen=" << built->averageDocumentLength() << "\n";
    std::lock_guard<std::mutex> lk(indexMutex_);
    lexical_ = std::move(built);
}

bool CorpusSearcher::hasLexicalIndex() const {
    std::lock_guard<std::mutex> lk(indexMutex_);
    return lexical_ != nullptr;
}

std::shared_ptr<const LexicalIndex> CorpusSearcher::lexicalIndex() const {
    std::lock_guard<std::mutex> lk(indexMutex_);
    return lexical_;
}

TimePoint CorpusSearcher::now() const {
    return fixedNow_ ? *fixedNow_ : Clock::now();
}

std::vector<SearchResult> CorpusSearcher::toResults(const std::vector<VectorHit>& hits,
                                                    const std::optional<MetadataFilter>& filter,
                                                    std::size_t maxResults) const {
    std::vector<SearchResult> results;
    results.reserve(hits.size());
    for (const auto& h : hits) {
        // Stores are only trusted with the quality and format clauses.
        if (filter && !filter->matchesTags(h.metadata)) continue;
        results.emplace_back(h.chunkId, h.content, h.metadata, h.distance);
    }
    std::stable_sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        return a.similarityScore > b.similarityScore;
    });
    if (results.size() > maxResults) results.erase(results.begin() + static_cast<std::ptrdiff_t>(maxResults), results.end());
    return results;
}

std::vector<SearchResult> CorpusSearcher::search(const std::string& query,
                                                 std::size_t maxResults,
                                                 const std::optional<MetadataFilter>& filter) const {
    auto batch = searchBatch({query}, maxResults, filter);
    return std::move(batch.front());
}

std::vector<std::vector<SearchResult>> CorpusSearcher::searchBatch(const std::vector<std::string>& queries,
                                                                   std::size_t maxResults,
                                                                   const std::optional<MetadataFilter>& filter) const {
    if (queries.empty()) return {};
    const auto embeddings = embedder_->embed(queries);
    if (embeddings.size() != queries.size()) {
        throw std::runtime_error("embedding client returned " + std::to_string(embeddings.size()) +
                                 " vectors for " + std::to_string(queries.size()) + " texts");
    }

    std::vector<std::vector<SearchResult>> out;
    out.reserve(queries.size());
    for (const auto& embedding : embeddings) {
        if (maxResults == 0) {
            out.emplace_back();
            continue;
        }
        out.push_back(toResults(store_->query(embedding, filter, maxResults), filter, maxResults));
    }
    return out;
}

std::vector<SearchResult> CorpusSearcher::searchHybrid(const std::string& query,
                                                       std::size_t maxResults,
                                                       double semanticWeight,
                                                       double lexicalWeight,
                                                       const std::optional<MetadataFilter>& filter) const {
    const std::size_t pool = maxResults * kOverFetchFactor;
    auto dense = search(query, pool, filter);

    algo::LexicalScores lexical;
    if (auto idx = lexicalIndex()) {
        lexical = algo::normalizeScores(idx->search(query, pool));
    }
    return algo::fuseScores(std::move(dense), lexical, semanticWeight, lexicalWeight, maxResults);
}

std::vector<SearchResult> CorpusSearcher::searchHybrid(const std::string& query, std::size_t maxResults) const {
    return searchHybrid(query, maxResults, config_.search.semanticWeight, config_.search.lexicalWeight);
}

std::vector<SearchResult> CorpusSearcher::searchWithRecency(const std::string& query,
                                                            std::size_t maxResults,
                                                            double recencyWeight,
                                                            const std::optional<MetadataFilter>& filter) const {
    auto pool = search(query, maxResults * kOverFetchFactor, filter);
    return algo::applyRecencyWeights(std::move(pool), recencyWeight, maxResults, now(), config_.weighting);
}

std::vector<SearchResult> CorpusSearcher::searchWithQuality(const std::string& query,
                                                            std::size_t maxResults,
                                                            double qualityWeight,
                                                            const std::optional<MetadataFilter>& filter) const {
    auto pool = search(query, maxResults * kOverFetchFactor, filter);
    return algo::applyQualityWeights(std::move(pool), qualityWeight, maxResults, config_.weighting);
}

std::vector<SearchResult> CorpusSearcher::searchWithWeights(const std::string& query,
                                                            std::size_t maxResults,
                                                            double recencyWeight,
                                                            double qualityWeight,
                                                            const std::optional<MetadataFilter>& filter) const {
    auto pool = search(query, maxResults * kOverFetchFactor, filter);
    return algo::applyCombinedWeights(std::move(pool), recencyWeight, qualityWeight, maxResults, now(),
                                      config_.weighting);
}

std::vector<SearchResult> CorpusSearcher::searchWithWeights(const std::string& query, std::size_t maxResults) const {
    return searchWithWeights(query, maxResults, config_.search.recencyWeight, config_.search.qualityWeight);
}

json CorpusSearcher::stats() const {
    auto idx = lexicalIndex();
    json j{
        {"total_chunks", store_->count()},
        {"lexical_index", idx ? json{
            {"chunks", idx->documentCount()},
            {"terms", idx->termCount()},
            {"avg_doc_len", idx->averageDocumentLength()}
        } : json(nullptr)},
        {"config", config_.toJson()}
    };
    return j;
}

} // namespace groundwork
