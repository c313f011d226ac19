//CorpusSearcher.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "groundwork/Collaborators.hpp"
#include "groundwork/Config.hpp"
#include "groundwork/LexicalIndex.hpp"
#include "groundwork/Types.hpp"

namespace groundwork {

// Semantic, lexical and attribute-weighted retrieval over one corpus snapshot.
// The embedding client and vector store are owned by the caller and shared in.
class CorpusSearcher {
public:
    // Weighted variants pull this many times the requested count before re-ranking.
    static constexpr std::size_t kOverFetchFactor = 3;

    CorpusSearcher(std::shared_ptr<EmbeddingClient> embedder,
                   std::shared_ptr<VectorStore> store,
                   EngineConfig config = EngineConfig{});

    // Builds a new BM25 index and publishes it; searches in flight keep the old one.
    void buildLexicalIndex(const std::vector<Chunk>& chunks);
    bool hasLexicalIndex() const;
    std::shared_ptr<const LexicalIndex> lexicalIndex() const;

    // Plain dense search ordered by similarity.
    std::vector<SearchResult> search(const std::string& query,
                                     std::size_t maxResults = 10,
                                     const std::optional<MetadataFilter>& filter = std::nullopt) const;

    // One embedding call for every query; one list per query, in input order.
    std::vector<std::vector<SearchResult>> searchBatch(const std::vector<std::string>& queries,
                                                       std::size_t maxResults = 10,
                                                       const std::optional<MetadataFilter>& filter = std::nullopt) const;

    // Dense + BM25 fusion. Without a lexical index this is pure semantic ranking.
    std::vector<SearchResult> searchHybrid(const std::string& query,
                                           std::size_t maxResults,
                                           double semanticWeight,
                                           double lexicalWeight,
                                           const std::optional<MetadataFilter>& filter = std::nullopt) const;
    std::vector<SearchResult> searchHybrid(const std::string& query, std::size_t maxResults = 10) const;

    std::vector<SearchResult> searchWithRecency(const std::string& query,
                                                std::size_t maxResults = 10,
                                                double recencyWeight = 0.3,
                                                const std::optional<MetadataFilter>& filter = std::nullopt) const;

    std::vector<SearchResult> searchWithQuality(const std::string& query,
                                                std::size_t maxResults = 10,
                                                double qualityWeight = 0.2,
                                                const std::optional<MetadataFilter>& filter = std::nullopt) const;

    std::vector<SearchResult> searchWithWeights(const std::string& query,
                                                std::size_t maxResults,
                                                double recencyWeight,
                                                double qualityWeight,
                                                const std::optional<MetadataFilter>& filter = std::nullopt) const;
    // Uses the configured recency and quality weights.
    std::vector<SearchResult> searchWithWeights(const std::string& query, std::size_t maxResults = 10) const;

    const EngineConfig& config() const { return config_; }
    nlohmann::json stats() const;

    // Fixes "now" for the recency stage; unset means the system clock.
    void setClock(std::optional<TimePoint> now) { fixedNow_ = now; }

private:
    std::shared_ptr<EmbeddingClient> embedder_;
    std::shared_ptr<VectorStore> store_;
    EngineConfig config_;
    std::optional<TimePoint> fixedNow_;

    mutable std::mutex indexMutex_;
    std::shared_ptr<const LexicalIndex> lexical_;

    TimePoint now() const;
    std::vector<SearchResult> toResults(const std::vector<VectorHit>& hits,
                                        const std::optional<MetadataFilter>& filter,
                                        std::size_t maxResults) const;
};

} // namespace groundwork
