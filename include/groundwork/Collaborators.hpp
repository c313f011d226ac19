#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "groundwork/Types.hpp"

namespace groundwork {

// Computes embeddings. Must be deterministic within a session and return
// vectors in input order.
class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;
    virtual std::vector<Embedding> embed(const std::vector<std::string>& texts) = 0;
};

struct VectorHit {
    std::string chunkId;
    double distance;
    std::string content;
    ChunkMetadata metadata;
};

// Dense retrieval boundary. Distances are non-negative, conventionally ascending.
class VectorStore {
public:
    virtual ~VectorStore() = default;
    virtual std::vector<VectorHit> query(const Embedding& embedding,
                                         const std::optional<MetadataFilter>& filter,
                                         std::size_t n) const = 0;
    virtual std::size_t count() const = 0;
};

} // namespace groundwork
