#pragma once

#include <cstddef>
#include "groundwork/Collaborators.hpp"

namespace groundwork {

// Local stand-in for a sentence-embedding model: analyzer tokens hashed into a
// fixed number of buckets, log-scaled term frequency, L2-normalized. Identical
// text always yields an identical vector.
class HashedTermEmbedder : public EmbeddingClient {
public:
    explicit HashedTermEmbedder(std::size_t dimensions = 256);

    std::vector<Embedding> embed(const std::vector<std::string>& texts) override;

    std::size_t dimensions() const { return dimensions_; }

private:
    std::size_t dimensions_;

    Embedding embedOne(const std::string& text) const;
};

} // namespace groundwork
