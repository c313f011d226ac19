#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "groundwork/Collaborators.hpp"

namespace groundwork {

// Brute-force cosine-distance store over chunks held in memory.
class InMemoryVectorStore : public VectorStore {
public:
    explicit InMemoryVectorStore(std::string collection = "groundwork_corpus");

    // Replaces an existing entry with the same chunk id.
    void add(const Chunk& chunk, Embedding embedding);

    std::vector<VectorHit> query(const Embedding& embedding,
                                 const std::optional<MetadataFilter>& filter,
                                 std::size_t n) const override;

    std::size_t count() const override { return entries_.size(); }
    const std::string& collection() const { return collection_; }

private:
    struct Entry {
        Chunk chunk;
        Embedding embedding;
        double norm;
    };

    std::string collection_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
};

// Looks a collection up by name; throws ConfigurationError when it does not exist.
class VectorStoreRegistry {
public:
    void registerStore(const std::string& name, std::shared_ptr<VectorStore> store);
    std::shared_ptr<VectorStore> get(const std::string& name) const;
    bool contains(const std::string& name) const { return stores_.count(name) > 0; }

private:
    std::unordered_map<std::string, std::shared_ptr<VectorStore>> stores_;
};

} // namespace groundwork
