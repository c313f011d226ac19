#include "groundwork/InMemoryVectorStore.hpp"

#include <algorithm>
#include <cmath>
#include "groundwork/Errors.hpp"

namespace groundwork {

namespace {

double dot(const Embedding& a, const Embedding& b) {
    double s = 0.0;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) s += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    return s;
}

double norm(const Embedding& a) {
    double s = 0.0;
    for (auto v : a) s += static_cast<double>(v) * static_cast<double>(v);
    return std::sqrt(s);
}

} // namespace

InMemoryVectorStore::InMemoryVectorStore(std::string collection) : collection_(std::move(collection)) {}

void InMemoryVectorStore::add(const Chunk& chunk, Embedding embedding) {
    const double n = norm(embedding);
    auto it = positions_.find(chunk.id);
    if (it != positions_.end()) {
        entries_[it->second] = Entry{chunk, std::move(embedding), n};
        return;
    }
    positions_[chunk.id] = entries_.size();
    entries_.push_back(Entry{chunk, std::move(embedding), n});
}

std::vector<VectorHit> InMemoryVectorStore::query(const Embedding& embedding,
                                                  const std::optional<MetadataFilter>& filter,
                                                  std::size_t n) const {
    if (n == 0 || entries_.empty()) return {};
    const double qn = norm(embedding);

    std::vector<VectorHit> hits;
    hits.reserve(entries_.size());
    for (const auto& e : entries_) {
        if (filter && !filter->matches(e.chunk.metadata)) continue;
        if (e.embedding.size() != embedding.size()) continue;
        // A zero vector has no direction; treat it as orthogonal.
        const double denom = qn * e.norm;
        const double cosine = denom > 0.0 ? dot(embedding, e.embedding) / denom : 0.0;
        hits.push_back({e.chunk.id, std::max(0.0, 1.0 - cosine), e.chunk.content, e.chunk.metadata});
    }

    std::stable_sort(hits.begin(), hits.end(), [](const VectorHit& a, const VectorHit& b) {
        return a.distance < b.distance;
    });
    if (hits.size() > n) hits.resize(n);
    return hits;
}

void VectorStoreRegistry::registerStore(const std::string& name, std::shared_ptr<VectorStore> store) {
    stores_[name] = std::move(store);
}

std::shared_ptr<VectorStore> VectorStoreRegistry::get(const std::string& name) const {
    auto it = stores_.find(name);
    if (it == stores_.end()) throw ConfigurationError("collection '" + name + "' not found");
    return it->second;
}

} // namespace groundwork
