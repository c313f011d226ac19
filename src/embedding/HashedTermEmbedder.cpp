#include "groundwork/HashedTermEmbedder.hpp"

#include <cmath>
#include <unordered_map>
#include "groundwork/Analyzer.hpp"
#include "groundwork/Checksum.hpp"
#include "groundwork/Errors.hpp"

namespace groundwork {

HashedTermEmbedder::HashedTermEmbedder(std::size_t dimensions) : dimensions_(dimensions) {
    if (dimensions_ == 0) throw ConfigurationError("embedding dimensions must be positive");
}

std::vector<Embedding> HashedTermEmbedder::embed(const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) out.push_back(embedOne(text));
    return out;
}

Embedding HashedTermEmbedder::embedOne(const std::string& text) const {
    std::unordered_map<std::string, uint32_t> tf;
    for (const auto& t : Analyzer::tokenize(text)) ++tf[t];

    std::vector<double> acc(dimensions_, 0.0);
    for (const auto& kv : tf) {
        const uint32_t h = crc32(kv.first);
        // Sign comes from the top hash bit.
        const double sign = (h & 0x80000000u) ? -1.0 : 1.0;
        acc[h % dimensions_] += sign * (1.0 + std::log(static_cast<double>(kv.second)));
    }

    double normSq = 0.0;
    for (double v : acc) normSq += v * v;
    const double n = std::sqrt(normSq);

    Embedding vec(dimensions_, 0.0f);
    if (n == 0.0) return vec;
    for (std::size_t i = 0; i < dimensions_; ++i) vec[i] = static_cast<float>(acc[i] / n);
    return vec;
}

} // namespace groundwork
