#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "groundwork/Types.hpp"

namespace groundwork {

struct LexicalHit {
    std::string chunkId;
    double score;
};

struct LexicalIndexParams {
    double k1 = 1.5;
    double b = 0.75;
};

// BM25 index over chunk text. Built once per corpus snapshot, read-only after.
class LexicalIndex {
public:
    using Params = LexicalIndexParams;

    LexicalIndex() = default;
    explicit LexicalIndex(Params params) : params_(params) {}

    // Consumes the full chunk set; the same input always yields the same statistics.
    static LexicalIndex build(const std::vector<Chunk>& chunks, Params params = Params{});

    // Up to n chunks by descending BM25 score; equal scores keep insertion order.
    std::vector<LexicalHit> search(const std::string& query, std::size_t n) const;

    std::size_t documentCount() const { return chunkIds_.size(); }
    std::size_t termCount() const { return postings_.size(); }
    std::size_t documentFrequency(const std::string& term) const;
    double averageDocumentLength() const { return avgDocLen_; }
    const Params& params() const { return params_; }

private:
    struct Posting {
        uint32_t doc; // ordinal in chunkIds_
        uint32_t tf;
    };

    Params params_;
    std::vector<std::string> chunkIds_;
    std::vector<uint32_t> docLengths_;
    std::unordered_map<std::string, std::vector<Posting>> postings_;
    double avgDocLen_ = 0.0;

    void addDocument(const Chunk& chunk);
    void refreshAverages();
};

} // namespace groundwork
