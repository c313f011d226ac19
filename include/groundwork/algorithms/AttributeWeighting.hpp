#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "groundwork/Config.hpp"
#include "groundwork/Types.hpp"

namespace groundwork::algo {

// Recency of a document. Unknown (no creation date) scores a neutral 0.5.
struct RecencyScore {
    enum class Kind { Known, Unknown };
    static constexpr double kUnknownValue = 0.5;

    Kind kind = Kind::Unknown;
    double score = kUnknownValue;

    static RecencyScore unknown() { return RecencyScore{}; }
    static RecencyScore fromDate(const std::optional<TimePoint>& created, TimePoint now, double decayRate);

    double value() const { return kind == Kind::Known ? score : kUnknownValue; }
};

// max(0, 1 - ageYears * decayRate), clamped to [0,1].
double recencyScore(const std::optional<TimePoint>& created, TimePoint now, double decayRate);

// multiplier[rating] / max(multipliers), clamped to [0,1]. The top tier scores 1.0.
double qualityScore(QualityRating rating, const QualityWeights& weights);

// (1 - rw - qw) * similarity + rw * recency + qw * quality. A negative remainder is kept.
double combinedScore(double similarity, double recency, double quality,
                     double recencyWeight, double qualityWeight);

// Each variant fills the relevant score fields, stable-sorts descending by
// combinedScore and truncates to maxResults.
std::vector<SearchResult> applyRecencyWeights(std::vector<SearchResult> results,
                                              double recencyWeight,
                                              std::size_t maxResults,
                                              TimePoint now,
                                              const WeightingConfig& config);

std::vector<SearchResult> applyQualityWeights(std::vector<SearchResult> results,
                                              double qualityWeight,
                                              std::size_t maxResults,
                                              const WeightingConfig& config);

std::vector<SearchResult> applyCombinedWeights(std::vector<SearchResult> results,
                                               double recencyWeight,
                                               double qualityWeight,
                                               std::size_t maxResults,
                                               TimePoint now,
                                               const WeightingConfig& config);

} // namespace groundwork::algo
