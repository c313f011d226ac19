#include "groundwork/algorithms/AttributeWeighting.hpp"

#include <algorithm>
#include <chrono>

namespace groundwork::algo {

namespace {

constexpr double kDaysPerYear = 365.0;
constexpr double kSecondsPerDay = 86400.0;

void sortAndTruncate(std::vector<SearchResult>& results, std::size_t maxResults) {
    std::stable_sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        return *a.combinedScore > *b.combinedScore;
    });
    if (results.size() > maxResults) results.erase(results.begin() + static_cast<std::ptrdiff_t>(maxResults), results.end());
}

} // namespace

RecencyScore RecencyScore::fromDate(const std::optional<TimePoint>& created, TimePoint now, double decayRate) {
    if (!created) return unknown();
    const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *created).count();
    const double ageYears = static_cast<double>(age) / kSecondsPerDay / kDaysPerYear;
    RecencyScore r;
    r.kind = Kind::Known;
    r.score = std::clamp(1.0 - ageYears * decayRate, 0.0, 1.0);
    return r;
}

double recencyScore(const std::optional<TimePoint>& created, TimePoint now, double decayRate) {
    return RecencyScore::fromDate(created, now, decayRate).value();
}

double qualityScore(QualityRating rating, const QualityWeights& weights) {
    const double top = weights.maxMultiplier();
    if (top <= 0.0) return 0.0;
    return std::clamp(weights.multiplier(rating) / top, 0.0, 1.0);
}

double combinedScore(double similarity, double recency, double quality,
                     double recencyWeight, double qualityWeight) {
    const double similarityWeight = 1.0 - recencyWeight - qualityWeight;
    return similarityWeight * similarity + recencyWeight * recency + qualityWeight * quality;
}

std::vector<SearchResult> applyRecencyWeights(std::vector<SearchResult> results,
                                              double recencyWeight,
                                              std::size_t maxResults,
                                              TimePoint now,
                                              const WeightingConfig& config) {
    for (auto& r : results) {
        const double rec = recencyScore(r.metadata.createdDate, now, config.recencyDecay);
        r.recencyScore = rec;
        r.combinedScore = combinedScore(r.similarityScore, rec, 0.0, recencyWeight, 0.0);
    }
    sortAndTruncate(results, maxResults);
    return results;
}

std::vector<SearchResult> applyQualityWeights(std::vector<SearchResult> results,
                                              double qualityWeight,
                                              std::size_t maxResults,
                                              const WeightingConfig& config) {
    for (auto& r : results) {
        const double q = qualityScore(r.metadata.quality, config.qualityWeights);
        r.qualityScore = q;
        r.combinedScore = combinedScore(r.similarityScore, 0.0, q, 0.0, qualityWeight);
    }
    sortAndTruncate(results, maxResults);
    return results;
}

std::vector<SearchResult> applyCombinedWeights(std::vector<SearchResult> results,
                                               double recencyWeight,
                                               double qualityWeight,
                                               std::size_t maxResults,
                                               TimePoint now,
                                               const WeightingConfig& config) {
    for (auto& r : results) {
        const double rec = recencyScore(r.metadata.createdDate, now, config.recencyDecay);
        const double q = qualityScore(r.metadata.quality, config.qualityWeights);
        r.recencyScore = rec;
        r.qualityScore = q;
        r.combinedScore = combinedScore(r.similarityScore, rec, q, recencyWeight, qualityWeight);
    }
    sortAndTruncate(results, maxResults);
    return results;
}

} // namespace groundwork::algo
