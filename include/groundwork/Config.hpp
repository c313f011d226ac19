#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "groundwork/Types.hpp"

namespace groundwork {

// Multipliers for the closed set of quality tiers.
struct QualityWeights {
    double preferred = 1.5;
    double reference = 1.0;
    double supplemental = 0.7;
    double deprecated = 0.3;

    double multiplier(QualityRating rating) const;
    double maxMultiplier() const;
};

struct WeightingConfig {
    QualityWeights qualityWeights;
    double recencyDecay = 0.1; // score lost per year of age
    std::unordered_map<std::string, double> tagBoosts;

    // Configured boost for a tag, 1.0 when none is configured.
    double tagBoost(const std::string& tag) const;
};

struct SearchDefaults {
    double semanticWeight = 0.7;
    double lexicalWeight = 0.3;
    double recencyWeight = 0.2;
    double qualityWeight = 0.1;
    std::size_t minCoverageSources = 3;
};

struct EngineConfig {
    WeightingConfig weighting;
    SearchDefaults search;

    // Throws ConfigurationError on malformed input; validates before returning.
    static EngineConfig fromJson(const nlohmann::json& j);
    static EngineConfig fromFile(const std::string& path);

    // GROUNDWORK_* overrides; malformed values are logged and ignored.
    void applyEnvironment();

    void validate() const;
    nlohmann::json toJson() const;
};

} // namespace groundwork
