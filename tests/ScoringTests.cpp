#include <chrono>
#include <cmath>
#include <cstdlib>
#include <limits>
#include "groundwork/Config.hpp"
#include "groundwork/Errors.hpp"
#include "groundwork/algorithms/AttributeWeighting.hpp"
#include "groundwork/algorithms/ScoreFusion.hpp"
#include "TestSupport.hpp"

using namespace groundwork;
using testsupport::expect;
using testsupport::meta;
using testsupport::near;

static SearchResult result(const std::string& id, double distance, ChunkMetadata m = ChunkMetadata{}) {
    return SearchResult(id, "content " + id, std::move(m), distance);
}

static void testSimilarityInvariant() {
    for (double d : {0.0, 0.25, 0.9, 1.0, 1.4, 2.0}) {
        auto r = result("x", d);
        expect(r.similarityScore == 1.0 - d, "similarity is exactly 1 - distance");
    }
    expect(result("x", 1.4).similarityScore < 0.0, "similarity is not clamped");
    auto r = result("x", 0.2);
    expect(!r.hybridScore && !r.combinedScore && !r.recencyScore && !r.qualityScore, "derived scores start unset");
}

static void testNormalize() {
    expect(algo::normalizeScores({}).empty(), "empty input normalizes to {}");
    expect(algo::normalizeScores({{"a", 0.0}, {"b", 0.0}}).empty(), "all-zero input normalizes to {}");

    auto n = algo::normalizeScores({{"a", 4.0}, {"b", 2.0}, {"c", 1.0}});
    expect(n.size() == 3, "one entry per hit");
    expect(n["a"] == 1.0, "max maps to 1");
    expect(near(n["b"], 0.5) && near(n["c"], 0.25), "scores divided by max");
    for (const auto& kv : n) expect(kv.second >= 0.0 && kv.second <= 1.0, "normalized within [0,1]");
}

static void testFuse() {
    std::vector<SearchResult> dense = {result("a", 0.2), result("b", 0.3), result("c", 0.6)};

    auto fallback = algo::fuseScores(dense, {}, 0.7, 0.3, 10);
    expect(fallback.size() == 3, "fallback keeps all results");
    for (const auto& r : fallback) {
        expect(r.hybridScore && *r.hybridScore == r.similarityScore, "empty lexical map falls back to similarity");
    }
    expect(fallback[0].chunkId == "a", "fallback ordered by similarity");

    algo::LexicalScores lex{{"c", 1.0}, {"b", 0.5}};
    auto fused = algo::fuseScores(dense, lex, 0.7, 0.3, 2);
    expect(fused.size() == 2, "fused truncated to n");
    // a: 0.56, b: 0.49 + 0.15 = 0.64, c: 0.28 + 0.3 = 0.58
    expect(fused[0].chunkId == "b" && fused[1].chunkId == "c", "fused ordering by hybrid score");
    expect(near(*fused[0].hybridScore, 0.7 * 0.7 + 0.3 * 0.5), "hybrid formula");
    expect(near(*fused[0].lexicalScore, 0.5), "lexical score recorded");

    auto unweighted = algo::fuseScores(dense, lex, 2.0, 2.0, 3);
    expect(near(*unweighted[0].hybridScore, 2.0 * 0.4 + 2.0 * 1.0), "weights are not required to sum to 1");

    std::vector<SearchResult> tied = {result("first", 0.5), result("second", 0.5)};
    auto t = algo::fuseScores(tied, {{"zzz", 1.0}}, 0.5, 0.5, 2);
    expect(t[0].chunkId == "first" && t[1].chunkId == "second", "fuse ties keep input order");
}

static void testRecency() {
    const auto now = *parseIsoDate("2026-06-01");
    expect(algo::recencyScore(std::nullopt, now, 0.1) == 0.5, "missing date scores neutral 0.5");
    expect(algo::RecencyScore::unknown().value() == algo::RecencyScore::kUnknownValue, "unknown variant");
    expect(algo::recencyScore(now, now, 0.1) == 1.0, "today scores 1");
    expect(algo::recencyScore(*parseIsoDate("2027-01-01"), now, 0.1) == 1.0, "future dates clamp to 1");
    expect(algo::recencyScore(*parseIsoDate("1990-01-01"), now, 0.1) == 0.0, "very old clamps to 0");

    double previous = 1.0;
    for (int years = 0; years <= 12; ++years) {
        const auto created = now - std::chrono::hours(24 * 365 * years);
        const double s = algo::recencyScore(created, now, 0.1);
        expect(s >= 0.0 && s <= 1.0, "recency within [0,1]");
        expect(s <= previous, "recency non-increasing with age");
        previous = s;
    }
    const auto fiveYears = now - std::chrono::hours(24 * 365 * 5);
    expect(near(algo::recencyScore(fiveYears, now, 0.1), 0.5), "linear decay of 0.1 per year");
}

static void testQuality() {
    QualityWeights defaults;
    expect(algo::qualityScore(QualityRating::Preferred, defaults) == 1.0, "top tier scores 1.0");
    expect(near(algo::qualityScore(QualityRating::Reference, defaults), 1.0 / 1.5), "reference relative to max");
    expect(near(algo::qualityScore(QualityRating::Deprecated, defaults), 0.3 / 1.5), "deprecated relative to max");

    QualityWeights huge{150.0, 100.0, 70.0, 30.0};
    expect(algo::qualityScore(QualityRating::Preferred, huge) == 1.0, "top tier 1.0 regardless of magnitude");

    QualityWeights inverted{0.2, 0.5, 0.9, 3.0};
    expect(algo::qualityScore(QualityRating::Deprecated, inverted) == 1.0, "highest configured tier scores 1.0");
    expect(algo::qualityScore(QualityRating::Preferred, inverted) < 1.0, "other tiers below 1.0");
}

static void testCombined() {
    expect(near(algo::combinedScore(0.8, 0.5, 1.0, 0.2, 0.1), 0.7 * 0.8 + 0.2 * 0.5 + 0.1 * 1.0), "combined formula");
    const double inverted = algo::combinedScore(0.9, 0.0, 0.0, 0.8, 0.7);
    expect(near(inverted, -0.5 * 0.9), "negative similarity weight is preserved");
}

static void testWeightedSorts() {
    const auto now = *parseIsoDate("2026-06-01");
    WeightingConfig cfg;

    std::vector<SearchResult> pool = {
        result("old-preferred", 0.30, meta("d1", QualityRating::Preferred, "2010-01-01")),
        result("new-deprecated", 0.30, meta("d2", QualityRating::Deprecated, "2026-05-01")),
        result("undated", 0.10, meta("d3")),
    };

    auto byRecency = algo::applyRecencyWeights(pool, 0.9, 3, now, cfg);
    expect(byRecency[0].chunkId == "new-deprecated", "recency favours recent documents");
    expect(byRecency[0].recencyScore && !byRecency[0].qualityScore, "recency stage fills recency only");
    expect(*byRecency[1].recencyScore == 0.5 || *byRecency[2].recencyScore == 0.5, "undated scored neutral");

    auto byQuality = algo::applyQualityWeights(pool, 0.9, 2, cfg);
    expect(byQuality.size() == 2, "quality stage truncates");
    expect(byQuality[0].chunkId == "old-preferred", "quality favours preferred");

    auto combined = algo::applyCombinedWeights(pool, 0.2, 0.1, 3, now, cfg);
    for (size_t i = 1; i < combined.size(); ++i) {
        expect(*combined[i - 1].combinedScore >= *combined[i].combinedScore, "combined sorted descending");
    }

    std::vector<SearchResult> tied = {
        result("t1", 0.5, meta("d1")), result("t2", 0.5, meta("d2")), result("t3", 0.5, meta("d3")),
    };
    auto stable = algo::applyCombinedWeights(tied, 0.2, 0.1, 3, now, cfg);
    expect(stable[0].chunkId == "t1" && stable[1].chunkId == "t2" && stable[2].chunkId == "t3",
           "exact ties keep unweighted order");
}

static void testConfig() {
    EngineConfig defaults;
    defaults.validate();
    expect(defaults.weighting.tagBoost("anything") == 1.0, "unconfigured tag boost is 1.0");

    auto cfg = EngineConfig::fromJson(nlohmann::json{
        {"quality_weights", {{"preferred", 2.0}, {"deprecated", 0.1}}},
        {"recency_decay", 0.05},
        {"tag_boosts", {{"Leadership", 1.3}}},
        {"search", {{"semantic_weight", 0.6}, {"min_coverage_sources", 2}}}
    });
    expect(cfg.weighting.qualityWeights.preferred == 2.0, "preferred weight loaded");
    expect(cfg.weighting.qualityWeights.reference == 1.0, "unset tiers keep defaults");
    expect(cfg.weighting.recencyDecay == 0.05, "decay loaded");
    expect(near(cfg.weighting.tagBoost("leadership"), 1.3), "tag boosts are case-insensitive");
    expect(cfg.search.semanticWeight == 0.6 && cfg.search.minCoverageSources == 2, "search defaults loaded");
    expect(cfg.toJson()["recency_decay"].get<double>() == 0.05, "config echoes as json");

    bool threw = false;
    try {
        EngineConfig::fromJson(nlohmann::json{{"recency_decay", -0.1}});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "negative decay rate is a configuration error");

    threw = false;
    try {
        EngineConfig::fromJson(nlohmann::json{{"quality_weights", {{"gold", 2.0}}}});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "unknown quality tier is a configuration error");

    threw = false;
    try {
        EngineConfig bad;
        bad.weighting.qualityWeights.reference = 0.0;
        bad.validate();
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "non-positive multiplier is a configuration error");
}

static void testEnvironmentOverrides() {
    setenv("GROUNDWORK_MIN_SOURCES", "-1", 1);
    setenv("GROUNDWORK_SEMANTIC_WEIGHT", "nan", 1);
    setenv("GROUNDWORK_LEXICAL_WEIGHT", "0.4", 1);
    EngineConfig cfg;
    cfg.applyEnvironment();
    expect(cfg.search.minCoverageSources == 3, "negative source count from the environment is ignored");
    expect(cfg.search.semanticWeight == 0.7, "non-finite weight from the environment is ignored");
    expect(cfg.search.lexicalWeight == 0.4, "valid weight override applied");
    cfg.validate();

    setenv("GROUNDWORK_MIN_SOURCES", "5", 1);
    cfg.applyEnvironment();
    expect(cfg.search.minCoverageSources == 5, "source count override applied");
    unsetenv("GROUNDWORK_MIN_SOURCES");
    unsetenv("GROUNDWORK_SEMANTIC_WEIGHT");
    unsetenv("GROUNDWORK_LEXICAL_WEIGHT");

    for (double bad : {std::nan(""), std::numeric_limits<double>::infinity()}) {
        bool threw = false;
        try {
            EngineConfig c;
            c.search.semanticWeight = bad;
            c.validate();
        } catch (const ConfigurationError&) {
            threw = true;
        }
        expect(threw, "non-finite search weight is a configuration error");
    }

    EngineConfig unnormalized;
    unnormalized.search.semanticWeight = 2.0;
    unnormalized.search.lexicalWeight = -0.5;
    unnormalized.validate();
}

int main() {
    testSimilarityInvariant();
    testNormalize();
    testFuse();
    testRecency();
    testQuality();
    testCombined();
    testWeightedSorts();
    testConfig();
    testEnvironmentOverrides();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
