#include "groundwork/Config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "groundwork/Analyzer.hpp"
#include "groundwork/Errors.hpp"

using json = nlohmann::json;

namespace groundwork {

namespace {

double requireNumber(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number()) throw ConfigurationError(std::string("'") + key + "' must be a number");
    return v.get<double>();
}

template <typename Parse>
void envOverride(const char* name, Parse parse) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    try {
        parse(std::string(raw));
        std::cerr << "EngineConfig: " << name << "=" << raw << "\n";
    } catch (const std::exception& e) {
        std::cerr << "EngineConfig: ignoring " << name << "=" << raw << " (" << e.what() << ")\n";
    }
}

} // namespace

double QualityWeights::multiplier(QualityRating rating) const {
    switch (rating) {
        case QualityRating::Preferred: return preferred;
        case QualityRating::Reference: return reference;
        case QualityRating::Supplemental: return supplemental;
        case QualityRating::Deprecated: return deprecated;
    }
    return reference;
}

double QualityWeights::maxMultiplier() const {
    return std::max({preferred, reference, supplemental, deprecated});
}

double WeightingConfig::tagBoost(const std::string& tag) const {
    auto it = tagBoosts.find(Analyzer::toLower(tag));
    return it != tagBoosts.end() ? it->second : 1.0;
}

EngineConfig EngineConfig::fromJson(const json& j) {
    if (!j.is_object()) throw ConfigurationError("config root must be an object");
    EngineConfig cfg;

    if (j.contains("quality_weights")) {
        const auto& qw = j.at("quality_weights");
        if (!qw.is_object()) throw ConfigurationError("'quality_weights' must be an object");
        for (auto it = qw.begin(); it != qw.end(); ++it) {
            if (!it.value().is_number()) {
                throw ConfigurationError("quality weight '" + it.key() + "' must be a number");
            }
            const double w = it.value().get<double>();
            const auto tier = Analyzer::toLower(it.key());
            if (tier == "preferred") cfg.weighting.qualityWeights.preferred = w;
            else if (tier == "reference") cfg.weighting.qualityWeights.reference = w;
            else if (tier == "supplemental") cfg.weighting.qualityWeights.supplemental = w;
            else if (tier == "deprecated") cfg.weighting.qualityWeights.deprecated = w;
            else throw ConfigurationError("unknown quality tier '" + it.key() + "'");
        }
    }
    if (j.contains("recency_decay")) {
        cfg.weighting.recencyDecay = requireNumber(j, "recency_decay");
    }
    if (j.contains("tag_boosts")) {
        const auto& tb = j.at("tag_boosts");
        if (!tb.is_object()) throw ConfigurationError("'tag_boosts' must be an object");
        for (auto it = tb.begin(); it != tb.end(); ++it) {
            if (!it.value().is_number()) {
                throw ConfigurationError("tag boost '" + it.key() + "' must be a number");
            }
            cfg.weighting.tagBoosts[Analyzer::toLower(it.key())] = it.value().get<double>();
        }
    }
    if (j.contains("search")) {
        const auto& s = j.at("search");
        if (!s.is_object()) throw ConfigurationError("'search' must be an object");
        if (s.contains("semantic_weight")) cfg.search.semanticWeight = requireNumber(s, "semantic_weight");
        if (s.contains("lexical_weight")) cfg.search.lexicalWeight = requireNumber(s, "lexical_weight");
        if (s.contains("recency_weight")) cfg.search.recencyWeight = requireNumber(s, "recency_weight");
        if (s.contains("quality_weight")) cfg.search.qualityWeight = requireNumber(s, "quality_weight");
        if (s.contains("min_coverage_sources")) {
            const auto& v = s.at("min_coverage_sources");
            if (!v.is_number_integer() || v.get<long long>() < 0) {
                throw ConfigurationError("'min_coverage_sources' must be a non-negative integer");
            }
            cfg.search.minCoverageSources = v.get<std::size_t>();
        }
    }

    cfg.validate();
    return cfg;
}

EngineConfig EngineConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open config file " + path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigurationError("config file " + path + " is not valid JSON");
    auto cfg = fromJson(j);
    std::cerr << "EngineConfig: loaded " << path << "\n";
    return cfg;
}

void EngineConfig::applyEnvironment() {
    envOverride("GROUNDWORK_RECENCY_DECAY", [this](const std::string& v) {
        const double d = std::stod(v);
        if (d < 0.0) throw std::invalid_argument("negative decay");
        weighting.recencyDecay = d;
    });
    envOverride("GROUNDWORK_MIN_SOURCES", [this](const std::string& v) {
        const long long n = std::stoll(v);
        if (n < 0) throw std::invalid_argument("negative source count");
        search.minCoverageSources = static_cast<std::size_t>(n);
    });
    envOverride("GROUNDWORK_SEMANTIC_WEIGHT", [this](const std::string& v) {
        const double w = std::stod(v);
        if (!std::isfinite(w)) throw std::invalid_argument("non-finite weight");
        search.semanticWeight = w;
    });
    envOverride("GROUNDWORK_LEXICAL_WEIGHT", [this](const std::string& v) {
        const double w = std::stod(v);
        if (!std::isfinite(w)) throw std::invalid_argument("non-finite weight");
        search.lexicalWeight = w;
    });
}

void EngineConfig::validate() const {
    const auto& w = weighting;
    if (!std::isfinite(w.recencyDecay) || w.recencyDecay < 0.0) {
        throw ConfigurationError("recency_decay must be a non-negative number");
    }
    const std::pair<const char*, double> tiers[] = {
        {"preferred", w.qualityWeights.preferred},
        {"reference", w.qualityWeights.reference},
        {"supplemental", w.qualityWeights.supplemental},
        {"deprecated", w.qualityWeights.deprecated},
    };
    for (const auto& tier : tiers) {
        if (!std::isfinite(tier.second) || tier.second <= 0.0) {
            throw ConfigurationError(std::string("quality weight '") + tier.first + "' must be positive");
        }
    }
    const std::pair<const char*, double> searchWeights[] = {
        {"semantic_weight", search.semanticWeight},
        {"lexical_weight", search.lexicalWeight},
        {"recency_weight", search.recencyWeight},
        {"quality_weight", search.qualityWeight},
    };
    for (const auto& sw : searchWeights) {
        if (!std::isfinite(sw.second)) {
            throw ConfigurationError(std::string("search weight '") + sw.first + "' must be finite");
        }
    }
    for (const auto& kv : w.tagBoosts) {
        if (!std::isfinite(kv.second) || kv.second < 0.0) {
            throw ConfigurationError("tag boost '" + kv.first + "' must be non-negative");
        }
    }
}

json EngineConfig::toJson() const {
    json boosts = json::object();
    for (const auto& kv : weighting.tagBoosts) boosts[kv.first] = kv.second;
    return json{
        {"quality_weights", {
            {"preferred", weighting.qualityWeights.preferred},
            {"reference", weighting.qualityWeights.reference},
            {"supplemental", weighting.qualityWeights.supplemental},
            {"deprecated", weighting.qualityWeights.deprecated}
        }},
        {"recency_decay", weighting.recencyDecay},
        {"tag_boosts", boosts},
        {"search", {
            {"semantic_weight", search.semanticWeight},
            {"lexical_weight", search.lexicalWeight},
            {"recency_weight", search.recencyWeight},
            {"quality_weight", search.qualityWeight},
            {"min_coverage_sources", search.minCoverageSources}
        }}
    };
}

} // namespace groundwork
