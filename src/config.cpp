#include <pill_match/config.hpp>
#include <pill_match/errors.hpp>

#include <cmath>
#include <string>

namespace pill_match {

namespace {

void require_unit_interval(const std::string& field, double value) {
    if (std::isnan(value) || value < 0.0 || value > 1.0) {
        throw ConfigError(field, "must be within [0, 1], got " + std::to_string(value));
    }
}

}  // namespace

MatchConfig default_config() {
    return MatchConfig{.min_relevance = 0.1,
                       .max_results = 10,
                       .max_edit_distance = 2,
                       .weights = TierWeights{.exact = 1.0, .partial = 0.5, .fuzzy = 0.3},
                       .min_text_confidence = 0.0,
                       .extract_dosages = false,
                       .parallel_threshold = 0,
                       .parallel_workers = 4};
}

void validate_config(const MatchConfig& config) {
    require_unit_interval("min_relevance", config.min_relevance);
    require_unit_interval("min_text_confidence", config.min_text_confidence);

    if (config.max_results == 0) {
        throw ConfigError("max_results", "must be positive");
    }

    // Scores must stay in [0, 1] and tiers must keep their order
    const auto& w = config.weights;
    require_unit_interval("weights.exact", w.exact);
    require_unit_interval("weights.partial", w.partial);
    require_unit_interval("weights.fuzzy", w.fuzzy);
    if (w.exact < w.partial || w.partial < w.fuzzy) {
        throw ConfigError("weights", "expected exact >= partial >= fuzzy");
    }

    if (config.parallel_threshold > 0 && config.parallel_workers == 0) {
        throw ConfigError("parallel_workers", "must be positive when parallel scoring is enabled");
    }
}

MatchConfig make_config(std::initializer_list<ConfigOption> options) {
    MatchConfig config = default_config();
    for (const auto& option : options) {
        option(config);
    }
    validate_config(config);
    return config;
}

void apply_options(MatchConfig& config, const std::vector<ConfigOption>& options) {
    for (const auto& option : options) {
        option(config);
    }
}

ConfigOption with_min_relevance(double threshold) {
    return [threshold](MatchConfig& c) { c.min_relevance = threshold; };
}

ConfigOption with_max_results(std::size_t max_results) {
    return [max_results](MatchConfig& c) { c.max_results = max_results; };
}

ConfigOption with_max_edit_distance(std::size_t distance) {
    return [distance](MatchConfig& c) { c.max_edit_distance = distance; };
}

ConfigOption with_tier_weights(double exact, double partial, double fuzzy) {
    return [=](MatchConfig& c) {
        c.weights.exact = exact;
        c.weights.partial = partial;
        c.weights.fuzzy = fuzzy;
    };
}

ConfigOption with_min_text_confidence(double confidence) {
    return [confidence](MatchConfig& c) { c.min_text_confidence = confidence; };
}

ConfigOption with_dosage_extraction(bool enabled) {
    return [enabled](MatchConfig& c) { c.extract_dosages = enabled; };
}

ConfigOption with_parallel_scoring(std::size_t threshold, std::size_t workers) {
    return [threshold, workers](MatchConfig& c) {
        c.parallel_threshold = threshold;
        c.parallel_workers = workers;
    };
}

}  // namespace pill_match
