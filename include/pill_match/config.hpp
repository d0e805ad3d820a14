#pragma once

/// @file config.hpp
/// @brief Configuration types for the pill_match library

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <vector>

namespace pill_match {

/// @brief Score contributed by a query term for each match tier
struct TierWeights {
    /// Query term equals a record term
    double exact = 1.0;
    /// One of the two contains the other
    double partial = 0.5;
    /// Within the configured edit distance
    double fuzzy = 0.3;
};

/// @brief Tunable parameters of the identification pipeline
struct MatchConfig {
    /// Candidates scoring at or below this value are discarded
    double min_relevance = 0.1;
    /// Maximum number of ranked results returned
    std::size_t max_results = 10;
    /// Largest edit distance still accepted by the fuzzy tier
    std::size_t max_edit_distance = 2;
    /// Per-tier contributions
    TierWeights weights;
    /// Recognized text below this confidence is dropped (0 keeps everything)
    double min_text_confidence = 0.0;
    /// Append dosage fragments found in recognized text as extra terms
    bool extract_dosages = false;
    /// Score candidates on worker threads once the candidate count reaches
    /// this value (0 = always sequential)
    std::size_t parallel_threshold = 0;
    /// Number of worker tasks used by parallel scoring
    std::size_t parallel_workers = 4;
};

/// @brief Returns a configuration with the documented defaults
[[nodiscard]] MatchConfig default_config();

/// @brief Throws ConfigError if any field is out of range
void validate_config(const MatchConfig& config);

/// @brief Functional option type for configuring the pipeline
using ConfigOption = std::function<void(MatchConfig&)>;

/// @brief Builds a configuration from the defaults plus the given options
///
/// The result is validated before it is returned.
[[nodiscard]] MatchConfig make_config(std::initializer_list<ConfigOption> options);

/// @brief Applies options in order to an existing configuration
void apply_options(MatchConfig& config, const std::vector<ConfigOption>& options);

/// @brief Sets the minimum relevance threshold (exclusive)
[[nodiscard]] ConfigOption with_min_relevance(double threshold);

/// @brief Sets the maximum number of results
[[nodiscard]] ConfigOption with_max_results(std::size_t max_results);

/// @brief Sets the fuzzy-tier edit distance cutoff (inclusive)
[[nodiscard]] ConfigOption with_max_edit_distance(std::size_t distance);

/// @brief Sets the tier weights
[[nodiscard]] ConfigOption with_tier_weights(double exact, double partial, double fuzzy);

/// @brief Drops recognized text reported below the given confidence
[[nodiscard]] ConfigOption with_min_text_confidence(double confidence);

/// @brief Enables dosage extraction from recognized text
[[nodiscard]] ConfigOption with_dosage_extraction(bool enabled = true);

/// @brief Enables parallel scoring for large candidate sets
[[nodiscard]] ConfigOption with_parallel_scoring(std::size_t threshold, std::size_t workers);

}  // namespace pill_match
