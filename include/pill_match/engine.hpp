#pragma once

/// @file engine.hpp
/// @brief Identification pipeline: barcode shortcut, aggregation, ranking

#include <pill_match/config.hpp>
#include <pill_match/scorer.hpp>
#include <pill_match/types.hpp>

#include <vector>

namespace pill_match {

/// @brief Checks caller-supplied signals
///
/// @throws ValidationError if a recognized-text confidence is NaN or
///         outside [0, 1]
void validate(const QuerySignals& signals);

/// @brief Checks a candidate set
///
/// @throws ValidationError if a record id is blank or appears twice
void validate(const std::vector<Record>& candidates);

/// @brief Identifies medications from query signals
///
/// The engine holds only its configuration. Every call works on its own
/// inputs, so one instance can serve concurrent requests.
class Engine {
public:
    /// @throws ConfigError if @p config is invalid
    explicit Engine(MatchConfig config = default_config());

    [[nodiscard]] const MatchConfig& config() const { return config_; }

    /// @brief Runs the full pipeline and returns scored candidates
    ///
    /// If the signals carry an external code that a candidate shares, that
    /// candidate is returned alone at score 1.0. Otherwise the signals are
    /// aggregated into query terms and the candidates are ranked.
    ///
    /// The returned entries point into @p candidates.
    ///
    /// @throws ValidationError on malformed signals or candidates
    [[nodiscard]] std::vector<ScoredCandidate> identify_scored(
        const QuerySignals& signals, const std::vector<Record>& candidates) const;

    /// @brief Runs the full pipeline and returns the matching records, best first
    [[nodiscard]] std::vector<Record> identify(
        const QuerySignals& signals, const std::vector<Record>& candidates) const;

    /// @brief Scores one record with this engine's configuration
    [[nodiscard]] double score(const QueryTerms& query_terms, const Record& record) const;

    /// @brief Explains the score of one record
    [[nodiscard]] ScoreBreakdown explain(const QueryTerms& query_terms, const Record& record) const;

private:
    MatchConfig config_;
};

/// @brief identify() with the default configuration
[[nodiscard]] std::vector<Record> identify(
    const QuerySignals& signals, const std::vector<Record>& candidates);

}  // namespace pill_match
