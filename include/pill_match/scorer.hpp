#pragma once

/// @file scorer.hpp
/// @brief Relevance scoring of a record against query terms

#include <pill_match/config.hpp>
#include <pill_match/terms.hpp>
#include <pill_match/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace pill_match {

/// @brief How a single query term matched a record
enum class MatchTier {
    Exact,    ///< Equal to a record term
    Partial,  ///< Substring of a record term, or the reverse
    Fuzzy,    ///< Within the edit distance cutoff of a non-blank record term
    None      ///< No match
};

/// @brief Converts MatchTier to string
[[nodiscard]] std::string to_string(MatchTier tier);

/// @brief Classifies one normalized query term against a record's terms
///
/// Tiers are tried in the order exact, partial, fuzzy and the first one that
/// matches wins.
///
/// @param query Normalized query term
/// @param record_terms Terms from extract_terms()
/// @param config Supplies the fuzzy edit distance cutoff
/// @param matched_term If not null, receives the record term that matched
[[nodiscard]] MatchTier classify_term(
    std::string_view query,
    const TermSet& record_terms,
    const MatchConfig& config = {},
    std::string* matched_term = nullptr);

/// @brief Returns the configured contribution of a tier
[[nodiscard]] double tier_weight(MatchTier tier, const TierWeights& weights);

/// @brief Computes the relevance of a record for a list of query terms
///
/// Query terms are normalized and deduplicated first. Each term contributes
/// the weight of its tier; the sum is divided by the number of query terms.
/// An empty query scores 0.
///
/// @return Score in [0, 1]
[[nodiscard]] double score(
    const QueryTerms& query_terms, const TermSet& record_terms, const MatchConfig& config = {});

/// @brief score() for terms already passed through normalization::normalize_terms()
[[nodiscard]] double score_normalized(
    const QueryTerms& normalized_terms, const TermSet& record_terms, const MatchConfig& config);

/// @brief Convenience overload that extracts the record's terms
[[nodiscard]] double score(
    const QueryTerms& query_terms, const Record& record, const MatchConfig& config = {});

/// @brief Match details for one query term
struct TermMatch {
    /// Normalized query term
    std::string query_term;
    MatchTier tier = MatchTier::None;
    /// Record term that produced the match, empty for MatchTier::None
    std::string matched_term;
    /// Contribution before division by the query term count
    double contribution = 0.0;
    /// Diagnostic similarity to the matched term (0-1)
    double similarity = 0.0;
};

/// @brief Per-term explanation of a score
struct ScoreBreakdown {
    std::vector<TermMatch> terms;
    /// Same value score() returns for the same inputs
    double score = 0.0;
};

/// @brief Computes a score together with the tier of every query term
[[nodiscard]] ScoreBreakdown score_breakdown(
    const QueryTerms& query_terms, const TermSet& record_terms, const MatchConfig& config = {});

}  // namespace pill_match
