#pragma once

/// @file ranker.hpp
/// @brief Ranks a candidate set by relevance

#include <pill_match/config.hpp>
#include <pill_match/types.hpp>

#include <vector>

namespace pill_match {

/// @brief Scores, filters, sorts and truncates a candidate set
///
/// 1. Scores every candidate against the query terms.
/// 2. Drops candidates whose score is not strictly above
///    config.min_relevance.
/// 3. Sorts by descending score. Equal scores keep candidate-set order.
/// 4. Keeps at most config.max_results entries.
///
/// An empty candidate set or query yields an empty result. The returned
/// entries point into @p candidates, which must outlive them.
///
/// @param candidates Records to rank
/// @param query_terms Query terms (normalized internally)
/// @param config Thresholds, weights and parallelism
/// @return Ranked candidates, best first
[[nodiscard]] std::vector<ScoredCandidate> rank(
    const std::vector<Record>& candidates,
    const QueryTerms& query_terms,
    const MatchConfig& config = {});

/// @brief Extracts the records from ranked candidates, preserving order
[[nodiscard]] std::vector<Record> to_records(const std::vector<ScoredCandidate>& ranked);

}  // namespace pill_match
