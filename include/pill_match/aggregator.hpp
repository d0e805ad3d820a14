#pragma once

/// @file aggregator.hpp
/// @brief Merges heterogeneous query signals into one term list

#include <pill_match/config.hpp>
#include <pill_match/types.hpp>

namespace pill_match {

/// @brief Builds the query term list for a request
///
/// Terms are collected in this order: recognized text, dosage fragments
/// (only with config.extract_dosages), labels, AI-suggested terms, the
/// detected color label and the detected shape label. Every term is trimmed
/// and lowercased; blank terms and repeats are dropped, keeping the first
/// occurrence. Recognized text reported below config.min_text_confidence is
/// skipped. The external code is not a term.
///
/// @param signals Evidence for one identification request
/// @param config Supplies the confidence filter and dosage extraction flag
/// @return Normalized, deduplicated query terms
[[nodiscard]] QueryTerms aggregate_signals(const QuerySignals& signals, const MatchConfig& config = {});

}  // namespace pill_match
