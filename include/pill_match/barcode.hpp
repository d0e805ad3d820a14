#pragma once

/// @file barcode.hpp
/// @brief Exact external-code lookup that bypasses scoring

#include <pill_match/types.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace pill_match {

/// @brief Finds the record whose external code equals @p code
///
/// Surrounding whitespace is trimmed from both codes; the comparison is
/// otherwise exact and case-sensitive. The first matching candidate wins.
///
/// @return The match at score 1.0, or std::nullopt if @p code is blank or
///         no candidate carries it
[[nodiscard]] std::optional<ScoredCandidate> find_by_external_code(
    std::string_view code, const std::vector<Record>& candidates);

/// @brief Applies find_by_external_code() to the code carried by @p signals
[[nodiscard]] std::optional<ScoredCandidate> barcode_shortcut(
    const QuerySignals& signals, const std::vector<Record>& candidates);

}  // namespace pill_match
