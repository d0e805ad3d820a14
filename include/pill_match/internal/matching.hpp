#pragma once

/// @file matching.hpp
/// @brief String matching primitives used by the relevance scorer

#include <cstddef>
#include <string>
#include <string_view>

namespace pill_match {
namespace matching {

/// @brief Default maximum edit distance accepted by the fuzzy tier
constexpr std::size_t kDefaultMaxEditDistance = 2;

/// @brief Calculates the Levenshtein distance between two strings
///
/// Counts the minimum number of single-character insertions, deletions or
/// substitutions turning @p a into @p b. Characters are Unicode scalar values
/// decoded from UTF-8, so "é" counts as one character. The comparison is
/// case-sensitive; callers normalize first.
///
/// @param a First string (UTF-8)
/// @param b Second string (UTF-8)
/// @return The edit distance; the length of the other string if one is empty
[[nodiscard]] std::size_t edit_distance(std::string_view a, std::string_view b);

/// @brief Levenshtein distance over already decoded scalar values
[[nodiscard]] std::size_t edit_distance(std::u32string_view a, std::u32string_view b);

/// @brief Returns true if edit_distance(a, b) <= max_distance
[[nodiscard]] bool within_distance(std::string_view a, std::string_view b, std::size_t max_distance);

/// @brief Returns true if either string contains the other
///
/// Empty strings never match partially.
[[nodiscard]] bool is_partial_match(std::string_view a, std::string_view b);

/// @brief Normalized similarity between two strings
///
/// Returns a value between 0 and 1, where 1 indicates identical strings.
/// Used for diagnostics only; ranking never depends on it.
[[nodiscard]] double similarity(std::string_view a, std::string_view b);

}  // namespace matching
}  // namespace pill_match
