#pragma once

/// @file normalization.hpp
/// @brief Text normalization applied to every term before comparison

#include <string>
#include <string_view>
#include <vector>

namespace pill_match {
namespace normalization {

/// @brief Normalizes a term for comparison
///
/// Performs the following transformations:
/// - Trims surrounding whitespace
/// - Converts to lowercase (full Unicode case mapping when built with ICU)
///
/// Inner whitespace and punctuation are preserved, so "500 mg" and "500mg"
/// remain distinct terms.
///
/// @param term The raw term
/// @return The normalized term, possibly empty
[[nodiscard]] std::string normalize_term(std::string_view term);

/// @brief Normalizes every term, dropping empty results and duplicates
///
/// The first occurrence of each normalized term keeps its position.
[[nodiscard]] std::vector<std::string> normalize_terms(const std::vector<std::string>& terms);

/// @brief Decodes UTF-8 into Unicode scalar values
///
/// Malformed sequences decode to U+FFFD so that distance computations
/// stay total.
[[nodiscard]] std::u32string to_code_points(std::string_view utf8);

/// @brief Checks if a string contains non-ASCII characters
[[nodiscard]] bool has_non_ascii(std::string_view str);

/// @brief Trims ASCII whitespace from both ends
[[nodiscard]] std::string trim(std::string_view str);

}  // namespace normalization
}  // namespace pill_match
