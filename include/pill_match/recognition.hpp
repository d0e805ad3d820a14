#pragma once

/// @file recognition.hpp
/// @brief Heuristics over text produced by a text recognizer

#include <pill_match/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pill_match {
namespace recognition {

/// @brief Extracts the first dosage fragment from recognized text
///
/// Matches a number followed by a unit (mg, mcg, g, ml, IU, unit, units),
/// optionally separated by one whitespace character. The match is
/// case-insensitive and returned verbatim, e.g. "Aspirin 500mg" -> "500mg".
///
/// @param text Recognized text
/// @return The dosage fragment, or std::nullopt if there is none
[[nodiscard]] std::optional<std::string> extract_dosage(std::string_view text);

/// @brief Checks whether recognized text looks like a medication name
///
/// True when the text contains an uppercase letter, has more letters than
/// digits, and has at most three words.
[[nodiscard]] bool looks_like_medication_name(std::string_view text);

/// @brief Returns the texts that look like medication names, in order
[[nodiscard]] std::vector<std::string> medication_name_candidates(
    const std::vector<RecognizedText>& texts);

/// @brief Returns the dosage fragments found in the texts, in order
[[nodiscard]] std::vector<std::string> dosage_candidates(const std::vector<RecognizedText>& texts);

}  // namespace recognition
}  // namespace pill_match
