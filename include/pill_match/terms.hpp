#pragma once

/// @file terms.hpp
/// @brief Derives searchable terms from a medication record

#include <pill_match/types.hpp>

#include <string>
#include <vector>

namespace pill_match {

/// @brief Normalized searchable terms of a record
///
/// Ordered and free of duplicates. The first element is always the
/// normalized display name.
using TermSet = std::vector<std::string>;

/// @brief Extracts the searchable terms of a record
///
/// Collects the display name and, when metadata is present, the generic
/// name, every brand name, the active ingredient, the dosage amount, and the
/// canonical color and shape labels. Absent fields contribute nothing and
/// notes are never included. Terms are trimmed and lowercased; duplicates
/// are dropped, keeping the first occurrence.
///
/// The result is recomputed on every call and never cached.
[[nodiscard]] TermSet extract_terms(const Record& record);

}  // namespace pill_match
