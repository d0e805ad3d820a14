#pragma once

/// @file common.hpp
/// @brief Built-in table of common medications for lookup and suggestions

#include <pill_match/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pill_match {
namespace reference {

/// @brief Therapeutic category of a reference medication
enum class MedicationCategory {
    PainRelief,
    Antibiotic,
    Vitamin,
    HeartHealth,
    Diabetes,
    MentalHealth,
    Allergy,
    Other
};

/// @brief Display name of a category (e.g. "Pain Relief")
[[nodiscard]] std::string to_string(MedicationCategory category);

/// @brief A well-known medication
struct ReferenceMedication {
    std::string name;
    std::optional<std::string> generic_name;
    std::vector<std::string> brand_names;
    std::string active_ingredient;
    /// Dosages the medication is commonly sold in
    std::vector<std::string> common_dosages;
    MedicationCategory category = MedicationCategory::Other;
};

/// @brief Returns the built-in reference table
[[nodiscard]] const std::vector<ReferenceMedication>& common_medications();

/// @brief Finds the first entry whose name, generic name, brand names or
///        active ingredient contain @p term (case-insensitive)
[[nodiscard]] std::optional<ReferenceMedication> find_reference(std::string_view term);

/// @brief Returns entries whose name, generic name or a brand name starts
///        with @p term (case-insensitive), in table order
[[nodiscard]] std::vector<ReferenceMedication> reference_suggestions(
    std::string_view term, std::size_t limit = 5);

/// @brief Converts a reference entry into record metadata
///
/// The first common dosage, if any, becomes the dosage amount.
[[nodiscard]] MedicationMetadata to_metadata(const ReferenceMedication& medication);

}  // namespace reference
}  // namespace pill_match
