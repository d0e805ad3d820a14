#include <pill_match/internal/normalization.hpp>
#include <pill_match/reference/common.hpp>

#include <algorithm>

namespace pill_match {
namespace reference {

namespace {

const std::vector<ReferenceMedication> kCommonMedications = {
    // Pain relief
    {"Aspirin", "Acetylsalicylic Acid", {"Bayer", "Bufferin", "Ecotrin"}, "Aspirin",
     {"81mg", "325mg", "500mg"}, MedicationCategory::PainRelief},
    {"Ibuprofen", std::nullopt, {"Advil", "Motrin", "Nurofen"}, "Ibuprofen",
     {"200mg", "400mg", "600mg", "800mg"}, MedicationCategory::PainRelief},
    {"Acetaminophen", std::nullopt, {"Tylenol", "Paracetamol"}, "Acetaminophen",
     {"325mg", "500mg", "650mg"}, MedicationCategory::PainRelief},

    // Vitamins
    {"Vitamin D", "Cholecalciferol", {"Vitamin D3"}, "Vitamin D3",
     {"1000 IU", "2000 IU", "5000 IU"}, MedicationCategory::Vitamin},
    {"Multivitamin", std::nullopt, {"Centrum", "One A Day", "Nature Made"}, "Mixed vitamins",
     {"Daily"}, MedicationCategory::Vitamin},
    {"Fish Oil", "Omega-3 Fatty Acids", {"Nordic Naturals", "Nature Made"}, "EPA/DHA",
     {"1000mg", "1200mg"}, MedicationCategory::Vitamin},

    // Antibiotics
    {"Amoxicillin", std::nullopt, {"Amoxil", "Moxatag"}, "Amoxicillin",
     {"250mg", "500mg", "875mg"}, MedicationCategory::Antibiotic},

    // Allergy
    {"Cetirizine", std::nullopt, {"Zyrtec", "Alleroff"}, "Cetirizine",
     {"5mg", "10mg"}, MedicationCategory::Allergy},
    {"Loratadine", std::nullopt, {"Claritin", "Alavert"}, "Loratadine",
     {"10mg"}, MedicationCategory::Allergy},
};

bool contains(std::string_view haystack, std::string_view needle) {
    return normalization::normalize_term(haystack).find(needle) != std::string::npos;
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return normalization::normalize_term(text).rfind(prefix, 0) == 0;
}

}  // namespace

std::string to_string(MedicationCategory category) {
    switch (category) {
    case MedicationCategory::PainRelief:
        return "Pain Relief";
    case MedicationCategory::Antibiotic:
        return "Antibiotic";
    case MedicationCategory::Vitamin:
        return "Vitamin";
    case MedicationCategory::HeartHealth:
        return "Heart Health";
    case MedicationCategory::Diabetes:
        return "Diabetes";
    case MedicationCategory::MentalHealth:
        return "Mental Health";
    case MedicationCategory::Allergy:
        return "Allergy";
    case MedicationCategory::Other:
        return "Other";
    }
    return "Other";
}

const std::vector<ReferenceMedication>& common_medications() {
    return kCommonMedications;
}

std::optional<ReferenceMedication> find_reference(std::string_view term) {
    const std::string needle = normalization::normalize_term(term);
    if (needle.empty()) {
        return std::nullopt;
    }

    for (const auto& med : kCommonMedications) {
        const bool brand_hit = std::any_of(
            med.brand_names.begin(), med.brand_names.end(),
            [&needle](const std::string& brand) { return contains(brand, needle); });
        if (contains(med.name, needle) || (med.generic_name && contains(*med.generic_name, needle)) ||
            brand_hit || contains(med.active_ingredient, needle)) {
            return med;
        }
    }
    return std::nullopt;
}

std::vector<ReferenceMedication> reference_suggestions(std::string_view term, std::size_t limit) {
    const std::string prefix = normalization::normalize_term(term);
    std::vector<ReferenceMedication> suggestions;
    if (prefix.empty() || limit == 0) {
        return suggestions;
    }

    for (const auto& med : kCommonMedications) {
        const bool brand_hit = std::any_of(
            med.brand_names.begin(), med.brand_names.end(),
            [&prefix](const std::string& brand) { return starts_with(brand, prefix); });
        if (starts_with(med.name, prefix) ||
            (med.generic_name && starts_with(*med.generic_name, prefix)) || brand_hit) {
            suggestions.push_back(med);
            if (suggestions.size() >= limit) break;
        }
    }
    return suggestions;
}

MedicationMetadata to_metadata(const ReferenceMedication& medication) {
    MedicationMetadata metadata;
    metadata.generic_name = medication.generic_name;
    metadata.brand_names = medication.brand_names;
    metadata.active_ingredient = medication.active_ingredient;
    if (!medication.common_dosages.empty()) {
        metadata.dosage_amount = medication.common_dosages.front();
    }
    return metadata;
}

}  // namespace reference
}  // namespace pill_match
