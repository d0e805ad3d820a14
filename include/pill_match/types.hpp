#pragma once

/// @file types.hpp
/// @brief Core data types for the pill_match library

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace pill_match {

/// @brief Dominant pill color reported by a color classifier
enum class PillColor {
    White,
    Yellow,
    Orange,
    Red,
    Pink,
    Blue,
    Green,
    Purple,
    Brown,
    Gray,
    Black,
    Multicolor
};

/// @brief Pill outline reported by a shape classifier
enum class PillShape {
    Round,
    Oval,
    Capsule,
    Oblong,
    Rectangle,
    Triangle,
    Diamond,
    Pentagon,
    Hexagon,
    Octagon,
    Other
};

/// @brief Canonical lowercase label for a color (e.g. "white")
[[nodiscard]] std::string to_string(PillColor color);

/// @brief Canonical lowercase label for a shape (e.g. "capsule")
[[nodiscard]] std::string to_string(PillShape shape);

/// @brief Parses a color label, ignoring case and surrounding whitespace
[[nodiscard]] std::optional<PillColor> parse_pill_color(std::string_view label);

/// @brief Parses a shape label, ignoring case and surrounding whitespace
[[nodiscard]] std::optional<PillShape> parse_pill_shape(std::string_view label);

/// @brief Every color, in declaration order
[[nodiscard]] const std::vector<PillColor>& all_pill_colors();

/// @brief Every shape, in declaration order
[[nodiscard]] const std::vector<PillShape>& all_pill_shapes();

/// @brief Serialization for PillColor and PillShape (canonical labels)
void to_json(nlohmann::json& j, const PillColor& c);
void from_json(const nlohmann::json& j, PillColor& c);
void to_json(nlohmann::json& j, const PillShape& s);
void from_json(const nlohmann::json& j, PillShape& s);

/// @brief Optional descriptive data attached to a medication record
struct MedicationMetadata {
    /// Generic or scientific name
    std::optional<std::string> generic_name;
    /// Brand names the medication is sold under
    std::vector<std::string> brand_names;
    /// Active ingredient
    std::optional<std::string> active_ingredient;
    /// Dosage amount as printed (e.g. "500mg")
    std::optional<std::string> dosage_amount;
    std::optional<PillColor> pill_color;
    std::optional<PillShape> pill_shape;
    /// Exact-match identifier such as an NDC barcode payload
    std::optional<std::string> external_code;
    /// Free-text notes, never used for matching
    std::optional<std::string> notes;
};

/// @brief Serialization for MedicationMetadata
void to_json(nlohmann::json& j, const MedicationMetadata& m);
void from_json(const nlohmann::json& j, MedicationMetadata& m);

/// @brief A stored medication entry
///
/// The metadata is the only source of truth for matching; searchable terms
/// are derived from it on demand (see extract_terms()).
struct Record {
    /// Unique, immutable identifier (typically a UUID string)
    std::string id;
    /// Display name
    std::string name;
    /// Extended metadata, if the user provided any
    std::optional<MedicationMetadata> metadata;

    /// Returns the external code, or nullptr if there is none
    [[nodiscard]] const std::string* external_code() const {
        if (metadata && metadata->external_code) {
            return &*metadata->external_code;
        }
        return nullptr;
    }
};

/// @brief Serialization for Record
void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

/// @brief A text fragment produced by a text recognizer
struct RecognizedText {
    std::string text;
    /// Recognizer confidence in [0, 1], if reported
    std::optional<double> confidence;
};

/// @brief Serialization for RecognizedText
void to_json(nlohmann::json& j, const RecognizedText& t);
void from_json(const nlohmann::json& j, RecognizedText& t);

/// @brief Evidence captured for a single identification request
struct QuerySignals {
    /// Text recognized in the image
    std::vector<RecognizedText> recognized_text;
    /// Semantic labels from an image classifier
    std::vector<std::string> labels;
    /// Detected pill color
    std::optional<PillColor> color;
    /// Detected pill shape
    std::optional<PillShape> shape;
    /// Decoded barcode payload
    std::optional<std::string> external_code;
    /// Terms suggested by a language model
    std::vector<std::string> ai_terms;
};

/// @brief Serialization for QuerySignals
void to_json(nlohmann::json& j, const QuerySignals& s);
void from_json(const nlohmann::json& j, QuerySignals& s);

/// @brief Normalized, deduplicated query terms
using QueryTerms = std::vector<std::string>;

/// @brief A candidate paired with its relevance score
///
/// Only valid while the candidate vector it points into is alive.
struct ScoredCandidate {
    /// The scored record
    const Record* record = nullptr;
    /// Relevance score in [0, 1]
    double score = 0.0;
    /// Position of the record in the candidate set (tie-break key)
    std::size_t index = 0;
};

}  // namespace pill_match
