#include <pill_match/errors.hpp>
#include <pill_match/internal/normalization.hpp>
#include <pill_match/types.hpp>

#include <array>
#include <utility>

namespace pill_match {

namespace {

const std::array<std::pair<PillColor, std::string_view>, 12> kColorLabels = {{
    {PillColor::White, "white"},
    {PillColor::Yellow, "yellow"},
    {PillColor::Orange, "orange"},
    {PillColor::Red, "red"},
    {PillColor::Pink, "pink"},
    {PillColor::Blue, "blue"},
    {PillColor::Green, "green"},
    {PillColor::Purple, "purple"},
    {PillColor::Brown, "brown"},
    {PillColor::Gray, "gray"},
    {PillColor::Black, "black"},
    {PillColor::Multicolor, "multicolor"},
}};

const std::array<std::pair<PillShape, std::string_view>, 11> kShapeLabels = {{
    {PillShape::Round, "round"},
    {PillShape::Oval, "oval"},
    {PillShape::Capsule, "capsule"},
    {PillShape::Oblong, "oblong"},
    {PillShape::Rectangle, "rectangle"},
    {PillShape::Triangle, "triangle"},
    {PillShape::Diamond, "diamond"},
    {PillShape::Pentagon, "pentagon"},
    {PillShape::Hexagon, "hexagon"},
    {PillShape::Octagon, "octagon"},
    {PillShape::Other, "other"},
}};

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

}  // namespace

std::string to_string(PillColor color) {
    for (const auto& [value, label] : kColorLabels) {
        if (value == color) return std::string(label);
    }
    return "unknown";
}

std::string to_string(PillShape shape) {
    for (const auto& [value, label] : kShapeLabels) {
        if (value == shape) return std::string(label);
    }
    return "unknown";
}

std::optional<PillColor> parse_pill_color(std::string_view label) {
    const std::string key = normalization::normalize_term(label);
    for (const auto& [value, name] : kColorLabels) {
        if (name == key) return value;
    }
    // Accept the British spelling recognizers sometimes emit
    if (key == "grey") return PillColor::Gray;
    return std::nullopt;
}

std::optional<PillShape> parse_pill_shape(std::string_view label) {
    const std::string key = normalization::normalize_term(label);
    for (const auto& [value, name] : kShapeLabels) {
        if (name == key) return value;
    }
    return std::nullopt;
}

const std::vector<PillColor>& all_pill_colors() {
    static const std::vector<PillColor> colors = [] {
        std::vector<PillColor> out;
        for (const auto& entry : kColorLabels) out.push_back(entry.first);
        return out;
    }();
    return colors;
}

const std::vector<PillShape>& all_pill_shapes() {
    static const std::vector<PillShape> shapes = [] {
        std::vector<PillShape> out;
        for (const auto& entry : kShapeLabels) out.push_back(entry.first);
        return out;
    }();
    return shapes;
}

// Enum serialization
void to_json(nlohmann::json& j, const PillColor& c) { j = to_string(c); }

void from_json(const nlohmann::json& j, PillColor& c) {
    const auto label = j.get<std::string>();
    auto parsed = parse_pill_color(label);
    if (!parsed) {
        throw ValidationError("pill_color", "unknown color '" + label + "'");
    }
    c = *parsed;
}

void to_json(nlohmann::json& j, const PillShape& s) { j = to_string(s); }

void from_json(const nlohmann::json& j, PillShape& s) {
    const auto label = j.get<std::string>();
    auto parsed = parse_pill_shape(label);
    if (!parsed) {
        throw ValidationError("pill_shape", "unknown shape '" + label + "'");
    }
    s = *parsed;
}

// MedicationMetadata serialization
void to_json(nlohmann::json& j, const MedicationMetadata& m) {
    j = nlohmann::json::object();
    put_optional(j, "generic_name", m.generic_name);
    if (!m.brand_names.empty()) j["brand_names"] = m.brand_names;
    put_optional(j, "active_ingredient", m.active_ingredient);
    put_optional(j, "dosage_amount", m.dosage_amount);
    put_optional(j, "pill_color", m.pill_color);
    put_optional(j, "pill_shape", m.pill_shape);
    put_optional(j, "external_code", m.external_code);
    put_optional(j, "notes", m.notes);
}

void from_json(const nlohmann::json& j, MedicationMetadata& m) {
    get_optional(j, "generic_name", m.generic_name);
    if (j.contains("brand_names")) j.at("brand_names").get_to(m.brand_names);
    get_optional(j, "active_ingredient", m.active_ingredient);
    get_optional(j, "dosage_amount", m.dosage_amount);
    get_optional(j, "pill_color", m.pill_color);
    get_optional(j, "pill_shape", m.pill_shape);
    get_optional(j, "external_code", m.external_code);
    get_optional(j, "notes", m.notes);
}

// Record serialization
void to_json(nlohmann::json& j, const Record& r) {
    j = nlohmann::json{{"id", r.id}, {"name", r.name}};
    if (r.metadata) {
        j["metadata"] = *r.metadata;
    }
}

void from_json(const nlohmann::json& j, Record& r) {
    j.at("id").get_to(r.id);
    j.at("name").get_to(r.name);
    get_optional(j, "metadata", r.metadata);
}

// RecognizedText serialization
void to_json(nlohmann::json& j, const RecognizedText& t) {
    j = nlohmann::json{{"text", t.text}};
    put_optional(j, "confidence", t.confidence);
}

void from_json(const nlohmann::json& j, RecognizedText& t) {
    if (j.is_string()) {
        t.text = j.get<std::string>();
        return;
    }
    j.at("text").get_to(t.text);
    get_optional(j, "confidence", t.confidence);
}

// QuerySignals serialization
void to_json(nlohmann::json& j, const QuerySignals& s) {
    j = nlohmann::json::object();
    if (!s.recognized_text.empty()) j["recognized_text"] = s.recognized_text;
    if (!s.labels.empty()) j["labels"] = s.labels;
    put_optional(j, "color", s.color);
    put_optional(j, "shape", s.shape);
    put_optional(j, "external_code", s.external_code);
    if (!s.ai_terms.empty()) j["ai_terms"] = s.ai_terms;
}

void from_json(const nlohmann::json& j, QuerySignals& s) {
    if (j.contains("recognized_text")) j.at("recognized_text").get_to(s.recognized_text);
    if (j.contains("labels")) j.at("labels").get_to(s.labels);
    get_optional(j, "color", s.color);
    get_optional(j, "shape", s.shape);
    get_optional(j, "external_code", s.external_code);
    if (j.contains("ai_terms")) j.at("ai_terms").get_to(s.ai_terms);
}

}  // namespace pill_match
