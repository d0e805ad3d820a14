#include <pill_match/recognition.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace pill_match {
namespace recognition {

namespace {

const std::regex kDosagePattern(R"(\d+\s?(mg|mcg|g|ml|iu|units?))", std::regex::icase);

constexpr std::size_t kMaxNameWords = 3;

}  // namespace

std::optional<std::string> extract_dosage(std::string_view text) {
    std::smatch match;
    std::string input(text);
    if (std::regex_search(input, match, kDosagePattern)) {
        return match[0].str();
    }
    return std::nullopt;
}

bool looks_like_medication_name(std::string_view text) {
    const bool has_upper = std::any_of(
        text.begin(), text.end(), [](unsigned char c) { return std::isupper(c) != 0; });
    const auto letters = std::count_if(
        text.begin(), text.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
    const auto digits = std::count_if(
        text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });

    std::istringstream words_stream{std::string(text)};
    std::size_t words = 0;
    std::string word;
    while (words_stream >> word) {
        ++words;
    }

    return has_upper && letters > digits && words <= kMaxNameWords;
}

std::vector<std::string> medication_name_candidates(const std::vector<RecognizedText>& texts) {
    std::vector<std::string> names;
    for (const auto& element : texts) {
        if (looks_like_medication_name(element.text)) {
            names.push_back(element.text);
        }
    }
    return names;
}

std::vector<std::string> dosage_candidates(const std::vector<RecognizedText>& texts) {
    std::vector<std::string> dosages;
    for (const auto& element : texts) {
        if (auto dosage = extract_dosage(element.text)) {
            dosages.push_back(std::move(*dosage));
        }
    }
    return dosages;
}

}  // namespace recognition
}  // namespace pill_match
