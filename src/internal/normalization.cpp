#include <pill_match/internal/normalization.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_set>

#ifdef PILL_MATCH_NO_ICU
// ASCII-only fallback without ICU
#else
#include <unicode/locid.h>
#include <unicode/unistr.h>
#endif

namespace pill_match {
namespace normalization {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

std::string to_lower_ascii(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

#ifdef PILL_MATCH_NO_ICU
// Decodes one UTF-8 sequence starting at pos, advancing pos past it
char32_t decode_utf8(std::string_view str, size_t& pos) {
    const auto lead = static_cast<unsigned char>(str[pos++]);
    if (lead < 0x80) return lead;

    int extra = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        return kReplacementChar;
    }

    for (int i = 0; i < extra; ++i) {
        if (pos >= str.size()) return kReplacementChar;
        const auto next = static_cast<unsigned char>(str[pos]);
        if ((next & 0xC0) != 0x80) return kReplacementChar;
        cp = (cp << 6) | (next & 0x3F);
        ++pos;
    }

    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return kReplacementChar;
    return cp;
}
#endif

}  // namespace

bool has_non_ascii(std::string_view str) {
    return std::any_of(
        str.begin(), str.end(), [](unsigned char c) { return c > 127; });
}

std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return "";
    const auto end = str.find_last_not_of(" \t\n\r\f\v");
    return std::string(str.substr(start, end - start + 1));
}

std::string normalize_term(std::string_view term) {
    if (!has_non_ascii(term)) {
        return to_lower_ascii(trim(term));
    }

#ifdef PILL_MATCH_NO_ICU
    // Non-ASCII bytes pass through unchanged
    return to_lower_ascii(trim(term));
#else
    icu::UnicodeString ustr =
        icu::UnicodeString::fromUTF8(icu::StringPiece(term.data(), static_cast<int32_t>(term.size())));
    ustr.trim();
    ustr.toLower(icu::Locale::getRoot());

    std::string result;
    ustr.toUTF8String(result);
    return result;
#endif
}

std::vector<std::string> normalize_terms(const std::vector<std::string>& terms) {
    std::vector<std::string> result;
    result.reserve(terms.size());
    std::unordered_set<std::string> seen;

    for (const auto& term : terms) {
        std::string normalized = normalize_term(term);
        if (normalized.empty()) continue;
        if (seen.insert(normalized).second) {
            result.push_back(std::move(normalized));
        }
    }
    return result;
}

std::u32string to_code_points(std::string_view utf8) {
    std::u32string result;
    result.reserve(utf8.size());

    if (!has_non_ascii(utf8)) {
        for (unsigned char c : utf8) {
            result.push_back(static_cast<char32_t>(c));
        }
        return result;
    }

#ifdef PILL_MATCH_NO_ICU
    size_t pos = 0;
    while (pos < utf8.size()) {
        result.push_back(decode_utf8(utf8, pos));
    }
#else
    // fromUTF8 maps ill-formed sequences to U+FFFD
    icu::UnicodeString ustr =
        icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        const UChar32 c = ustr.char32At(i);
        result.push_back(c < 0 ? kReplacementChar : static_cast<char32_t>(c));
    }
#endif
    return result;
}

}  // namespace normalization
}  // namespace pill_match
