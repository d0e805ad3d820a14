// Tests for term normalization
#include <gtest/gtest.h>

#include <pill_match/internal/normalization.hpp>

using namespace pill_match;
using namespace pill_match::normalization;

TEST(NormalizationTest, NormalizeTerm) {
    EXPECT_EQ(normalize_term("Aspirin"), "aspirin");
    EXPECT_EQ(normalize_term("  IBUPROFEN\t"), "ibuprofen");
    EXPECT_EQ(normalize_term("\nVitamin D3 \r"), "vitamin d3");
    EXPECT_EQ(normalize_term("500 MG"), "500 mg");
}

TEST(NormalizationTest, NormalizeTermKeepsInnerText) {
    // Inner whitespace and punctuation survive
    EXPECT_EQ(normalize_term("Omega-3  Fatty Acids"), "omega-3  fatty acids");
    EXPECT_EQ(normalize_term("EPA/DHA"), "epa/dha");
}

TEST(NormalizationTest, NormalizeTermEdgeCases) {
    EXPECT_EQ(normalize_term(""), "");
    EXPECT_EQ(normalize_term("   "), "");
    EXPECT_EQ(normalize_term("a"), "a");
}

#ifndef PILL_MATCH_NO_ICU
TEST(NormalizationTest, NormalizeTermUnicode) {
    EXPECT_EQ(normalize_term("PARACÉTAMOL"), "paracétamol");
    EXPECT_EQ(normalize_term("  ÄSPIRIN "), "äspirin");
}
#endif

TEST(NormalizationTest, NormalizeTermsDeduplicates) {
    auto result = normalize_terms({"Advil", "advil ", "", "  ", "Motrin", "ADVIL"});
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "advil");
    EXPECT_EQ(result[1], "motrin");
}

TEST(NormalizationTest, NormalizeTermsEmpty) {
    EXPECT_TRUE(normalize_terms({}).empty());
    EXPECT_TRUE(normalize_terms({"", " "}).empty());
}

TEST(NormalizationTest, ToCodePoints) {
    EXPECT_EQ(to_code_points("abc"), std::u32string(U"abc"));
    EXPECT_EQ(to_code_points("café"), std::u32string(U"café"));
    EXPECT_EQ(to_code_points("日本"), std::u32string(U"日本"));
    EXPECT_TRUE(to_code_points("").empty());
}

TEST(NormalizationTest, ToCodePointsMalformed) {
    // A lone continuation byte decodes to one replacement character
    auto result = to_code_points(std::string("a\x80") + "b");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], U'a');
    EXPECT_EQ(result[1], char32_t{0xFFFD});
    EXPECT_EQ(result[2], U'b');
}

TEST(NormalizationTest, HasNonAscii) {
    EXPECT_FALSE(has_non_ascii("aspirin 500mg"));
    EXPECT_TRUE(has_non_ascii("café"));
    EXPECT_FALSE(has_non_ascii(""));
}

TEST(NormalizationTest, Trim) {
    EXPECT_EQ(trim("  0573-0164-40 "), "0573-0164-40");
    EXPECT_EQ(trim("\t\n"), "");
    EXPECT_EQ(trim("x"), "x");
}
