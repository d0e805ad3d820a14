// Tests for edit distance and string matching primitives
#include <gtest/gtest.h>

#include <pill_match/internal/matching.hpp>

#include "testutil/loader.hpp"

using namespace pill_match;
using namespace pill_match::testutil;
using namespace pill_match::matching;

class MatchingTest : public ::testing::Test {
  protected:
    void SetUp() override { loader_ = std::make_unique<Loader>(Loader::from_compile_definition()); }

    std::unique_ptr<Loader> loader_;
};

// Test edit_distance using shared test data
TEST_F(MatchingTest, EditDistance) {
    auto test_cases = loader_->get_test_cases("matching", "edit_distance");
    ASSERT_FALSE(test_cases.empty()) << "No test cases loaded";

    for (const auto& tc : test_cases) {
        auto s1 = tc.input_get<std::string>("s1");
        auto s2 = tc.input_get<std::string>("s2");
        auto expected = static_cast<std::size_t>(tc.expected_int());

        EXPECT_EQ(edit_distance(s1, s2), expected) << "Test case: " << tc.id << " - " << tc.description;
        // Symmetric
        EXPECT_EQ(edit_distance(s2, s1), expected) << "Test case (swapped): " << tc.id;
    }
}

TEST_F(MatchingTest, EditDistanceToSelfIsZero) {
    for (const char* s : {"", "a", "aspirin", "Acetylsalicylic Acid", "500 mg", "café"}) {
        EXPECT_EQ(edit_distance(s, s), 0u) << s;
    }
}

TEST_F(MatchingTest, EditDistanceFromEmptyIsLength) {
    EXPECT_EQ(edit_distance("", "ibuprofen"), 9u);
    EXPECT_EQ(edit_distance("tylenol", ""), 7u);
    // Length in characters, not bytes
    EXPECT_EQ(edit_distance("", "café"), 4u);
}

TEST_F(MatchingTest, EditDistanceIsCaseSensitive) {
    EXPECT_EQ(edit_distance("Aspirin", "aspirin"), 1u);
}

TEST_F(MatchingTest, EditDistanceOnCodePoints) {
    EXPECT_EQ(edit_distance(std::u32string_view(U"abc"), std::u32string_view(U"abd")), 1u);
    EXPECT_EQ(edit_distance(std::u32string_view(U""), std::u32string_view(U"xyz")), 3u);
}

TEST_F(MatchingTest, WithinDistance) {
    EXPECT_TRUE(within_distance("asprin", "aspirin", 2));
    EXPECT_TRUE(within_distance("ibuprophen", "ibuprofen", 2));
    EXPECT_FALSE(within_distance("ibuprophen", "ibuprofen", 1));
    EXPECT_FALSE(within_distance("advil", "motrin", 2));
    // Length gap alone exceeds the cutoff
    EXPECT_FALSE(within_distance("ab", "abcdef", 2));
    EXPECT_TRUE(within_distance("same", "same", 0));
}

TEST_F(MatchingTest, PartialMatch) {
    EXPECT_TRUE(is_partial_match("ibu", "ibuprofen"));
    EXPECT_TRUE(is_partial_match("ibuprofen", "ibu"));
    EXPECT_TRUE(is_partial_match("500", "500mg"));
    EXPECT_TRUE(is_partial_match("advil", "advil"));
    EXPECT_FALSE(is_partial_match("asprin", "aspirin"));
    EXPECT_FALSE(is_partial_match("", "aspirin"));
    EXPECT_FALSE(is_partial_match("aspirin", ""));
}

TEST_F(MatchingTest, Similarity) {
    EXPECT_NEAR(similarity("aspirin", "aspirin"), 1.0, 0.001);
    EXPECT_NEAR(similarity("", ""), 1.0, 0.001);
    EXPECT_GT(similarity("asprin", "aspirin"), similarity("advil", "aspirin"));

    double value = similarity("zyrtec", "claritin");
    EXPECT_GE(value, 0.0);
    EXPECT_LE(value, 1.0);
}
