// Tests for candidate ranking
#include <gtest/gtest.h>

#include <pill_match/ranker.hpp>

#include <string>
#include <vector>

using namespace pill_match;

namespace {

Record named(std::string id, std::string name) {
    return Record{.id = std::move(id), .name = std::move(name), .metadata = std::nullopt};
}

Record branded(std::string id, std::string name, std::vector<std::string> brands) {
    Record r = named(std::move(id), std::move(name));
    r.metadata = MedicationMetadata{};
    r.metadata->brand_names = std::move(brands);
    return r;
}

std::vector<std::string> ids(const std::vector<ScoredCandidate>& ranked) {
    std::vector<std::string> out;
    for (const auto& c : ranked) out.push_back(c.record->id);
    return out;
}

}  // namespace

TEST(RankerTest, KeepsOnlyRelevantCandidates) {
    std::vector<Record> candidates = {
        named("a", "Aspirin"), named("i", "Ibuprofen"), named("c", "Acetaminophen")};

    auto ranked = rank(candidates, {"aspirin"});
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].record->name, "Aspirin");
    EXPECT_DOUBLE_EQ(ranked[0].score, 1.0);
    EXPECT_EQ(ranked[0].index, 0u);
}

TEST(RankerTest, SortedByDescendingScore) {
    std::vector<Record> candidates = {
        named("partial", "Advil Liqui-Gels"),
        named("fuzzy", "Advyl"),
        branded("exact", "Ibuprofen", {"Advil"})};

    auto ranked = rank(candidates, {"advil"});
    EXPECT_EQ(ids(ranked), (std::vector<std::string>{"exact", "partial", "fuzzy"}));
    EXPECT_DOUBLE_EQ(ranked[0].score, 1.0);
    EXPECT_DOUBLE_EQ(ranked[1].score, 0.5);
    EXPECT_DOUBLE_EQ(ranked[2].score, 0.3);
}

TEST(RankerTest, TiesKeepCandidateOrder) {
    std::vector<Record> candidates;
    for (int i = 0; i < 8; ++i) {
        candidates.push_back(branded("t" + std::to_string(i), "Tablet " + std::to_string(i), {"Advil"}));
    }

    auto ranked = rank(candidates, {"advil"});
    ASSERT_EQ(ranked.size(), 8u);
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        EXPECT_EQ(ranked[i].index, i);
        EXPECT_EQ(ranked[i].record->id, "t" + std::to_string(i));
    }
}

TEST(RankerTest, EqualMixedTierScoresKeepCandidateOrder) {
    // Both records get two exact and two fuzzy hits, at different query positions
    std::vector<Record> candidates = {
        branded("a", "Aspirin", {"Advil", "Motrn", "Bayr"}),
        branded("b", "Motrin", {"Bayer", "Aspirn", "Advl"}),
    };

    auto ranked = rank(candidates, {"aspirin", "advil", "motrin", "bayer"});
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].score, ranked[1].score);
    EXPECT_EQ(ids(ranked), (std::vector<std::string>{"a", "b"}));
}

TEST(RankerTest, BlankNameDoesNotMatchShortTerms) {
    std::vector<Record> candidates = {named("x", "")};
    EXPECT_TRUE(rank(candidates, {"mg"}).empty());
    EXPECT_TRUE(rank(candidates, {"10", "d3"}).empty());
}

TEST(RankerTest, TruncatesToMaxResults) {
    std::vector<Record> candidates;
    for (int i = 1; i <= 20; ++i) {
        candidates.push_back(named(std::to_string(i), "Medication " + std::to_string(i)));
    }

    auto ranked = rank(candidates, {"medication"});
    ASSERT_EQ(ranked.size(), 10u);
    EXPECT_EQ(ranked.front().record->id, "1");
    EXPECT_EQ(ranked.back().record->id, "10");

    MatchConfig config;
    config.max_results = 3;
    EXPECT_EQ(rank(candidates, {"medication"}, config).size(), 3u);
}

TEST(RankerTest, NeverLongerThanCandidates) {
    std::vector<Record> candidates = {named("a", "Aspirin"), named("b", "Aspirin Low Dose")};
    auto ranked = rank(candidates, {"aspirin"});
    EXPECT_LE(ranked.size(), candidates.size());
    EXPECT_EQ(ranked.size(), 2u);
}

// The minimum relevance boundary is exclusive
TEST(RankerTest, ThresholdIsExclusive) {
    std::vector<Record> candidates = {named("a", "Aspirin")};

    MatchConfig at_score;
    at_score.min_relevance = 0.3;
    EXPECT_TRUE(rank(candidates, {"asprin"}, at_score).empty());

    MatchConfig below_score;
    below_score.min_relevance = 0.29;
    auto ranked = rank(candidates, {"asprin"}, below_score);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_DOUBLE_EQ(ranked[0].score, 0.3);
}

TEST(RankerTest, DefaultThresholdBoundary) {
    std::vector<Record> candidates = {named("a", "Aspirin")};
    // One exact hit among ten terms scores exactly 0.1
    QueryTerms query = {"aspirin", "blue",  "tablet", "morning", "bottle",
                        "label",   "pharmacy", "refill", "expiry",  "lotnumber"};
    EXPECT_TRUE(rank(candidates, query).empty());

    query.pop_back();
    auto ranked = rank(candidates, query);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_NEAR(ranked[0].score, 1.0 / 9.0, 1e-12);
}

TEST(RankerTest, EmptyInputs) {
    std::vector<Record> none;
    EXPECT_TRUE(rank(none, {"aspirin"}).empty());

    std::vector<Record> candidates = {named("a", "Aspirin")};
    EXPECT_TRUE(rank(candidates, {}).empty());
    EXPECT_TRUE(rank(candidates, {"  ", ""}).empty());
}

TEST(RankerTest, ParallelMatchesSequential) {
    std::vector<Record> candidates;
    for (int i = 0; i < 200; ++i) {
        // Alternate exact, partial, fuzzy and unrelated records
        switch (i % 4) {
        case 0:
            candidates.push_back(branded("r" + std::to_string(i), "Generic " + std::to_string(i), {"Advil"}));
            break;
        case 1:
            candidates.push_back(named("r" + std::to_string(i), "Advil " + std::to_string(i)));
            break;
        case 2:
            candidates.push_back(named("r" + std::to_string(i), "Advyl"));
            break;
        default:
            candidates.push_back(named("r" + std::to_string(i), "Zyrtec"));
            break;
        }
    }

    MatchConfig sequential;
    sequential.max_results = 200;

    MatchConfig parallel = sequential;
    parallel.parallel_threshold = 16;
    parallel.parallel_workers = 7;

    auto expected = rank(candidates, {"advil"}, sequential);
    auto actual = rank(candidates, {"advil"}, parallel);

    ASSERT_EQ(actual.size(), expected.size());
    EXPECT_EQ(actual.size(), 150u);
    for (std::size_t i = 0; i < actual.size(); ++i) {
        EXPECT_EQ(actual[i].record, expected[i].record);
        EXPECT_DOUBLE_EQ(actual[i].score, expected[i].score);
        EXPECT_EQ(actual[i].index, expected[i].index);
    }
}

TEST(RankerTest, ToRecordsPreservesOrder) {
    std::vector<Record> candidates = {named("p", "Advil PM"), branded("e", "Ibuprofen", {"Advil"})};
    auto records = to_records(rank(candidates, {"advil"}));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "e");
    EXPECT_EQ(records[1].id, "p");
}
