#include <gtest/gtest.h>
#include "scoring/component_scores.hpp"
#include <limits>
#include <stdexcept>

using namespace cred;

// ==========================================
// Methodology Tests
// ==========================================

TEST(MethodologyScoreTest, PerfectInputs) {
    MethodologyInputs inputs(40.0, 25.0, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(methodology_score(inputs), 100.0);
}

TEST(MethodologyScoreTest, ZeroInputs) {
    MethodologyInputs inputs(0.0, 0.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(methodology_score(inputs), 0.0);
}

TEST(MethodologyScoreTest, Midpoints) {
    MethodologyInputs inputs(20.0, 12.5, 0.5, 0.5);
    EXPECT_DOUBLE_EQ(methodology_score(inputs), 50.0);
}

TEST(MethodologyScoreTest, WeightedTerms) {
    // 30 + 12 + 3 + 12
    MethodologyInputs inputs(30.0, 10.0, 0.2, 0.8);
    EXPECT_NEAR(methodology_score(inputs), 57.0, 1e-9);
}

TEST(MethodologyScoreTest, MonotonicInEachInput) {
    MethodologyInputs base(20.0, 12.5, 0.5, 0.5);
    double s = methodology_score(base);
    EXPECT_GT(methodology_score(MethodologyInputs(25.0, 12.5, 0.5, 0.5)), s);
    EXPECT_GT(methodology_score(MethodologyInputs(20.0, 15.0, 0.5, 0.5)), s);
    EXPECT_GT(methodology_score(MethodologyInputs(20.0, 12.5, 0.7, 0.5)), s);
    EXPECT_GT(methodology_score(MethodologyInputs(20.0, 12.5, 0.5, 0.7)), s);
}

TEST(MethodologyScoreTest, RejectsOutOfRange) {
    EXPECT_THROW(MethodologyInputs(41.0, 10.0, 0.5, 0.5), std::out_of_range);
    EXPECT_THROW(MethodologyInputs(-1.0, 10.0, 0.5, 0.5), std::out_of_range);
    EXPECT_THROW(MethodologyInputs(20.0, 26.0, 0.5, 0.5), std::out_of_range);
    EXPECT_THROW(MethodologyInputs(20.0, 10.0, 1.5, 0.5), std::out_of_range);
    EXPECT_THROW(MethodologyInputs(20.0, 10.0, 0.5, -0.1), std::out_of_range);
    EXPECT_THROW(MethodologyInputs(std::numeric_limits<double>::quiet_NaN(), 10.0, 0.5, 0.5),
                 std::out_of_range);
}

// ==========================================
// Logic Tests
// ==========================================

TEST(LogicScoreTest, NoArticles) {
    EXPECT_DOUBLE_EQ(logic_score({}, 0), 0.0);
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::HIGH}, 0), 0.0);
}

TEST(LogicScoreTest, CleanArticles) {
    EXPECT_DOUBLE_EQ(logic_score({}, 5), 100.0);
}

TEST(LogicScoreTest, SeverityWeights) {
    EXPECT_DOUBLE_EQ(fallacy_deduction(FallacySeverity::LOW), 1.0);
    EXPECT_DOUBLE_EQ(fallacy_deduction(FallacySeverity::MEDIUM), 2.0);
    EXPECT_DOUBLE_EQ(fallacy_deduction(FallacySeverity::HIGH), 3.0);
}

TEST(LogicScoreTest, SingleFallacyInSingleArticle) {
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::HIGH}, 1), 40.0);
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::MEDIUM}, 1), 60.0);
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::LOW}, 1), 80.0);
}

TEST(LogicScoreTest, AveragesAcrossArticles) {
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::HIGH, FallacySeverity::HIGH}, 3), 60.0);
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::LOW, FallacySeverity::LOW, FallacySeverity::LOW}, 10), 94.0);
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::HIGH, FallacySeverity::MEDIUM,
                                  FallacySeverity::LOW, FallacySeverity::LOW}, 10), 86.0);
}

TEST(LogicScoreTest, KnownMix) {
    // 3 + 2 + 2 + 1 + 1 + 1 over 5 articles
    std::vector<FallacySeverity> mix = {
        FallacySeverity::HIGH, FallacySeverity::MEDIUM, FallacySeverity::MEDIUM,
        FallacySeverity::LOW, FallacySeverity::LOW, FallacySeverity::LOW
    };
    EXPECT_DOUBLE_EQ(logic_score(mix, 5), 60.0);
}

TEST(LogicScoreTest, RoundsToOneDecimal) {
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::LOW, FallacySeverity::LOW}, 3), 86.7);
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::LOW}, 7), 97.1);
}

TEST(LogicScoreTest, ClampsAtZero) {
    EXPECT_DOUBLE_EQ(logic_score({FallacySeverity::HIGH, FallacySeverity::MEDIUM, FallacySeverity::LOW}, 1), 0.0);
    std::vector<FallacySeverity> many(10, FallacySeverity::HIGH);
    EXPECT_DOUBLE_EQ(logic_score(many, 1), 0.0);
}

TEST(LogicScoreTest, SeverityParsing) {
    EXPECT_EQ(string_to_fallacy_severity("low"), FallacySeverity::LOW);
    EXPECT_EQ(string_to_fallacy_severity("HIGH"), FallacySeverity::HIGH);
    EXPECT_EQ(string_to_fallacy_severity("medium"), FallacySeverity::MEDIUM);
    EXPECT_EQ(string_to_fallacy_severity("catastrophic"), FallacySeverity::LOW);
    EXPECT_DOUBLE_EQ(logic_score({string_to_fallacy_severity("unknown")}, 1), 80.0);
    EXPECT_EQ(fallacy_severity_to_string(FallacySeverity::HIGH), "high");
}
