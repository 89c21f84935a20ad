// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_strength_estimator.cc
 * @brief Unit tests for StrengthEstimator (zxcvbn-backed scoring)
 */

#include <gtest/gtest.h>
#include "../src/core/security/StrengthEstimator.h"
#include <algorithm>

using namespace Pulsar;

// ============================================================================
// Scoring
// ============================================================================

TEST(StrengthEstimatorTest, CommonPasswordIsLowestTier) {
    auto result = StrengthEstimator::check_strength("password");

    EXPECT_EQ(result.score, 0);
    EXPECT_FALSE(result.warning.empty());
    ASSERT_FALSE(result.suggestions.empty());
    EXPECT_EQ(result.suggestions.front(), "Add more words that are less common.");
}

TEST(StrengthEstimatorTest, RandomMixedClassStringIsTopTier) {
    auto result = StrengthEstimator::check_strength("q7#Vx2!mZp9$Lw4^Tr8&Kb3*");

    EXPECT_EQ(result.score, 4);
    EXPECT_TRUE(result.warning.empty());
    EXPECT_TRUE(result.suggestions.empty());
    EXPECT_EQ(result.crack_time_display, "centuries");
    EXPECT_GT(result.entropy_bits, 60.0);
}

TEST(StrengthEstimatorTest, KeyboardRowIsWeak) {
    auto result = StrengthEstimator::check_strength("qwertyuiop");
    EXPECT_LE(result.score, 1);
}

TEST(StrengthEstimatorTest, RepeatedCharactersAreWeak) {
    auto result = StrengthEstimator::check_strength("aaaaaaaaaaaa");
    EXPECT_LE(result.score, 1);
    EXPECT_FALSE(result.warning.empty());
}

TEST(StrengthEstimatorTest, UserInputsLowerTheEstimate) {
    const std::string candidate = "zorblaxtrifon";

    auto without = StrengthEstimator::check_strength(candidate);
    auto with = StrengthEstimator::check_strength(candidate, {"zorblaxtrifon"});

    EXPECT_LT(with.entropy_bits, without.entropy_bits);
    EXPECT_LE(with.score, without.score);
    EXPECT_EQ(with.warning, "There should not be any personal or page related data.");
}

TEST(StrengthEstimatorTest, EmptyUserInputsAreIgnored) {
    auto plain = StrengthEstimator::check_strength("correcthorse");
    auto with_blank = StrengthEstimator::check_strength("correcthorse", {"", ""});

    EXPECT_DOUBLE_EQ(plain.entropy_bits, with_blank.entropy_bits);
}

TEST(StrengthEstimatorTest, EmptyCandidateIsUnscored) {
    auto result = StrengthEstimator::check_strength("");

    EXPECT_EQ(result.score, StrengthResult::UNSCORED);
    EXPECT_EQ(result.suggestions.size(), 2u);
    EXPECT_TRUE(result.crack_time_display.empty());
    EXPECT_EQ(StrengthEstimator::label(result), "Not scored");
}

// ============================================================================
// Breach override
// ============================================================================

TEST(StrengthEstimatorTest, BreachForcesLowestTier) {
    auto strong = StrengthEstimator::check_strength("q7#Vx2!mZp9$Lw4^Tr8&Kb3*");
    ASSERT_EQ(strong.score, 4);

    auto breached = StrengthEstimator::apply_breach_signal(strong, BreachSignal{42});

    EXPECT_EQ(breached.score, 0);
    EXPECT_TRUE(breached.breached);
    EXPECT_EQ(StrengthEstimator::label(breached), "Breached");
    EXPECT_EQ(breached.warning, "Your password was exposed by a data breach on the Internet.");
}

TEST(StrengthEstimatorTest, ZeroCountLeavesResultUntouched) {
    auto strong = StrengthEstimator::check_strength("q7#Vx2!mZp9$Lw4^Tr8&Kb3*");
    auto after = StrengthEstimator::apply_breach_signal(strong, BreachSignal{0});

    EXPECT_EQ(after.score, strong.score);
    EXPECT_FALSE(after.breached);
    EXPECT_EQ(StrengthEstimator::label(after), "Very strong");
}

TEST(StrengthEstimatorTest, BreachSuggestionAddedOnce) {
    StrengthResult result;
    result.score = 2;

    result = StrengthEstimator::apply_breach_signal(result, BreachSignal{1});
    result = StrengthEstimator::apply_breach_signal(result, BreachSignal{1});

    EXPECT_EQ(std::ranges::count(result.suggestions,
                                 std::string("If you use this password elsewhere, you should change it.")),
              1);
}

// ============================================================================
// Helpers
// ============================================================================

TEST(StrengthEstimatorTest, ScoreLabels) {
    EXPECT_EQ(StrengthEstimator::score_label(0), "Very weak");
    EXPECT_EQ(StrengthEstimator::score_label(1), "Weak");
    EXPECT_EQ(StrengthEstimator::score_label(2), "Fair");
    EXPECT_EQ(StrengthEstimator::score_label(3), "Strong");
    EXPECT_EQ(StrengthEstimator::score_label(4), "Very strong");
    EXPECT_EQ(StrengthEstimator::score_label(-1), "Not scored");
}

TEST(StrengthEstimatorTest, ScoreThresholds) {
    EXPECT_EQ(StrengthEstimator::score_from_entropy(0.0), 0);
    EXPECT_EQ(StrengthEstimator::score_from_entropy(9.0), 0);
    EXPECT_EQ(StrengthEstimator::score_from_entropy(10.0), 1);
    EXPECT_EQ(StrengthEstimator::score_from_entropy(20.0), 2);
    EXPECT_EQ(StrengthEstimator::score_from_entropy(30.0), 3);
    EXPECT_EQ(StrengthEstimator::score_from_entropy(34.0), 4);
    EXPECT_EQ(StrengthEstimator::score_from_entropy(128.0), 4);
}

TEST(StrengthEstimatorTest, DisplayTime) {
    EXPECT_EQ(StrengthEstimator::display_time(0.0), "less than a second");
    EXPECT_EQ(StrengthEstimator::display_time(0.99), "less than a second");
    EXPECT_EQ(StrengthEstimator::display_time(1.0), "1 second");
    EXPECT_EQ(StrengthEstimator::display_time(30.0), "30 seconds");
    EXPECT_EQ(StrengthEstimator::display_time(60.0), "1 minute");
    EXPECT_EQ(StrengthEstimator::display_time(3 * 3600.0), "3 hours");
    EXPECT_EQ(StrengthEstimator::display_time(2 * 86400.0), "2 days");
    EXPECT_EQ(StrengthEstimator::display_time(31 * 86400.0), "1 month");
    EXPECT_EQ(StrengthEstimator::display_time(5 * 12 * 31 * 86400.0), "5 years");
    EXPECT_EQ(StrengthEstimator::display_time(1e12), "centuries");
}
