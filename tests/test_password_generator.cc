// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_password_generator.cc
 * @brief Unit tests for PasswordGenerator
 *
 * Index arithmetic is checked with a deterministic random source; output
 * properties (length, excluded glyphs) are checked against the real
 * OpenSSL source.
 */

#include <gtest/gtest.h>
#include "../src/core/generator/CharsetBuilder.h"
#include "../src/core/generator/PasswordGenerator.h"
#include "../src/utils/Log.h"
#include "support/SequenceRandomSource.h"
#include <sstream>
#include <vector>

using namespace Pulsar;
using Pulsar::Testing::SequenceRandomSource;

namespace {

GenerationOptions all_classes() {
    GenerationOptions options;
    options.uppercase = true;
    options.lowercase = true;
    options.digits = true;
    options.symbols = true;
    return options;
}

GenerationOptions no_classes() {
    GenerationOptions options;
    options.uppercase = false;
    options.lowercase = false;
    options.digits = false;
    options.symbols = false;
    return options;
}

} // anonymous namespace

// ============================================================================
// Deterministic selection
// ============================================================================

TEST(PasswordGeneratorTest, SequentialValuesSelectPoolPrefix) {
    std::vector<uint32_t> sequence(16);
    for (uint32_t i = 0; i < 16; ++i) {
        sequence[i] = i;
    }
    SequenceRandomSource source(sequence);
    PasswordGenerator generator(source);

    const auto options = all_classes();
    const std::string pool = CharsetBuilder::build_pool(options);
    ASSERT_EQ(pool.size(), 88u);

    EXPECT_EQ(generator.generate(16, options), pool.substr(0, 16));
    EXPECT_EQ(generator.generate(16, options), "ABCDEFGHIJKLMNOP");
}

TEST(PasswordGeneratorTest, ValuesWrapModuloPoolSize) {
    SequenceRandomSource source({88, 89, 175});
    PasswordGenerator generator(source);

    // 88 % 88 = 0, 89 % 88 = 1, 175 % 88 = 87
    EXPECT_EQ(generator.generate(3, all_classes()), "AB?");
}

TEST(PasswordGeneratorTest, SelectCharactersUsesModulo) {
    const std::vector<uint32_t> values{0, 3, 4, 10};
    EXPECT_EQ(PasswordGenerator::select_characters("abcd", values, false), "adac");
}

TEST(PasswordGeneratorTest, PronounceableAlternatesConsonantsAndVowels) {
    // Pool "abcde": vowels "ae", consonants "bcd"
    const std::vector<uint32_t> values{0, 0, 1, 1, 2, 2};
    EXPECT_EQ(PasswordGenerator::select_characters("abcde", values, true), "baceda");
}

TEST(PasswordGeneratorTest, PronounceableFallsBackWithoutVowels) {
    const std::vector<uint32_t> values{0, 1, 2, 3};
    EXPECT_EQ(PasswordGenerator::select_characters("!@#$", values, true), "!@#$");
}

TEST(PasswordGeneratorTest, PronounceableFallsBackWithoutConsonants) {
    const std::vector<uint32_t> values{0, 1, 2, 3, 4};
    EXPECT_EQ(PasswordGenerator::select_characters("aeiou", values, true), "aeiou");
}

TEST(PasswordGeneratorTest, PronounceableOutputParity) {
    PasswordGenerator generator;
    auto options = all_classes();
    options.pronounceable = true;

    const std::string password = generator.generate(40, options);
    ASSERT_EQ(password.size(), 40u);
    for (size_t i = 0; i < password.size(); ++i) {
        EXPECT_EQ(CharsetBuilder::is_vowel(password[i]), i % 2 == 1) << "position " << i;
    }
}

// ============================================================================
// Output properties
// ============================================================================

TEST(PasswordGeneratorTest, LengthMatchesRequest) {
    PasswordGenerator generator;
    const std::vector<GenerationOptions> variants = [] {
        std::vector<GenerationOptions> result;
        for (int mask = 1; mask < 16; ++mask) {
            GenerationOptions options;
            options.uppercase = mask & 1;
            options.lowercase = mask & 2;
            options.digits = mask & 4;
            options.symbols = mask & 8;
            result.push_back(options);
        }
        return result;
    }();

    for (const auto& options : variants) {
        for (uint32_t length : {1u, 8u, 20u, 47u, 128u}) {
            EXPECT_EQ(generator.generate(length, options).size(), length);
        }
    }
}

TEST(PasswordGeneratorTest, AmbiguousCharactersNeverAppear) {
    PasswordGenerator generator;
    auto options = all_classes();
    options.ambiguous = true;

    for (int i = 0; i < 50; ++i) {
        const std::string password = generator.generate(64, options);
        ASSERT_EQ(password.size(), 64u);
        EXPECT_EQ(password.find_first_of(CharsetBuilder::AMBIGUOUS), std::string::npos) << password;
    }
}

TEST(PasswordGeneratorTest, SimilarCharactersNeverAppear) {
    PasswordGenerator generator;
    auto options = all_classes();
    options.similar = true;

    const std::string password = generator.generate(256, options);
    EXPECT_EQ(password.find_first_of(CharsetBuilder::SIMILAR), std::string::npos);
}

TEST(PasswordGeneratorTest, OnlyPoolCharactersUsed) {
    PasswordGenerator generator;
    GenerationOptions options = no_classes();
    options.digits = true;

    const std::string password = generator.generate(100, options);
    EXPECT_EQ(password.find_first_not_of(CharsetBuilder::DIGITS), std::string::npos);
}

// ============================================================================
// Failure handling
// ============================================================================

TEST(PasswordGeneratorTest, NoClassesReturnsEmptyString) {
    PasswordGenerator generator;
    EXPECT_EQ(generator.generate(16, no_classes()), "");
}

TEST(PasswordGeneratorTest, NoClassesReportsEmptyPool) {
    PasswordGenerator generator;
    auto result = generator.try_generate(16, no_classes());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), GeneratorError::EmptyCharsetPool);
}

TEST(PasswordGeneratorTest, ExclusionsLeavingCharactersStillGenerate) {
    GenerationOptions options = no_classes();
    options.digits = true;
    options.similar = true;
    options.ambiguous = true;
    // Digits minus "10" minus the similar set still leaves 2-9
    PasswordGenerator generator;
    EXPECT_TRUE(generator.try_generate(4, options).has_value());
}

TEST(PasswordGeneratorTest, InvalidLengthsRejected) {
    PasswordGenerator generator;
    EXPECT_EQ(generator.try_generate(0, all_classes()).error(), GeneratorError::InvalidLength);
    EXPECT_EQ(generator.try_generate(PasswordGenerator::MAX_LENGTH + 1, all_classes()).error(),
              GeneratorError::InvalidLength);
    EXPECT_EQ(generator.generate(0, all_classes()), "");
}

/**
 * @test Only the strict API enforces MAX_LENGTH; generate() honors any length
 */
TEST(PasswordGeneratorTest, LegacyGenerateIsNotCapped) {
    SequenceRandomSource source;
    PasswordGenerator generator(source);
    const uint32_t length = PasswordGenerator::MAX_LENGTH + 1;

    const std::string password = generator.generate(length, all_classes());
    EXPECT_EQ(password.size(), length);

    const std::string pool = CharsetBuilder::build_pool(all_classes());
    EXPECT_EQ(password.front(), pool[0]);
    EXPECT_EQ(password.back(), pool[(length - 1) % pool.size()]);
}

TEST(PasswordGeneratorTest, LegacyFailureLogsWarning) {
    std::ostringstream captured;
    Log::set_sink(&captured);
    Log::set_level(Log::Level::Warning);

    PasswordGenerator generator;
    EXPECT_EQ(generator.generate(8, no_classes()), "");

    Log::set_sink(nullptr);
    Log::set_level(Log::Level::Info);
    EXPECT_NE(captured.str().find("WARN"), std::string::npos);
    EXPECT_NE(captured.str().find("Returning empty password"), std::string::npos);
}

TEST(PasswordGeneratorTest, RandomSourceFailurePropagates) {
    SequenceRandomSource source;
    source.set_fail(true);
    PasswordGenerator generator(source);

    auto result = generator.try_generate(12, all_classes());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), GeneratorError::RandomSourceFailed);
    EXPECT_EQ(generator.generate(12, all_classes()), "");
}

TEST(PasswordGeneratorTest, EmptyPoolDoesNotConsumeRandomness) {
    SequenceRandomSource source;
    PasswordGenerator generator(source);

    (void)generator.generate(10, no_classes());
    EXPECT_EQ(source.calls(), 0);
}
