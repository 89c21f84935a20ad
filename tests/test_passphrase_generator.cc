// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_passphrase_generator.cc
 * @brief Unit tests for PassphraseGenerator
 */

#include <gtest/gtest.h>
#include "../src/core/generator/PassphraseGenerator.h"
#include "../src/utils/Log.h"
#include "../src/utils/StringHelpers.h"
#include "support/SequenceRandomSource.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Pulsar;
using Pulsar::Testing::SequenceRandomSource;
namespace fs = std::filesystem;

class PassphraseGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_path = fs::temp_directory_path() /
                 (std::string("pulsar_passphrase_") +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".txt");
        std::ofstream out(m_path);
        out << "# test list\n"
               "11111\tamber\n"
               "11112\tbasil\n"
               "11113\tcedar\n"
               "11114\tdelta\n"
               "11115\tember\n";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    fs::path m_path;
    WordListCache m_cache;
};

TEST_F(PassphraseGeneratorTest, SelectsWordsByModulo) {
    SequenceRandomSource source({0, 6, 2, 13});
    PassphraseGenerator generator(m_path, m_cache, source);

    // 0 -> amber, 6 % 5 = 1 -> basil, 2 -> cedar, 13 % 5 = 3 -> delta
    EXPECT_EQ(generator.generate_passphrase(4, "-"), "amber-basil-cedar-delta");
}

TEST_F(PassphraseGeneratorTest, RepeatsAreAllowed) {
    SequenceRandomSource source({4, 4, 4});
    PassphraseGenerator generator(m_path, m_cache, source);

    EXPECT_EQ(generator.generate_passphrase(3, " "), "ember ember ember");
}

TEST_F(PassphraseGeneratorTest, SeparatorCountIsWordCountMinusOne) {
    PassphraseGenerator generator(m_path, m_cache);

    for (uint32_t words = 1; words <= 12; ++words) {
        const std::string passphrase = generator.generate_passphrase(words, "-");
        EXPECT_EQ(static_cast<uint32_t>(std::ranges::count(passphrase, '-')), words - 1);

        auto list = m_cache.get(m_path);
        ASSERT_TRUE(list.has_value());
        for (std::string_view word : split(passphrase, '-')) {
            EXPECT_TRUE((*list)->contains(word)) << word;
        }
    }
}

TEST_F(PassphraseGeneratorTest, MultiCharacterAndEmptySeparators) {
    SequenceRandomSource source({0, 1});
    PassphraseGenerator generator(m_path, m_cache, source);

    EXPECT_EQ(generator.generate_passphrase(2, " :: "), "amber :: basil");
    EXPECT_EQ(generator.generate_passphrase(2, ""), "amberbasil");
}

TEST_F(PassphraseGeneratorTest, LoadsWordListOnce) {
    PassphraseGenerator generator(m_path, m_cache);

    (void)generator.generate_passphrase(3, "-");
    (void)generator.generate_passphrase(3, "-");
    PassphraseGenerator second(m_path, m_cache);
    (void)second.generate_passphrase(3, "-");

    EXPECT_EQ(m_cache.load_count(), 1u);
}

TEST_F(PassphraseGeneratorTest, WordListSize) {
    PassphraseGenerator generator(m_path, m_cache);
    auto size = generator.word_list_size();
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 5u);
}

TEST_F(PassphraseGeneratorTest, InvalidWordCount) {
    PassphraseGenerator generator(m_path, m_cache);

    EXPECT_EQ(generator.try_generate_passphrase(0, "-").error(), GeneratorError::InvalidWordCount);
    EXPECT_EQ(generator.try_generate_passphrase(PassphraseGenerator::MAX_WORD_COUNT + 1, "-").error(),
              GeneratorError::InvalidWordCount);
    EXPECT_EQ(generator.generate_passphrase(0, "-"), "");
}

TEST_F(PassphraseGeneratorTest, LegacyGenerateIsNotCapped) {
    SequenceRandomSource source;
    PassphraseGenerator generator(m_path, m_cache, source);
    const uint32_t words = PassphraseGenerator::MAX_WORD_COUNT + 1;

    const std::string passphrase = generator.generate_passphrase(words, "-");
    EXPECT_EQ(static_cast<uint32_t>(std::ranges::count(passphrase, '-')), words - 1);
    EXPECT_TRUE(passphrase.starts_with("amber-basil-cedar-delta-ember-amber"));
}

TEST_F(PassphraseGeneratorTest, LegacyFailureLogsWarning) {
    std::ostringstream captured;
    Log::set_sink(&captured);
    Log::set_level(Log::Level::Warning);

    PassphraseGenerator generator(m_path, m_cache);
    EXPECT_EQ(generator.generate_passphrase(0, "-"), "");

    Log::set_sink(nullptr);
    Log::set_level(Log::Level::Info);
    EXPECT_NE(captured.str().find("WARN"), std::string::npos);
    EXPECT_NE(captured.str().find("Returning empty passphrase"), std::string::npos);
}

TEST_F(PassphraseGeneratorTest, MissingWordListDegradesToEmpty) {
    PassphraseGenerator generator(m_path.string() + ".missing", m_cache);

    EXPECT_EQ(generator.generate_passphrase(4, "-"), "");
    auto strict = generator.try_generate_passphrase(4, "-");
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error(), GeneratorError::WordListNotFound);
}

TEST_F(PassphraseGeneratorTest, RandomSourceFailure) {
    SequenceRandomSource source;
    source.set_fail(true);
    PassphraseGenerator generator(m_path, m_cache, source);

    auto result = generator.try_generate_passphrase(4, "-");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), GeneratorError::RandomSourceFailed);
}

TEST(PassphraseJoinTest, JoinWordsIsPureIndexArithmetic) {
    const WordList words({"red", "green", "blue"});
    const std::vector<uint32_t> values{2, 3, 7};

    EXPECT_EQ(PassphraseGenerator::join_words(words, values, "."), "blue.red.green");
}
