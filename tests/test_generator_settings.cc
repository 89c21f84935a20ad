// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_generator_settings.cc
 * @brief Tests for the typed GSettings handle
 */

#include <gtest/gtest.h>
#include "../src/core/settings/GeneratorSettings.h"
#include "support/TestSettings.h"
#include <stdexcept>

using namespace Pulsar;

class GeneratorSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            m_gio = Testing::open_test_settings();
        } catch (const Glib::Error& e) {
            GTEST_SKIP() << "Could not create settings: " << e.what();
        }
        if (!m_gio) {
            GTEST_SKIP() << "Schema " << GeneratorSettings::SCHEMA_ID << " not compiled";
        }
        Testing::reset_test_settings(m_gio);
        m_settings = std::make_unique<GeneratorSettings>(m_gio);
    }

    void TearDown() override {
        m_settings.reset();
        Testing::reset_test_settings(m_gio);
    }

    Glib::RefPtr<Gio::Settings> m_gio;
    std::unique_ptr<GeneratorSettings> m_settings;
};

TEST(GeneratorSettingsConstructionTest, NullSettingsThrows) {
    Glib::RefPtr<Gio::Settings> null_settings;
    EXPECT_THROW({ GeneratorSettings settings(null_settings); }, std::invalid_argument);
}

TEST_F(GeneratorSettingsTest, CreateFindsInstalledSchema) {
    auto created = GeneratorSettings::create();
    ASSERT_TRUE(created.has_value());
    EXPECT_NE(created->get(), nullptr);
}

TEST_F(GeneratorSettingsTest, DefaultsMatchSchema) {
    const auto options = m_settings->load_options();

    EXPECT_FALSE(options.uppercase);
    EXPECT_TRUE(options.lowercase);
    EXPECT_FALSE(options.digits);
    EXPECT_FALSE(options.symbols);
    EXPECT_FALSE(options.ambiguous);
    EXPECT_FALSE(options.similar);
    EXPECT_FALSE(options.pronounceable);
    EXPECT_EQ(options.mode, GenerationMode::Password);
    EXPECT_EQ(options.word_count, 6u);
    EXPECT_EQ(options.separator, "-");

    EXPECT_EQ(m_settings->password_length(), 47u);
    EXPECT_TRUE(m_settings->wordlist_path().empty());
    EXPECT_FALSE(m_settings->external_breach_check());
    EXPECT_EQ(m_settings->breach_check_timeout(), std::chrono::seconds(5));
    EXPECT_EQ(m_settings->log_level(), "info");
}

TEST_F(GeneratorSettingsTest, SaveThenLoadOptions) {
    GenerationOptions options;
    options.uppercase = true;
    options.lowercase = true;
    options.digits = true;
    options.symbols = false;
    options.similar = true;
    options.mode = GenerationMode::Passphrase;
    options.word_count = 9;
    options.separator = ".";

    m_settings->save_options(options, 32);

    const auto loaded = m_settings->load_options();
    EXPECT_TRUE(loaded.uppercase);
    EXPECT_TRUE(loaded.digits);
    EXPECT_FALSE(loaded.symbols);
    EXPECT_TRUE(loaded.similar);
    EXPECT_EQ(loaded.mode, GenerationMode::Passphrase);
    EXPECT_EQ(loaded.word_count, 9u);
    EXPECT_EQ(loaded.separator, ".");
    EXPECT_EQ(m_settings->password_length(), 32u);
}

TEST_F(GeneratorSettingsTest, SaveClampsToSafeRanges) {
    GenerationOptions options;
    options.word_count = 64;

    m_settings->save_options(options, 4096);
    EXPECT_EQ(m_settings->password_length(), 128u);
    EXPECT_EQ(m_settings->load_options().word_count, 20u);

    options.word_count = 1;
    m_settings->save_options(options, 4);
    EXPECT_EQ(m_settings->password_length(), 8u);
    EXPECT_EQ(m_settings->load_options().word_count, 3u);
}

TEST_F(GeneratorSettingsTest, OverlongSeparatorIsNotSaved) {
    GenerationOptions options;
    options.separator = "-----------";

    m_settings->save_options(options, 20);
    EXPECT_EQ(m_settings->load_options().separator, "-");
}

TEST_F(GeneratorSettingsTest, TypedSetters) {
    m_settings->set_external_breach_check(true);
    EXPECT_TRUE(m_settings->external_breach_check());

    m_settings->set_wordlist_path("/usr/share/dict/diceware.txt");
    EXPECT_EQ(m_settings->wordlist_path(), "/usr/share/dict/diceware.txt");
}

TEST_F(GeneratorSettingsTest, ChangedSignalRelaysKey) {
    std::vector<std::string> changed;
    m_settings->signal_changed().connect([&changed](const std::string& key) { changed.push_back(key); });

    m_settings->set_external_breach_check(true);

    ASSERT_FALSE(changed.empty());
    EXPECT_EQ(changed.back(), GeneratorSettings::KEY_EXTERNAL_BREACH_CHECK);
}

TEST_F(GeneratorSettingsTest, DefaultPresetsFromSchema) {
    auto presets = m_settings->load_presets();
    ASSERT_TRUE(presets.has_value());
    EXPECT_EQ(*presets, default_password_presets());
}

TEST_F(GeneratorSettingsTest, PresetsRoundTripThroughGSettings) {
    PasswordPreset custom;
    custom.name = "PIN-ish";
    custom.length = 10;
    custom.char_set = "Digits";
    custom.strength = 40;
    custom.options.uppercase = false;
    custom.options.lowercase = false;
    custom.options.symbols = false;
    custom.options.digits = true;
    custom.options.ambiguous = true;
    custom.options.pronounceable = false;

    std::vector<PasswordPreset> presets{custom};
    ASSERT_TRUE(m_settings->save_presets(presets));

    auto loaded = m_settings->load_presets();
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 1u);
    const auto& back = loaded->front();
    EXPECT_EQ(back.name, "PIN-ish");
    EXPECT_EQ(back.length, 10u);
    EXPECT_EQ(back.char_set, "Digits");
    EXPECT_EQ(back.strength, 40);
    EXPECT_TRUE(back.options.digits);
    EXPECT_TRUE(back.options.ambiguous);
    EXPECT_FALSE(back.options.uppercase);
    EXPECT_FALSE(back.options.symbols);
}

TEST_F(GeneratorSettingsTest, EmptyPresetListIsStored) {
    ASSERT_TRUE(m_settings->save_presets({}));
    auto loaded = m_settings->load_presets();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->empty());
}
