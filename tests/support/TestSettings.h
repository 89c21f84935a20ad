// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file TestSettings.h
 * @brief Opens the compiled com.pulsar.generator schema for tests
 *
 * The test environment points GSETTINGS_SCHEMA_DIR at the build's compiled
 * schema and selects the memory backend, so nothing touches dconf.
 */

#pragma once

#include "../../src/core/settings/GeneratorSettings.h"
#include <giomm/init.h>
#include <giomm/settings.h>
#include <giomm/settingsschemasource.h>
#include <array>

namespace Pulsar::Testing {

/**
 * @brief Settings for the generator schema, or null when it is not available
 *
 * Looks the schema up first: Gio::Settings::create() aborts the process on
 * an unknown schema instead of throwing.
 */
inline Glib::RefPtr<Gio::Settings> open_test_settings() {
    Gio::init();

    auto source = Gio::SettingsSchemaSource::get_default();
    if (!source || !source->lookup(GeneratorSettings::SCHEMA_ID, true)) {
        return {};
    }
    return Gio::Settings::create(GeneratorSettings::SCHEMA_ID);
}

/**
 * @brief Return every key to its schema default
 */
inline void reset_test_settings(const Glib::RefPtr<Gio::Settings>& settings) {
    static constexpr std::array KEYS = {
        GeneratorSettings::KEY_PASSWORD_LENGTH,
        GeneratorSettings::KEY_USE_UPPERCASE,
        GeneratorSettings::KEY_USE_LOWERCASE,
        GeneratorSettings::KEY_USE_DIGITS,
        GeneratorSettings::KEY_USE_SYMBOLS,
        GeneratorSettings::KEY_EXCLUDE_AMBIGUOUS,
        GeneratorSettings::KEY_EXCLUDE_SIMILAR,
        GeneratorSettings::KEY_PRONOUNCEABLE,
        GeneratorSettings::KEY_GENERATION_MODE,
        GeneratorSettings::KEY_WORD_COUNT,
        GeneratorSettings::KEY_SEPARATOR,
        GeneratorSettings::KEY_WORDLIST_PATH,
        GeneratorSettings::KEY_EXTERNAL_BREACH_CHECK,
        GeneratorSettings::KEY_BREACH_TIMEOUT,
        GeneratorSettings::KEY_LOG_LEVEL,
        GeneratorSettings::KEY_PRESETS,
    };

    if (!settings) {
        return;
    }
    for (const char* key : KEYS) {
        settings->reset(key);
    }
}

} // namespace Pulsar::Testing
