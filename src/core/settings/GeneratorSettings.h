// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file GeneratorSettings.h
 * @brief Typed handle over the com.pulsar.generator GSettings schema
 *
 * Owns the Gio::Settings object and translates between GSettings keys and
 * the generator's own types. Numeric keys are read through
 * SettingsValidator, so out-of-range values never reach the generators.
 *
 * The handle is passed explicitly to whoever needs configuration; nothing
 * looks it up globally.
 */

#ifndef PULSAR_GENERATOR_SETTINGS_H
#define PULSAR_GENERATOR_SETTINGS_H

#include "PasswordPreset.h"
#include "../GeneratorError.h"
#include "../generator/GenerationOptions.h"
#include <giomm/settings.h>
#include <sigc++/connection.h>
#include <sigc++/signal.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Pulsar {

class GeneratorSettings {
public:
    static constexpr const char* SCHEMA_ID = "com.pulsar.generator";

    static constexpr const char* KEY_PASSWORD_LENGTH = "password-length";
    static constexpr const char* KEY_USE_UPPERCASE = "use-uppercase";
    static constexpr const char* KEY_USE_LOWERCASE = "use-lowercase";
    static constexpr const char* KEY_USE_DIGITS = "use-digits";
    static constexpr const char* KEY_USE_SYMBOLS = "use-symbols";
    static constexpr const char* KEY_EXCLUDE_AMBIGUOUS = "exclude-ambiguous";
    static constexpr const char* KEY_EXCLUDE_SIMILAR = "exclude-similar";
    static constexpr const char* KEY_PRONOUNCEABLE = "pronounceable";
    static constexpr const char* KEY_GENERATION_MODE = "generation-mode";
    static constexpr const char* KEY_WORD_COUNT = "passphrase-word-count";
    static constexpr const char* KEY_SEPARATOR = "passphrase-separator";
    static constexpr const char* KEY_WORDLIST_PATH = "wordlist-path";
    static constexpr const char* KEY_EXTERNAL_BREACH_CHECK = "external-breach-check";
    static constexpr const char* KEY_BREACH_TIMEOUT = "breach-check-timeout";
    static constexpr const char* KEY_LOG_LEVEL = "log-level";
    static constexpr const char* KEY_PRESETS = "password-presets";

    /**
     * @brief Wrap an existing settings object
     * @param settings Settings bound to SCHEMA_ID
     * @throws std::invalid_argument if settings is null
     */
    explicit GeneratorSettings(Glib::RefPtr<Gio::Settings> settings);
    ~GeneratorSettings();

    GeneratorSettings(const GeneratorSettings&) = delete;
    GeneratorSettings& operator=(const GeneratorSettings&) = delete;

    /**
     * @brief Open the installed schema
     * @return Handle, or SettingsUnavailable when the schema is not installed
     */
    [[nodiscard]] static GeneratorResult<std::unique_ptr<GeneratorSettings>> create();

    /**
     * @brief Generator options as configured (classes, exclusions, mode, words)
     */
    [[nodiscard]] GenerationOptions load_options() const;

    /**
     * @brief Persist options and password length as the new defaults
     */
    void save_options(const GenerationOptions& options, uint32_t password_length);

    [[nodiscard]] uint32_t password_length() const;
    [[nodiscard]] std::string wordlist_path() const;
    [[nodiscard]] bool external_breach_check() const;
    [[nodiscard]] std::chrono::seconds breach_check_timeout() const;
    [[nodiscard]] std::string log_level() const;

    void set_external_breach_check(bool enabled);
    void set_wordlist_path(const std::string& path);

    /**
     * @brief Stored preset list
     * @return Presets, or nullopt if the stored value cannot be decoded
     */
    [[nodiscard]] std::optional<std::vector<PasswordPreset>> load_presets() const;

    /**
     * @brief Replace the stored preset list
     * @return false if GSettings rejected the value
     */
    bool save_presets(const std::vector<PasswordPreset>& presets);

    /// Emitted with the key name whenever a key of the schema changes
    [[nodiscard]] sigc::signal<void(const std::string&)>& signal_changed() noexcept {
        return m_signal_changed;
    }

    [[nodiscard]] const Glib::RefPtr<Gio::Settings>& gio_settings() const noexcept { return m_settings; }

private:
    Glib::RefPtr<Gio::Settings> m_settings;
    sigc::connection m_changed_connection;
    sigc::signal<void(const std::string&)> m_signal_changed;
};

} // namespace Pulsar

#endif // PULSAR_GENERATOR_SETTINGS_H
