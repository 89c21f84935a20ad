// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef PULSAR_SETTINGS_VALIDATOR_H
#define PULSAR_SETTINGS_VALIDATOR_H

#include <algorithm>
#include <string>
#include <giomm/settings.h>

namespace Pulsar {

/**
 * @brief Validates and enforces safety constraints on GSettings values
 *
 * Runtime validation so that editing the GSettings schema file cannot push
 * the generator outside safe limits. Values are clamped to the ranges below
 * even if the schema allows more.
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class SettingsValidator final {
public:
    static inline constexpr int MIN_PASSWORD_LENGTH{8};
    static inline constexpr int MAX_PASSWORD_LENGTH{128};
    static inline constexpr int DEFAULT_PASSWORD_LENGTH{47};

    static inline constexpr int MIN_WORD_COUNT{3};
    static inline constexpr int MAX_WORD_COUNT{20};
    static inline constexpr int DEFAULT_WORD_COUNT{6};

    static inline constexpr int MIN_BREACH_TIMEOUT{1};     // seconds
    static inline constexpr int MAX_BREACH_TIMEOUT{30};
    static inline constexpr int DEFAULT_BREACH_TIMEOUT{5};

    static inline constexpr std::string::size_type MAX_SEPARATOR_LENGTH{8};
    static inline constexpr const char* DEFAULT_SEPARATOR{"-"};

    /**
     * @brief Get password length with validation
     * @param settings GSettings instance (must not be null)
     * @return Validated length (8-128)
     */
    [[nodiscard]] static int get_password_length(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("password-length")};
        return std::clamp(value, MIN_PASSWORD_LENGTH, MAX_PASSWORD_LENGTH);
    }

    /**
     * @brief Get passphrase word count with validation
     * @return Validated word count (3-20)
     */
    [[nodiscard]] static int get_word_count(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("passphrase-word-count")};
        return std::clamp(value, MIN_WORD_COUNT, MAX_WORD_COUNT);
    }

    /**
     * @brief Get breach-check timeout with validation
     * @return Validated timeout in seconds (1-30)
     */
    [[nodiscard]] static int get_breach_timeout(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("breach-check-timeout")};
        return std::clamp(value, MIN_BREACH_TIMEOUT, MAX_BREACH_TIMEOUT);
    }

    /**
     * @brief Get passphrase separator with validation
     * @return Separator, or "-" when longer than 8 bytes
     *
     * An empty separator is allowed (words run together).
     */
    [[nodiscard]] static std::string get_separator(const Glib::RefPtr<Gio::Settings>& settings) {
        std::string value{settings->get_string("passphrase-separator").raw()};
        if (value.size() > MAX_SEPARATOR_LENGTH) {
            return DEFAULT_SEPARATOR;
        }
        return value;
    }

    /**
     * @brief Check whether password lengths from presets or the CLI are acceptable
     */
    [[nodiscard]] static constexpr bool is_valid_password_length(int length) noexcept {
        return length >= MIN_PASSWORD_LENGTH && length <= MAX_PASSWORD_LENGTH;
    }

private:
    SettingsValidator() = delete;                                    // No instantiation
    ~SettingsValidator() = delete;                                   // No destruction
    SettingsValidator(const SettingsValidator&) = delete;            // No copy
    SettingsValidator& operator=(const SettingsValidator&) = delete; // No copy assignment
    SettingsValidator(SettingsValidator&&) = delete;                 // No move
    SettingsValidator& operator=(SettingsValidator&&) = delete;      // No move assignment
};

} // namespace Pulsar

#endif // PULSAR_SETTINGS_VALIDATOR_H
