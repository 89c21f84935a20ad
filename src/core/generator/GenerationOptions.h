// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file GenerationOptions.h
 * @brief Options record shared by the password and passphrase generators
 */

#ifndef PULSAR_GENERATION_OPTIONS_H
#define PULSAR_GENERATION_OPTIONS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Pulsar {

/**
 * @brief Kind of secret to produce
 */
enum class GenerationMode : uint8_t {
    Password,    ///< Fixed-length random characters
    Passphrase   ///< Separator-joined words from the word list
};

/**
 * @brief Generator configuration
 *
 * The character-class flags select which alphabets feed the pool,
 * `ambiguous` and `similar` remove glyphs from it afterwards.
 * Defaults match an unconfigured generator call: every class on,
 * no exclusions, uniform selection.
 */
struct GenerationOptions {
    bool uppercase = true;
    bool lowercase = true;
    bool digits = true;
    bool symbols = true;
    bool ambiguous = false;      ///< Exclude i I 1 L o O 0
    bool similar = false;        ///< Exclude visually-similar glyphs
    bool pronounceable = false;  ///< Alternate consonant/vowel positions

    GenerationMode mode = GenerationMode::Password;
    uint32_t word_count = 6;
    std::string separator = "-";

    [[nodiscard]] bool has_character_class() const noexcept {
        return uppercase || lowercase || digits || symbols;
    }

    bool operator==(const GenerationOptions&) const = default;
};

[[nodiscard]] inline constexpr std::string_view to_string(GenerationMode mode) noexcept {
    switch (mode) {
        case GenerationMode::Password:
            return "password";
        case GenerationMode::Passphrase:
            return "passphrase";
    }
    return "password";
}

[[nodiscard]] inline std::optional<GenerationMode> parse_generation_mode(std::string_view text) noexcept {
    if (text == "password") {
        return GenerationMode::Password;
    }
    if (text == "passphrase") {
        return GenerationMode::Passphrase;
    }
    return std::nullopt;
}

} // namespace Pulsar

#endif // PULSAR_GENERATION_OPTIONS_H
