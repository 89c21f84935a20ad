// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file CharsetBuilder.h
 * @brief Assembles the character pool used by the password generator
 *
 * The pool is the concatenation of the enabled class alphabets in the fixed
 * order uppercase, lowercase, digits, symbols. Exclusion sets are applied
 * afterwards as plain membership filters, so a single exclusion can remove
 * characters contributed by any class.
 *
 * @section order Order of Operations
 * 1. Concatenate enabled alphabets (A-Z, a-z, 0-9, symbols)
 * 2. Remove ambiguous glyphs when `ambiguous` is set
 * 3. Remove similar glyphs when `similar` is set
 */

#ifndef PULSAR_CHARSET_BUILDER_H
#define PULSAR_CHARSET_BUILDER_H

#include "GenerationOptions.h"
#include <string>
#include <string_view>

namespace Pulsar {

class CharsetBuilder final {
public:
    static inline constexpr std::string_view UPPERCASE{"ABCDEFGHIJKLMNOPQRSTUVWXYZ"};
    static inline constexpr std::string_view LOWERCASE{"abcdefghijklmnopqrstuvwxyz"};
    static inline constexpr std::string_view DIGITS{"0123456789"};
    static inline constexpr std::string_view SYMBOLS{"!@#$%^&*()_+-=[]{}|;:,.<>?"};

    /// Easily confused glyphs removed by the `ambiguous` option
    static inline constexpr std::string_view AMBIGUOUS{"iI1LoO0"};

    /// Case-paired look-alikes removed by the `similar` option
    static inline constexpr std::string_view SIMILAR{
        "oO0l1IvVwWsScCpPkKxXzZbBdDgGqQeEfFtTuUjJmMnrRhHaAyY"};

    /// Vowels used by pronounceable mode (compared case-insensitively)
    static inline constexpr std::string_view VOWELS{"aeiou"};

    /**
     * @brief Build the pool for the given options
     * @param options Generator options (mode fields are ignored)
     * @return Ordered, duplicate-free pool; empty when no class is enabled
     *         or the exclusions remove every character
     */
    [[nodiscard]] static std::string build_pool(const GenerationOptions& options);

    /**
     * @brief Split a pool into its vowel and consonant subsets
     * @param pool Character pool (order preserved in both subsets)
     * @param[out] vowels Pool characters that are a, e, i, o or u in any case
     * @param[out] consonants Every other pool character
     */
    static void partition_vowels(std::string_view pool,
                                 std::string& vowels,
                                 std::string& consonants);

    [[nodiscard]] static bool is_vowel(char c) noexcept;

private:
    [[nodiscard]] static std::string remove_all(std::string_view pool, std::string_view excluded);

    CharsetBuilder() = delete;
};

} // namespace Pulsar

#endif // PULSAR_CHARSET_BUILDER_H
