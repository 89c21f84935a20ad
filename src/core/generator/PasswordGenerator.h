// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file PasswordGenerator.h
 * @brief Fixed-length random password generation
 *
 * Draws one 32-bit random value per output character and maps it onto the
 * character pool with `pool[value % pool.size()]`.
 *
 * @section pronounceable Pronounceable Mode
 * The pool is split into vowels (a, e, i, o, u in either case) and
 * consonants (everything else). Even positions draw from the consonants,
 * odd positions from the vowels, each as `subset[value % subset.size()]`.
 * When either subset is empty (for example a symbols-only pool) every
 * position falls back to uniform selection over the whole pool.
 *
 * @section errors Error Reporting
 * - generate(): never fails, returns "" when the pool is empty, the length
 *   is zero, or the random source fails. Any non-zero length is honored.
 *   This is the behavior the settings screens and presets rely on.
 * - try_generate(): reports the reason as a GeneratorError and also rejects
 *   lengths above MAX_LENGTH.
 */

#pragma once

#include "GenerationOptions.h"
#include "RandomSource.h"
#include "../GeneratorError.h"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Pulsar {

class PasswordGenerator {
public:
    /// Upper bound accepted by try_generate(); generate() is not capped
    static constexpr uint32_t MAX_LENGTH = 4096;

    /**
     * @brief Construct a generator
     * @param source Random source (must outlive the generator)
     */
    explicit PasswordGenerator(IRandomSource& source = OpenSslRandomSource::instance());

    /**
     * @brief Generate a password, degrading to "" on any failure
     * @param length Number of characters
     * @param options Character classes, exclusions, pronounceable flag
     * @return Password of exactly @p length characters, or ""
     */
    [[nodiscard]] std::string generate(uint32_t length, const GenerationOptions& options) const;

    /**
     * @brief Generate a password, reporting why generation is impossible
     * @return Password or EmptyCharsetPool / InvalidLength / RandomSourceFailed
     */
    [[nodiscard]] GeneratorResult<std::string>
    try_generate(uint32_t length, const GenerationOptions& options) const;

    /**
     * @brief Map random values onto a pool (pure index arithmetic)
     * @param pool Non-empty character pool
     * @param values One random value per output character
     * @param pronounceable Alternate consonant/vowel subsets
     * @return Selected characters, values.size() long
     */
    [[nodiscard]] static std::string select_characters(std::string_view pool,
                                                       std::span<const uint32_t> values,
                                                       bool pronounceable);

private:
    GeneratorResult<std::string> generate_checked(uint32_t length, const GenerationOptions& options) const;

    IRandomSource& m_source;
};

} // namespace Pulsar
