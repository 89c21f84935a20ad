// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file EntropyEstimator.h
 * @brief Bits-of-entropy estimates for generated secrets
 *
 * Password mode: floor(length * log2(pool_size)).
 * Passphrase mode: floor(word_count * log2(word_list_size)).
 * Both return 0 when the pool or list size is not positive.
 *
 * @section pool_size Pool Size Shortcut
 * get_pool_size() is the quick estimate shown next to the length slider: it
 * adds the class sizes and subtracts the seven ambiguous glyphs, but it does
 * NOT account for the `similar` exclusion. actual_pool_size() measures the
 * pool the generator really uses. The two differ whenever `similar` is set
 * (and slightly when `ambiguous` removes glyphs from disabled classes);
 * callers that need an exact figure must use actual_pool_size().
 */

#pragma once

#include "GenerationOptions.h"
#include <cstdint>

namespace Pulsar {

class EntropyEstimator final {
public:
    /**
     * @brief Entropy in whole bits
     * @param count Characters (password) or words (passphrase)
     * @param pool_or_list_size Pool size or word list size
     * @param mode Which formula to apply (both are count * log2(size))
     * @return floor(count * log2(size)), or 0 if size <= 0
     */
    [[nodiscard]] static int64_t calculate_entropy(int64_t count,
                                                   int64_t pool_or_list_size,
                                                   GenerationMode mode = GenerationMode::Password) noexcept;

    /**
     * @brief Quick pool size from class flags (ignores `similar`)
     * @return Sum of enabled class sizes, minus 7 if `ambiguous`, floored at 0
     */
    [[nodiscard]] static int64_t get_pool_size(const GenerationOptions& options) noexcept;

    /**
     * @brief Exact size of the pool CharsetBuilder produces for @p options
     */
    [[nodiscard]] static int64_t actual_pool_size(const GenerationOptions& options);

private:
    static constexpr int64_t AMBIGUOUS_PENALTY = 7;

    EntropyEstimator() = delete;
};

} // namespace Pulsar
