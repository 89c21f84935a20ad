// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "EntropyEstimator.h"
#include "CharsetBuilder.h"
#include <algorithm>
#include <cmath>

namespace Pulsar {

int64_t EntropyEstimator::calculate_entropy(int64_t count,
                                            int64_t pool_or_list_size,
                                            GenerationMode mode) noexcept {
    // Same formula for both modes; the mode only names what is counted
    static_cast<void>(mode);

    if (pool_or_list_size <= 0 || count <= 0) {
        return 0;
    }

    const double bits = static_cast<double>(count) * std::log2(static_cast<double>(pool_or_list_size));
    return static_cast<int64_t>(std::floor(bits));
}

int64_t EntropyEstimator::get_pool_size(const GenerationOptions& options) noexcept {
    int64_t size = 0;
    if (options.uppercase) size += static_cast<int64_t>(CharsetBuilder::UPPERCASE.size());
    if (options.lowercase) size += static_cast<int64_t>(CharsetBuilder::LOWERCASE.size());
    if (options.digits) size += static_cast<int64_t>(CharsetBuilder::DIGITS.size());
    if (options.symbols) size += static_cast<int64_t>(CharsetBuilder::SYMBOLS.size());

    if (options.ambiguous) {
        size = std::max<int64_t>(0, size - AMBIGUOUS_PENALTY);
    }
    return size;
}

int64_t EntropyEstimator::actual_pool_size(const GenerationOptions& options) {
    return static_cast<int64_t>(CharsetBuilder::build_pool(options).size());
}

} // namespace Pulsar
