// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "CharsetBuilder.h"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace Pulsar {

std::string CharsetBuilder::build_pool(const GenerationOptions& options) {
    std::string pool;
    pool.reserve(UPPERCASE.size() + LOWERCASE.size() + DIGITS.size() + SYMBOLS.size());

    if (options.uppercase) pool += UPPERCASE;
    if (options.lowercase) pool += LOWERCASE;
    if (options.digits) pool += DIGITS;
    if (options.symbols) pool += SYMBOLS;

    if (options.ambiguous) {
        pool = remove_all(pool, AMBIGUOUS);
    }

    if (options.similar) {
        pool = remove_all(pool, SIMILAR);
    }

    return pool;
}

void CharsetBuilder::partition_vowels(std::string_view pool,
                                      std::string& vowels,
                                      std::string& consonants) {
    vowels.clear();
    consonants.clear();

    for (char c : pool) {
        if (is_vowel(c)) {
            vowels.push_back(c);
        } else {
            consonants.push_back(c);
        }
    }
}

bool CharsetBuilder::is_vowel(char c) noexcept {
    const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return VOWELS.find(lower) != std::string_view::npos;
}

std::string CharsetBuilder::remove_all(std::string_view pool, std::string_view excluded) {
    std::string filtered;
    filtered.reserve(pool.size());
    std::ranges::copy_if(pool, std::back_inserter(filtered), [excluded](char c) {
        return excluded.find(c) == std::string_view::npos;
    });
    return filtered;
}

} // namespace Pulsar
