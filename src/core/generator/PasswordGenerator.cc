// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "PasswordGenerator.h"
#include "CharsetBuilder.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"

namespace Pulsar {

PasswordGenerator::PasswordGenerator(IRandomSource& source)
    : m_source(source) {
}

std::string PasswordGenerator::generate(uint32_t length, const GenerationOptions& options) const {
    auto result = generate_checked(length, options);
    if (!result) {
        Log::warning("PasswordGenerator: Returning empty password ({})", to_string(result.error()));
        return {};
    }
    return std::move(*result);
}

GeneratorResult<std::string>
PasswordGenerator::try_generate(uint32_t length, const GenerationOptions& options) const {
    if (length > MAX_LENGTH) {
        return std::unexpected(GeneratorError::InvalidLength);
    }
    return generate_checked(length, options);
}

GeneratorResult<std::string>
PasswordGenerator::generate_checked(uint32_t length, const GenerationOptions& options) const {
    if (length == 0) {
        return std::unexpected(GeneratorError::InvalidLength);
    }

    const std::string pool = CharsetBuilder::build_pool(options);
    if (pool.empty()) {
        return std::unexpected(GeneratorError::EmptyCharsetPool);
    }

    SecureVector<uint32_t> values(length);
    if (auto filled = m_source.fill(values); !filled) {
        return std::unexpected(filled.error());
    }

    return select_characters(pool, values, options.pronounceable);
}

std::string PasswordGenerator::select_characters(std::string_view pool,
                                                 std::span<const uint32_t> values,
                                                 bool pronounceable) {
    std::string password;
    password.reserve(values.size());

    if (pronounceable) {
        std::string vowels;
        std::string consonants;
        CharsetBuilder::partition_vowels(pool, vowels, consonants);

        if (!vowels.empty() && !consonants.empty()) {
            for (size_t i = 0; i < values.size(); ++i) {
                const std::string& source = (i % 2 == 0) ? consonants : vowels;
                password.push_back(source[values[i] % source.size()]);
            }
            return password;
        }
        // One subset is empty: uniform selection over the whole pool
    }

    for (uint32_t value : values) {
        password.push_back(pool[value % pool.size()]);
    }
    return password;
}

} // namespace Pulsar
