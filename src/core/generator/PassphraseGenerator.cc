// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "PassphraseGenerator.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"

namespace Pulsar {

PassphraseGenerator::PassphraseGenerator(std::filesystem::path word_list_path,
                                         WordListCache& cache,
                                         IRandomSource& source)
    : m_path(std::move(word_list_path)),
      m_cache(cache),
      m_source(source) {
}

std::string PassphraseGenerator::generate_passphrase(uint32_t word_count, std::string_view separator) const {
    auto result = generate_checked(word_count, separator);
    if (!result) {
        Log::warning("PassphraseGenerator: Returning empty passphrase ({})", to_string(result.error()));
        return {};
    }
    return std::move(*result);
}

GeneratorResult<std::string>
PassphraseGenerator::try_generate_passphrase(uint32_t word_count, std::string_view separator) const {
    if (word_count > MAX_WORD_COUNT) {
        return std::unexpected(GeneratorError::InvalidWordCount);
    }
    return generate_checked(word_count, separator);
}

GeneratorResult<std::string>
PassphraseGenerator::generate_checked(uint32_t word_count, std::string_view separator) const {
    if (word_count == 0) {
        return std::unexpected(GeneratorError::InvalidWordCount);
    }

    auto words = m_cache.get(m_path);
    if (!words) {
        return std::unexpected(words.error());
    }

    SecureVector<uint32_t> values(word_count);
    if (auto filled = m_source.fill(values); !filled) {
        return std::unexpected(filled.error());
    }

    return join_words(**words, values, separator);
}

GeneratorResult<size_t> PassphraseGenerator::word_list_size() const {
    auto words = m_cache.get(m_path);
    if (!words) {
        return std::unexpected(words.error());
    }
    return (*words)->size();
}

std::string PassphraseGenerator::join_words(const WordList& words,
                                            std::span<const uint32_t> values,
                                            std::string_view separator) {
    std::string passphrase;

    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            passphrase += separator;
        }
        passphrase += words[values[i] % words.size()];
    }

    return passphrase;
}

} // namespace Pulsar
