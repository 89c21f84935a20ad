// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file PassphraseGenerator.h
 * @brief Word-based passphrase generation
 *
 * Draws one 32-bit random value per word, selects
 * `words[value % words.size()]` and joins the words with the separator in
 * draw order. Repeated words are allowed; nothing is sorted or deduplicated.
 */

#pragma once

#include "RandomSource.h"
#include "WordList.h"
#include "../GeneratorError.h"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace Pulsar {

class PassphraseGenerator {
public:
    /// Upper bound accepted by try_generate_passphrase(); generate_passphrase() is not capped
    static constexpr uint32_t MAX_WORD_COUNT = 64;

    /**
     * @brief Construct a generator
     * @param word_list_path Word list file (loaded on first use)
     * @param cache Memoizing loader (must outlive the generator)
     * @param source Random source (must outlive the generator)
     */
    explicit PassphraseGenerator(std::filesystem::path word_list_path,
                                 WordListCache& cache = WordListCache::shared(),
                                 IRandomSource& source = OpenSslRandomSource::instance());

    /**
     * @brief Generate a passphrase, degrading to "" on any failure
     *
     * Any non-zero word count is honored.
     */
    [[nodiscard]] std::string generate_passphrase(uint32_t word_count, std::string_view separator) const;

    /**
     * @brief Generate a passphrase, reporting failures
     * @return Passphrase, or InvalidWordCount / WordList* / RandomSourceFailed
     */
    [[nodiscard]] GeneratorResult<std::string>
    try_generate_passphrase(uint32_t word_count, std::string_view separator) const;

    /**
     * @brief Size of the configured word list (loads it if needed)
     */
    [[nodiscard]] GeneratorResult<size_t> word_list_size() const;

    [[nodiscard]] const std::filesystem::path& word_list_path() const noexcept { return m_path; }

    /**
     * @brief Select and join words (pure index arithmetic)
     * @param words Non-empty word list
     * @param values One random value per word
     * @param separator Joiner placed between consecutive words
     */
    [[nodiscard]] static std::string join_words(const WordList& words,
                                                std::span<const uint32_t> values,
                                                std::string_view separator);

private:
    GeneratorResult<std::string> generate_checked(uint32_t word_count, std::string_view separator) const;

    std::filesystem::path m_path;
    WordListCache& m_cache;
    IRandomSource& m_source;
};

} // namespace Pulsar
