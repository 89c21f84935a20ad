// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file WordList.h
 * @brief Word list used for passphrase generation
 *
 * A word list is an ordered sequence of distinct lowercase words. Files may
 * use one word per line or the diceware layout where each line starts with
 * the dice roll (`11111<TAB>abacus`); in both cases the word is the last
 * whitespace-separated field. Blank lines and `#` comments are ignored.
 *
 * The list is large and only needed in passphrase mode, so it is loaded on
 * first use through WordListCache, which memoizes one list per path.
 */

#pragma once

#include "../GeneratorError.h"
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Pulsar {

class WordList {
public:
    /**
     * @brief Build a list from already-parsed words
     *
     * Words are lowercased; empty words and duplicates are dropped (first
     * occurrence kept).
     */
    explicit WordList(std::vector<std::string> words);

    /**
     * @brief Parse word list text
     * @param text File contents
     * @return List, or WordListEmpty if no word survives parsing
     */
    [[nodiscard]] static GeneratorResult<WordList> parse(std::string_view text);

    /**
     * @brief Load and parse a word list file
     * @return List, or WordListNotFound / WordListReadFailed / WordListEmpty
     */
    [[nodiscard]] static GeneratorResult<WordList> load_from_file(const std::filesystem::path& path);

    [[nodiscard]] size_t size() const noexcept { return m_words.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_words.empty(); }
    [[nodiscard]] const std::string& operator[](size_t index) const { return m_words[index]; }
    [[nodiscard]] const std::vector<std::string>& words() const noexcept { return m_words; }
    [[nodiscard]] bool contains(std::string_view word) const;

private:
    std::vector<std::string> m_words;
};

/**
 * @brief Lazily loads word lists once and shares them
 *
 * Thread-safety: concurrent get() calls for the same path block on the
 * single in-flight load and all receive the same list. A failed load is not
 * cached, so a later call retries (e.g. after the file is installed).
 */
class WordListCache {
public:
    using Loader = GeneratorResult<WordList> (*)(const std::filesystem::path&);

    explicit WordListCache(Loader loader = &WordList::load_from_file);

    WordListCache(const WordListCache&) = delete;
    WordListCache& operator=(const WordListCache&) = delete;

    /**
     * @brief Get the list for a path, loading it on first use
     */
    [[nodiscard]] GeneratorResult<std::shared_ptr<const WordList>>
    get(const std::filesystem::path& path);

    /// Number of successful loads performed (memoization check)
    [[nodiscard]] size_t load_count() const;

    void clear();

    /**
     * @brief Process-wide cache used by the passphrase generator by default
     */
    [[nodiscard]] static WordListCache& shared();

private:
    Loader m_loader;
    mutable std::mutex m_mutex;
    std::map<std::filesystem::path, std::shared_ptr<const WordList>> m_lists;
    size_t m_load_count = 0;
};

} // namespace Pulsar
