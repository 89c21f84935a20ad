// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "WordList.h"
#include "../../utils/Log.h"
#include "../../utils/StringHelpers.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace Pulsar {

WordList::WordList(std::vector<std::string> words) {
    std::unordered_set<std::string> seen;
    m_words.reserve(words.size());

    for (auto& word : words) {
        std::string lower = to_lower_ascii(word);
        if (lower.empty()) {
            continue;
        }
        if (!seen.insert(lower).second) {
            Log::warning("WordList: Dropping duplicate word '{}'", lower);
            continue;
        }
        m_words.push_back(std::move(lower));
    }
}

GeneratorResult<WordList> WordList::parse(std::string_view text) {
    std::vector<std::string> words;

    for (std::string_view line : split(text, '\n')) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        // Diceware layout: "11111<TAB>abacus" - the word is the last field
        const auto last_space = line.find_last_of(" \t");
        if (last_space != std::string_view::npos) {
            line = line.substr(last_space + 1);
        }
        words.emplace_back(line);
    }

    WordList list(std::move(words));
    if (list.empty()) {
        return std::unexpected(GeneratorError::WordListEmpty);
    }
    return list;
}

GeneratorResult<WordList> WordList::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        Log::error("WordList: File not found: {}", path.string());
        return std::unexpected(GeneratorError::WordListNotFound);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Log::error("WordList: Failed to open {}", path.string());
        return std::unexpected(GeneratorError::WordListReadFailed);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        Log::error("WordList: Failed to read {}", path.string());
        return std::unexpected(GeneratorError::WordListReadFailed);
    }

    auto list = parse(contents.str());
    if (!list) {
        Log::error("WordList: {} contains no words", path.string());
        return list;
    }

    Log::debug("WordList: Loaded {} words from {}", list->size(), path.string());
    return list;
}

bool WordList::contains(std::string_view word) const {
    return std::ranges::find(m_words, word) != m_words.end();
}

// ============================================================================
// WordListCache
// ============================================================================

WordListCache::WordListCache(Loader loader)
    : m_loader(loader) {
}

GeneratorResult<std::shared_ptr<const WordList>>
WordListCache::get(const std::filesystem::path& path) {
    // Held across the load so concurrent callers share the in-flight result
    std::lock_guard lock(m_mutex);

    if (auto it = m_lists.find(path); it != m_lists.end()) {
        return it->second;
    }

    auto loaded = m_loader(path);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    auto list = std::make_shared<const WordList>(std::move(*loaded));
    m_lists.emplace(path, list);
    ++m_load_count;
    return list;
}

size_t WordListCache::load_count() const {
    std::lock_guard lock(m_mutex);
    return m_load_count;
}

void WordListCache::clear() {
    std::lock_guard lock(m_mutex);
    m_lists.clear();
}

WordListCache& WordListCache::shared() {
    static WordListCache cache;
    return cache;
}

} // namespace Pulsar
