// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file GeneratorCommand.h
 * @brief One invocation of pulsar-gen, independent of option parsing
 *
 * Application parses the command line into CommandOptions and hands it to
 * GeneratorCommand::run(). Keeping the two apart lets the behavior of every
 * option be exercised without a GApplication.
 *
 * @section resolution Option Resolution
 * 1. Start from the stored defaults (GSettings, or built-in values when the
 *    schema is not installed).
 * 2. `--preset` replaces length, character classes and exclusions.
 * 3. Any explicit class flag replaces the whole class selection.
 * 4. Exclusion flags, `--passphrase`, `--words`, `--separator` and
 *    `--length` are applied on top.
 */

#ifndef PULSAR_GENERATOR_COMMAND_H
#define PULSAR_GENERATOR_COMMAND_H

#include "../core/generator/GenerationOptions.h"
#include "../core/generator/PasswordGenerator.h"
#include "../core/generator/WordList.h"
#include "../core/security/BreachChecker.h"
#include "../core/security/StrengthEstimator.h"
#include "../core/settings/PasswordPresetStore.h"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace Pulsar {

class GeneratorSettings;

/**
 * @brief Parsed command-line options
 *
 * Unset optionals mean "not given on the command line".
 */
struct CommandOptions {
    std::optional<int> length;
    bool uppercase = false;
    bool lowercase = false;
    bool digits = false;
    bool symbols = false;
    bool exclude_ambiguous = false;
    bool exclude_similar = false;
    bool pronounceable = false;

    bool passphrase = false;
    std::optional<int> words;
    std::optional<std::string> separator;
    std::optional<std::string> wordlist;

    std::optional<std::string> preset;
    bool list_presets = false;
    std::optional<int> count;

    bool strength = false;
    bool check_breach = false;
    std::optional<std::string> check_text;

    std::optional<std::string> log_level;
    bool save = false;

    [[nodiscard]] bool has_class_flag() const noexcept {
        return uppercase || lowercase || digits || symbols;
    }
};

/**
 * @brief Fully resolved generation request
 */
struct GenerationRequest {
    GenerationOptions options;
    uint32_t length = 0;
    uint32_t count = 1;
    std::filesystem::path wordlist_path;
};

class GeneratorCommand {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_GENERATION_ERROR = 1;
    static constexpr int EXIT_USAGE_ERROR = 2;

    static constexpr int MAX_COUNT = 1000;

    /// Values used when no settings schema is installed
    static constexpr uint32_t FALLBACK_PASSWORD_LENGTH = 47;

    /**
     * @param settings Stored configuration, or nullptr to use built-in defaults
     * @param presets Preset list
     * @param breach_checker Breach lookup used by --check-breach
     * @param default_wordlist Word list used when neither settings nor
     *        --wordlist name one
     * @param out Destination of generated secrets and reports
     * @param err Destination of user-facing error messages
     * @param cache Word list cache
     * @param source Random source for both generators
     */
    GeneratorCommand(GeneratorSettings* settings,
                     PasswordPresetStore& presets,
                     BreachChecker& breach_checker,
                     std::filesystem::path default_wordlist,
                     std::ostream& out,
                     std::ostream& err,
                     WordListCache& cache = WordListCache::shared(),
                     IRandomSource& source = OpenSslRandomSource::instance());

    /**
     * @brief Execute the command
     * @return EXIT_OK, EXIT_GENERATION_ERROR or EXIT_USAGE_ERROR
     */
    [[nodiscard]] int run(const CommandOptions& options);

    /**
     * @brief Apply defaults, preset and flags
     * @return Request, or an error message describing the usage error
     */
    [[nodiscard]] std::expected<GenerationRequest, std::string>
    resolve(const CommandOptions& options) const;

    /// Generator options used when no settings schema is installed
    [[nodiscard]] static GenerationOptions fallback_options();

private:
    int list_presets();
    int check_text(const std::string& text, bool with_breach);
    int generate(const GenerationRequest& request, bool with_strength, bool with_breach);

    /// Strength (and breach) lines for @p candidate; the candidate itself is not printed
    void print_report(const std::string& candidate, std::optional<int64_t> entropy_bits, bool with_breach);

    GeneratorSettings* m_settings;
    PasswordPresetStore& m_presets;
    BreachChecker& m_breach_checker;
    std::filesystem::path m_default_wordlist;
    std::ostream& m_out;
    std::ostream& m_err;
    WordListCache& m_cache;
    IRandomSource& m_source;
};

} // namespace Pulsar

#endif // PULSAR_GENERATOR_COMMAND_H
