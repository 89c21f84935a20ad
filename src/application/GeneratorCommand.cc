// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "GeneratorCommand.h"
#include "../core/generator/EntropyEstimator.h"
#include "../core/generator/PassphraseGenerator.h"
#include "../core/settings/GeneratorSettings.h"
#include "../utils/Log.h"
#include "../utils/SecureMemory.h"
#include <format>

namespace Pulsar {

GeneratorCommand::GeneratorCommand(GeneratorSettings* settings,
                                   PasswordPresetStore& presets,
                                   BreachChecker& breach_checker,
                                   std::filesystem::path default_wordlist,
                                   std::ostream& out,
                                   std::ostream& err,
                                   WordListCache& cache,
                                   IRandomSource& source)
    : m_settings(settings),
      m_presets(presets),
      m_breach_checker(breach_checker),
      m_default_wordlist(std::move(default_wordlist)),
      m_out(out),
      m_err(err),
      m_cache(cache),
      m_source(source) {
}

GenerationOptions GeneratorCommand::fallback_options() {
    // Mirrors the schema defaults
    GenerationOptions options;
    options.uppercase = false;
    options.lowercase = true;
    options.digits = false;
    options.symbols = false;
    return options;
}

int GeneratorCommand::run(const CommandOptions& options) {
    if (options.log_level) {
        auto level = Log::parse_level(*options.log_level);
        if (!level) {
            m_err << std::format("Unknown log level '{}'\n", *options.log_level);
            return EXIT_USAGE_ERROR;
        }
        Log::set_level(*level);
    } else if (m_settings) {
        if (auto level = Log::parse_level(m_settings->log_level())) {
            Log::set_level(*level);
        }
    }

    if (m_settings) {
        m_breach_checker.set_timeout(m_settings->breach_check_timeout());
    }

    if (options.list_presets) {
        return list_presets();
    }

    const bool with_breach = options.check_breach ||
                             (options.strength && m_settings && m_settings->external_breach_check());

    if (options.check_text) {
        return check_text(*options.check_text, with_breach);
    }

    auto request = resolve(options);
    if (!request) {
        m_err << request.error() << '\n';
        return EXIT_USAGE_ERROR;
    }

    if (options.save) {
        if (m_settings) {
            m_settings->save_options(request->options, request->length);
        } else {
            Log::warning("Settings are unavailable, --save ignored");
            m_err << "Settings are unavailable; options were not saved\n";
        }
    }

    return generate(*request, options.strength || options.check_breach, with_breach);
}

std::expected<GenerationRequest, std::string>
GeneratorCommand::resolve(const CommandOptions& options) const {
    GenerationRequest request;
    request.options = m_settings ? m_settings->load_options() : fallback_options();
    request.length = m_settings ? m_settings->password_length() : FALLBACK_PASSWORD_LENGTH;

    if (options.preset) {
        auto preset = m_presets.find(*options.preset);
        if (!preset) {
            return std::unexpected(std::format("Unknown preset '{}'", *options.preset));
        }
        const auto word_count = request.options.word_count;
        const auto separator = request.options.separator;
        request.options = preset->options;
        request.options.mode = GenerationMode::Password;
        request.options.word_count = word_count;
        request.options.separator = separator;
        request.length = preset->length;
    }

    if (options.has_class_flag()) {
        request.options.uppercase = options.uppercase;
        request.options.lowercase = options.lowercase;
        request.options.digits = options.digits;
        request.options.symbols = options.symbols;
    }

    request.options.ambiguous = request.options.ambiguous || options.exclude_ambiguous;
    request.options.similar = request.options.similar || options.exclude_similar;
    request.options.pronounceable = request.options.pronounceable || options.pronounceable;

    if (options.passphrase) {
        request.options.mode = GenerationMode::Passphrase;
    }

    if (options.words) {
        if (*options.words < 1 || *options.words > static_cast<int>(PassphraseGenerator::MAX_WORD_COUNT)) {
            return std::unexpected(std::format("--words must be between 1 and {}",
                                               PassphraseGenerator::MAX_WORD_COUNT));
        }
        request.options.word_count = static_cast<uint32_t>(*options.words);
    }

    if (options.separator) {
        request.options.separator = *options.separator;
    }

    if (options.length) {
        if (*options.length < 1 || *options.length > static_cast<int>(PasswordGenerator::MAX_LENGTH)) {
            return std::unexpected(std::format("--length must be between 1 and {}",
                                               PasswordGenerator::MAX_LENGTH));
        }
        request.length = static_cast<uint32_t>(*options.length);
    }

    if (options.count) {
        if (*options.count < 1 || *options.count > MAX_COUNT) {
            return std::unexpected(std::format("--count must be between 1 and {}", MAX_COUNT));
        }
        request.count = static_cast<uint32_t>(*options.count);
    }

    if (options.wordlist) {
        request.wordlist_path = *options.wordlist;
    } else if (m_settings && !m_settings->wordlist_path().empty()) {
        request.wordlist_path = m_settings->wordlist_path();
    } else {
        request.wordlist_path = m_default_wordlist;
    }

    return request;
}

int GeneratorCommand::list_presets() {
    for (const auto& preset : m_presets.presets()) {
        m_out << std::format("{}\t{}\t{}\t{}\n", preset.name, preset.length, preset.char_set, preset.strength);
    }
    return EXIT_OK;
}

int GeneratorCommand::check_text(const std::string& text, bool with_breach) {
    print_report(text, std::nullopt, with_breach);
    return EXIT_OK;
}

int GeneratorCommand::generate(const GenerationRequest& request, bool with_strength, bool with_breach) {
    if (request.options.mode == GenerationMode::Passphrase) {
        PassphraseGenerator generator(request.wordlist_path, m_cache, m_source);

        std::optional<int64_t> entropy;
        if (with_strength) {
            if (auto size = generator.word_list_size()) {
                entropy = EntropyEstimator::calculate_entropy(request.options.word_count,
                                                              static_cast<int64_t>(*size),
                                                              GenerationMode::Passphrase);
            }
        }

        for (uint32_t i = 0; i < request.count; ++i) {
            auto passphrase = generator.try_generate_passphrase(request.options.word_count,
                                                                request.options.separator);
            if (!passphrase) {
                m_err << std::format("Cannot generate passphrase: {}\n", to_string(passphrase.error()));
                return EXIT_GENERATION_ERROR;
            }
            m_out << *passphrase << '\n';
            if (with_strength) {
                print_report(*passphrase, entropy, with_breach);
            }
            secure_clear(*passphrase);
        }
        Log::debug("Generated {} passphrase(s) of {} words", request.count, request.options.word_count);
        return EXIT_OK;
    }

    PasswordGenerator generator(m_source);
    const auto entropy = EntropyEstimator::calculate_entropy(
        request.length, EntropyEstimator::actual_pool_size(request.options));

    for (uint32_t i = 0; i < request.count; ++i) {
        auto password = generator.try_generate(request.length, request.options);
        if (!password) {
            m_err << std::format("Cannot generate password: {}\n", to_string(password.error()));
            return EXIT_GENERATION_ERROR;
        }
        m_out << *password << '\n';
        if (with_strength) {
            print_report(*password, entropy, with_breach);
        }
        secure_clear(*password);
    }
    Log::debug("Generated {} password(s) of length {}", request.count, request.length);
    return EXIT_OK;
}

void GeneratorCommand::print_report(const std::string& candidate,
                                    std::optional<int64_t> entropy_bits,
                                    bool with_breach) {
    auto result = StrengthEstimator::check_strength(candidate);

    std::optional<uint64_t> breaches;
    if (with_breach) {
        breaches = m_breach_checker.check_breach(candidate);
        result = StrengthEstimator::apply_breach_signal(std::move(result), BreachSignal{*breaches});
    }

    if (entropy_bits) {
        m_out << std::format("  entropy: {} bits\n", *entropy_bits);
    }
    if (result.score == StrengthResult::UNSCORED) {
        m_out << std::format("  strength: {}\n", StrengthEstimator::label(result));
    } else {
        m_out << std::format("  strength: {} ({}/4)\n", StrengthEstimator::label(result), result.score);
        m_out << std::format("  crack time: {}\n", result.crack_time_display);
    }
    if (!result.warning.empty()) {
        m_out << std::format("  warning: {}\n", result.warning);
    }
    for (const auto& suggestion : result.suggestions) {
        m_out << std::format("  suggestion: {}\n", suggestion);
    }
    if (breaches) {
        m_out << std::format("  breaches: {}\n", *breaches);
    }
}

} // namespace Pulsar
