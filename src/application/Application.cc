// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "Application.h"
#include "../core/security/HttpClient.h"
#include "../core/settings/GeneratorSettings.h"
#include "../utils/Log.h"
#include "config.h"
#include <iostream>

namespace Pulsar {

Application::Application()
    : Gio::Application(APP_ID, Gio::Application::Flags::NON_UNIQUE) {
    add_options();
    signal_handle_local_options().connect(
        sigc::mem_fun(*this, &Application::on_handle_local_options), false);
}

Application::~Application() = default;

Glib::RefPtr<Application> Application::create() {
    return Glib::make_refptr_for_instance<Application>(new Application());
}

void Application::add_options() {
    using Type = Gio::Application::OptionType;

    set_option_context_summary("Generate passwords and passphrases, score them and check them against known breaches.");

    // Password
    add_main_option_entry(Type::INT, "length", 'l', "Password length", "N");
    add_main_option_entry(Type::BOOL, "uppercase", 'u', "Include uppercase letters");
    add_main_option_entry(Type::BOOL, "lowercase", 'a', "Include lowercase letters");
    add_main_option_entry(Type::BOOL, "digits", 'd', "Include digits");
    add_main_option_entry(Type::BOOL, "symbols", 's', "Include symbols");
    add_main_option_entry(Type::BOOL, "exclude-ambiguous", '\0', "Exclude i I 1 L o O 0");
    add_main_option_entry(Type::BOOL, "exclude-similar", '\0', "Exclude visually similar characters");
    add_main_option_entry(Type::BOOL, "pronounceable", '\0', "Alternate consonants and vowels");

    // Passphrase
    add_main_option_entry(Type::BOOL, "passphrase", 'p', "Generate a passphrase");
    add_main_option_entry(Type::INT, "words", 'w', "Words per passphrase", "N");
    add_main_option_entry(Type::STRING, "separator", '\0', "Text between passphrase words", "TEXT");
    add_main_option_entry(Type::FILENAME, "wordlist", '\0', "Word list file", "PATH");

    // Presets and output
    add_main_option_entry(Type::STRING, "preset", '\0', "Use a named preset", "NAME");
    add_main_option_entry(Type::BOOL, "list-presets", '\0', "List presets and exit");
    add_main_option_entry(Type::INT, "count", 'n', "Number of secrets to generate", "N");
    add_main_option_entry(Type::BOOL, "strength", '\0', "Show entropy, strength and crack time");
    add_main_option_entry(Type::BOOL, "check-breach", '\0', "Look up secrets in the Pwned Passwords range API");
    add_main_option_entry(Type::STRING, "check", '\0', "Score the given password instead of generating", "TEXT");

    // Configuration
    add_main_option_entry(Type::STRING, "log-level", '\0', "debug, info, warning or error", "LEVEL");
    add_main_option_entry(Type::BOOL, "save", '\0', "Store the chosen options as new defaults");
}

void Application::create_services() {
    if (auto settings = GeneratorSettings::create()) {
        m_settings = std::move(*settings);
        m_presets = std::make_unique<PasswordPresetStore>(*m_settings);
    } else {
        Log::warning("Using built-in defaults: {}", to_string(settings.error()));
        m_presets = std::make_unique<PasswordPresetStore>();
    }

    m_http_client = std::make_unique<CurlHttpClient>(std::string("pulsar-generator/") + VERSION);
    m_breach_checker = std::make_unique<BreachChecker>(*m_http_client);
}

int Application::on_handle_local_options(const Glib::RefPtr<Glib::VariantDict>& options) {
    create_services();

    GeneratorCommand command(m_settings.get(), *m_presets, *m_breach_checker,
                             PULSAR_WORDLIST_PATH, std::cout, std::cerr);
    return command.run(to_command_options(options));
}

CommandOptions Application::to_command_options(const Glib::RefPtr<Glib::VariantDict>& options) {
    CommandOptions result;

    auto flag = [&options](const char* name) {
        bool value = false;
        return options->lookup_value(name, value) && value;
    };
    auto number = [&options](const char* name) -> std::optional<int> {
        int value = 0;
        if (options->lookup_value(name, value)) {
            return value;
        }
        return std::nullopt;
    };
    auto text = [&options](const char* name) -> std::optional<std::string> {
        Glib::ustring value;
        if (options->lookup_value(name, value)) {
            return value.raw();
        }
        return std::nullopt;
    };

    result.length = number("length");
    result.uppercase = flag("uppercase");
    result.lowercase = flag("lowercase");
    result.digits = flag("digits");
    result.symbols = flag("symbols");
    result.exclude_ambiguous = flag("exclude-ambiguous");
    result.exclude_similar = flag("exclude-similar");
    result.pronounceable = flag("pronounceable");

    result.passphrase = flag("passphrase");
    result.words = number("words");
    result.separator = text("separator");

    std::string wordlist;
    if (options->lookup_value("wordlist", wordlist)) {
        result.wordlist = wordlist;
    }

    result.preset = text("preset");
    result.list_presets = flag("list-presets");
    result.count = number("count");
    result.strength = flag("strength");
    result.check_breach = flag("check-breach");
    result.check_text = text("check");

    result.log_level = text("log-level");
    result.save = flag("save");
    return result;
}

void Application::on_activate() {
    // Every invocation is fully handled in on_handle_local_options()
    Log::debug("Activated without local handling");
}

} // namespace Pulsar
