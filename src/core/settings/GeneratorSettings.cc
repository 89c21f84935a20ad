// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "GeneratorSettings.h"
#include "../../utils/Log.h"
#include "../../utils/SettingsValidator.h"
#include <giomm/settingsschemasource.h>
#include <glibmm/variant.h>
#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <typeinfo>

namespace Pulsar {

namespace {

// (sisibbbbbbb): name, length, char set label, strength, then the seven
// option flags in GenerationOptions order
using PresetTuple = std::tuple<Glib::ustring, gint32, Glib::ustring, gint32,
                               bool, bool, bool, bool, bool, bool, bool>;
using PresetVariant = Glib::Variant<std::vector<PresetTuple>>;

PresetTuple to_tuple(const PasswordPreset& preset) {
    const auto& o = preset.options;
    return {preset.name, static_cast<gint32>(preset.length), preset.char_set, preset.strength,
            o.uppercase, o.lowercase, o.digits, o.symbols, o.ambiguous, o.similar, o.pronounceable};
}

PasswordPreset from_tuple(const PresetTuple& t) {
    PasswordPreset preset;
    preset.name = std::get<0>(t).raw();
    preset.length = static_cast<uint32_t>(std::max<gint32>(0, std::get<1>(t)));
    preset.char_set = std::get<2>(t).raw();
    preset.strength = std::get<3>(t);
    preset.options.uppercase = std::get<4>(t);
    preset.options.lowercase = std::get<5>(t);
    preset.options.digits = std::get<6>(t);
    preset.options.symbols = std::get<7>(t);
    preset.options.ambiguous = std::get<8>(t);
    preset.options.similar = std::get<9>(t);
    preset.options.pronounceable = std::get<10>(t);
    return preset;
}

} // anonymous namespace

GeneratorSettings::GeneratorSettings(Glib::RefPtr<Gio::Settings> settings)
    : m_settings(std::move(settings)) {
    if (!m_settings) {
        throw std::invalid_argument("GeneratorSettings requires a settings object");
    }

    m_changed_connection = m_settings->signal_changed().connect(
        [this](const Glib::ustring& key) { m_signal_changed.emit(key.raw()); });
}

GeneratorSettings::~GeneratorSettings() {
    m_changed_connection.disconnect();
}

GeneratorResult<std::unique_ptr<GeneratorSettings>> GeneratorSettings::create() {
    auto source = Gio::SettingsSchemaSource::get_default();
    if (!source || !source->lookup(SCHEMA_ID, true)) {
        Log::warning("GSettings schema {} is not installed", SCHEMA_ID);
        return std::unexpected(GeneratorError::SettingsUnavailable);
    }

    try {
        return std::make_unique<GeneratorSettings>(Gio::Settings::create(SCHEMA_ID));
    } catch (const Glib::Error& e) {
        Log::error("Failed to load settings: {}", e.what());
        return std::unexpected(GeneratorError::SettingsUnavailable);
    }
}

GenerationOptions GeneratorSettings::load_options() const {
    GenerationOptions options;
    options.uppercase = m_settings->get_boolean(KEY_USE_UPPERCASE);
    options.lowercase = m_settings->get_boolean(KEY_USE_LOWERCASE);
    options.digits = m_settings->get_boolean(KEY_USE_DIGITS);
    options.symbols = m_settings->get_boolean(KEY_USE_SYMBOLS);
    options.ambiguous = m_settings->get_boolean(KEY_EXCLUDE_AMBIGUOUS);
    options.similar = m_settings->get_boolean(KEY_EXCLUDE_SIMILAR);
    options.pronounceable = m_settings->get_boolean(KEY_PRONOUNCEABLE);

    const auto mode_text = m_settings->get_string(KEY_GENERATION_MODE).raw();
    if (auto mode = parse_generation_mode(mode_text)) {
        options.mode = *mode;
    } else {
        Log::warning("Unknown generation mode '{}', using password", mode_text);
    }

    options.word_count = static_cast<uint32_t>(SettingsValidator::get_word_count(m_settings));
    options.separator = SettingsValidator::get_separator(m_settings);
    return options;
}

void GeneratorSettings::save_options(const GenerationOptions& options, uint32_t password_length) {
    const int length = std::clamp(static_cast<int>(std::min<uint32_t>(password_length, 1024)),
                                  SettingsValidator::MIN_PASSWORD_LENGTH,
                                  SettingsValidator::MAX_PASSWORD_LENGTH);
    const int words = std::clamp(static_cast<int>(std::min<uint32_t>(options.word_count, 1024)),
                                 SettingsValidator::MIN_WORD_COUNT,
                                 SettingsValidator::MAX_WORD_COUNT);

    m_settings->set_int(KEY_PASSWORD_LENGTH, length);
    m_settings->set_boolean(KEY_USE_UPPERCASE, options.uppercase);
    m_settings->set_boolean(KEY_USE_LOWERCASE, options.lowercase);
    m_settings->set_boolean(KEY_USE_DIGITS, options.digits);
    m_settings->set_boolean(KEY_USE_SYMBOLS, options.symbols);
    m_settings->set_boolean(KEY_EXCLUDE_AMBIGUOUS, options.ambiguous);
    m_settings->set_boolean(KEY_EXCLUDE_SIMILAR, options.similar);
    m_settings->set_boolean(KEY_PRONOUNCEABLE, options.pronounceable);
    m_settings->set_string(KEY_GENERATION_MODE, std::string(to_string(options.mode)));
    m_settings->set_int(KEY_WORD_COUNT, words);
    if (options.separator.size() <= SettingsValidator::MAX_SEPARATOR_LENGTH) {
        m_settings->set_string(KEY_SEPARATOR, options.separator);
    }

    Log::debug("Saved generator defaults (length {}, mode {})", length, to_string(options.mode));
}

uint32_t GeneratorSettings::password_length() const {
    return static_cast<uint32_t>(SettingsValidator::get_password_length(m_settings));
}

std::string GeneratorSettings::wordlist_path() const {
    return m_settings->get_string(KEY_WORDLIST_PATH).raw();
}

bool GeneratorSettings::external_breach_check() const {
    return m_settings->get_boolean(KEY_EXTERNAL_BREACH_CHECK);
}

std::chrono::seconds GeneratorSettings::breach_check_timeout() const {
    return std::chrono::seconds(SettingsValidator::get_breach_timeout(m_settings));
}

std::string GeneratorSettings::log_level() const {
    return m_settings->get_string(KEY_LOG_LEVEL).raw();
}

void GeneratorSettings::set_external_breach_check(bool enabled) {
    m_settings->set_boolean(KEY_EXTERNAL_BREACH_CHECK, enabled);
}

void GeneratorSettings::set_wordlist_path(const std::string& path) {
    m_settings->set_string(KEY_WORDLIST_PATH, path);
}

std::optional<std::vector<PasswordPreset>> GeneratorSettings::load_presets() const {
    // g_settings_get_value returns a new reference, which VariantBase adopts
    Glib::VariantBase value(g_settings_get_value(m_settings->gobj(), KEY_PRESETS), false);

    try {
        const auto typed = Glib::VariantBase::cast_dynamic<PresetVariant>(value);
        std::vector<PasswordPreset> presets;
        for (const auto& entry : typed.get()) {
            presets.push_back(from_tuple(entry));
        }
        return presets;
    } catch (const std::bad_cast&) {
        Log::error("Stored presets have unexpected type {}", value.get_type_string());
        return std::nullopt;
    }
}

bool GeneratorSettings::save_presets(const std::vector<PasswordPreset>& presets) {
    std::vector<PresetTuple> tuples;
    tuples.reserve(presets.size());
    for (const auto& preset : presets) {
        tuples.push_back(to_tuple(preset));
    }

    if (!m_settings->set_value(KEY_PRESETS, PresetVariant::create(tuples))) {
        Log::error("GSettings rejected the preset list");
        return false;
    }
    return true;
}

} // namespace Pulsar
