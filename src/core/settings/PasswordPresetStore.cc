// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "PasswordPresetStore.h"
#include "GeneratorSettings.h"
#include "../../utils/Log.h"
#include "../../utils/SettingsValidator.h"
#include <algorithm>

namespace Pulsar {

PasswordPresetStore::PasswordPresetStore()
    : m_presets(default_password_presets()) {
}

PasswordPresetStore::PasswordPresetStore(GeneratorSettings& settings)
    : m_settings(&settings) {
    auto stored = settings.load_presets();
    if (stored && !stored->empty()) {
        m_presets = std::move(*stored);
        return;
    }

    Log::info("No stored presets, installing defaults");
    m_presets = default_password_presets();
    persist();
}

std::optional<PasswordPreset> PasswordPresetStore::find(std::string_view name) const {
    auto it = std::ranges::find_if(m_presets, [name](const PasswordPreset& p) {
        return p.name == name;
    });
    if (it == m_presets.end()) {
        return std::nullopt;
    }
    return *it;
}

GeneratorResult<void> PasswordPresetStore::add_preset(const PasswordPreset& preset) {
    if (!is_valid(preset)) {
        Log::warning("Rejected preset '{}'", preset.name);
        return std::unexpected(GeneratorError::InvalidPreset);
    }

    m_presets.push_back(preset);
    persist();
    return {};
}

size_t PasswordPresetStore::delete_preset(std::string_view name) {
    const auto removed = std::erase_if(m_presets, [name](const PasswordPreset& p) {
        return p.name == name;
    });
    if (removed > 0) {
        persist();
    }
    return removed;
}

GeneratorResult<void> PasswordPresetStore::update_preset(std::string_view name, const PasswordPreset& preset) {
    if (!is_valid(preset)) {
        Log::warning("Rejected update of preset '{}'", name);
        return std::unexpected(GeneratorError::InvalidPreset);
    }

    size_t replaced = 0;
    for (auto& existing : m_presets) {
        if (existing.name == name) {
            existing = preset;
            ++replaced;
        }
    }

    if (replaced == 0) {
        return std::unexpected(GeneratorError::InvalidPreset);
    }

    persist();
    return {};
}

void PasswordPresetStore::reset_presets() {
    m_presets = default_password_presets();
    persist();
}

bool PasswordPresetStore::is_valid(const PasswordPreset& preset) noexcept {
    return !preset.name.empty() &&
           preset.length <= static_cast<uint32_t>(SettingsValidator::MAX_PASSWORD_LENGTH) &&
           SettingsValidator::is_valid_password_length(static_cast<int>(preset.length)) &&
           preset.options.has_character_class();
}

void PasswordPresetStore::persist() {
    if (m_settings && !m_settings->save_presets(m_presets)) {
        Log::warning("Preset changes were not persisted");
    }
}

} // namespace Pulsar
