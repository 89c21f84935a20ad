// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file PasswordPresetStore.h
 * @brief Editable list of generator presets
 *
 * Presets are matched by name. Names are not required to be unique, so
 * delete_preset() and update_preset() act on every preset carrying the
 * name. When a GeneratorSettings handle is attached, the list is loaded
 * from the `password-presets` key and every mutation is written back.
 */

#ifndef PULSAR_PASSWORD_PRESET_STORE_H
#define PULSAR_PASSWORD_PRESET_STORE_H

#include "PasswordPreset.h"
#include "../GeneratorError.h"
#include <optional>
#include <string_view>
#include <vector>

namespace Pulsar {

class GeneratorSettings;

class PasswordPresetStore {
public:
    /// In-memory store holding the default presets
    PasswordPresetStore();

    /**
     * @brief Store backed by GSettings
     * @param settings Settings handle (must outlive the store)
     *
     * An empty or undecodable stored list is replaced by the defaults.
     */
    explicit PasswordPresetStore(GeneratorSettings& settings);

    [[nodiscard]] const std::vector<PasswordPreset>& presets() const noexcept { return m_presets; }

    /**
     * @brief First preset with the given name
     */
    [[nodiscard]] std::optional<PasswordPreset> find(std::string_view name) const;

    /**
     * @brief Append a preset
     * @return InvalidPreset for an empty name, a length outside 8-128 or a
     *         preset without any character class
     */
    [[nodiscard]] GeneratorResult<void> add_preset(const PasswordPreset& preset);

    /**
     * @brief Remove every preset named @p name
     * @return Number of presets removed
     */
    size_t delete_preset(std::string_view name);

    /**
     * @brief Replace every preset named @p name with @p preset
     * @return InvalidPreset if @p preset is invalid or no preset has that name
     */
    [[nodiscard]] GeneratorResult<void> update_preset(std::string_view name, const PasswordPreset& preset);

    /**
     * @brief Restore the shipped defaults
     */
    void reset_presets();

    [[nodiscard]] static bool is_valid(const PasswordPreset& preset) noexcept;

private:
    void persist();

    std::vector<PasswordPreset> m_presets;
    GeneratorSettings* m_settings = nullptr;
};

} // namespace Pulsar

#endif // PULSAR_PASSWORD_PRESET_STORE_H
