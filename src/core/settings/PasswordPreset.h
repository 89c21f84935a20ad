// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file PasswordPreset.h
 * @brief Named generator configurations offered in the generator popup
 */

#ifndef PULSAR_PASSWORD_PRESET_H
#define PULSAR_PASSWORD_PRESET_H

#include "../generator/GenerationOptions.h"
#include <cstdint>
#include <string>
#include <vector>

namespace Pulsar {

struct PasswordPreset {
    std::string name;
    uint32_t length = 20;
    std::string char_set;       ///< Display label, e.g. "Alphanumeric"
    int strength = 0;           ///< Display strength, 0-100
    GenerationOptions options;

    bool operator==(const PasswordPreset&) const = default;
};

/**
 * @brief Presets shipped with the application
 */
[[nodiscard]] inline std::vector<PasswordPreset> default_password_presets() {
    GenerationOptions all_classes;

    GenerationOptions alphanumeric;
    alphanumeric.symbols = false;

    return {
        {"Recommended 20", 20, "All", 98, all_classes},
        {"Banking Safe", 12, "Alphanumeric", 85, alphanumeric},
        {"Ultra Secure", 32, "All + Extended", 99, all_classes},
    };
}

} // namespace Pulsar

#endif // PULSAR_PASSWORD_PRESET_H
