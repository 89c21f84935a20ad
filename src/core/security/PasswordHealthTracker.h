// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file PasswordHealthTracker.h
 * @brief Per-item strength and breach status for the security dashboard
 *
 * Responsibilities:
 * - Score stored passwords with item-specific user inputs
 * - Record breach-check results next to the strength score
 * - Forget everything when the vault locks
 *
 * NOT responsible for:
 * - Reading items from the vault (the caller passes them in)
 * - Network policy (see BreachChecker)
 */

#pragma once

#include "BreachChecker.h"
#include "StrengthEstimator.h"
#include <sigc++/signal.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Pulsar {

/**
 * @brief The fields of a vault item the dashboard needs
 */
struct PasswordItem {
    int64_t id = 0;
    std::string title;
    std::string username;
    std::string url;
    std::string tags;       ///< Comma-separated
    std::string password;
};

enum class BreachState : uint8_t {
    NotChecked,
    Safe,
    Breached
};

struct PasswordHealth {
    int score = StrengthResult::UNSCORED;
    std::string crack_time_display;
    std::vector<std::string> suggestions;
    std::string warning;
    BreachState breach_state = BreachState::NotChecked;
    uint64_t breach_count = 0;
};

class PasswordHealthTracker {
public:
    /// Application name, always treated as a guessable user input
    static constexpr std::string_view APPLICATION_INPUT = "pulsar";

    /**
     * @param checker Breach checker used by check_breach() (must outlive the tracker)
     */
    explicit PasswordHealthTracker(BreachChecker& checker);

    PasswordHealthTracker(const PasswordHealthTracker&) = delete;
    PasswordHealthTracker& operator=(const PasswordHealthTracker&) = delete;

    /**
     * @brief Score an item's password and store the result
     *
     * Does nothing for an empty password. An existing breach state is kept.
     */
    void assess_strength(const PasswordItem& item);

    /**
     * @brief Run the breach check for an item
     *
     * Does nothing for an empty password or id 0, and only updates items
     * that already have a health record (assess_strength() first).
     */
    void check_breach(const PasswordItem& item);

    /**
     * @brief Drop every record (vault locked)
     */
    void reset();

    [[nodiscard]] std::optional<PasswordHealth> health(int64_t id) const;
    [[nodiscard]] const std::map<int64_t, PasswordHealth>& items() const noexcept { return m_items; }

    /**
     * @brief Score shown for an item, with the breach override applied
     * @return 0 when breached, the heuristic score otherwise, nullopt if unknown
     */
    [[nodiscard]] std::optional<int> effective_score(int64_t id) const;

    /**
     * @brief Guessable strings for an item: username, title, url,
     *        the application name and every tag
     */
    [[nodiscard]] static std::vector<std::string> user_inputs_for(const PasswordItem& item);

    /// Emitted after any record changes
    [[nodiscard]] sigc::signal<void()>& signal_changed() noexcept { return m_signal_changed; }

private:
    BreachChecker& m_checker;
    std::map<int64_t, PasswordHealth> m_items;
    sigc::signal<void()> m_signal_changed;
};

} // namespace Pulsar
