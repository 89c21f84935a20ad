// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "PasswordHealthTracker.h"
#include "../../utils/Log.h"
#include "../../utils/StringHelpers.h"

namespace Pulsar {

PasswordHealthTracker::PasswordHealthTracker(BreachChecker& checker)
    : m_checker(checker) {
}

void PasswordHealthTracker::assess_strength(const PasswordItem& item) {
    if (item.password.empty()) {
        return;
    }

    const auto result = StrengthEstimator::check_strength(item.password, user_inputs_for(item));

    // Keep the breach state from an earlier check
    PasswordHealth& health = m_items[item.id];
    health.score = result.score;
    health.crack_time_display = result.crack_time_display;
    health.suggestions = result.suggestions;
    health.warning = result.warning;

    Log::debug("PasswordHealthTracker: Item {} scored {}", item.id, result.score);
    m_signal_changed.emit();
}

void PasswordHealthTracker::check_breach(const PasswordItem& item) {
    if (item.password.empty() || item.id == 0) {
        return;
    }

    const uint64_t count = m_checker.check_breach(item.password);

    auto it = m_items.find(item.id);
    if (it == m_items.end()) {
        Log::debug("PasswordHealthTracker: No strength record for item {}, breach result dropped", item.id);
        return;
    }

    it->second.breach_state = count > 0 ? BreachState::Breached : BreachState::Safe;
    it->second.breach_count = count;
    m_signal_changed.emit();
}

void PasswordHealthTracker::reset() {
    m_items.clear();
    m_signal_changed.emit();
}

std::optional<PasswordHealth> PasswordHealthTracker::health(int64_t id) const {
    if (auto it = m_items.find(id); it != m_items.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> PasswordHealthTracker::effective_score(int64_t id) const {
    auto it = m_items.find(id);
    if (it == m_items.end()) {
        return std::nullopt;
    }
    if (it->second.breach_state == BreachState::Breached) {
        return 0;
    }
    return it->second.score;
}

std::vector<std::string> PasswordHealthTracker::user_inputs_for(const PasswordItem& item) {
    std::vector<std::string> inputs{item.username, item.title, item.url, std::string(APPLICATION_INPUT)};

    if (!item.tags.empty()) {
        for (std::string_view tag : split(item.tags, ',')) {
            inputs.emplace_back(trim(tag));
        }
    }
    return inputs;
}

} // namespace Pulsar
