// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "StrengthEstimator.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"
#include "../../utils/StringHelpers.h"
#include <zxcvbn.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <format>
#include <memory>
#include <new>

namespace Pulsar {

namespace {

// zxcvbn English feedback catalogue
namespace Warning {
    constexpr std::string_view STRAIGHT_ROW = "Straight rows of keys on your keyboard are easy to guess.";
    constexpr std::string_view KEY_PATTERN = "Short keyboard patterns are easy to guess.";
    constexpr std::string_view SIMPLE_REPEAT = "Repeated characters like \"aaa\" are easy to guess.";
    constexpr std::string_view EXTENDED_REPEAT = "Repeated character patterns like \"abcabcabc\" are easy to guess.";
    constexpr std::string_view SEQUENCES = "Common character sequences like \"abc\" are easy to guess.";
    constexpr std::string_view RECENT_YEARS = "Recent years are easy to guess.";
    constexpr std::string_view DATES = "Dates are easy to guess.";
    constexpr std::string_view TOP_TEN = "This is a heavily used password.";
    constexpr std::string_view TOP_HUNDRED = "This is a frequently used password.";
    constexpr std::string_view COMMON = "This is a commonly used password.";
    constexpr std::string_view SIMILAR_TO_COMMON = "This is similar to a commonly used password.";
    constexpr std::string_view USER_INPUTS = "There should not be any personal or page related data.";
    constexpr std::string_view PWNED = "Your password was exposed by a data breach on the Internet.";
}

namespace Suggestion {
    constexpr std::string_view L33T = "Avoid predictable letter substitutions like '@' for 'a'.";
    constexpr std::string_view ALL_UPPERCASE = "Capitalize some, but not all letters.";
    constexpr std::string_view CAPITALIZATION = "Capitalize more than the first letter.";
    constexpr std::string_view DATES = "Avoid dates and years that are associated with you.";
    constexpr std::string_view RECENT_YEARS = "Avoid recent years.";
    constexpr std::string_view ASSOCIATED_YEARS = "Avoid years that are associated with you.";
    constexpr std::string_view SEQUENCES = "Avoid common character sequences.";
    constexpr std::string_view REPEATED = "Avoid repeated words and characters.";
    constexpr std::string_view LONGER_KEYBOARD_PATTERN =
        "Use longer keyboard patterns and change typing direction multiple times.";
    constexpr std::string_view ANOTHER_WORD = "Add more words that are less common.";
    constexpr std::string_view USE_WORDS = "Use multiple words, but avoid common phrases.";
    constexpr std::string_view NO_NEED =
        "You can create strong passwords without using symbols, numbers, or uppercase letters.";
    constexpr std::string_view PWNED = "If you use this password elsewhere, you should change it.";
}

constexpr std::array<std::string_view, 4> KEYBOARD_ROWS = {
    "1234567890", "qwertyuiop", "asdfghjkl", "zxcvbnm"};

struct MatchInfoDeleter {
    void operator()(ZxcMatch_t* info) const {
        if (info) {
            ZxcvbnFreeInfo(info);
        }
    }
};
using MatchInfoPtr = std::unique_ptr<ZxcMatch_t, MatchInfoDeleter>;

struct Feedback {
    std::string warning;
    std::vector<std::string> suggestions;
};

Feedback default_feedback() {
    return {"", {std::string(Suggestion::USE_WORDS), std::string(Suggestion::NO_NEED)}};
}

bool is_straight_row(std::string_view token) {
    const std::string lower = to_lower_ascii(token);

    return std::ranges::any_of(KEYBOARD_ROWS, [&lower](std::string_view row) {
        std::string reversed(row.rbegin(), row.rend());
        return row.find(lower) != std::string_view::npos || reversed.find(lower) != std::string::npos;
    });
}

void add_capitalization_suggestions(std::string_view token, std::vector<std::string>& suggestions) {
    if (token.empty()) {
        return;
    }

    const bool has_lower = std::ranges::any_of(token, [](char c) { return std::islower(static_cast<unsigned char>(c)); });
    const bool has_upper = std::ranges::any_of(token, [](char c) { return std::isupper(static_cast<unsigned char>(c)); });
    const bool starts_upper = std::isupper(static_cast<unsigned char>(token.front())) != 0;

    if (has_upper && !has_lower && token.size() > 1) {
        suggestions.emplace_back(Suggestion::ALL_UPPERCASE);
    } else if (starts_upper && has_lower) {
        suggestions.emplace_back(Suggestion::CAPITALIZATION);
    }
}

Feedback dictionary_feedback(const ZxcMatch_t& match, std::string_view token,
                             bool sole_match, bool leet) {
    Feedback feedback;

    if (sole_match && !leet) {
        // Rank in the frequency list is roughly 2^entropy for a plain match
        const double rank = std::exp2(match.Entrpy);
        if (rank <= 10) {
            feedback.warning = Warning::TOP_TEN;
        } else if (rank <= 100) {
            feedback.warning = Warning::TOP_HUNDRED;
        } else {
            feedback.warning = Warning::COMMON;
        }
    } else if (match.Entrpy * std::log10(2.0) <= 4) {
        feedback.warning = Warning::SIMILAR_TO_COMMON;
    }

    add_capitalization_suggestions(token, feedback.suggestions);
    if (leet) {
        feedback.suggestions.emplace_back(Suggestion::L33T);
    }
    return feedback;
}

// Brute-force segments produce no specific feedback
Feedback match_feedback(const ZxcMatch_t& match, std::string_view password, bool sole_match) {
    const int type = static_cast<int>(match.Type) & ~static_cast<int>(MULTIPLE_MATCH);
    std::string_view token;
    if (match.Begin >= 0 && static_cast<size_t>(match.Begin) < password.size()) {
        token = password.substr(static_cast<size_t>(match.Begin), static_cast<size_t>(std::max(match.Length, 0)));
    }

    Feedback feedback;
    switch (type) {
        case DICTIONARY_MATCH:
            return dictionary_feedback(match, token, sole_match, false);
        case DICT_LEET_MATCH:
            return dictionary_feedback(match, token, sole_match, true);
        case USER_MATCH:
        case USER_LEET_MATCH:
            feedback.warning = Warning::USER_INPUTS;
            add_capitalization_suggestions(token, feedback.suggestions);
            if (type == USER_LEET_MATCH) {
                feedback.suggestions.emplace_back(Suggestion::L33T);
            }
            break;
        case SPATIAL_MATCH:
            feedback.warning = is_straight_row(token) ? Warning::STRAIGHT_ROW : Warning::KEY_PATTERN;
            feedback.suggestions.emplace_back(Suggestion::LONGER_KEYBOARD_PATTERN);
            break;
        case REPEATS_MATCH: {
            const bool single_char = !token.empty() &&
                std::ranges::all_of(token, [first = token.front()](char c) { return c == first; });
            feedback.warning = single_char ? Warning::SIMPLE_REPEAT : Warning::EXTENDED_REPEAT;
            feedback.suggestions.emplace_back(Suggestion::REPEATED);
            break;
        }
        case SEQUENCE_MATCH:
            feedback.warning = Warning::SEQUENCES;
            feedback.suggestions.emplace_back(Suggestion::SEQUENCES);
            break;
        case YEAR_MATCH:
            feedback.warning = Warning::RECENT_YEARS;
            feedback.suggestions.emplace_back(Suggestion::RECENT_YEARS);
            feedback.suggestions.emplace_back(Suggestion::ASSOCIATED_YEARS);
            break;
        case DATE_MATCH:
            feedback.warning = Warning::DATES;
            feedback.suggestions.emplace_back(Suggestion::DATES);
            break;
        default:
            break;
    }
    return feedback;
}

Feedback build_feedback(int score, const ZxcMatch_t* matches, std::string_view password) {
    if (score > 2) {
        return {};
    }

    const ZxcMatch_t* longest = nullptr;
    size_t match_count = 0;
    for (const ZxcMatch_t* m = matches; m != nullptr; m = m->Next) {
        ++match_count;
        if (!longest || m->Length > longest->Length) {
            longest = m;
        }
    }

    Feedback feedback;
    feedback.suggestions.emplace_back(Suggestion::ANOTHER_WORD);
    if (!longest) {
        return feedback;
    }

    Feedback specific = match_feedback(*longest, password, match_count == 1);
    feedback.warning = std::move(specific.warning);
    for (auto& suggestion : specific.suggestions) {
        feedback.suggestions.push_back(std::move(suggestion));
    }
    return feedback;
}

} // anonymous namespace

StrengthResult StrengthEstimator::check_strength(std::string_view candidate,
                                                 const std::vector<std::string>& user_inputs) {
    StrengthResult result;

    if (candidate.empty()) {
        auto feedback = default_feedback();
        result.suggestions = std::move(feedback.suggestions);
        return result;
    }

    try {
        std::string password(candidate);

        std::vector<const char*> dictionary;
        dictionary.reserve(user_inputs.size() + 1);
        for (const auto& input : user_inputs) {
            if (!input.empty()) {
                dictionary.push_back(input.c_str());
            }
        }
        dictionary.push_back(nullptr);

        ZxcMatch_t* raw_info = nullptr;
        const double entropy = ZxcvbnMatch(password.c_str(), dictionary.data(), &raw_info);
        MatchInfoPtr info(raw_info);

        if (!std::isfinite(entropy) || entropy < 0.0) {
            Log::warning("StrengthEstimator: Matcher returned no estimate");
            secure_clear(password);
            auto feedback = default_feedback();
            result.suggestions = std::move(feedback.suggestions);
            return result;
        }

        result.entropy_bits = entropy;
        result.score = score_from_entropy(entropy);
        result.crack_time_display = display_time(std::exp2(entropy) / GUESSES_PER_SECOND);

        auto feedback = build_feedback(result.score, info.get(), password);
        result.warning = std::move(feedback.warning);
        result.suggestions = std::move(feedback.suggestions);

        secure_clear(password);
    } catch (const std::bad_alloc&) {
        Log::error("StrengthEstimator: Out of memory while scoring password");
        result = StrengthResult{};
    }

    return result;
}

StrengthResult StrengthEstimator::apply_breach_signal(StrengthResult result, BreachSignal signal) {
    if (!signal.breached()) {
        return result;
    }

    result.breached = true;
    result.score = 0;
    result.warning = Warning::PWNED;
    if (std::ranges::find(result.suggestions, Suggestion::PWNED) == result.suggestions.end()) {
        result.suggestions.emplace_back(Suggestion::PWNED);
    }
    return result;
}

std::string_view StrengthEstimator::label(const StrengthResult& result) noexcept {
    if (result.breached) {
        return "Breached";
    }
    return score_label(result.score);
}

std::string_view StrengthEstimator::score_label(int score) noexcept {
    switch (score) {
        case 0: return "Very weak";
        case 1: return "Weak";
        case 2: return "Fair";
        case 3: return "Strong";
        case 4: return "Very strong";
        default: return "Not scored";
    }
}

int StrengthEstimator::score_from_entropy(double entropy_bits) noexcept {
    constexpr double DELTA = 5;
    const double guesses = std::exp2(entropy_bits);

    if (guesses < 1e3 + DELTA) return 0;
    if (guesses < 1e6 + DELTA) return 1;
    if (guesses < 1e8 + DELTA) return 2;
    if (guesses < 1e10 + DELTA) return 3;
    return 4;
}

std::string StrengthEstimator::display_time(double seconds) {
    constexpr double MINUTE = 60;
    constexpr double HOUR = MINUTE * 60;
    constexpr double DAY = HOUR * 24;
    constexpr double MONTH = DAY * 31;
    constexpr double YEAR = MONTH * 12;
    constexpr double CENTURY = YEAR * 100;

    auto format_unit = [](double value, std::string_view unit) {
        const auto base = static_cast<long long>(std::llround(value));
        return std::format("{} {}{}", base, unit, base == 1 ? "" : "s");
    };

    if (seconds < 1) return "less than a second";
    if (seconds < MINUTE) return format_unit(seconds, "second");
    if (seconds < HOUR) return format_unit(seconds / MINUTE, "minute");
    if (seconds < DAY) return format_unit(seconds / HOUR, "hour");
    if (seconds < MONTH) return format_unit(seconds / DAY, "day");
    if (seconds < YEAR) return format_unit(seconds / MONTH, "month");
    if (seconds < CENTURY) return format_unit(seconds / YEAR, "year");
    return "centuries";
}

} // namespace Pulsar
