// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "BackendInvoker.h"
#include "../../utils/Log.h"
#include "../../utils/StringHelpers.h"
#include <algorithm>
#include <array>
#include <thread>

namespace Pulsar {

namespace {

constexpr std::array<std::string_view, 3> TRANSIENT_MARKERS = {"busy", "timeout", "locked"};

} // anonymous namespace

BackendInvoker::BackendInvoker(IBackendTransport& transport,
                               int max_retries,
                               std::chrono::milliseconds base_delay,
                               Sleeper sleeper)
    : m_transport(transport),
      m_max_retries(std::clamp(max_retries, 0, MAX_RETRIES)),
      m_base_delay(base_delay),
      m_sleeper(sleeper ? std::move(sleeper)
                        : Sleeper([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })) {
}

BackendResult<std::string> BackendInvoker::call(std::string_view command, std::string_view args_json) {
    for (int attempt = 0;; ++attempt) {
        auto result = m_transport.invoke(command, args_json);
        if (result) {
            return result;
        }

        const BackendError& error = result.error();
        Log::error("Backend error in {} [{}]: {}", command, to_string(error.code), error.message);

        if (attempt < m_max_retries && is_transient(error.message)) {
            const auto delay = m_base_delay * (int64_t{1} << attempt);
            Log::debug("Retrying {} in {} ms (attempt {}/{})",
                       command, delay.count(), attempt + 1, m_max_retries);
            m_sleeper(delay);
            continue;
        }

        if (!is_silent(command, error.message)) {
            m_signal_user_error.emit(error.message);
        }
        return result;
    }
}

bool BackendInvoker::is_transient(std::string_view message) {
    const std::string lower = to_lower_ascii(message);
    return std::ranges::any_of(TRANSIENT_MARKERS, [&lower](std::string_view marker) {
        return lower.find(marker) != std::string::npos;
    });
}

bool BackendInvoker::is_silent(std::string_view command, std::string_view message) {
    return command.starts_with("is_") ||
           command.starts_with("check_") ||
           contains_ignore_case(message, "cancel");
}

} // namespace Pulsar
