// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file Log.h
 * @brief Simple logging framework with compile-time formatting
 *
 * Provides a lightweight, type-safe logging system using C++23 std::format
 * and std::source_location. The source location is captured at the call
 * site together with the format string, so every line points at the code
 * that logged it.
 *
 * @section features Features
 * - Compile-time format string validation
 * - Automatic timestamp generation (millisecond precision)
 * - Source location tracking (file:line of the caller)
 * - Runtime log level filtering, settable from text (CLI / GSettings)
 * - Redirectable sink (tests capture output)
 *
 * @section usage Usage Example
 * @code
 * Pulsar::Log::set_level(Pulsar::Log::Level::Debug);
 *
 * Pulsar::Log::debug("Loaded word list: {} words", count);
 * Pulsar::Log::info("Generated {} secrets", n);
 * Pulsar::Log::warning("Breach check failed open: {}", reason);
 * Pulsar::Log::error("Random source failed");
 * @endcode
 *
 * @warning Never pass a password or passphrase as a format argument.
 *
 * @note Default log level is Info (Debug messages are hidden)
 */

#ifndef PULSAR_LOG_H
#define PULSAR_LOG_H

#include <cctype>
#include <chrono>
#include <concepts>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace Pulsar::Log {

/**
 * @brief Log severity levels
 */
enum class Level {
    Debug,     ///< Detailed debugging information (verbose)
    Info,      ///< General informational messages
    Warning,   ///< Warning conditions (potential issues)
    Error      ///< Error conditions (operation failures)
};

/**
 * @brief Current minimum log level (can be changed at runtime)
 */
inline Level current_level = Level::Info;

namespace detail {
    inline std::ostream* sink = &std::cerr;
    inline std::mutex sink_mutex;

    inline constexpr std::string_view level_to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO ";
            case Level::Warning: return "WARN ";
            case Level::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Generate ISO 8601 timestamp with millisecond precision
     * @return Formatted timestamp string (YYYY-MM-DD HH:MM:SS.mmm)
     */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
    }

    /**
     * @brief Format string bundled with the location of the call
     *
     * Implicitly built from a string literal at the call site, which is
     * where std::source_location::current() is evaluated.
     */
    template<typename... Args>
    struct LocatedFormat {
        std::format_string<Args...> fmt;
        std::source_location loc;

        template<typename T>
            requires std::convertible_to<const T&, std::string_view>
        consteval LocatedFormat(const T& str,
                                std::source_location location = std::source_location::current())
            : fmt(str), loc(location) {}
    };

    template<typename... Args>
    using FormatArg = LocatedFormat<std::type_identity_t<Args>...>;
}

/**
 * @brief Main logging function
 * @param level Log level for this message
 * @param fmt Format string with captured source location
 * @param args Format arguments
 *
 * @note Use convenience functions (debug, info, warning, error) instead of calling directly
 */
template<typename... Args>
void log(Level level, detail::FormatArg<Args...> fmt, Args&&... args) {
    if (level < current_level) {
        return;
    }

    auto message = std::format(fmt.fmt, std::forward<Args>(args)...);
    auto timestamp = detail::get_timestamp();
    auto level_str = detail::level_to_string(level);

    // Format: [TIMESTAMP] LEVEL: message (file:line)
    std::lock_guard lock(detail::sink_mutex);
    *detail::sink << std::format("[{}] {}: {} ({}:{})\n",
        timestamp, level_str, message,
        fmt.loc.file_name(), fmt.loc.line());
}

template<typename... Args>
void debug(detail::FormatArg<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(detail::FormatArg<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(detail::FormatArg<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(detail::FormatArg<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Error, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Set minimum log level at runtime
 */
inline void set_level(Level level) {
    current_level = level;
}

/**
 * @brief Redirect log output
 * @param stream Destination stream (must outlive all logging); nullptr restores std::cerr
 */
inline void set_sink(std::ostream* stream) {
    std::lock_guard lock(detail::sink_mutex);
    detail::sink = stream ? stream : &std::cerr;
}

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
 * @return Level, or nullopt for an unknown name
 */
inline std::optional<Level> parse_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warning" || lower == "warn") return Level::Warning;
    if (lower == "error") return Level::Error;
    return std::nullopt;
}

} // namespace Pulsar::Log

#endif // PULSAR_LOG_H
