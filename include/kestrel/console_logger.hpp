#pragma once

#include <kestrel/logger.hpp>
#include <kestrel/types.hpp>

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace kestrel {

inline auto to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARNING";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Timestamped console logger
 *
 * Lines look like `2024-03-01T12:00:00.125 WARNING: message [pid=42]`.
 * Error and critical go to stderr, everything else to stdout. Virtual users
 * log from pool threads, so a whole line is formatted first and written
 * under one lock.
 */
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::info)
        : _min_level(min_level) {}

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        write(level, message, {});
    }

    auto log(log_level level, std::string_view message, const log_fields& fields) -> void {
        write(level, message, fields);
    }

    auto trace(std::string_view message) -> void { write(log_level::trace, message, {}); }
    auto debug(std::string_view message) -> void { write(log_level::debug, message, {}); }
    auto info(std::string_view message) -> void { write(log_level::info, message, {}); }
    auto warning(std::string_view message) -> void { write(log_level::warning, message, {}); }
    auto error(std::string_view message) -> void { write(log_level::error, message, {}); }
    auto critical(std::string_view message) -> void { write(log_level::critical, message, {}); }

    auto debug(std::string_view message, const log_fields& fields) -> void { write(log_level::debug, message, fields); }
    auto info(std::string_view message, const log_fields& fields) -> void { write(log_level::info, message, fields); }
    auto warning(std::string_view message, const log_fields& fields) -> void {
        write(log_level::warning, message, fields);
    }
    auto error(std::string_view message, const log_fields& fields) -> void { write(log_level::error, message, fields); }

    auto set_min_level(log_level level) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        std::lock_guard<std::mutex> lock(_mutex);
        return _min_level;
    }

private:
    log_level _min_level;
    mutable std::mutex _mutex;

    auto enabled(log_level level) const -> bool {
        std::lock_guard<std::mutex> lock(_mutex);
        return level >= _min_level;
    }

    auto write(log_level level, std::string_view message, const log_fields& fields) -> void {
        if (!enabled(level)) {
            return;
        }

        std::ostringstream line;
        line << current_timestamp() << ' ' << to_string(level) << ": " << message;
        for (const auto& [key, value] : fields) {
            line << " [" << key << '=' << value << ']';
        }
        line << '\n';

        std::lock_guard<std::mutex> lock(_mutex);
        auto& out = level >= log_level::error ? std::cerr : std::cout;
        out << line.str();
        out.flush();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace kestrel
