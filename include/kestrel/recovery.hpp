#pragma once

#include <kestrel/exceptions.hpp>
#include <kestrel/types.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kestrel {

/**
 * @brief Error categories reported to the error handler
 */
enum class error_category {
    template_error,
    file_system,
    network,
    dependency,
    build,
    validation,
    configuration,
    system
};

/**
 * @brief Error severity; drives the recovery strategy lookup together with the category
 */
enum class error_severity {
    low,        // Warning-level issue that does not stop execution
    medium,     // Recoverable error
    high,       // Stops the current operation
    critical    // Requires complete rollback
};

enum class recovery_action {
    retry,
    skip,
    rollback,
    abort,
    manual
};

inline auto to_string(error_category category) -> std::string_view {
    switch (category) {
        case error_category::template_error: return "template";
        case error_category::file_system: return "file_system";
        case error_category::network: return "network";
        case error_category::dependency: return "dependency";
        case error_category::build: return "build";
        case error_category::validation: return "validation";
        case error_category::configuration: return "configuration";
        case error_category::system: return "system";
    }
    return "unknown";
}

inline auto to_string(error_severity severity) -> std::string_view {
    switch (severity) {
        case error_severity::low: return "low";
        case error_severity::medium: return "medium";
        case error_severity::high: return "high";
        case error_severity::critical: return "critical";
    }
    return "unknown";
}

inline auto to_string(recovery_action action) -> std::string_view {
    switch (action) {
        case recovery_action::retry: return "retry";
        case recovery_action::skip: return "skip";
        case recovery_action::rollback: return "rollback";
        case recovery_action::abort: return "abort";
        case recovery_action::manual: return "manual";
    }
    return "unknown";
}

inline auto operator<<(std::ostream& os, error_category category) -> std::ostream& {
    return os << to_string(category);
}

inline auto operator<<(std::ostream& os, error_severity severity) -> std::ostream& {
    return os << to_string(severity);
}

inline auto operator<<(std::ostream& os, recovery_action action) -> std::ostream& {
    return os << to_string(action);
}

/**
 * @brief A phase failure as reported by the engine
 */
struct error_report {
    std::string project_id;
    error_category category{error_category::validation};
    error_severity severity{error_severity::medium};
    std::string message;
    std::string phase;
    std::map<std::string, std::string> details;
    // 1 for the first failure of a phase, incremented on every retry
    std::size_t attempt{1};
};

/**
 * @brief How to recover from a (category, severity) pair
 */
struct recovery_strategy {
    error_category category{error_category::system};
    error_severity severity{error_severity::high};
    recovery_action action{recovery_action::abort};
    std::size_t max_retries{3};
    std::chrono::milliseconds retry_delay{1000};
    bool cleanup_required{false};
};

/**
 * @brief Immutable category x severity -> strategy lookup
 *
 * Built once and handed to the error handler by reference. Nothing mutates it
 * after construction, so concurrent lookups need no locking.
 */
class recovery_table {
public:
    explicit recovery_table(const std::vector<recovery_strategy>& strategies) {
        for (const auto& strategy : strategies) {
            _strategies.insert_or_assign(key(strategy.category, strategy.severity), strategy);
        }
    }

    static auto defaults() -> recovery_table {
        using std::chrono::milliseconds;
        return recovery_table({
            {.category = error_category::network, .severity = error_severity::medium,
             .action = recovery_action::retry, .max_retries = 3, .retry_delay = milliseconds{2000}},
            {.category = error_category::file_system, .severity = error_severity::medium,
             .action = recovery_action::retry, .max_retries = 2, .cleanup_required = true},
            {.category = error_category::template_error, .severity = error_severity::high,
             .action = recovery_action::abort, .cleanup_required = true},
            {.category = error_category::dependency, .severity = error_severity::medium,
             .action = recovery_action::retry, .max_retries = 2, .retry_delay = milliseconds{1000}},
            {.category = error_category::build, .severity = error_severity::high,
             .action = recovery_action::manual},
            {.category = error_category::validation, .severity = error_severity::low,
             .action = recovery_action::skip},
            {.category = error_category::system, .severity = error_severity::critical,
             .action = recovery_action::rollback, .cleanup_required = true},
        });
    }

    auto find(error_category category, error_severity severity) const -> std::optional<recovery_strategy> {
        auto it = _strategies.find(key(category, severity));
        if (it == _strategies.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto size() const -> std::size_t {
        return _strategies.size();
    }

private:
    std::map<std::pair<error_category, error_severity>, recovery_strategy> _strategies;

    static auto key(error_category category, error_severity severity) -> std::pair<error_category, error_severity> {
        return {category, severity};
    }
};

/**
 * @brief Error reporter concept: receives a failure and decides the recovery action
 */
template<typename H>
concept error_reporter = requires(H handler, const error_report& report) {
    { handler.handle_error(report) } -> std::same_as<recovery_action>;
};

/**
 * @brief A stored error report plus what the handler decided for it
 */
struct error_record {
    error_report report;
    recovery_action decided_action{recovery_action::abort};
    std::vector<std::string> suggested_actions;
    std::string timestamp;
};

/**
 * @brief Table-driven error handler
 *
 * Records every report per project, looks up the strategy, and downgrades a
 * retry to abort once the attempt count exceeds the strategy's retry budget.
 * Unknown (category, severity) pairs abort.
 */
class recovery_error_handler {
public:
    explicit recovery_error_handler(const recovery_table& table)
        : _table(table) {}

    // The table is held by reference and must outlive the handler
    explicit recovery_error_handler(recovery_table&&) = delete;

    recovery_error_handler(const recovery_error_handler&) = delete;
    recovery_error_handler& operator=(const recovery_error_handler&) = delete;

    auto handle_error(const error_report& report) -> recovery_action {
        auto action = decide(report);

        std::lock_guard<std::mutex> lock(_mutex);
        _errors[report.project_id].push_back(error_record{
            .report = report,
            .decided_action = action,
            .suggested_actions = suggested_actions(report.category),
            .timestamp = current_timestamp()
        });
        return action;
    }

    auto errors_for(const std::string& project_id) const -> std::vector<error_record> {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _errors.find(project_id);
        if (it == _errors.end()) {
            return {};
        }
        return it->second;
    }

    auto error_count(const std::string& project_id) const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _errors.find(project_id);
        return it == _errors.end() ? 0 : it->second.size();
    }

    auto clear(const std::string& project_id) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _errors.erase(project_id);
    }

    auto table() const -> const recovery_table& {
        return _table;
    }

private:
    const recovery_table& _table;
    std::unordered_map<std::string, std::vector<error_record>> _errors;
    mutable std::mutex _mutex;

    auto decide(const error_report& report) const -> recovery_action {
        auto strategy = _table.find(report.category, report.severity);
        if (!strategy) {
            return recovery_action::abort;
        }
        if (strategy->action == recovery_action::retry && report.attempt > strategy->max_retries) {
            return recovery_action::abort;
        }
        return strategy->action;
    }

    static auto suggested_actions(error_category category) -> std::vector<std::string> {
        switch (category) {
            case error_category::network:
                return {"Check network connectivity", "Retry the operation"};
            case error_category::file_system:
                return {"Check file and directory permissions", "Verify available disk space"};
            case error_category::dependency:
                return {"Verify the package manager is installed", "Reinstall project dependencies"};
            case error_category::build:
                return {"Review the build output", "Run the build manually to inspect errors"};
            case error_category::validation:
                return {"Review the server implementation against the protocol",
                        "Check the server logs for errors"};
            case error_category::configuration:
                return {"Review the project configuration", "Verify the entry command"};
            case error_category::template_error:
                return {"Verify the template is complete"};
            case error_category::system:
                return {"Check system resources", "Verify the runtime is installed"};
        }
        return {};
    }
};

static_assert(error_reporter<recovery_error_handler>,
    "recovery_error_handler must satisfy error_reporter concept");

/**
 * @brief Classification result for an unexpected exception
 */
struct error_classification {
    error_category category;
    error_severity severity;
    std::string description;
};

/**
 * @brief Classify an exception escaping a phase by its type and message
 *
 * Typed exceptions from this library map directly; anything else is matched on
 * lowercase keywords in the message.
 */
inline auto classify_exception(const std::exception& e) -> error_classification {
    if (dynamic_cast<const configuration_error*>(&e) != nullptr) {
        return {error_category::configuration, error_severity::high, "Invalid configuration"};
    }
    if (dynamic_cast<const process_start_error*>(&e) != nullptr) {
        return {error_category::system, error_severity::high, "Server process could not be started"};
    }
    if (dynamic_cast<const process_timeout_error*>(&e) != nullptr) {
        return {error_category::network, error_severity::medium, "Server did not respond in time"};
    }
    if (dynamic_cast<const protocol_error*>(&e) != nullptr) {
        return {error_category::validation, error_severity::medium, "Protocol violation"};
    }
    if (dynamic_cast<const scan_io_error*>(&e) != nullptr) {
        return {error_category::file_system, error_severity::low, "File could not be read"};
    }

    std::string error_msg = e.what();
    std::transform(error_msg.begin(), error_msg.end(), error_msg.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto contains = [&error_msg](std::string_view needle) {
        return error_msg.find(needle) != std::string::npos;
    };

    if (contains("timeout") || contains("timed out") || contains("time out")) {
        return {error_category::network, error_severity::medium, "Operation timed out"};
    }
    if (contains("broken pipe") || contains("connection reset") || contains("end of file")) {
        return {error_category::network, error_severity::medium, "Server connection lost"};
    }
    if (contains("permission denied") || contains("access denied") || contains("not found")
        || contains("no such file")) {
        return {error_category::system, error_severity::high, "Resource unavailable"};
    }
    if (contains("parse") || contains("malformed") || contains("invalid format")
        || contains("protocol")) {
        return {error_category::validation, error_severity::medium, "Malformed server response"};
    }
    if (contains("out of memory") || contains("no space left")) {
        return {error_category::system, error_severity::critical, "Resource exhaustion"};
    }
    return {error_category::system, error_severity::high, "Unknown error: " + std::string(e.what())};
}

} // namespace kestrel
