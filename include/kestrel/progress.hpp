#pragma once

#include <kestrel/logger.hpp>
#include <kestrel/types.hpp>

#include <concepts>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel {

// Progress reporter concept: receives phase lifecycle facts keyed by project and phase
template<typename P>
concept progress_reporter = requires(
    P reporter,
    std::string_view project,
    std::string_view phase,
    double percentage,
    std::string_view message
) {
    { reporter.start_phase(project, phase, message) } -> std::same_as<void>;
    { reporter.update_progress(project, phase, percentage, message) } -> std::same_as<void>;
    { reporter.complete_phase(project, phase, message) } -> std::same_as<void>;
    { reporter.report_error(project, phase, message) } -> std::same_as<void>;
    { reporter.report_warning(project, phase, message) } -> std::same_as<void>;
};

class noop_progress_reporter {
public:
    auto start_phase(std::string_view, std::string_view, std::string_view) -> void {}
    auto update_progress(std::string_view, std::string_view, double, std::string_view) -> void {}
    auto complete_phase(std::string_view, std::string_view, std::string_view) -> void {}
    auto report_error(std::string_view, std::string_view, std::string_view) -> void {}
    auto report_warning(std::string_view, std::string_view, std::string_view) -> void {}
};

static_assert(progress_reporter<noop_progress_reporter>,
    "noop_progress_reporter must satisfy progress_reporter concept");

// Forwards progress events to a diagnostic logger
template<diagnostic_logger Logger>
class logging_progress_reporter {
public:
    explicit logging_progress_reporter(Logger& logger)
        : _logger(logger) {}

    auto start_phase(std::string_view project, std::string_view phase, std::string_view message) -> void {
        _logger.info(message, {{"project", project}, {"phase", phase}, {"event", "start"}});
    }

    auto update_progress(std::string_view project, std::string_view phase, double percentage,
                         std::string_view message) -> void {
        auto pct = std::to_string(static_cast<int>(percentage));
        _logger.debug(message, {{"project", project}, {"phase", phase}, {"progress", pct}});
    }

    auto complete_phase(std::string_view project, std::string_view phase, std::string_view message) -> void {
        _logger.info(message, {{"project", project}, {"phase", phase}, {"event", "complete"}});
    }

    auto report_error(std::string_view project, std::string_view phase, std::string_view message) -> void {
        _logger.error(message, {{"project", project}, {"phase", phase}});
    }

    auto report_warning(std::string_view project, std::string_view phase, std::string_view message) -> void {
        _logger.warning(message, {{"project", project}, {"phase", phase}});
    }

private:
    Logger& _logger;
};

static_assert(progress_reporter<logging_progress_reporter<noop_logger>>,
    "logging_progress_reporter must satisfy progress_reporter concept");

enum class progress_event_type {
    phase_start,
    progress,
    phase_complete,
    error,
    warning
};

inline auto to_string(progress_event_type type) -> std::string_view {
    switch (type) {
        case progress_event_type::phase_start: return "phase_start";
        case progress_event_type::progress: return "progress";
        case progress_event_type::phase_complete: return "phase_complete";
        case progress_event_type::error: return "error";
        case progress_event_type::warning: return "warning";
    }
    return "unknown";
}

inline auto operator<<(std::ostream& os, progress_event_type type) -> std::ostream& {
    return os << to_string(type);
}

struct progress_event {
    progress_event_type type{progress_event_type::progress};
    std::string project;
    std::string phase;
    double percentage{0.0};
    std::string message;
    std::string timestamp;
};

/**
 * @brief Thread-safe reporter that keeps every event in arrival order
 *
 * Used by tests and by callers that persist progress themselves. Percentages
 * reported for phase start and completion are 0 and 100.
 */
class recording_progress_reporter {
public:
    recording_progress_reporter() = default;
    recording_progress_reporter(const recording_progress_reporter&) = delete;
    recording_progress_reporter& operator=(const recording_progress_reporter&) = delete;

    auto start_phase(std::string_view project, std::string_view phase, std::string_view message) -> void {
        record(progress_event_type::phase_start, project, phase, 0.0, message);
    }

    auto update_progress(std::string_view project, std::string_view phase, double percentage,
                         std::string_view message) -> void {
        record(progress_event_type::progress, project, phase, percentage, message);
    }

    auto complete_phase(std::string_view project, std::string_view phase, std::string_view message) -> void {
        record(progress_event_type::phase_complete, project, phase, 100.0, message);
    }

    auto report_error(std::string_view project, std::string_view phase, std::string_view message) -> void {
        record(progress_event_type::error, project, phase, 0.0, message);
    }

    auto report_warning(std::string_view project, std::string_view phase, std::string_view message) -> void {
        record(progress_event_type::warning, project, phase, 0.0, message);
    }

    auto events() const -> std::vector<progress_event> {
        std::lock_guard<std::mutex> lock(_mutex);
        return _events;
    }

    auto events_for(std::string_view project) const -> std::vector<progress_event> {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<progress_event> result;
        for (const auto& event : _events) {
            if (event.project == project) {
                result.push_back(event);
            }
        }
        return result;
    }

    // Phases that were started, in order, without duplicates
    auto started_phases(std::string_view project) const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<std::string> phases;
        for (const auto& event : _events) {
            if (event.project != project || event.type != progress_event_type::phase_start) {
                continue;
            }
            bool seen = false;
            for (const auto& phase : phases) {
                seen = seen || phase == event.phase;
            }
            if (!seen) {
                phases.push_back(event.phase);
            }
        }
        return phases;
    }

    auto count(progress_event_type type) const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        std::size_t n = 0;
        for (const auto& event : _events) {
            if (event.type == type) {
                ++n;
            }
        }
        return n;
    }

private:
    std::vector<progress_event> _events;
    mutable std::mutex _mutex;

    auto record(progress_event_type type, std::string_view project, std::string_view phase,
                double percentage, std::string_view message) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _events.push_back(progress_event{
            .type = type,
            .project = std::string(project),
            .phase = std::string(phase),
            .percentage = percentage,
            .message = std::string(message),
            .timestamp = current_timestamp()
        });
    }
};

static_assert(progress_reporter<recording_progress_reporter>,
    "recording_progress_reporter must satisfy progress_reporter concept");

} // namespace kestrel
