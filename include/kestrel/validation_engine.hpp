#pragma once

#include <kestrel/capability_survey.hpp>
#include <kestrel/config.hpp>
#include <kestrel/console_logger.hpp>
#include <kestrel/entry_point.hpp>
#include <kestrel/exceptions.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/process.hpp>
#include <kestrel/progress.hpp>
#include <kestrel/protocol_exchange.hpp>
#include <kestrel/recovery.hpp>
#include <kestrel/types.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace kestrel {

/**
 * @brief Collaborator set of the validation engine and comprehensive tester
 */
template<typename T>
concept engine_types = requires {
    typename T::logger_type;
    typename T::progress_type;
    typename T::error_reporter_type;
} && diagnostic_logger<typename T::logger_type>
  && progress_reporter<typename T::progress_type>
  && error_reporter<typename T::error_reporter_type>;

struct default_engine_types {
    using logger_type = console_logger;
    using progress_type = logging_progress_reporter<console_logger>;
    using error_reporter_type = recovery_error_handler;
};

static_assert(engine_types<default_engine_types>, "default_engine_types must satisfy engine_types");

namespace phases {
    inline constexpr std::string_view startup = "startup";
    inline constexpr std::string_view protocol = "protocol";
    inline constexpr std::string_view functionality = "functionality";
} // namespace phases

// Lines on stderr that count as error output during startup
inline auto is_error_output(std::string_view line) -> bool {
    std::string lower(line);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (std::string_view keyword : {"error", "exception", "traceback", "fatal"}) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Recommendations derived from the three phase results
 *
 * Deterministic: the same results always produce the same list in the same
 * order.
 */
inline auto generate_recommendations(const validation_report& report,
                                     std::chrono::milliseconds slow_startup_threshold) -> std::vector<std::string> {
    std::vector<std::string> recommendations;
    const auto& startup = report.startup_result;
    const auto& protocol = report.protocol_result;
    const auto& functionality = report.functionality_result;

    if (!startup.success) {
        recommendations.emplace_back("Fix server startup issues before deployment");
        if (!startup.errors.empty()) {
            recommendations.emplace_back("Review server logs for startup errors");
        }
    }

    if (!protocol.missing_capabilities.empty()) {
        std::string names;
        for (const auto& name : protocol.missing_capabilities) {
            names += names.empty() ? name : ", " + name;
        }
        recommendations.push_back("Implement missing MCP capabilities: " + names);
    }

    if (!functionality.skipped && startup.success && functionality.total_tested() == 0) {
        recommendations.emplace_back("Add at least one tool, resource, or prompt to make the server useful");
    }

    if (startup.success && startup.startup_time > slow_startup_threshold) {
        recommendations.push_back("Consider optimizing server startup time (took "
                                  + std::to_string(static_cast<long long>(startup.startup_time.count()))
                                  + " ms)");
    }

    return recommendations;
}

/**
 * @brief Startup, protocol and functionality checks against one server process
 *
 * One process is started per run and reused by all three phases; it is owned
 * by the run and stopped on every exit path. Phase failures are reported to
 * the error reporter and its decision is obeyed: retry re-runs the phase (up to
 * max_phase_attempts), skip continues, abort and manual stop, rollback stops
 * and sweeps the process registry. Nothing thrown inside a phase escapes
 * validate().
 */
template<typename Types>
requires engine_types<Types>
class validation_engine {
public:
    using logger_type = typename Types::logger_type;
    using progress_type = typename Types::progress_type;
    using error_reporter_type = typename Types::error_reporter_type;

    /**
     * @throws configuration_error when @p config is invalid
     */
    validation_engine(engine_config config,
                      process_registry& registry,
                      logger_type& logger,
                      progress_type& progress,
                      error_reporter_type& errors)
        : _config(std::move(config))
        , _registry(registry)
        , _supervisor(registry, logger)
        , _logger(logger)
        , _progress(progress)
        , _errors(errors) {
        validate_engine_config(_config);
        if (!_config.entry_command.empty()) {
            // Tokenise now so a bad override fails before any process starts
            static_cast<void>(parse_command(_config.entry_command));
        }
    }

    auto validate(const std::filesystem::path& project_path) -> validation_report {
        return validate(project_path, _config.level);
    }

    auto validate(const std::filesystem::path& project_path, validation_level level) -> validation_report {
        auto run_start = std::chrono::steady_clock::now();
        const auto project = project_path.string();

        validation_report report;
        report.project_path = project;
        report.level = level;
        report.timestamp = current_timestamp();

        _logger.info("Starting validation", {{"project", project}, {"level", to_string(level)}});

        process_ptr process;
        bool proceed = true;

        // Startup
        {
            auto outcome = run_phase(project, phases::startup, [&]() {
                if (process) {
                    _supervisor.stop(*process, _config.stop_grace_period);
                    process.reset();
                }
                report.startup_result = check_startup(project_path, process);
                return phase_status{report.startup_result.success, report.startup_result.errors,
                                    startup_failure_class(report.startup_result)};
            }, [&](const std::string& error) {
                report.startup_result.success = false;
                report.startup_result.errors.push_back(error);
            });
            proceed = outcome;
        }

        // Protocol
        if (proceed || _config.continue_on_failure) {
            auto outcome = run_phase(project, phases::protocol, [&]() {
                report.protocol_result = check_protocol(process);
                return phase_status{report.protocol_result.success, report.protocol_result.errors,
                                    protocol_failure_class(report.protocol_result)};
            }, [&](const std::string& error) {
                report.protocol_result.success = false;
                report.protocol_result.errors.push_back(error);
            });
            proceed = outcome;
        } else {
            report.protocol_result.skipped = true;
            report.protocol_result.errors.emplace_back("Skipped: server startup failed");
        }

        // Functionality
        if (level == validation_level::basic) {
            report.functionality_result.skipped = true;
            report.functionality_result.success = true;
        } else if (proceed || _config.continue_on_failure) {
            run_phase(project, phases::functionality, [&]() {
                report.functionality_result = check_functionality(process, report.protocol_result, level);
                return phase_status{report.functionality_result.success, report.functionality_result.errors,
                                    {error_category::validation, error_severity::low, ""}};
            }, [&](const std::string& error) {
                report.functionality_result.success = false;
                report.functionality_result.errors.push_back(error);
            });
        } else {
            report.functionality_result.skipped = true;
            report.functionality_result.errors.emplace_back("Skipped: an earlier phase failed");
        }

        if (process) {
            _supervisor.stop(*process, _config.stop_grace_period);
            process.reset();
        }

        report.overall_success = report.startup_result.success
                                 && report.protocol_result.success
                                 && report.functionality_result.success;
        report.performance_metrics = collect_metrics(report);
        report.recommendations = generate_recommendations(report, _config.slow_startup_threshold);
        report.total_execution_time = std::chrono::steady_clock::now() - run_start;

        _logger.info("Validation finished", {
            {"project", project},
            {"success", report.overall_success ? "true" : "false"}
        });
        return report;
    }

    auto config() const -> const engine_config& {
        return _config;
    }

    auto supervisor() -> process_supervisor<logger_type>& {
        return _supervisor;
    }

private:
    struct phase_status {
        bool success;
        std::vector<std::string> errors;
        error_classification classification;
    };

    engine_config _config;
    process_registry& _registry;
    process_supervisor<logger_type> _supervisor;
    logger_type& _logger;
    progress_type& _progress;
    error_reporter_type& _errors;

    /**
     * Runs @p attempt until it passes or the error reporter stops retrying.
     * An exception thrown by an attempt is handed to @p record as an error
     * line of the phase result. Returns true when the next phase should run.
     */
    template<typename Attempt, typename Record>
    auto run_phase(const std::string& project, std::string_view phase, Attempt&& attempt, Record&& record) -> bool {
        _progress.start_phase(project, phase, "Running " + std::string(phase) + " validation");

        for (std::size_t attempt_number = 1;; ++attempt_number) {
            phase_status status{false, {}, {error_category::system, error_severity::high, ""}};
            try {
                status = attempt();
            } catch (const std::exception& e) {
                auto error = std::string(phase) + " validation failed: " + e.what();
                record(error);
                status = phase_status{false, {error}, classify_exception(e)};
            }

            if (status.success) {
                _progress.complete_phase(project, phase, std::string(phase) + " validation passed");
                return true;
            }

            auto message = status.errors.empty() ? std::string(phase) + " validation failed"
                                                 : status.errors.front();
            _progress.report_error(project, phase, message);

            error_report report{
                .project_id = project,
                .category = status.classification.category,
                .severity = status.classification.severity,
                .message = message,
                .phase = std::string(phase),
                .details = {{"error_count", std::to_string(status.errors.size())}},
                .attempt = attempt_number
            };
            auto action = _errors.handle_error(report);
            _logger.warning("Phase failed", {
                {"project", project}, {"phase", phase}, {"action", to_string(action)}
            });

            switch (action) {
                case recovery_action::retry:
                    if (attempt_number < _config.max_phase_attempts) {
                        _progress.report_warning(project, phase, "Retrying " + std::string(phase) + " validation");
                        continue;
                    }
                    return false;
                case recovery_action::skip:
                    return true;
                case recovery_action::rollback:
                    _registry.terminate_all(_config.stop_grace_period);
                    return false;
                case recovery_action::abort:
                case recovery_action::manual:
                    return false;
            }
            return false;
        }
    }

    static auto startup_failure_class(const server_startup_result& result) -> error_classification {
        for (const auto& error : result.errors) {
            if (error.find("No entry point") != std::string::npos) {
                return {error_category::configuration, error_severity::high, "No entry point"};
            }
            if (error.find("did not answer") != std::string::npos) {
                return {error_category::network, error_severity::medium, "Readiness ping timed out"};
            }
        }
        return {error_category::system, error_severity::high, "Server failed to start"};
    }

    static auto protocol_failure_class(const protocol_compliance_result& result) -> error_classification {
        bool handshake_failed = std::find(result.supported_capabilities.begin(),
                                          result.supported_capabilities.end(),
                                          std::string(methods::initialize)) == result.supported_capabilities.end();
        if (handshake_failed) {
            return {error_category::validation, error_severity::medium, "Handshake failed"};
        }
        return {error_category::validation, error_severity::low, "Baseline capabilities missing"};
    }

    auto check_startup(const std::filesystem::path& project_path, process_ptr& process) -> server_startup_result {
        server_startup_result result;
        auto start = std::chrono::steady_clock::now();

        auto command = detect_entry_command(project_path, _config.entry_command);
        if (!command) {
            result.errors.push_back("No entry point detected in " + project_path.string());
            result.startup_time = std::chrono::steady_clock::now() - start;
            return result;
        }
        result.logs.push_back("Entry command: " + command->to_string());

        auto started = _supervisor.start(project_path, *command);
        if (started.hasException()) {
            result.errors.push_back(started.exception().what().toStdString());
            result.startup_time = std::chrono::steady_clock::now() - start;
            return result;
        }
        process = std::move(started.value());
        result.pid = static_cast<std::int64_t>(process->pid());
        result.logs.push_back("Server started with PID " + std::to_string(process->pid()));

        stdio_channel<logger_type> channel(*process, _logger);
        auto deadline = start + _config.startup_window;
        bool ready = false;
        bool exited_cleanly = false;

        while (std::chrono::steady_clock::now() < deadline) {
            if (!process->is_alive()) {
                auto status = process->exit_status().value_or(-1);
                if (status == 0 && _config.allow_short_lived) {
                    exited_cleanly = true;
                } else {
                    result.errors.push_back("Server process exited with status " + std::to_string(status)
                                            + " during startup");
                }
                break;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            auto answer = call_method(channel, methods::ping, {}, std::min(remaining, _config.call_timeout));
            if (answer.hasValue()) {
                // Any well-formed reply, even a JSON-RPC error, proves the server is serving
                ready = true;
                break;
            }
            if (answer.tryGetExceptionObject<process_timeout_error>() != nullptr) {
                continue;
            }
            std::this_thread::sleep_for(_config.liveness_poll_interval);
        }

        if (!ready && !exited_cleanly && result.errors.empty()) {
            result.errors.push_back("Server did not answer the readiness ping within "
                                    + std::to_string(_config.startup_window.count()) + " ms");
        }
        result.startup_time = std::chrono::steady_clock::now() - start;

        if (ready) {
            process->pump_stderr(_config.liveness_poll_interval);
        }
        for (const auto& line : process->stderr_lines()) {
            result.logs.push_back("STDERR: " + line);
            if (is_error_output(line)) {
                result.errors.push_back("STDERR: " + line);
            }
        }

        result.success = (ready || exited_cleanly) && result.errors.empty();
        if (!result.success) {
            _supervisor.stop(*process, _config.stop_grace_period);
            process.reset();
        }
        return result;
    }

    auto check_protocol(process_ptr& process) -> protocol_compliance_result {
        if (!process || !process->is_alive()) {
            protocol_compliance_result result;
            result.errors.emplace_back("Server process is not running");
            for (const auto& method : _config.baseline_capabilities) {
                result.missing_capabilities.insert(method);
            }
            return result;
        }
        stdio_channel<logger_type> channel(*process, _logger);
        return survey_protocol(channel, _config);
    }

    auto check_functionality(process_ptr& process, const protocol_compliance_result& protocol,
                             validation_level level) -> functionality_test_result {
        if (!process || !process->is_alive()) {
            functionality_test_result result;
            result.errors.emplace_back("Server process is not running");
            return result;
        }
        stdio_channel<logger_type> channel(*process, _logger);
        return exercise_functionality(channel, protocol.advertised_capabilities, level,
                                      _config.max_items_per_kind, _config.call_timeout);
    }

    static auto collect_metrics(const validation_report& report) -> std::map<std::string, double> {
        std::map<std::string, double> metrics;
        metrics["startup_time_ms"] = report.startup_result.startup_time.count();

        double total = 0.0;
        for (const auto& [key, value] : report.functionality_result.performance_metrics) {
            metrics[key] = value;
            if (key.size() > 6 && key.compare(key.size() - 6, 6, "_count") == 0) {
                total += value;
            }
        }
        metrics["total_capabilities"] = total;
        return metrics;
    }
};

} // namespace kestrel
