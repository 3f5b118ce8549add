#pragma once

#include <kestrel/benchmark.hpp>
#include <kestrel/capability_survey.hpp>
#include <kestrel/config.hpp>
#include <kestrel/entry_point.hpp>
#include <kestrel/exceptions.hpp>
#include <kestrel/integration.hpp>
#include <kestrel/load_test.hpp>
#include <kestrel/process.hpp>
#include <kestrel/protocol_exchange.hpp>
#include <kestrel/recovery.hpp>
#include <kestrel/resource_sampler.hpp>
#include <kestrel/security_scanner.hpp>
#include <kestrel/types.hpp>
#include <kestrel/validation_engine.hpp>

#include <folly/Try.h>
#include <folly/executors/CPUThreadPoolExecutor.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kestrel {

namespace sections {
    inline constexpr std::string_view performance = "performance";
    inline constexpr std::string_view integration = "integration";
    inline constexpr std::string_view load_testing = "load_testing";
    inline constexpr std::string_view security = "security";
} // namespace sections

namespace detail {

inline auto join_names(const std::vector<std::string>& names) -> std::string {
    std::string joined;
    for (const auto& name : names) {
        joined += joined.empty() ? name : ", " + name;
    }
    return joined;
}

inline auto format_percent(double rate) -> std::string {
    auto tenths = static_cast<long long>(rate * 1000.0 + 0.5);
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + "%";
}

} // namespace detail

// Every load step stayed within @p max_error_rate; true when no step ran
inline auto load_results_passed(const std::map<std::string, load_test_result>& results, double max_error_rate) -> bool {
    return std::all_of(results.begin(), results.end(), [max_error_rate](const auto& entry) {
        return load_step_passed(entry.second, max_error_rate);
    });
}

/**
 * @brief Basic-validation recommendations followed by threshold-triggered
 *        ones, duplicates removed keeping the first occurrence
 */
inline auto merge_recommendations(const comprehensive_test_report& report,
                                  const tester_config& config) -> std::vector<std::string> {
    const auto& limits = config.thresholds;
    std::vector<std::string> merged(report.basic_validation.recommendations);

    std::vector<std::string> slow;
    std::vector<std::string> failing;
    bool heavy = false;
    for (const auto& benchmark : report.performance_benchmarks) {
        if (benchmark.average_response_time > limits.benchmark_average_latency) {
            slow.push_back(benchmark.operation_name);
        }
        if (benchmark.error_rate > limits.benchmark_error_rate) {
            failing.push_back(benchmark.operation_name);
        }
        if (benchmark.memory_usage_mb && *benchmark.memory_usage_mb > limits.benchmark_memory_mb) {
            heavy = true;
        }
    }
    if (!slow.empty()) {
        merged.push_back("Optimize slow operations: " + detail::join_names(slow));
    }
    if (!failing.empty()) {
        merged.push_back("Fix high error rate operations: " + detail::join_names(failing));
    }
    if (heavy) {
        merged.emplace_back("Consider memory optimization for resource-intensive operations");
    }

    std::vector<std::string> incompatible;
    for (const auto& result : report.integration_results) {
        if (result.compatibility_score < limits.compatibility_score) {
            incompatible.push_back(result.client_name);
        }
    }
    if (!incompatible.empty()) {
        merged.push_back("Improve compatibility with: " + detail::join_names(incompatible));
    }

    std::size_t max_users = 0;
    for (const auto& [key, step] : report.load_test_results) {
        if (step.error_rate > limits.load_error_rate) {
            merged.push_back("URGENT: Improve server stability under load (error rate "
                             + detail::format_percent(step.error_rate) + " at "
                             + std::to_string(step.concurrent_users) + " concurrent users)");
        }
        if (load_step_passed(step, limits.load_error_rate)) {
            max_users = std::max(max_users, step.concurrent_users);
        }
    }
    if (!report.load_test_results.empty() && max_users < 10) {
        merged.emplace_back("Consider scaling improvements for concurrent user support");
    }

    auto security = total_counts(report.security_scan_results);
    if (security.critical > 0) {
        merged.emplace_back("URGENT: Fix critical security vulnerabilities before deployment");
    }
    if (security.high > 0) {
        merged.emplace_back("Address high-severity security issues");
    }
    for (const auto& [category, result] : report.security_scan_results) {
        merged.insert(merged.end(), result.recommendations.begin(), result.recommendations.end());
    }

    if (!report.basic_validation.overall_success) {
        merged.emplace_back("Complete basic server validation before advanced testing");
    }
    if (!report.skipped_reason) {
        if (config.run_performance && report.performance_benchmarks.empty()) {
            merged.emplace_back("Add performance monitoring to track server metrics");
        }
        if (config.run_integration && report.integration_results.empty()) {
            merged.emplace_back("Test integration with different MCP client types");
        }
    }

    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (auto& recommendation : merged) {
        if (seen.insert(recommendation).second) {
            unique.push_back(std::move(recommendation));
        }
    }
    return unique;
}

/**
 * @brief Overall verdict of a comprehensive run
 *
 * Basic validation passed, every benchmark error rate is below the gating
 * rate, every client scored above the compatibility threshold, the load test
 * stayed within its error bound (or did not run), no section failed and no
 * critical security issue was found.
 */
inline auto comprehensive_success(const comprehensive_test_report& report, const tester_thresholds& limits) -> bool {
    if (!report.basic_validation.overall_success) {
        return false;
    }
    for (const auto& benchmark : report.performance_benchmarks) {
        if (benchmark.error_rate >= limits.gating_error_rate) {
            return false;
        }
    }
    for (const auto& result : report.integration_results) {
        if (result.compatibility_score <= limits.compatibility_score) {
            return false;
        }
    }
    if (!load_results_passed(report.load_test_results, limits.load_error_rate)) {
        return false;
    }
    if (!report.section_errors.empty()) {
        return false;
    }
    return total_counts(report.security_scan_results).critical == 0;
}

/**
 * @brief Basic validation followed by benchmarks, client integration, load
 *        and security sections
 *
 * The comprehensive sections run only when basic validation passes. Each
 * benchmark operation and each client profile gets a fresh server process;
 * the load ladder shares one. A section that throws is handled by the error
 * reporter, whose action decides whether later sections run. Every process
 * is started through the shared registry, and the registry is swept when
 * run() returns or throws.
 */
template<typename Types>
requires engine_types<Types>
class comprehensive_tester {
public:
    using logger_type = typename Types::logger_type;
    using progress_type = typename Types::progress_type;
    using error_reporter_type = typename Types::error_reporter_type;

    /**
     * @throws configuration_error when either config is invalid
     */
    comprehensive_tester(engine_config engine,
                         tester_config tester,
                         process_registry& registry,
                         logger_type& logger,
                         progress_type& progress,
                         error_reporter_type& errors)
        : _tester_config(std::move(tester))
        , _registry(registry)
        , _validator(std::move(engine), registry, logger, progress, errors)
        , _logger(logger)
        , _progress(progress)
        , _errors(errors) {
        validate_tester_config(_tester_config);
    }

    auto run(const std::filesystem::path& project_path) -> comprehensive_test_report {
        return run(project_path, _validator.config().level);
    }

    auto run(const std::filesystem::path& project_path, validation_level level) -> comprehensive_test_report {
        registry_sweep sweep{_registry, _validator.config().stop_grace_period, _logger};
        auto run_start = std::chrono::steady_clock::now();
        const auto project = project_path.string();

        comprehensive_test_report report;
        report.project_path = project;
        report.timestamp = current_timestamp();

        _logger.info("Starting comprehensive testing", {{"project", project}});
        report.basic_validation = _validator.validate(project_path, level);

        if (!report.basic_validation.overall_success) {
            report.skipped_reason = "Basic validation failed; comprehensive tests were not run";
            _progress.report_warning(project, "comprehensive", *report.skipped_reason);
        } else {
            // A failed section can end the run; later sections are then only listed
            bool proceed = true;
            auto section = [&](bool enabled, std::string_view name, auto&& body) {
                if (!enabled) {
                    return;
                }
                if (!proceed) {
                    report.abandoned_sections.emplace_back(name);
                    return;
                }
                proceed = run_section(report, name, body);
            };

            section(_tester_config.run_performance, sections::performance, [&]() {
                report.performance_benchmarks = run_benchmarks(project_path);
            });
            section(_tester_config.run_integration, sections::integration, [&]() {
                report.integration_results = run_integration(project_path);
            });
            section(_tester_config.run_load, sections::load_testing, [&]() {
                report.load_test_results = run_load(project_path);
            });
            section(_tester_config.run_security, sections::security, [&]() {
                report.security_scan_results = scan_project(project_path);
            });

            if (!report.abandoned_sections.empty()) {
                _progress.report_warning(project, "comprehensive",
                                         "Sections not run: " + detail::join_names(report.abandoned_sections));
            }
        }

        report.overall_success = comprehensive_success(report, _tester_config.thresholds);
        report.recommendations = merge_recommendations(report, _tester_config);
        report.total_test_duration = std::chrono::steady_clock::now() - run_start;

        _logger.info("Comprehensive testing finished", {
            {"project", project},
            {"success", report.overall_success ? "true" : "false"}
        });
        return report;
    }

    auto engine() -> validation_engine<Types>& {
        return _validator;
    }

    auto config() const -> const tester_config& {
        return _tester_config;
    }

private:
    // Stops every process still registered when a run ends, however it ends
    struct registry_sweep {
        process_registry& registry;
        std::chrono::milliseconds grace;
        logger_type& logger;

        ~registry_sweep() {
            auto swept = registry.terminate_all(grace);
            if (swept > 0) {
                auto count = std::to_string(swept);
                logger.warning("Swept leftover server processes", {{"count", count}});
            }
        }
    };

    tester_config _tester_config;
    process_registry& _registry;
    validation_engine<Types> _validator;
    logger_type& _logger;
    progress_type& _progress;
    error_reporter_type& _errors;

    /**
     * Runs @p body until it completes or the error reporter stops retrying.
     * The error of a throwing attempt is recorded in @p report and handed to
     * the error reporter, whose action is obeyed: retry re-runs the section
     * up to max_phase_attempts, skip moves on, rollback sweeps the registry
     * and stops, abort and manual stop. Returns true when the next section
     * should run.
     */
    template<typename Section>
    auto run_section(comprehensive_test_report& report, std::string_view section, Section&& body) -> bool {
        const auto& project = report.project_path;
        const auto& engine = _validator.config();
        const auto name = std::string(section);
        _progress.start_phase(project, section, "Running " + name + " tests");

        for (std::size_t attempt_number = 1;; ++attempt_number) {
            std::string message;
            error_classification classification{error_category::system, error_severity::high, ""};
            try {
                body();
                report.section_errors.erase(name);
                _progress.complete_phase(project, section, name + " tests finished");
                return true;
            } catch (const std::exception& e) {
                classification = classify_exception(e);
                message = name + " tests failed: " + e.what();
            }

            report.section_errors[name] = message;
            _progress.report_error(project, section, message);
            error_report error{
                .project_id = project,
                .category = classification.category,
                .severity = classification.severity,
                .message = message,
                .phase = name,
                .details = {{"classification", classification.description}},
                .attempt = attempt_number
            };
            auto action = _errors.handle_error(error);
            _logger.error("Section failed", {
                {"project", project}, {"section", section}, {"action", to_string(action)}
            });

            switch (action) {
                case recovery_action::retry:
                    if (attempt_number < engine.max_phase_attempts) {
                        _progress.report_warning(project, section, "Retrying " + name + " tests");
                        continue;
                    }
                    return false;
                case recovery_action::skip:
                    return true;
                case recovery_action::rollback:
                    _registry.terminate_all(engine.stop_grace_period);
                    return false;
                case recovery_action::abort:
                case recovery_action::manual:
                    return false;
            }
            return false;
        }
    }

    auto start_server(const std::filesystem::path& project_path) -> folly::Try<process_ptr> {
        const auto& engine = _validator.config();
        auto command = detect_entry_command(project_path, engine.entry_command);
        if (!command) {
            return folly::Try<process_ptr>(
                folly::make_exception_wrapper<process_start_error>("No entry point detected in "
                                                                   + project_path.string()));
        }
        return _validator.supervisor().start(project_path, *command);
    }

    auto stop_server(process_ptr& process) -> void {
        if (process) {
            _validator.supervisor().stop(*process, _validator.config().stop_grace_period);
            process.reset();
        }
    }

    auto handshake(stdio_channel<logger_type>& channel) -> handshake_outcome {
        const auto& engine = _validator.config();
        return perform_handshake(channel, engine.protocol_version, engine.client_name,
                                 engine.client_version, engine.call_timeout);
    }

    auto run_benchmarks(const std::filesystem::path& project_path) -> std::vector<performance_benchmark> {
        const auto project = project_path.string();
        const auto& engine = _validator.config();
        std::vector<performance_benchmark> benchmarks;
        const auto total = _tester_config.benchmarks.size();

        for (std::size_t i = 0; i < total; ++i) {
            const auto& spec = _tester_config.benchmarks[i];
            auto name = std::string(to_string(spec.operation));
            _progress.update_progress(project, sections::performance,
                                      100.0 * static_cast<double>(i) / static_cast<double>(total),
                                      "Benchmarking " + name);

            auto failed_run = [&](const std::string& error) {
                performance_benchmark benchmark;
                benchmark.operation_name = name;
                benchmark.total_requests = spec.requests;
                benchmark.failed_requests = spec.requests;
                benchmark.error_rate = error_rate(spec.requests, spec.requests);
                benchmarks.push_back(std::move(benchmark));
                _logger.warning("Benchmark could not run", {{"operation", name}, {"error", error}});
            };

            auto started = start_server(project_path);
            if (started.hasException()) {
                failed_run(started.exception().what().toStdString());
                continue;
            }
            auto process = std::move(started.value());
            stdio_channel<logger_type> channel(*process, _logger);

            auto init = handshake(channel);
            if (!init.success) {
                failed_run(init.error);
                stop_server(process);
                continue;
            }

            auto request = resolve_benchmark_request(channel, spec.operation, engine);
            if (!request) {
                _logger.info("Benchmark omitted; server lists no items", {{"operation", name}});
                stop_server(process);
                continue;
            }

            auto before = try_sample_process(process->pid());
            auto benchmark = measure_operation(channel, name, *request, spec.requests, engine.call_timeout);
            auto after = try_sample_process(process->pid());
            attach_resource_usage(benchmark, before, after);
            stop_server(process);

            benchmarks.push_back(std::move(benchmark));
        }
        return benchmarks;
    }

    auto run_integration(const std::filesystem::path& project_path) -> std::vector<integration_test_result> {
        const auto project = project_path.string();
        std::vector<integration_test_result> results;

        for (const auto& profile : _tester_config.client_profiles) {
            _progress.update_progress(project, sections::integration,
                                      100.0 * static_cast<double>(results.size())
                                          / static_cast<double>(_tester_config.client_profiles.size()),
                                      "Simulating " + profile.name);

            auto started = start_server(project_path);
            if (started.hasException()) {
                integration_test_result result;
                result.client_name = profile.name;
                result.failed_features = profile_features(profile);
                result.errors.push_back("Failed to start server: " + started.exception().what().toStdString());
                results.push_back(std::move(result));
                continue;
            }
            auto process = std::move(started.value());
            stdio_channel<logger_type> channel(*process, _logger);
            results.push_back(run_client_profile(channel, profile, _validator.config().call_timeout));
            stop_server(process);
        }
        return results;
    }

    auto run_load(const std::filesystem::path& project_path) -> std::map<std::string, load_test_result> {
        const auto project = project_path.string();
        const auto& engine = _validator.config();
        const auto& limits = _tester_config.thresholds;
        std::map<std::string, load_test_result> results;

        // Without a server there is no load section; value() rethrows the start failure
        auto started = start_server(project_path);
        auto process = std::move(started.value());
        stdio_channel<logger_type> channel(*process, _logger);

        auto init = handshake(channel);
        if (!init.success) {
            stop_server(process);
            throw protocol_error("Load test handshake failed: " + init.error);
        }

        auto mix = default_load_mix(channel, engine.call_timeout);
        auto executor = std::make_unique<folly::CPUThreadPoolExecutor>(_tester_config.max_workers);

        for (auto users : _tester_config.load_user_ladder) {
            _progress.update_progress(project, sections::load_testing, 0.0,
                                      "Load step with " + std::to_string(users) + " users");

            auto before = try_sample_process(process->pid());
            auto step = run_load_step(channel, *executor, mix, users,
                                      _tester_config.load_requests_per_user, engine.call_timeout);
            auto after = try_sample_process(process->pid());
            if (before) {
                step.memory_before_mb = before->memory_mb;
            }
            if (after) {
                step.memory_after_mb = after->memory_mb;
            }
            if (before && after) {
                step.cpu_usage_percent = cpu_percent_between(*before, *after);
            }

            auto rate = detail::format_percent(step.error_rate);
            auto users_text = std::to_string(users);
            _logger.info("Load step finished", {{"users", users_text}, {"error_rate", rate}});

            bool stop_escalating = step.error_rate >= limits.load_stop_error_rate;
            results.emplace(load_result_key(users), std::move(step));
            if (stop_escalating) {
                _progress.report_warning(project, sections::load_testing,
                                         "Stopping load escalation at " + users_text + " users");
                break;
            }
        }

        executor->join();
        stop_server(process);
        return results;
    }
};

} // namespace kestrel
