#define BOOST_TEST_MODULE ValidationEngineTest
#include <boost/test/unit_test.hpp>

#include <kestrel/config.hpp>
#include <kestrel/exceptions.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/process.hpp>
#include <kestrel/progress.hpp>
#include <kestrel/recovery.hpp>
#include <kestrel/validation_engine.hpp>

#include "test_utils/scripted_error_reporter.hpp"
#include "test_utils/temp_project.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <vector>

using namespace kestrel;

namespace {
    struct test_engine_types {
        using logger_type = noop_logger;
        using progress_type = recording_progress_reporter;
        using error_reporter_type = recovery_error_handler;
    };

    static_assert(engine_types<test_engine_types>, "test_engine_types must satisfy engine_types");

    auto fake_server_command(const std::string& mode) -> std::string {
        return "\"" KESTREL_FAKE_SERVER_PATH "\" " + mode;
    }

    auto test_config(const std::string& mode) -> engine_config {
        engine_config config;
        config.entry_command = fake_server_command(mode);
        config.call_timeout = std::chrono::milliseconds{2000};
        config.startup_window = std::chrono::milliseconds{3000};
        config.stop_grace_period = std::chrono::milliseconds{500};
        config.max_phase_attempts = 1;
        return config;
    }

    auto contains(const std::vector<std::string>& items, std::string_view value) -> bool {
        return std::find(items.begin(), items.end(), value) != items.end();
    }

    auto any_contains(const std::vector<std::string>& items, std::string_view fragment) -> bool {
        return std::any_of(items.begin(), items.end(), [fragment](const std::string& item) {
            return item.find(fragment) != std::string::npos;
        });
    }

    // Collaborators of one engine, torn down after it
    struct engine_fixture {
        explicit engine_fixture(engine_config config)
            : errors(table)
            , engine(std::move(config), registry, logger, progress, errors) {}

        test::temp_project project;
        process_registry registry;
        noop_logger logger;
        recording_progress_reporter progress;
        recovery_table table{recovery_table::defaults()};
        recovery_error_handler errors;
        validation_engine<test_engine_types> engine;
    };

    struct scripted_engine_types {
        using logger_type = noop_logger;
        using progress_type = recording_progress_reporter;
        using error_reporter_type = test::scripted_error_reporter;
    };

    // Engine whose error reporter follows a script, next to a server the
    // engine never owns; only a registry sweep stops that one
    struct scripted_fixture {
        scripted_fixture(engine_config config, std::vector<recovery_action> actions)
            : errors(std::move(actions))
            , supervisor(registry, logger)
            , engine(std::move(config), registry, logger, progress, errors) {
            auto started = supervisor.start(project.path(), entry_command{{KESTREL_FAKE_SERVER_PATH, "silent"}});
            bystander = std::move(started.value());
        }

        test::temp_project project;
        process_registry registry;
        noop_logger logger;
        recording_progress_reporter progress;
        test::scripted_error_reporter errors;
        process_supervisor<noop_logger> supervisor;
        validation_engine<scripted_engine_types> engine;
        process_ptr bystander;
    };
}

BOOST_AUTO_TEST_SUITE(healthy_server_tests)

BOOST_AUTO_TEST_CASE(standard_validation_passes_every_phase, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("normal"));
    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(report.overall_success);
    BOOST_CHECK(report.level == validation_level::standard);
    BOOST_CHECK_EQUAL(report.project_path, fixture.project.path().string());
    BOOST_CHECK(!report.timestamp.empty());

    BOOST_CHECK(report.startup_result.success);
    BOOST_CHECK(report.startup_result.pid.has_value());
    BOOST_CHECK(report.startup_result.errors.empty());
    BOOST_CHECK_GT(report.startup_result.startup_time.count(), 0.0);

    BOOST_CHECK(report.protocol_result.success);
    BOOST_CHECK(report.protocol_result.missing_capabilities.empty());
    BOOST_CHECK_EQUAL(report.protocol_result.supported_capabilities.size(), 4u);
    BOOST_CHECK_EQUAL(report.protocol_result.protocol_version.value_or(""), "2024-11-05");

    BOOST_CHECK(report.functionality_result.success);
    BOOST_CHECK(report.functionality_result.tested_tools.at("echo"));
    BOOST_CHECK(report.functionality_result.tested_resources.at("memory://greeting"));
    BOOST_CHECK(report.functionality_result.tested_prompts.at("greet"));

    BOOST_CHECK_EQUAL(report.performance_metrics.at("total_capabilities"), 3.0);
    BOOST_CHECK(report.performance_metrics.count("startup_time_ms") == 1);
    BOOST_CHECK(report.recommendations.empty());
    BOOST_CHECK_GE(report.total_execution_time.count(), report.startup_result.startup_time.count());

    auto phases = fixture.progress.started_phases(report.project_path);
    BOOST_CHECK((phases == std::vector<std::string>{"startup", "protocol", "functionality"}));
    BOOST_CHECK_EQUAL(fixture.errors.error_count(report.project_path), 0u);
    BOOST_CHECK_EQUAL(fixture.registry.active_count(), 0u);
}

BOOST_AUTO_TEST_CASE(basic_level_skips_functionality, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("normal"));
    auto report = fixture.engine.validate(fixture.project.path(), validation_level::basic);

    BOOST_CHECK(report.overall_success);
    BOOST_CHECK(report.level == validation_level::basic);
    BOOST_CHECK(report.functionality_result.skipped);
    BOOST_CHECK_EQUAL(report.functionality_result.total_tested(), 0u);

    auto phases = fixture.progress.started_phases(report.project_path);
    BOOST_CHECK((phases == std::vector<std::string>{"startup", "protocol"}));
}

BOOST_AUTO_TEST_CASE(noisy_stdout_does_not_break_validation, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("garbage"));
    auto report = fixture.engine.validate(fixture.project.path());
    BOOST_CHECK(report.overall_success);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(startup_failure_tests)

BOOST_AUTO_TEST_CASE(crashing_server_fails_startup_and_skips_the_rest, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("crash"));
    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(!report.overall_success);
    BOOST_CHECK(!report.startup_result.success);
    BOOST_CHECK(any_contains(report.startup_result.errors, "exited with status 1"));
    BOOST_CHECK(report.protocol_result.skipped);
    BOOST_CHECK(report.functionality_result.skipped);
    BOOST_CHECK(contains(report.recommendations, "Fix server startup issues before deployment"));
    BOOST_CHECK(contains(report.recommendations, "Review server logs for startup errors"));

    BOOST_CHECK_EQUAL(fixture.errors.error_count(report.project_path), 1u);
    BOOST_CHECK_EQUAL(fixture.registry.active_count(), 0u);
}

BOOST_AUTO_TEST_CASE(silent_server_misses_the_readiness_window, * boost::unit_test::timeout(60)) {
    auto config = test_config("silent");
    config.startup_window = std::chrono::milliseconds{800};
    config.call_timeout = std::chrono::milliseconds{300};
    engine_fixture fixture(config);

    auto start = std::chrono::steady_clock::now();
    auto report = fixture.engine.validate(fixture.project.path());
    auto elapsed = std::chrono::steady_clock::now() - start;

    BOOST_CHECK(!report.startup_result.success);
    BOOST_CHECK(any_contains(report.startup_result.errors, "did not answer the readiness ping"));
    BOOST_CHECK(elapsed < std::chrono::seconds{10});
    BOOST_CHECK_EQUAL(fixture.registry.active_count(), 0u);
}

BOOST_AUTO_TEST_CASE(readiness_timeout_is_retried_up_to_the_attempt_limit, * boost::unit_test::timeout(60)) {
    auto config = test_config("silent");
    config.startup_window = std::chrono::milliseconds{500};
    config.call_timeout = std::chrono::milliseconds{200};
    config.max_phase_attempts = 2;
    engine_fixture fixture(config);

    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(!report.startup_result.success);
    // network/medium failures are retried; the second attempt is the last
    BOOST_CHECK_EQUAL(fixture.errors.error_count(report.project_path), 2u);
    BOOST_CHECK_EQUAL(fixture.progress.count(progress_event_type::warning), 1u);
    BOOST_CHECK_EQUAL(fixture.registry.active_count(), 0u);
}

BOOST_AUTO_TEST_CASE(error_output_on_stderr_fails_startup, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("stderr-error"));
    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(!report.startup_result.success);
    BOOST_CHECK(any_contains(report.startup_result.errors, "simulated configuration problem"));
    BOOST_CHECK(any_contains(report.startup_result.logs, "STDERR: Error:"));
}

BOOST_AUTO_TEST_CASE(project_without_entry_point_fails_before_spawning, * boost::unit_test::timeout(30)) {
    auto config = test_config("normal");
    config.entry_command.clear();
    engine_fixture fixture(config);
    fixture.project.write("README.md", "# not a server\n");

    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(!report.startup_result.success);
    BOOST_CHECK(!report.startup_result.pid.has_value());
    BOOST_CHECK(any_contains(report.startup_result.errors, "No entry point detected"));

    auto records = fixture.errors.errors_for(report.project_path);
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].report.category == error_category::configuration);
    BOOST_CHECK(records[0].decided_action == recovery_action::abort);
}

BOOST_AUTO_TEST_CASE(continue_on_failure_runs_later_phases, * boost::unit_test::timeout(60)) {
    auto config = test_config("crash");
    config.continue_on_failure = true;
    engine_fixture fixture(config);

    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(!report.protocol_result.skipped);
    BOOST_CHECK(!report.protocol_result.success);
    BOOST_CHECK(any_contains(report.protocol_result.errors, "not running"));
    BOOST_CHECK_EQUAL(report.protocol_result.missing_capabilities.size(), 4u);
    BOOST_CHECK(!report.functionality_result.skipped);
    BOOST_CHECK(!report.functionality_result.success);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(capability_failure_tests)

BOOST_AUTO_TEST_CASE(missing_tools_list_is_reported_and_recommended, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("no-tools-list"));
    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(report.startup_result.success);
    BOOST_CHECK(!report.protocol_result.success);
    BOOST_CHECK((report.protocol_result.missing_capabilities == std::set<std::string>{"tools/list"}));
    // Missing baseline methods are low severity, so functionality still runs
    BOOST_CHECK(!report.functionality_result.skipped);
    BOOST_CHECK(!report.overall_success);
    BOOST_CHECK(contains(report.recommendations, "Implement missing MCP capabilities: tools/list"));
}

BOOST_AUTO_TEST_CASE(server_with_nothing_to_offer_fails_functionality, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("empty"));
    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(report.startup_result.success);
    BOOST_CHECK(report.protocol_result.success);
    BOOST_CHECK(!report.functionality_result.success);
    BOOST_CHECK_EQUAL(report.performance_metrics.at("total_capabilities"), 0.0);
    BOOST_CHECK(contains(report.recommendations,
                         "Add at least one tool, resource, or prompt to make the server useful"));
}

BOOST_AUTO_TEST_CASE(failing_tool_fails_functionality_only, * boost::unit_test::timeout(60)) {
    engine_fixture fixture(test_config("failing-tools"));
    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(report.protocol_result.success);
    BOOST_CHECK(!report.functionality_result.success);
    BOOST_CHECK(!report.functionality_result.tested_tools.at("echo"));
    BOOST_CHECK(report.functionality_result.tested_resources.at("memory://greeting"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(recovery_action_tests)

BOOST_AUTO_TEST_CASE(skip_runs_the_next_phase_and_keeps_the_failure, * boost::unit_test::timeout(60)) {
    scripted_fixture fixture(test_config("no-tools-list"), {recovery_action::skip});
    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(!report.protocol_result.success);
    BOOST_CHECK((report.protocol_result.missing_capabilities == std::set<std::string>{"tools/list"}));
    BOOST_CHECK(!report.functionality_result.skipped);
    BOOST_CHECK(!report.overall_success);

    auto phases = fixture.progress.started_phases(report.project_path);
    BOOST_CHECK((phases == std::vector<std::string>{"startup", "protocol", "functionality"}));
    auto reported = fixture.errors.phases();
    BOOST_REQUIRE(!reported.empty());
    BOOST_CHECK_EQUAL(reported.front(), "protocol");

    BOOST_CHECK(fixture.bystander->is_alive());
    BOOST_CHECK_EQUAL(fixture.registry.active_count(), 1u);
}

BOOST_AUTO_TEST_CASE(abort_and_manual_stop_after_the_failed_phase, * boost::unit_test::timeout(120)) {
    for (auto action : {recovery_action::abort, recovery_action::manual}) {
        scripted_fixture fixture(test_config("no-tools-list"), {action});
        auto report = fixture.engine.validate(fixture.project.path());

        BOOST_CHECK(!report.protocol_result.success);
        BOOST_CHECK(report.functionality_result.skipped);
        BOOST_CHECK(any_contains(report.functionality_result.errors, "an earlier phase failed"));

        auto phases = fixture.progress.started_phases(report.project_path);
        BOOST_CHECK((phases == std::vector<std::string>{"startup", "protocol"}));
        BOOST_CHECK((fixture.errors.phases() == std::vector<std::string>{"protocol"}));

        // Stopping is not a sweep
        BOOST_CHECK(fixture.bystander->is_alive());
        BOOST_CHECK_EQUAL(fixture.registry.active_count(), 1u);
    }
}

BOOST_AUTO_TEST_CASE(rollback_sweeps_the_registry_before_returning, * boost::unit_test::timeout(60)) {
    scripted_fixture fixture(test_config("no-tools-list"), {recovery_action::rollback});
    BOOST_REQUIRE_EQUAL(fixture.registry.active_count(), 1u);

    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK(report.functionality_result.skipped);
    BOOST_CHECK((fixture.errors.phases() == std::vector<std::string>{"protocol"}));
    // validate() stops only its own server; the bystander fell to the sweep
    BOOST_CHECK(!fixture.bystander->is_alive());
    BOOST_CHECK_EQUAL(fixture.registry.active_count(), 0u);
}

BOOST_AUTO_TEST_CASE(retry_reruns_the_phase_before_the_next_action, * boost::unit_test::timeout(60)) {
    auto config = test_config("no-tools-list");
    config.max_phase_attempts = 3;
    scripted_fixture fixture(config, {recovery_action::retry, recovery_action::skip});

    auto report = fixture.engine.validate(fixture.project.path());

    auto reports = fixture.errors.reports();
    BOOST_REQUIRE_GE(reports.size(), 2u);
    BOOST_CHECK_EQUAL(reports[0].phase, "protocol");
    BOOST_CHECK_EQUAL(reports[0].attempt, 1u);
    BOOST_CHECK_EQUAL(reports[1].phase, "protocol");
    BOOST_CHECK_EQUAL(reports[1].attempt, 2u);
    BOOST_CHECK_EQUAL(fixture.progress.count(progress_event_type::warning), 1u);
    BOOST_CHECK(!report.functionality_result.skipped);
}

BOOST_AUTO_TEST_CASE(retry_stops_at_the_attempt_limit, * boost::unit_test::timeout(60)) {
    auto config = test_config("no-tools-list");
    config.max_phase_attempts = 2;
    scripted_fixture fixture(config, {recovery_action::retry});

    auto report = fixture.engine.validate(fixture.project.path());

    BOOST_CHECK((fixture.errors.phases() == std::vector<std::string>{"protocol", "protocol"}));
    BOOST_CHECK(report.functionality_result.skipped);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(construction_tests)

BOOST_AUTO_TEST_CASE(invalid_configuration_is_rejected_up_front, * boost::unit_test::timeout(30)) {
    process_registry registry;
    noop_logger logger;
    recording_progress_reporter progress;
    auto table = recovery_table::defaults();
    recovery_error_handler errors(table);

    auto unterminated = test_config("normal");
    unterminated.entry_command = "\"server --stdio";
    BOOST_CHECK_THROW((validation_engine<test_engine_types>(unterminated, registry, logger, progress, errors)),
                      configuration_error);

    auto zero_timeout = test_config("normal");
    zero_timeout.call_timeout = std::chrono::milliseconds{0};
    BOOST_CHECK_THROW((validation_engine<test_engine_types>(zero_timeout, registry, logger, progress, errors)),
                      configuration_error);
}

BOOST_AUTO_TEST_CASE(recommendations_are_deterministic, * boost::unit_test::timeout(30)) {
    validation_report report;
    report.startup_result.success = true;
    report.startup_result.startup_time = duration_ms{7200.0};
    report.protocol_result.missing_capabilities = {"prompts/list", "resources/list"};
    report.functionality_result.tested_tools["echo"] = true;

    auto first = generate_recommendations(report, std::chrono::seconds{5});
    auto second = generate_recommendations(report, std::chrono::seconds{5});
    BOOST_CHECK(first == second);
    BOOST_REQUIRE_EQUAL(first.size(), 2u);
    BOOST_CHECK_EQUAL(first[0], "Implement missing MCP capabilities: prompts/list, resources/list");
    BOOST_CHECK_EQUAL(first[1], "Consider optimizing server startup time (took 7200 ms)");
}

BOOST_AUTO_TEST_CASE(error_output_keywords, * boost::unit_test::timeout(30)) {
    BOOST_CHECK(is_error_output("Traceback (most recent call last):"));
    BOOST_CHECK(is_error_output("FATAL: cannot bind"));
    BOOST_CHECK(is_error_output("Unhandled Exception in handler"));
    BOOST_CHECK(!is_error_output("Server listening on stdio"));
}

BOOST_AUTO_TEST_SUITE_END()
