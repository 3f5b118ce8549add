#define BOOST_TEST_MODULE ProcessSupervisorTest
#include <boost/test/unit_test.hpp>

#include <kestrel/entry_point.hpp>
#include <kestrel/exceptions.hpp>
#include <kestrel/json_rpc.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/process.hpp>

#include "test_utils/temp_project.hpp"

#include <cerrno>
#include <chrono>
#include <string>
#include <thread>

#include <signal.h>

using namespace kestrel;

namespace {
    constexpr std::chrono::milliseconds short_grace{500};
    constexpr std::chrono::milliseconds exit_wait{3000};

    auto fake_server(const std::string& mode) -> entry_command {
        return entry_command{{KESTREL_FAKE_SERVER_PATH, mode}};
    }

    auto wait_for_exit(process_handle& handle) -> bool {
        auto deadline = std::chrono::steady_clock::now() + exit_wait;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!handle.is_alive()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
        }
        return false;
    }

    auto process_exists(pid_t pid) -> bool {
        return ::kill(pid, 0) == 0 || errno != ESRCH;
    }
}

BOOST_AUTO_TEST_SUITE(command_parsing_tests)

BOOST_AUTO_TEST_CASE(whitespace_separates_and_quotes_group, * boost::unit_test::timeout(30)) {
    auto command = parse_command(R"(  node "dist/my server.js"   --port 0 )");
    BOOST_REQUIRE_EQUAL(command.argv.size(), 4u);
    BOOST_CHECK_EQUAL(command.executable(), "node");
    BOOST_CHECK_EQUAL(command.argv[1], "dist/my server.js");
    BOOST_CHECK_EQUAL(command.argv[3], "0");
    BOOST_CHECK_EQUAL(command.to_string(), R"(node "dist/my server.js" --port 0)");
}

BOOST_AUTO_TEST_CASE(no_shell_expansion_happens, * boost::unit_test::timeout(30)) {
    auto command = parse_command("python3 $HOME/*.py");
    BOOST_REQUIRE_EQUAL(command.argv.size(), 2u);
    BOOST_CHECK_EQUAL(command.argv[1], "$HOME/*.py");
}

BOOST_AUTO_TEST_CASE(empty_and_unterminated_commands_throw, * boost::unit_test::timeout(30)) {
    BOOST_CHECK_THROW(parse_command(""), configuration_error);
    BOOST_CHECK_THROW(parse_command("   \t "), configuration_error);
    BOOST_CHECK_THROW(parse_command(R"(node "server.js)"), configuration_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(entry_detection_tests)

BOOST_AUTO_TEST_CASE(python_module_is_preferred, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    project.write("server.py", "print('hi')\n");
    project.write("package.json", R"({"scripts": {"start": "node index.js"}})");

    auto command = detect_entry_command(project.path());
    BOOST_REQUIRE(command.has_value());
    BOOST_CHECK((command->argv == std::vector<std::string>{"python3", "server.py"}));
}

BOOST_AUTO_TEST_CASE(package_manifest_start_script_then_main, * boost::unit_test::timeout(30)) {
    test::temp_project with_script;
    with_script.write("package.json", R"({"scripts": {"start": "node build/index.js"}, "main": "x.js"})");
    auto command = detect_entry_command(with_script.path());
    BOOST_REQUIRE(command.has_value());
    BOOST_CHECK((command->argv == std::vector<std::string>{"npm", "start"}));

    test::temp_project with_main;
    with_main.write("package.json", R"({"main": "build/index.js"})");
    command = detect_entry_command(with_main.path());
    BOOST_REQUIRE(command.has_value());
    BOOST_CHECK((command->argv == std::vector<std::string>{"node", "build/index.js"}));
}

BOOST_AUTO_TEST_CASE(pyproject_falls_back_to_poetry, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    project.write("pyproject.toml", "[tool.poetry]\nname = \"srv\"\n");
    auto command = detect_entry_command(project.path());
    BOOST_REQUIRE(command.has_value());
    BOOST_CHECK_EQUAL(command->executable(), "poetry");
}

BOOST_AUTO_TEST_CASE(unrecognised_project_has_no_entry, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    project.write("README.md", "# nothing to run\n");
    project.write("package.json", "{ not json");
    BOOST_CHECK(!detect_entry_command(project.path()).has_value());
}

BOOST_AUTO_TEST_CASE(override_always_wins, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    project.write("main.py", "");
    auto command = detect_entry_command(project.path(), "uv run server --stdio");
    BOOST_REQUIRE(command.has_value());
    BOOST_CHECK_EQUAL(command->executable(), "uv");
    BOOST_CHECK_EQUAL(command->argv.size(), 4u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(supervisor_tests)

BOOST_AUTO_TEST_CASE(started_server_answers_on_its_pipes, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    process_registry registry;
    noop_logger logger;
    process_supervisor<noop_logger> supervisor(registry, logger);

    auto started = supervisor.start(project.path(), fake_server("normal"));
    BOOST_REQUIRE(started.hasValue());
    auto& handle = *started.value();
    BOOST_CHECK_GT(handle.pid(), 0);
    BOOST_CHECK(handle.is_alive());
    BOOST_CHECK_EQUAL(registry.active_count(), 1u);

    {
        std::lock_guard<std::timed_mutex> lock(handle.io_mutex());
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        auto id = handle.next_request_id();
        handle.write_line(encode_request(rpc_request{.id = id, .method = "ping", .params = {}}), deadline);
        auto [status, line] = handle.read_line(deadline);
        BOOST_REQUIRE(status == read_status::line);
        auto response = decode_response(line);
        BOOST_REQUIRE(response.has_value());
        BOOST_CHECK_EQUAL(response->id, id);
    }

    supervisor.stop(handle, short_grace);
    BOOST_CHECK(!handle.is_alive());
    BOOST_CHECK(handle.exit_status().has_value());
    BOOST_CHECK_EQUAL(registry.active_count(), 0u);

    // Stopping twice is harmless
    BOOST_CHECK_NO_THROW(supervisor.stop(handle, short_grace));
}

BOOST_AUTO_TEST_CASE(crashing_server_reports_status_and_stderr, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    process_registry registry;
    noop_logger logger;
    process_supervisor<noop_logger> supervisor(registry, logger);

    auto started = supervisor.start(project.path(), fake_server("crash"));
    BOOST_REQUIRE(started.hasValue());
    auto& handle = *started.value();

    BOOST_REQUIRE(wait_for_exit(handle));
    BOOST_CHECK_EQUAL(handle.exit_status().value_or(-1), 1);

    handle.pump_stderr(std::chrono::milliseconds{500});
    auto lines = handle.stderr_lines();
    BOOST_REQUIRE(!lines.empty());
    BOOST_CHECK(lines.front().find("Fatal error") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(missing_executable_is_a_start_error, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    process_registry registry;
    noop_logger logger;
    process_supervisor<noop_logger> supervisor(registry, logger);

    auto started = supervisor.start(project.path(), entry_command{{"/nonexistent/kestrel-missing-server"}});
    BOOST_REQUIRE(started.hasException());
    BOOST_CHECK(started.tryGetExceptionObject<process_start_error>() != nullptr);
    BOOST_CHECK_EQUAL(registry.active_count(), 0u);

    auto unresolved = supervisor.start(project.path(), entry_command{{"kestrel-no-such-command-on-path"}});
    BOOST_CHECK(unresolved.hasException());
}

BOOST_AUTO_TEST_CASE(missing_working_directory_is_a_start_error, * boost::unit_test::timeout(30)) {
    process_registry registry;
    noop_logger logger;
    process_supervisor<noop_logger> supervisor(registry, logger);

    auto started = supervisor.start("/nonexistent/kestrel-project", fake_server("normal"));
    BOOST_REQUIRE(started.hasException());
    BOOST_CHECK(std::string(started.exception().what().toStdString()).find("Working directory")
                != std::string::npos);

    test::temp_project project;
    BOOST_CHECK(supervisor.start(project.path(), entry_command{}).hasException());
}

BOOST_AUTO_TEST_CASE(non_executable_file_is_a_start_error, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    project.write("server.sh", "#!/bin/sh\nexit 0\n");
    project.permissions("server.sh", std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    process_registry registry;
    noop_logger logger;
    process_supervisor<noop_logger> supervisor(registry, logger);

    auto started = supervisor.start(project.path(), entry_command{{"./server.sh"}});
    BOOST_CHECK(started.hasException());
}

BOOST_AUTO_TEST_CASE(destroying_handle_terminates_process, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    process_registry registry;
    noop_logger logger;
    process_supervisor<noop_logger> supervisor(registry, logger);

    pid_t pid = 0;
    {
        auto started = supervisor.start(project.path(), fake_server("silent"));
        BOOST_REQUIRE(started.hasValue());
        pid = started.value()->pid();
        BOOST_CHECK(process_exists(pid));
    }
    BOOST_CHECK(!process_exists(pid));
    BOOST_CHECK_EQUAL(registry.active_count(), 0u);
}

BOOST_AUTO_TEST_CASE(terminate_all_sweeps_every_registered_process, * boost::unit_test::timeout(30)) {
    test::temp_project project;
    process_registry registry;
    noop_logger logger;
    process_supervisor<noop_logger> supervisor(registry, logger);

    auto first = supervisor.start(project.path(), fake_server("silent"));
    auto second = supervisor.start(project.path(), fake_server("normal"));
    BOOST_REQUIRE(first.hasValue());
    BOOST_REQUIRE(second.hasValue());
    BOOST_CHECK_EQUAL(registry.active_pids().size(), 2u);

    BOOST_CHECK_EQUAL(supervisor.terminate_all(short_grace), 2u);
    BOOST_CHECK_EQUAL(registry.active_count(), 0u);
    BOOST_CHECK(!first.value()->is_alive());
    BOOST_CHECK(!second.value()->is_alive());

    BOOST_CHECK_EQUAL(supervisor.terminate_all(short_grace), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
