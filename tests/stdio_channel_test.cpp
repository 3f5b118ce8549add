#define BOOST_TEST_MODULE StdioChannelTest
#include <boost/test/unit_test.hpp>

#include <kestrel/exceptions.hpp>
#include <kestrel/json_rpc.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/process.hpp>
#include <kestrel/protocol_exchange.hpp>

#include "test_utils/temp_project.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace kestrel;

namespace {
    constexpr std::chrono::milliseconds generous_timeout{5000};
    constexpr std::size_t concurrent_callers = 8;
    constexpr std::size_t calls_per_caller = 10;

    // One fake server plus a channel over it
    struct server_fixture {
        explicit server_fixture(const std::string& mode)
            : supervisor(registry, logger) {
            auto started = supervisor.start(project.path(), entry_command{{KESTREL_FAKE_SERVER_PATH, mode}});
            process = std::move(started.value());
            channel = std::make_unique<stdio_channel<noop_logger>>(*process, logger);
        }

        test::temp_project project;
        process_registry registry;
        noop_logger logger;
        process_supervisor<noop_logger> supervisor;
        process_ptr process;
        std::unique_ptr<stdio_channel<noop_logger>> channel;
    };
}

BOOST_AUTO_TEST_SUITE(stdio_channel_tests)

BOOST_AUTO_TEST_CASE(round_trip_returns_matching_response, * boost::unit_test::timeout(30)) {
    server_fixture server("normal");
    auto result = call_method(*server.channel, methods::tools_list, {}, generous_timeout);
    BOOST_REQUIRE(succeeded(result));
    BOOST_CHECK(result.value().result.as_object()["tools"].is_array());
}

BOOST_AUTO_TEST_CASE(json_rpc_error_is_a_value_not_an_exception, * boost::unit_test::timeout(30)) {
    server_fixture server("no-tools-list");
    auto result = call_method(*server.channel, methods::tools_list, {}, generous_timeout);
    BOOST_REQUIRE(result.hasValue());
    BOOST_REQUIRE(result.value().is_error());
    BOOST_CHECK_EQUAL(result.value().error->code, -32601);
    BOOST_CHECK(describe_failure(result).find("-32601") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(silent_server_times_out, * boost::unit_test::timeout(30)) {
    server_fixture server("silent");
    auto start = std::chrono::steady_clock::now();
    auto result = call_method(*server.channel, methods::ping, {}, std::chrono::milliseconds{300});
    auto elapsed = std::chrono::steady_clock::now() - start;

    BOOST_REQUIRE(result.hasException());
    BOOST_CHECK(result.tryGetExceptionObject<process_timeout_error>() != nullptr);
    BOOST_CHECK(elapsed >= std::chrono::milliseconds{250});
    BOOST_CHECK(elapsed < std::chrono::seconds{3});
}

BOOST_AUTO_TEST_CASE(channel_survives_a_timed_out_call, * boost::unit_test::timeout(30)) {
    // The slow server answers every request after 200 ms, so the first answer
    // arrives after its caller gave up and must not be handed to the second
    server_fixture server("slow");
    auto first = call_method(*server.channel, methods::ping, {}, std::chrono::milliseconds{50});
    BOOST_CHECK(first.tryGetExceptionObject<process_timeout_error>() != nullptr);

    rpc_request second{.id = server.channel->next_id(), .method = std::string(methods::tools_list), .params = {}};
    auto result = server.channel->call(second, generous_timeout);
    BOOST_REQUIRE(succeeded(result));
    BOOST_CHECK_EQUAL(result.value().id, second.id);
    BOOST_CHECK(result.value().result.as_object().contains("tools"));
}

BOOST_AUTO_TEST_CASE(malformed_late_reply_does_not_fail_the_next_call, * boost::unit_test::timeout(30)) {
    // The ping reply arrives after its caller gave up and lacks a result;
    // it belongs to the abandoned request, so the tools/list call succeeds
    server_fixture server("malformed-ping");
    auto first = call_method(*server.channel, methods::ping, {}, std::chrono::milliseconds{50});
    BOOST_CHECK(first.tryGetExceptionObject<process_timeout_error>() != nullptr);

    auto result = call_method(*server.channel, methods::tools_list, {}, generous_timeout);
    BOOST_REQUIRE(succeeded(result));
    BOOST_CHECK(result.value().result.as_object().contains("tools"));
}

BOOST_AUTO_TEST_CASE(malformed_own_reply_is_a_protocol_error, * boost::unit_test::timeout(30)) {
    server_fixture server("malformed-ping");
    auto result = call_method(*server.channel, methods::ping, {}, generous_timeout);
    BOOST_REQUIRE(result.hasException());
    BOOST_CHECK(result.tryGetExceptionObject<protocol_error>() != nullptr);
}

BOOST_AUTO_TEST_CASE(non_json_output_is_skipped, * boost::unit_test::timeout(30)) {
    server_fixture server("garbage");
    for (int i = 0; i < 3; ++i) {
        auto result = call_method(*server.channel, methods::prompts_list, {}, generous_timeout);
        BOOST_CHECK(succeeded(result));
    }
}

BOOST_AUTO_TEST_CASE(exited_server_is_an_io_error, * boost::unit_test::timeout(30)) {
    server_fixture server("exit-zero");
    auto deadline = std::chrono::steady_clock::now() + generous_timeout;
    while (server.process->is_alive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }

    auto result = call_method(*server.channel, methods::ping, {}, generous_timeout);
    BOOST_REQUIRE(result.hasException());
    BOOST_CHECK(result.tryGetExceptionObject<process_io_error>() != nullptr);
}

BOOST_AUTO_TEST_CASE(concurrent_callers_each_get_their_own_response, * boost::unit_test::timeout(60)) {
    server_fixture server("normal");
    std::atomic<std::size_t> matched{0};
    std::atomic<std::size_t> failed{0};

    std::vector<std::thread> callers;
    for (std::size_t c = 0; c < concurrent_callers; ++c) {
        callers.emplace_back([&server, &matched, &failed, c]() {
            for (std::size_t i = 0; i < calls_per_caller; ++i) {
                const auto method = (c + i) % 2 == 0 ? methods::resources_list : methods::prompts_list;
                rpc_request request{.id = server.channel->next_id(), .method = std::string(method), .params = {}};
                auto result = server.channel->call(request, generous_timeout);
                if (succeeded(result) && result.value().id == request.id
                    && result.value().result.as_object().contains(
                        method == methods::resources_list ? "resources" : "prompts")) {
                    ++matched;
                } else {
                    ++failed;
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    BOOST_CHECK_EQUAL(matched.load(), concurrent_callers * calls_per_caller);
    BOOST_CHECK_EQUAL(failed.load(), 0u);
}

BOOST_AUTO_TEST_CASE(notification_expects_no_answer, * boost::unit_test::timeout(30)) {
    server_fixture server("normal");
    auto sent = server.channel->notify(rpc_notification{std::string(methods::initialized), {}});
    BOOST_CHECK(sent.hasValue());

    // The next call still receives its own answer
    auto result = call_method(*server.channel, methods::ping, {}, generous_timeout);
    BOOST_CHECK(succeeded(result));
}

BOOST_AUTO_TEST_SUITE_END()
