#define BOOST_TEST_MODULE BenchmarkTest
#include <boost/test/unit_test.hpp>

#include <kestrel/benchmark.hpp>
#include <kestrel/config.hpp>

#include "test_utils/mock_channel.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

using namespace kestrel;
using kestrel::test::mock_channel;

namespace {
    constexpr std::chrono::milliseconds test_timeout{1000};
    constexpr std::size_t benchmark_requests = 50;
    constexpr double tolerance = 1e-9;

    // Every @p nth call is rejected, the rest succeed
    auto fail_every(std::size_t nth) -> mock_channel::handler_type {
        auto counter = std::make_shared<std::atomic<std::size_t>>(0);
        return [counter, nth](const rpc_request& request) {
            if (++*counter % nth == 0) {
                rpc_response response;
                response.id = request.id;
                response.error = rpc_error{-32603, "Internal error"};
                return exchange_result(std::move(response));
            }
            return exchange_result(test::healthy_response(request));
        };
    }
}

BOOST_AUTO_TEST_SUITE(measure_operation_tests)

BOOST_AUTO_TEST_CASE(healthy_server_has_no_errors, * boost::unit_test::timeout(30)) {
    mock_channel channel(test::always_succeed(std::chrono::milliseconds{1}));
    benchmark_request request{std::string(methods::tools_list), {}};

    auto benchmark = measure_operation(channel, "list_tools", request, benchmark_requests, test_timeout);

    BOOST_CHECK_EQUAL(benchmark.operation_name, "list_tools");
    BOOST_CHECK_EQUAL(benchmark.total_requests, benchmark_requests);
    BOOST_CHECK_EQUAL(benchmark.successful_requests, benchmark_requests);
    BOOST_CHECK_EQUAL(benchmark.failed_requests, 0u);
    BOOST_CHECK_EQUAL(benchmark.error_rate, 0.0);
    BOOST_CHECK_EQUAL(channel.call_count(), benchmark_requests);

    BOOST_CHECK_GT(benchmark.min_response_time.count(), 0.0);
    BOOST_CHECK_LE(benchmark.min_response_time.count(), benchmark.average_response_time.count());
    BOOST_CHECK_LE(benchmark.average_response_time.count(), benchmark.percentile_95_response_time.count());
    BOOST_CHECK_LE(benchmark.percentile_95_response_time.count(), benchmark.max_response_time.count());
    BOOST_CHECK_GT(benchmark.requests_per_second, 0.0);
    BOOST_CHECK(!benchmark.memory_usage_mb.has_value());
}

BOOST_AUTO_TEST_CASE(failures_are_counted_and_run_continues, * boost::unit_test::timeout(30)) {
    mock_channel channel(fail_every(10));
    benchmark_request request{std::string(methods::prompts_list), {}};

    auto benchmark = measure_operation(channel, "list_prompts", request, benchmark_requests, test_timeout);

    BOOST_CHECK_EQUAL(benchmark.successful_requests, 45u);
    BOOST_CHECK_EQUAL(benchmark.failed_requests, 5u);
    BOOST_CHECK_EQUAL(benchmark.successful_requests + benchmark.failed_requests, benchmark.total_requests);
    BOOST_CHECK_CLOSE(benchmark.error_rate, 0.1, tolerance);
}

BOOST_AUTO_TEST_CASE(throwing_channel_fails_every_request, * boost::unit_test::timeout(30)) {
    mock_channel channel(test::always_throw());
    benchmark_request request{std::string(methods::tools_list), {}};

    auto benchmark = measure_operation(channel, "list_tools", request, 20, test_timeout);

    BOOST_CHECK_EQUAL(benchmark.failed_requests, 20u);
    BOOST_CHECK_EQUAL(benchmark.error_rate, 1.0);
    BOOST_CHECK_EQUAL(benchmark.average_response_time.count(), 0.0);
    BOOST_CHECK_EQUAL(benchmark.requests_per_second, 0.0);
}

BOOST_AUTO_TEST_CASE(wrong_response_shape_counts_as_failure, * boost::unit_test::timeout(30)) {
    mock_channel channel([](const rpc_request& request) {
        rpc_response response;
        response.id = request.id;
        response.result = boost::json::object{};
        return exchange_result(std::move(response));
    });
    benchmark_request request{std::string(methods::resources_list), {}};

    auto benchmark = measure_operation(channel, "list_resources", request, 10, test_timeout);
    BOOST_CHECK_EQUAL(benchmark.failed_requests, 10u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(request_resolution_tests)

BOOST_AUTO_TEST_CASE(item_operations_target_first_listed_item, * boost::unit_test::timeout(30)) {
    mock_channel channel(test::always_succeed());
    engine_config config;

    auto call = resolve_benchmark_request(channel, benchmark_operation::call_tool, config);
    BOOST_REQUIRE(call.has_value());
    BOOST_CHECK_EQUAL(call->method, "tools/call");
    BOOST_CHECK_EQUAL(std::string(call->params["name"].as_string()), "echo");

    auto read = resolve_benchmark_request(channel, benchmark_operation::read_resource, config);
    BOOST_REQUIRE(read.has_value());
    BOOST_CHECK_EQUAL(std::string(read->params["uri"].as_string()), "memory://greeting");

    auto init = resolve_benchmark_request(channel, benchmark_operation::initialize, config);
    BOOST_REQUIRE(init.has_value());
    BOOST_CHECK_EQUAL(std::string(init->params["protocolVersion"].as_string()), config.protocol_version);
}

BOOST_AUTO_TEST_CASE(empty_listing_omits_the_operation, * boost::unit_test::timeout(30)) {
    mock_channel channel([](const rpc_request& request) {
        rpc_response response;
        response.id = request.id;
        boost::json::object result;
        result["tools"] = boost::json::array{};
        response.result = std::move(result);
        return exchange_result(std::move(response));
    });

    BOOST_CHECK(!resolve_benchmark_request(channel, benchmark_operation::call_tool, engine_config{}).has_value());
    BOOST_CHECK(resolve_benchmark_request(channel, benchmark_operation::list_tools, engine_config{}).has_value());
}

BOOST_AUTO_TEST_CASE(resource_usage_needs_both_samples_for_cpu, * boost::unit_test::timeout(30)) {
    performance_benchmark benchmark;
    resource_sample after;
    after.memory_mb = 42.5;
    after.taken_at = std::chrono::steady_clock::now();

    attach_resource_usage(benchmark, std::nullopt, after);
    BOOST_REQUIRE(benchmark.memory_usage_mb.has_value());
    BOOST_CHECK_CLOSE(*benchmark.memory_usage_mb, 42.5, tolerance);
    BOOST_CHECK(!benchmark.cpu_usage_percent.has_value());

    performance_benchmark untouched;
    attach_resource_usage(untouched, std::nullopt, std::nullopt);
    BOOST_CHECK(!untouched.memory_usage_mb.has_value());
}

BOOST_AUTO_TEST_SUITE_END()
