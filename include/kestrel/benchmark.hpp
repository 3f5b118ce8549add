#pragma once

#include <kestrel/capability_survey.hpp>
#include <kestrel/config.hpp>
#include <kestrel/latency_statistics.hpp>
#include <kestrel/protocol_exchange.hpp>
#include <kestrel/resource_sampler.hpp>
#include <kestrel/types.hpp>

#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel {

// The request one benchmark repeats
struct benchmark_request {
    std::string method;
    boost::json::object params;
};

/**
 * @brief Issue @p count sequential round trips and summarise them
 *
 * Latency statistics cover the successful requests. A request that times out,
 * fails on the pipe, returns a JSON-RPC error or throws counts as failed and
 * the run continues. Resource fields are left empty; the caller samples the
 * process around the run.
 */
template<rpc_channel Channel>
auto measure_operation(Channel& channel,
                       std::string_view operation_name,
                       const benchmark_request& request,
                       std::size_t count,
                       std::chrono::milliseconds timeout) -> performance_benchmark {
    performance_benchmark benchmark;
    benchmark.operation_name = std::string(operation_name);
    benchmark.total_requests = count;

    std::vector<duration_ms> latencies;
    latencies.reserve(count);

    auto run_start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < count; ++i) {
        auto start = std::chrono::steady_clock::now();
        bool ok = false;
        try {
            ok = !check_response(request.method, call_method(channel, request.method, request.params, timeout));
        } catch (const std::exception&) {
            ok = false;
        }
        if (ok) {
            latencies.push_back(std::chrono::steady_clock::now() - start);
            ++benchmark.successful_requests;
        } else {
            ++benchmark.failed_requests;
        }
    }
    duration_ms elapsed = std::chrono::steady_clock::now() - run_start;

    auto summary = summarize_latencies(latencies);
    benchmark.min_response_time = summary.min;
    benchmark.average_response_time = summary.average;
    benchmark.max_response_time = summary.max;
    benchmark.percentile_95_response_time = summary.percentile_95;
    benchmark.nearest_rank_95_response_time = summary.nearest_rank_95;
    benchmark.requests_per_second = throughput(benchmark.successful_requests, elapsed);
    benchmark.error_rate = error_rate(benchmark.failed_requests, benchmark.total_requests);
    return benchmark;
}

/**
 * @brief Request used to benchmark @p operation against a server that has
 *        completed the handshake
 *
 * The item operations target the first item the server lists; std::nullopt
 * means the server lists none and the operation is omitted.
 */
template<rpc_channel Channel>
auto resolve_benchmark_request(Channel& channel,
                               benchmark_operation operation,
                               const engine_config& config) -> std::optional<benchmark_request> {
    auto from_invocation = [](const std::optional<invocation>& call) -> std::optional<benchmark_request> {
        if (!call) {
            return std::nullopt;
        }
        return benchmark_request{call->method, call->params};
    };

    switch (operation) {
        case benchmark_operation::initialize:
            return benchmark_request{
                std::string(methods::initialize),
                make_initialize_params(config.protocol_version, config.client_name, config.client_version)
            };
        case benchmark_operation::list_tools:
            return benchmark_request{std::string(methods::tools_list), {}};
        case benchmark_operation::list_resources:
            return benchmark_request{std::string(methods::resources_list), {}};
        case benchmark_operation::list_prompts:
            return benchmark_request{std::string(methods::prompts_list), {}};
        case benchmark_operation::call_tool:
            return from_invocation(first_item_invocation(channel, capability_kind::tool, config.call_timeout));
        case benchmark_operation::read_resource:
            return from_invocation(first_item_invocation(channel, capability_kind::resource, config.call_timeout));
        case benchmark_operation::get_prompt:
            return from_invocation(first_item_invocation(channel, capability_kind::prompt, config.call_timeout));
    }
    return std::nullopt;
}

// Attach before/after resource samples to a finished benchmark
inline auto attach_resource_usage(performance_benchmark& benchmark,
                                  const std::optional<resource_sample>& before,
                                  const std::optional<resource_sample>& after) -> void {
    if (after) {
        benchmark.memory_usage_mb = after->memory_mb;
    }
    if (before && after) {
        benchmark.cpu_usage_percent = cpu_percent_between(*before, *after);
    }
}

} // namespace kestrel
