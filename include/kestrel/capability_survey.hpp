#pragma once

#include <kestrel/config.hpp>
#include <kestrel/json_rpc.hpp>
#include <kestrel/latency_statistics.hpp>
#include <kestrel/protocol_exchange.hpp>
#include <kestrel/types.hpp>

#include <boost/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kestrel {

//=============================================================================
// Method tables
//=============================================================================

inline auto list_method(capability_kind kind) -> std::string_view {
    switch (kind) {
        case capability_kind::tool: return methods::tools_list;
        case capability_kind::resource: return methods::resources_list;
        case capability_kind::prompt: return methods::prompts_list;
    }
    return {};
}

inline auto invoke_method(capability_kind kind) -> std::string_view {
    switch (kind) {
        case capability_kind::tool: return methods::tools_call;
        case capability_kind::resource: return methods::resources_read;
        case capability_kind::prompt: return methods::prompts_get;
    }
    return {};
}

// Member every successful result of @p method must carry as an array;
// empty for methods without a declared shape
inline auto expected_array_member(std::string_view method) -> std::string_view {
    if (method == methods::tools_list) return "tools";
    if (method == methods::resources_list) return "resources";
    if (method == methods::prompts_list) return "prompts";
    if (method == methods::tools_call) return "content";
    if (method == methods::resources_read) return "contents";
    if (method == methods::prompts_get) return "messages";
    return {};
}

/**
 * @brief Check a round trip against the declared response shape of its method
 *
 * Returns an error description, or std::nullopt when the response is a
 * success of the right shape.
 */
inline auto check_response(std::string_view method, const exchange_result& result) -> std::optional<std::string> {
    if (!succeeded(result)) {
        return describe_failure(result);
    }
    auto member = expected_array_member(method);
    if (member.empty()) {
        return std::nullopt;
    }
    const auto& payload = result.value().result;
    if (!payload.is_object()) {
        return "Result of " + std::string(method) + " is not an object";
    }
    const auto* field = payload.as_object().if_contains(member);
    if (field == nullptr || !field->is_array()) {
        return "Result of " + std::string(method) + " lacks a '" + std::string(member) + "' array";
    }
    return std::nullopt;
}

//=============================================================================
// Handshake
//=============================================================================

struct handshake_outcome {
    bool success{false};
    std::optional<std::string> protocol_version;
    // Keys of the capabilities object in the initialize result
    std::vector<std::string> advertised;
    std::string error;
    duration_ms elapsed{0};
};

inline auto advertises(const std::vector<std::string>& advertised, capability_kind kind) -> bool {
    return std::find(advertised.begin(), advertised.end(), to_string(kind)) != advertised.end();
}

/**
 * @brief initialize followed by notifications/initialized
 */
template<rpc_channel Channel>
auto perform_handshake(Channel& channel,
                       std::string_view protocol_version,
                       std::string_view client_name,
                       std::string_view client_version,
                       std::chrono::milliseconds timeout) -> handshake_outcome {
    handshake_outcome outcome;
    auto start = std::chrono::steady_clock::now();

    auto result = call_method(channel, methods::initialize,
                              make_initialize_params(protocol_version, client_name, client_version),
                              timeout);
    outcome.elapsed = std::chrono::steady_clock::now() - start;

    if (!succeeded(result)) {
        outcome.error = "Initialization failed: " + describe_failure(result);
        return outcome;
    }

    const auto& payload = result.value().result;
    if (!payload.is_object()) {
        outcome.error = "Initialization result is not an object";
        return outcome;
    }

    const auto& obj = payload.as_object();
    if (const auto* version = obj.if_contains("protocolVersion"); version != nullptr && version->is_string()) {
        outcome.protocol_version = std::string(version->as_string());
    }
    if (const auto* caps = obj.if_contains("capabilities"); caps != nullptr && caps->is_object()) {
        for (const auto& entry : caps->as_object()) {
            outcome.advertised.emplace_back(std::string(entry.key()));
        }
    }

    auto notified = channel.notify(rpc_notification{std::string(methods::initialized), {}});
    if (notified.hasException()) {
        outcome.error = "Failed to send initialized notification: "
                        + notified.exception().what().toStdString();
        return outcome;
    }

    outcome.success = true;
    return outcome;
}

//=============================================================================
// Protocol compliance
//=============================================================================

/**
 * @brief Handshake, then confirm every baseline method with a real call
 *
 * A baseline method is supported when the call succeeds with the method's
 * declared response shape. initialize is confirmed by the handshake itself.
 */
template<rpc_channel Channel>
auto survey_protocol(Channel& channel, const engine_config& config) -> protocol_compliance_result {
    protocol_compliance_result result;

    auto handshake = perform_handshake(channel, config.protocol_version, config.client_name,
                                       config.client_version, config.call_timeout);
    result.protocol_version = handshake.protocol_version;
    result.advertised_capabilities = handshake.advertised;

    if (!handshake.success) {
        result.errors.push_back(handshake.error);
        for (const auto& method : config.baseline_capabilities) {
            result.missing_capabilities.insert(method);
        }
        return result;
    }

    for (const auto& method : config.baseline_capabilities) {
        if (method == methods::initialize) {
            result.supported_capabilities.push_back(method);
            continue;
        }

        auto response = call_method(channel, method, {}, config.call_timeout);
        if (auto problem = check_response(method, response)) {
            result.missing_capabilities.insert(method);
            result.errors.push_back("Method " + method + " not supported or failed: " + *problem);
        } else {
            result.supported_capabilities.push_back(method);
        }
    }

    result.success = result.missing_capabilities.empty() && result.errors.empty();
    return result;
}

//=============================================================================
// Functionality
//=============================================================================

struct capability_listing {
    bool success{false};
    std::vector<boost::json::object> items;
    std::string error;
    duration_ms elapsed{0};
};

template<rpc_channel Channel>
auto list_capability(Channel& channel, capability_kind kind, std::chrono::milliseconds timeout)
    -> capability_listing {
    capability_listing listing;
    auto method = list_method(kind);

    auto start = std::chrono::steady_clock::now();
    auto response = call_method(channel, method, {}, timeout);
    listing.elapsed = std::chrono::steady_clock::now() - start;

    if (auto problem = check_response(method, response)) {
        listing.error = "Failed to list " + std::string(to_string(kind)) + ": " + *problem;
        return listing;
    }

    const auto& array = response.value().result.as_object().at(expected_array_member(method)).as_array();
    for (const auto& entry : array) {
        if (entry.is_object()) {
            listing.items.push_back(entry.as_object());
        }
    }
    listing.success = true;
    return listing;
}

// Placeholder value for a JSON schema type
inline auto placeholder_for(std::string_view schema_type) -> boost::json::value {
    if (schema_type == "number" || schema_type == "integer") return 0;
    if (schema_type == "boolean") return false;
    if (schema_type == "array") return boost::json::array{};
    if (schema_type == "object") return boost::json::object{};
    return "test";
}

// Arguments for a tools/call built from the tool's inputSchema required properties
inline auto synthesize_tool_arguments(const boost::json::object& tool) -> boost::json::object {
    boost::json::object arguments;
    const auto* schema = tool.if_contains("inputSchema");
    if (schema == nullptr || !schema->is_object()) {
        return arguments;
    }
    const auto& schema_obj = schema->as_object();
    const auto* required = schema_obj.if_contains("required");
    if (required == nullptr || !required->is_array()) {
        return arguments;
    }

    const boost::json::object* properties = nullptr;
    if (const auto* props = schema_obj.if_contains("properties"); props != nullptr && props->is_object()) {
        properties = &props->as_object();
    }

    for (const auto& name : required->as_array()) {
        if (!name.is_string()) {
            continue;
        }
        std::string type = "string";
        if (properties != nullptr) {
            if (const auto* prop = properties->if_contains(name.as_string());
                prop != nullptr && prop->is_object()) {
                if (const auto* t = prop->as_object().if_contains("type"); t != nullptr && t->is_string()) {
                    type = std::string(t->as_string());
                }
            }
        }
        arguments[name.as_string()] = placeholder_for(type);
    }
    return arguments;
}

struct invocation {
    std::string key;            // tool or prompt name, resource uri
    std::string method;
    boost::json::object params;
};

/**
 * @brief Minimal invocation for one listed item
 *
 * Returns std::nullopt for a listing entry without the identifying member
 * (name for tools and prompts, uri for resources).
 */
inline auto synthesize_invocation(capability_kind kind, const boost::json::object& item)
    -> std::optional<invocation> {
    auto string_member = [&item](std::string_view key) -> std::optional<std::string> {
        if (const auto* v = item.if_contains(key); v != nullptr && v->is_string()) {
            return std::string(v->as_string());
        }
        return std::nullopt;
    };

    invocation call;
    call.method = std::string(invoke_method(kind));

    switch (kind) {
        case capability_kind::tool: {
            auto name = string_member("name");
            if (!name) return std::nullopt;
            call.key = *name;
            call.params["name"] = *name;
            call.params["arguments"] = synthesize_tool_arguments(item);
            return call;
        }
        case capability_kind::resource: {
            auto uri = string_member("uri");
            if (!uri) return std::nullopt;
            call.key = *uri;
            call.params["uri"] = *uri;
            return call;
        }
        case capability_kind::prompt: {
            auto name = string_member("name");
            if (!name) return std::nullopt;
            call.key = *name;
            boost::json::object arguments;
            if (const auto* args = item.if_contains("arguments"); args != nullptr && args->is_array()) {
                for (const auto& arg : args->as_array()) {
                    if (!arg.is_object()) continue;
                    const auto& arg_obj = arg.as_object();
                    const auto* arg_name = arg_obj.if_contains("name");
                    const auto* arg_required = arg_obj.if_contains("required");
                    if (arg_name != nullptr && arg_name->is_string()
                        && arg_required != nullptr && arg_required->is_bool() && arg_required->as_bool()) {
                        arguments[arg_name->as_string()] = "test";
                    }
                }
            }
            call.params["name"] = *name;
            call.params["arguments"] = std::move(arguments);
            return call;
        }
    }
    return std::nullopt;
}

// Invocation for the first item of @p kind the server lists
template<rpc_channel Channel>
auto first_item_invocation(Channel& channel, capability_kind kind, std::chrono::milliseconds timeout)
    -> std::optional<invocation> {
    auto listing = list_capability(channel, kind, timeout);
    if (!listing.success) {
        return std::nullopt;
    }
    for (const auto& item : listing.items) {
        if (auto call = synthesize_invocation(kind, item)) {
            return call;
        }
    }
    return std::nullopt;
}

namespace detail {

inline auto tested_map(functionality_test_result& result, capability_kind kind) -> std::map<std::string, bool>& {
    switch (kind) {
        case capability_kind::tool: return result.tested_tools;
        case capability_kind::resource: return result.tested_resources;
        case capability_kind::prompt: return result.tested_prompts;
    }
    return result.tested_tools;
}

} // namespace detail

/**
 * @brief List and exercise every advertised capability kind
 *
 * Kinds the server does not advertise are skipped. At standard level at most
 * @p max_items_per_kind items are exercised per kind; at comprehensive level
 * every listed item is. Metrics recorded: <kind>_count and
 * <kind>_response_time_ms (average over the listing call and invocations).
 */
template<rpc_channel Channel>
auto exercise_functionality(Channel& channel,
                            const std::vector<std::string>& advertised,
                            validation_level level,
                            std::size_t max_items_per_kind,
                            std::chrono::milliseconds timeout) -> functionality_test_result {
    functionality_test_result result;

    for (auto kind : {capability_kind::tool, capability_kind::resource, capability_kind::prompt}) {
        auto kind_name = std::string(to_string(kind));
        if (!advertises(advertised, kind)) {
            continue;
        }

        auto listing = list_capability(channel, kind, timeout);
        std::vector<duration_ms> timings{listing.elapsed};
        if (!listing.success) {
            result.errors.push_back(listing.error);
            result.performance_metrics[kind_name + "_response_time_ms"] = listing.elapsed.count();
            continue;
        }
        result.performance_metrics[kind_name + "_count"] = static_cast<double>(listing.items.size());

        auto limit = level == validation_level::comprehensive
            ? listing.items.size()
            : std::min(listing.items.size(), max_items_per_kind);

        auto& tested = detail::tested_map(result, kind);
        for (std::size_t i = 0; i < limit; ++i) {
            auto call = synthesize_invocation(kind, listing.items[i]);
            if (!call) {
                result.errors.push_back("Listed " + kind_name + " entry " + std::to_string(i)
                                        + " has no identifying name");
                continue;
            }

            auto start = std::chrono::steady_clock::now();
            auto response = call_method(channel, call->method, call->params, timeout);
            timings.push_back(std::chrono::steady_clock::now() - start);

            if (auto problem = check_response(call->method, response)) {
                tested[call->key] = false;
                result.errors.push_back(call->method + " " + call->key + " failed: " + *problem);
            } else {
                tested[call->key] = true;
            }
        }

        result.performance_metrics[kind_name + "_response_time_ms"] = summarize_latencies(timings).average.count();
    }

    result.success = result.errors.empty() && result.total_tested() > 0;
    if (result.total_tested() == 0 && result.errors.empty()) {
        result.errors.push_back("Server exposes no tools, resources or prompts to exercise");
    }
    return result;
}

} // namespace kestrel
