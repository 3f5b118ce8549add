#pragma once

#include <kestrel/capability_survey.hpp>
#include <kestrel/config.hpp>
#include <kestrel/json_rpc.hpp>
#include <kestrel/protocol_exchange.hpp>
#include <kestrel/types.hpp>

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kestrel {

// Feature exercised beyond the listing call for a capability kind
inline auto execution_feature(capability_kind kind) -> std::string_view {
    switch (kind) {
        case capability_kind::tool: return "tool_execution";
        case capability_kind::resource: return "resource_access";
        case capability_kind::prompt: return "prompt_rendering";
    }
    return "unknown";
}

// Every feature a profile attempts: one listing per capability, then one
// execution feature per capability, in profile order
inline auto profile_features(const client_profile& profile) -> std::vector<std::string> {
    std::vector<std::string> features;
    for (auto kind : profile.capabilities) {
        features.emplace_back(to_string(kind));
    }
    for (auto kind : profile.capabilities) {
        features.emplace_back(execution_feature(kind));
    }
    return features;
}

// "Standard MCP Client" -> "standard-mcp-client"
inline auto client_slug(std::string_view name) -> std::string {
    std::string slug;
    for (char c : name) {
        slug += c == ' ' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return slug;
}

inline auto profile_initialize_params(const client_profile& profile) -> boost::json::object {
    boost::json::object capabilities;
    for (auto kind : profile.capabilities) {
        capabilities[to_string(kind)] = boost::json::object{};
    }
    auto params = make_initialize_params(profile.protocol_version, client_slug(profile.name), "1.0.0");
    params["capabilities"] = std::move(capabilities);
    return params;
}

/**
 * @brief Behave like the client described by @p profile and score the server
 *
 * compatibility_score = supported / attempted features. Anything thrown while
 * talking to the server yields an unconnected, zero-score result with every
 * feature failed; nothing escapes to the caller.
 */
template<rpc_channel Channel>
auto run_client_profile(Channel& channel, const client_profile& profile,
                        std::chrono::milliseconds timeout) -> integration_test_result {
    integration_test_result result;
    result.client_name = profile.name;

    auto fail_all = [&result, &profile](std::string error) {
        result.connection_successful = false;
        result.supported_features.clear();
        result.failed_features = profile_features(profile);
        result.compatibility_score = 0.0;
        result.errors.push_back(std::move(error));
    };

    try {
        auto start = std::chrono::steady_clock::now();
        auto init = call_method(channel, methods::initialize, profile_initialize_params(profile), timeout);
        result.handshake_time = std::chrono::steady_clock::now() - start;

        if (!succeeded(init)) {
            fail_all("Handshake failed: " + describe_failure(init));
            return result;
        }

        auto notified = channel.notify(rpc_notification{std::string(methods::initialized), {}});
        if (notified.hasException()) {
            fail_all("Failed to send initialized notification: " + notified.exception().what().toStdString());
            return result;
        }
        result.connection_successful = true;

        std::vector<capability_listing> listings;
        for (auto kind : profile.capabilities) {
            auto listing = list_capability(channel, kind, timeout);
            if (listing.success) {
                result.supported_features.emplace_back(to_string(kind));
            } else {
                result.failed_features.emplace_back(to_string(kind));
                result.errors.push_back("Capability " + std::string(to_string(kind))
                                        + " not supported or failed: " + listing.error);
            }
            listings.push_back(std::move(listing));
        }

        for (std::size_t i = 0; i < profile.capabilities.size(); ++i) {
            auto kind = profile.capabilities[i];
            auto feature = std::string(execution_feature(kind));
            const auto& listing = listings[i];

            std::optional<invocation> call;
            for (const auto& item : listing.items) {
                if ((call = synthesize_invocation(kind, item))) {
                    break;
                }
            }
            if (!call) {
                result.failed_features.push_back(feature);
                result.errors.push_back(feature + " not tested: server lists no " + std::string(to_string(kind)));
                continue;
            }

            auto response = call_method(channel, call->method, call->params, timeout);
            if (auto problem = check_response(call->method, response)) {
                result.failed_features.push_back(feature);
                result.errors.push_back(feature + " failed: " + *problem);
            } else {
                result.supported_features.push_back(feature);
            }
        }
    } catch (const std::exception& e) {
        fail_all(std::string("Integration test failed: ") + e.what());
        return result;
    }

    auto attempted = result.supported_features.size() + result.failed_features.size();
    result.compatibility_score = attempted == 0
        ? 0.0
        : static_cast<double>(result.supported_features.size()) / static_cast<double>(attempted);
    return result;
}

} // namespace kestrel
