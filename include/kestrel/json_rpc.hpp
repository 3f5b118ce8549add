#pragma once

#include <kestrel/exceptions.hpp>

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kestrel {

using rpc_id = std::int64_t;

// JSON-RPC 2.0 method names used against the server under test
namespace methods {
    inline constexpr std::string_view initialize = "initialize";
    inline constexpr std::string_view initialized = "notifications/initialized";
    inline constexpr std::string_view ping = "ping";
    inline constexpr std::string_view tools_list = "tools/list";
    inline constexpr std::string_view tools_call = "tools/call";
    inline constexpr std::string_view resources_list = "resources/list";
    inline constexpr std::string_view resources_read = "resources/read";
    inline constexpr std::string_view prompts_list = "prompts/list";
    inline constexpr std::string_view prompts_get = "prompts/get";
} // namespace methods

struct rpc_request {
    rpc_id id{0};
    std::string method;
    boost::json::object params;
};

struct rpc_notification {
    std::string method;
    boost::json::object params;
};

struct rpc_error {
    std::int64_t code{0};
    std::string message;
};

struct rpc_response {
    rpc_id id{0};
    boost::json::value result;
    std::optional<rpc_error> error;

    auto is_error() const -> bool {
        return error.has_value();
    }
};

// Encoders produce one line without the trailing newline

inline auto encode_request(const rpc_request& request) -> std::string {
    boost::json::object obj;
    obj["jsonrpc"] = "2.0";
    obj["id"] = request.id;
    obj["method"] = request.method;
    obj["params"] = request.params;
    return boost::json::serialize(obj);
}

inline auto encode_notification(const rpc_notification& notification) -> std::string {
    boost::json::object obj;
    obj["jsonrpc"] = "2.0";
    obj["method"] = notification.method;
    if (!notification.params.empty()) {
        obj["params"] = notification.params;
    }
    return boost::json::serialize(obj);
}

inline auto encode_response(const rpc_response& response) -> std::string {
    boost::json::object obj;
    obj["jsonrpc"] = "2.0";
    obj["id"] = response.id;
    if (response.error) {
        boost::json::object err;
        err["code"] = response.error->code;
        err["message"] = response.error->message;
        obj["error"] = std::move(err);
    } else {
        obj["result"] = response.result;
    }
    return boost::json::serialize(obj);
}

namespace detail {

// Integer id of a response-shaped object; requests and notifications have none
inline auto response_id_of(const boost::json::object& obj) -> std::optional<rpc_id> {
    if (obj.contains("method")) {
        return std::nullopt;
    }
    const auto* id = obj.if_contains("id");
    if (id == nullptr || !id->is_int64()) {
        return std::nullopt;
    }
    return id->as_int64();
}

} // namespace detail

/**
 * @brief Id of the response on @p line without validating its body
 *
 * std::nullopt for every line decode_response() would skip.
 */
inline auto response_id(std::string_view line) -> std::optional<rpc_id> {
    boost::json::error_code ec;
    auto parsed = boost::json::parse(line, ec);
    if (ec || !parsed.is_object()) {
        return std::nullopt;
    }
    return detail::response_id_of(parsed.as_object());
}

/**
 * @brief Decode one line read from the server's stdout
 *
 * Returns std::nullopt for lines that are not responses: non-JSON output,
 * server-initiated requests and notifications, and responses whose id is not
 * an integer (this client only ever sends integer ids).
 *
 * @throws protocol_error for a response-shaped object that carries neither a
 *         result nor a well-formed error
 */
inline auto decode_response(std::string_view line) -> std::optional<rpc_response> {
    boost::json::error_code ec;
    auto parsed = boost::json::parse(line, ec);
    if (ec || !parsed.is_object()) {
        return std::nullopt;
    }

    const auto& obj = parsed.as_object();
    auto id = detail::response_id_of(obj);
    if (!id) {
        return std::nullopt;
    }

    rpc_response response;
    response.id = *id;

    if (const auto* err = obj.if_contains("error")) {
        if (!err->is_object()) {
            throw protocol_error("Response " + std::to_string(response.id) + " has a non-object error member");
        }
        const auto& err_obj = err->as_object();
        rpc_error error;
        if (const auto* code = err_obj.if_contains("code"); code != nullptr && code->is_int64()) {
            error.code = code->as_int64();
        }
        if (const auto* message = err_obj.if_contains("message"); message != nullptr && message->is_string()) {
            error.message = std::string(message->as_string());
        }
        response.error = std::move(error);
        return response;
    }

    const auto* result = obj.if_contains("result");
    if (result == nullptr) {
        throw protocol_error("Response " + std::to_string(response.id) + " carries neither result nor error");
    }
    response.result = *result;
    return response;
}

// A request or notification as seen from the server side; notifications have no id
struct rpc_incoming {
    std::optional<rpc_id> id;
    std::string method;
    boost::json::object params;
};

// Decode one line read by a server from its stdin. Returns std::nullopt for
// anything that is not a request or notification.
inline auto decode_incoming(std::string_view line) -> std::optional<rpc_incoming> {
    boost::json::error_code ec;
    auto parsed = boost::json::parse(line, ec);
    if (ec || !parsed.is_object()) {
        return std::nullopt;
    }

    const auto& obj = parsed.as_object();
    const auto* method = obj.if_contains("method");
    if (method == nullptr || !method->is_string()) {
        return std::nullopt;
    }

    rpc_incoming incoming;
    incoming.method = std::string(method->as_string());
    if (const auto* id = obj.if_contains("id"); id != nullptr && id->is_int64()) {
        incoming.id = id->as_int64();
    }
    if (const auto* params = obj.if_contains("params"); params != nullptr && params->is_object()) {
        incoming.params = params->as_object();
    }
    return incoming;
}

inline auto make_initialize_params(std::string_view protocol_version,
                                   std::string_view client_name,
                                   std::string_view client_version) -> boost::json::object {
    boost::json::object client_info;
    client_info["name"] = client_name;
    client_info["version"] = client_version;

    boost::json::object params;
    params["protocolVersion"] = protocol_version;
    params["capabilities"] = boost::json::object{};
    params["clientInfo"] = std::move(client_info);
    return params;
}

} // namespace kestrel
