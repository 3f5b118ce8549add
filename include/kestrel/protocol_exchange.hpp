#pragma once

#include <kestrel/exceptions.hpp>
#include <kestrel/json_rpc.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/process.hpp>

#include <boost/json.hpp>
#include <folly/Try.h>
#include <folly/Unit.h>

#include <chrono>
#include <concepts>
#include <mutex>
#include <string>
#include <string_view>

namespace kestrel {

// Outcome of one request/response round trip. Holds the response (which may
// itself be a JSON-RPC error) or one of process_timeout_error,
// process_io_error, protocol_error.
using exchange_result = folly::Try<rpc_response>;

/**
 * @brief RPC channel concept: one request/response round trip per call
 *
 * Implementations must never hand a response to a caller other than the one
 * whose request produced it, and must stay usable after a timed-out call.
 */
template<typename C>
concept rpc_channel = requires(
    C channel,
    const rpc_request& request,
    const rpc_notification& notification,
    std::chrono::milliseconds timeout
) {
    { channel.next_id() } -> std::same_as<rpc_id>;
    { channel.call(request, timeout) } -> std::same_as<exchange_result>;
    { channel.notify(notification) } -> std::same_as<folly::Try<folly::Unit>>;
};

// Build a request with a fresh id and perform the round trip
template<rpc_channel Channel>
auto call_method(Channel& channel, std::string_view method, boost::json::object params,
                 std::chrono::milliseconds timeout) -> exchange_result {
    rpc_request request{
        .id = channel.next_id(),
        .method = std::string(method),
        .params = std::move(params)
    };
    return channel.call(request, timeout);
}

/**
 * @brief JSON-RPC over a child process's stdin/stdout
 *
 * Each call holds the handle's I/O lock for the whole write+read, so
 * concurrent callers are serialised and never see each other's responses.
 * Lines that are not the pending response (non-JSON output, server-initiated
 * messages, late responses to earlier timed-out calls) are discarded.
 */
template<diagnostic_logger Logger>
class stdio_channel {
public:
    stdio_channel(process_handle& handle, Logger& logger)
        : _handle(handle)
        , _logger(logger) {}

    auto next_id() -> rpc_id {
        return _handle.next_request_id();
    }

    auto call(const rpc_request& request, std::chrono::milliseconds timeout) -> exchange_result {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        std::unique_lock<std::timed_mutex> lock(_handle.io_mutex(), std::defer_lock);
        if (!lock.try_lock_until(deadline)) {
            return timeout_failure(request, timeout, "waiting for the channel");
        }

        try {
            _handle.write_line(encode_request(request), deadline);

            while (true) {
                auto [status, line] = _handle.read_line(deadline);

                if (status == read_status::timeout) {
                    return timeout_failure(request, timeout, "waiting for the response");
                }
                if (status == read_status::end_of_stream) {
                    throw process_io_error("Server closed stdout before answering " + request.method);
                }

                // Only the pending request's own reply may fail the call as malformed
                auto id = response_id(line);
                if (!id) {
                    _logger.debug("Discarded non-response output", {{"line", line}});
                    continue;
                }
                if (*id != request.id) {
                    auto stale = std::to_string(*id);
                    _logger.debug("Discarded response for another request", {{"id", stale}});
                    continue;
                }
                auto response = decode_response(line);
                if (!response) {
                    throw protocol_error("Unreadable response to " + request.method);
                }
                return exchange_result(std::move(*response));
            }
        } catch (const kestrel_exception& e) {
            auto pid = std::to_string(_handle.pid());
            _logger.warning(e.what(), {{"pid", pid}, {"method", request.method}});
            return exchange_result(folly::exception_wrapper(std::current_exception(), e));
        }
    }

    auto notify(const rpc_notification& notification) -> folly::Try<folly::Unit> {
        std::lock_guard<std::timed_mutex> lock(_handle.io_mutex());
        try {
            _handle.write_line(encode_notification(notification),
                               std::chrono::steady_clock::now() + notify_timeout);
            return folly::Try<folly::Unit>(folly::unit);
        } catch (const kestrel_exception& e) {
            return folly::Try<folly::Unit>(folly::exception_wrapper(std::current_exception(), e));
        }
    }

    auto handle() -> process_handle& {
        return _handle;
    }

private:
    static constexpr std::chrono::milliseconds notify_timeout{1000};

    process_handle& _handle;
    Logger& _logger;

    auto timeout_failure(const rpc_request& request, std::chrono::milliseconds timeout,
                         std::string_view stage) -> exchange_result {
        auto message = "Timed out after " + std::to_string(timeout.count()) + " ms "
                       + std::string(stage) + " to " + request.method;
        auto pid = std::to_string(_handle.pid());
        _logger.warning(message, {{"pid", pid}, {"method", request.method}});
        return exchange_result(folly::make_exception_wrapper<process_timeout_error>(message));
    }
};

static_assert(rpc_channel<stdio_channel<noop_logger>>,
    "stdio_channel must satisfy rpc_channel concept");

// Human-readable description of a failed exchange
inline auto describe_failure(const exchange_result& result) -> std::string {
    if (result.hasException()) {
        return result.exception().what().toStdString();
    }
    if (result.value().is_error()) {
        const auto& error = *result.value().error;
        return "JSON-RPC error " + std::to_string(error.code) + ": " + error.message;
    }
    return {};
}

// A round trip that produced a non-error response
inline auto succeeded(const exchange_result& result) -> bool {
    return result.hasValue() && !result.value().is_error();
}

} // namespace kestrel
