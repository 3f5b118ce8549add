#pragma once

#include <kestrel/exceptions.hpp>
#include <kestrel/types.hpp>

#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kestrel {

// Configuration for the validation engine
struct engine_config {
    // Per request/response round trip
    std::chrono::milliseconds call_timeout{std::chrono::seconds{10}};

    // How long startup waits for the readiness ping to be answered
    std::chrono::milliseconds startup_window{std::chrono::seconds{5}};
    std::chrono::milliseconds liveness_poll_interval{100};

    // SIGTERM grace period before SIGKILL
    std::chrono::milliseconds stop_grace_period{std::chrono::seconds{5}};

    std::vector<std::string> baseline_capabilities{
        "initialize", "tools/list", "resources/list", "prompts/list"
    };

    std::string protocol_version{"2024-11-05"};
    std::string client_name{"kestrel"};
    std::string client_version{"1.0.0"};

    validation_level level{validation_level::standard};

    // Run the later phases even when an earlier one failed
    bool continue_on_failure{false};

    // Accept a startup where the process exits with status 0 before answering
    bool allow_short_lived{false};

    std::size_t max_items_per_kind{5};
    std::chrono::milliseconds slow_startup_threshold{std::chrono::seconds{5}};

    // Upper bound on retry decisions from the error reporter
    std::size_t max_phase_attempts{3};

    // Explicit entry command; empty means detect from project contents
    std::string entry_command;
};

enum class benchmark_operation {
    initialize,
    list_tools,
    list_resources,
    list_prompts,
    call_tool,
    read_resource,
    get_prompt
};

inline auto to_string(benchmark_operation op) -> std::string_view {
    switch (op) {
        case benchmark_operation::initialize: return "initialize";
        case benchmark_operation::list_tools: return "list_tools";
        case benchmark_operation::list_resources: return "list_resources";
        case benchmark_operation::list_prompts: return "list_prompts";
        case benchmark_operation::call_tool: return "call_tool";
        case benchmark_operation::read_resource: return "read_resource";
        case benchmark_operation::get_prompt: return "get_prompt";
    }
    return "unknown";
}

inline auto parse_benchmark_operation(std::string_view text) -> benchmark_operation {
    for (auto op : {benchmark_operation::initialize, benchmark_operation::list_tools,
                    benchmark_operation::list_resources, benchmark_operation::list_prompts,
                    benchmark_operation::call_tool, benchmark_operation::read_resource,
                    benchmark_operation::get_prompt}) {
        if (to_string(op) == text) {
            return op;
        }
    }
    throw configuration_error("Unknown benchmark operation: " + std::string(text));
}

struct benchmark_spec {
    benchmark_operation operation{benchmark_operation::initialize};
    std::size_t requests{50};
};

// A simulated client: the capability kinds it uses and the protocol version it speaks
struct client_profile {
    std::string name;
    std::vector<capability_kind> capabilities;
    std::string protocol_version{"2024-11-05"};
};

struct tester_thresholds {
    double benchmark_error_rate{0.05};
    duration_ms benchmark_average_latency{1000.0};
    double benchmark_memory_mb{100.0};
    double compatibility_score{0.7};
    double load_error_rate{0.05};
    // A load ladder step at or above this error rate stops escalation
    double load_stop_error_rate{0.1};
    // Overall success requires every benchmark error rate below this
    double gating_error_rate{0.1};
};

// Configuration for the comprehensive tester
struct tester_config {
    std::size_t max_workers{10};

    std::vector<benchmark_spec> benchmarks{
        {benchmark_operation::initialize, 50},
        {benchmark_operation::list_tools, 100},
        {benchmark_operation::list_resources, 100},
        {benchmark_operation::list_prompts, 100},
        {benchmark_operation::call_tool, 50},
        {benchmark_operation::read_resource, 50},
        {benchmark_operation::get_prompt, 50},
    };

    std::vector<client_profile> client_profiles{
        {"Standard MCP Client",
         {capability_kind::tool, capability_kind::resource, capability_kind::prompt}, "2024-11-05"},
        {"Tools-Only Client", {capability_kind::tool}, "2024-11-05"},
        {"Resources-Only Client", {capability_kind::resource}, "2024-11-05"},
        {"Legacy Client", {capability_kind::tool, capability_kind::resource}, "2024-10-07"},
    };

    std::vector<std::size_t> load_user_ladder{1, 5, 10, 20};
    std::size_t load_requests_per_user{50};

    tester_thresholds thresholds;

    bool run_performance{true};
    bool run_integration{true};
    bool run_load{true};
    bool run_security{true};
};

inline auto validate_engine_config(const engine_config& config) -> void {
    if (config.call_timeout.count() <= 0) {
        throw configuration_error("call_timeout must be positive");
    }

    if (config.startup_window.count() <= 0) {
        throw configuration_error("startup_window must be positive");
    }

    if (config.liveness_poll_interval.count() <= 0) {
        throw configuration_error("liveness_poll_interval must be positive");
    }

    if (config.liveness_poll_interval > config.startup_window) {
        throw configuration_error("liveness_poll_interval must not exceed startup_window");
    }

    if (config.stop_grace_period.count() < 0) {
        throw configuration_error("stop_grace_period must not be negative");
    }

    if (config.protocol_version.empty()) {
        throw configuration_error("protocol_version must not be empty");
    }

    for (const auto& capability : config.baseline_capabilities) {
        if (capability.empty()) {
            throw configuration_error("baseline capability names must not be empty");
        }
    }

    if (config.max_items_per_kind == 0) {
        throw configuration_error("max_items_per_kind must be greater than 0");
    }

    if (config.max_phase_attempts == 0) {
        throw configuration_error("max_phase_attempts must be greater than 0");
    }
}

inline auto validate_tester_config(const tester_config& config) -> void {
    if (config.max_workers == 0) {
        throw configuration_error("max_workers must be greater than 0");
    }

    if (config.run_performance) {
        if (config.benchmarks.empty()) {
            throw configuration_error("benchmark set must not be empty when performance testing is enabled");
        }
        for (const auto& spec : config.benchmarks) {
            if (spec.requests == 0) {
                throw configuration_error(
                    "benchmark request count must be greater than 0 for " + std::string(to_string(spec.operation)));
            }
        }
    }

    if (config.run_integration) {
        for (const auto& profile : config.client_profiles) {
            if (profile.name.empty()) {
                throw configuration_error("client profile name must not be empty");
            }
            if (profile.capabilities.empty()) {
                throw configuration_error("client profile '" + profile.name + "' declares no capabilities");
            }
        }
    }

    if (config.run_load) {
        if (config.load_user_ladder.empty()) {
            throw configuration_error("load user ladder must not be empty when load testing is enabled");
        }
        for (auto users : config.load_user_ladder) {
            if (users == 0) {
                throw configuration_error("load user counts must be greater than 0");
            }
        }
        if (config.load_requests_per_user == 0) {
            throw configuration_error("load_requests_per_user must be greater than 0");
        }
    }

    const auto& t = config.thresholds;
    for (double rate : {t.benchmark_error_rate, t.compatibility_score, t.load_error_rate,
                        t.load_stop_error_rate, t.gating_error_rate}) {
        if (rate < 0.0 || rate > 1.0) {
            throw configuration_error("rate thresholds must lie in [0, 1]");
        }
    }

    if (t.benchmark_average_latency.count() <= 0.0) {
        throw configuration_error("benchmark_average_latency threshold must be positive");
    }

    if (t.benchmark_memory_mb <= 0.0) {
        throw configuration_error("benchmark_memory_mb threshold must be positive");
    }
}

/**
 * @brief Combined configuration document
 */
struct kestrel_config {
    engine_config engine;
    tester_config tester;
};

namespace detail {

inline auto config_member(const boost::json::object& obj, std::string_view key) -> const boost::json::value* {
    return obj.if_contains(key);
}

inline auto read_milliseconds(const boost::json::object& obj, std::string_view key,
                              std::chrono::milliseconds& target) -> void {
    if (const auto* value = config_member(obj, key)) {
        if (!value->is_int64()) {
            throw configuration_error(std::string(key) + " must be an integer number of milliseconds");
        }
        target = std::chrono::milliseconds{value->as_int64()};
    }
}

inline auto read_size(const boost::json::object& obj, std::string_view key, std::size_t& target) -> void {
    if (const auto* value = config_member(obj, key)) {
        if (value->is_int64() && value->as_int64() >= 0) {
            target = static_cast<std::size_t>(value->as_int64());
        } else if (value->is_uint64()) {
            target = static_cast<std::size_t>(value->as_uint64());
        } else {
            throw configuration_error(std::string(key) + " must be a non-negative integer");
        }
    }
}

inline auto read_double(const boost::json::object& obj, std::string_view key, double& target) -> void {
    if (const auto* value = config_member(obj, key)) {
        if (!value->is_number()) {
            throw configuration_error(std::string(key) + " must be a number");
        }
        target = value->to_number<double>();
    }
}

inline auto read_bool(const boost::json::object& obj, std::string_view key, bool& target) -> void {
    if (const auto* value = config_member(obj, key)) {
        if (!value->is_bool()) {
            throw configuration_error(std::string(key) + " must be a boolean");
        }
        target = value->as_bool();
    }
}

inline auto read_string(const boost::json::object& obj, std::string_view key, std::string& target) -> void {
    if (const auto* value = config_member(obj, key)) {
        if (!value->is_string()) {
            throw configuration_error(std::string(key) + " must be a string");
        }
        target = std::string(value->as_string());
    }
}

inline auto as_object(const boost::json::value& value, std::string_view key) -> const boost::json::object& {
    if (!value.is_object()) {
        throw configuration_error(std::string(key) + " must be an object");
    }
    return value.as_object();
}

inline auto as_array(const boost::json::value& value, std::string_view key) -> const boost::json::array& {
    if (!value.is_array()) {
        throw configuration_error(std::string(key) + " must be an array");
    }
    return value.as_array();
}

inline auto parse_capability_kind(std::string_view text) -> capability_kind {
    if (text == "tools") return capability_kind::tool;
    if (text == "resources") return capability_kind::resource;
    if (text == "prompts") return capability_kind::prompt;
    throw configuration_error("Unknown capability kind: " + std::string(text));
}

inline auto apply_engine_section(const boost::json::object& obj, engine_config& config) -> void {
    read_milliseconds(obj, "call_timeout_ms", config.call_timeout);
    read_milliseconds(obj, "startup_window_ms", config.startup_window);
    read_milliseconds(obj, "liveness_poll_interval_ms", config.liveness_poll_interval);
    read_milliseconds(obj, "stop_grace_period_ms", config.stop_grace_period);
    read_milliseconds(obj, "slow_startup_threshold_ms", config.slow_startup_threshold);
    read_string(obj, "protocol_version", config.protocol_version);
    read_string(obj, "client_name", config.client_name);
    read_string(obj, "client_version", config.client_version);
    read_string(obj, "entry_command", config.entry_command);
    read_bool(obj, "continue_on_failure", config.continue_on_failure);
    read_bool(obj, "allow_short_lived", config.allow_short_lived);
    read_size(obj, "max_items_per_kind", config.max_items_per_kind);
    read_size(obj, "max_phase_attempts", config.max_phase_attempts);

    if (const auto* level = config_member(obj, "level")) {
        if (!level->is_string()) {
            throw configuration_error("level must be a string");
        }
        config.level = parse_validation_level(std::string(level->as_string()));
    }

    if (const auto* baseline = config_member(obj, "baseline_capabilities")) {
        config.baseline_capabilities.clear();
        for (const auto& entry : as_array(*baseline, "baseline_capabilities")) {
            if (!entry.is_string()) {
                throw configuration_error("baseline_capabilities entries must be strings");
            }
            config.baseline_capabilities.emplace_back(entry.as_string());
        }
    }
}

inline auto apply_tester_section(const boost::json::object& obj, tester_config& config) -> void {
    read_size(obj, "max_workers", config.max_workers);
    read_size(obj, "load_requests_per_user", config.load_requests_per_user);
    read_bool(obj, "run_performance", config.run_performance);
    read_bool(obj, "run_integration", config.run_integration);
    read_bool(obj, "run_load", config.run_load);
    read_bool(obj, "run_security", config.run_security);

    if (const auto* ladder = config_member(obj, "load_user_ladder")) {
        config.load_user_ladder.clear();
        for (const auto& entry : as_array(*ladder, "load_user_ladder")) {
            if (!entry.is_int64() || entry.as_int64() < 0) {
                throw configuration_error("load_user_ladder entries must be non-negative integers");
            }
            config.load_user_ladder.push_back(static_cast<std::size_t>(entry.as_int64()));
        }
    }

    // {"list_tools": 100, ...}; listed operations replace the default set
    if (const auto* benchmarks = config_member(obj, "benchmarks")) {
        config.benchmarks.clear();
        for (const auto& [name, count] : as_object(*benchmarks, "benchmarks")) {
            if (!count.is_int64() || count.as_int64() < 0) {
                throw configuration_error("benchmark request counts must be non-negative integers");
            }
            config.benchmarks.push_back(benchmark_spec{
                .operation = parse_benchmark_operation(std::string(name)),
                .requests = static_cast<std::size_t>(count.as_int64())
            });
        }
    }

    if (const auto* profiles = config_member(obj, "client_profiles")) {
        config.client_profiles.clear();
        for (const auto& entry : as_array(*profiles, "client_profiles")) {
            const auto& profile_obj = as_object(entry, "client_profiles entry");
            client_profile profile;
            read_string(profile_obj, "name", profile.name);
            read_string(profile_obj, "protocol_version", profile.protocol_version);
            if (const auto* kinds = config_member(profile_obj, "capabilities")) {
                for (const auto& kind : as_array(*kinds, "capabilities")) {
                    if (!kind.is_string()) {
                        throw configuration_error("client profile capabilities must be strings");
                    }
                    profile.capabilities.push_back(parse_capability_kind(std::string(kind.as_string())));
                }
            }
            config.client_profiles.push_back(std::move(profile));
        }
    }

    if (const auto* thresholds = config_member(obj, "thresholds")) {
        const auto& t_obj = as_object(*thresholds, "thresholds");
        auto& t = config.thresholds;
        read_double(t_obj, "benchmark_error_rate", t.benchmark_error_rate);
        double latency = t.benchmark_average_latency.count();
        read_double(t_obj, "benchmark_average_latency_ms", latency);
        t.benchmark_average_latency = duration_ms{latency};
        read_double(t_obj, "benchmark_memory_mb", t.benchmark_memory_mb);
        read_double(t_obj, "compatibility_score", t.compatibility_score);
        read_double(t_obj, "load_error_rate", t.load_error_rate);
        read_double(t_obj, "load_stop_error_rate", t.load_stop_error_rate);
        read_double(t_obj, "gating_error_rate", t.gating_error_rate);
    }
}

} // namespace detail

/**
 * @brief Parse a configuration document
 *
 * Absent keys keep their defaults. The result is validated before it is
 * returned.
 *
 * @throws configuration_error on malformed JSON, wrong value types, or
 *         values that fail validation
 */
inline auto parse_config(std::string_view text) -> kestrel_config {
    boost::json::error_code ec;
    auto document = boost::json::parse(text, ec);
    if (ec) {
        throw configuration_error("Invalid configuration document: " + ec.message());
    }

    const auto& root = detail::as_object(document, "configuration");
    kestrel_config config;

    if (const auto* engine = root.if_contains("engine")) {
        detail::apply_engine_section(detail::as_object(*engine, "engine"), config.engine);
    }
    if (const auto* tester = root.if_contains("tester")) {
        detail::apply_tester_section(detail::as_object(*tester, "tester"), config.tester);
    }

    validate_engine_config(config.engine);
    validate_tester_config(config.tester);
    return config;
}

inline auto load_config(const std::string& path) -> kestrel_config {
    std::ifstream in(path);
    if (!in) {
        throw configuration_error("Cannot open configuration file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

} // namespace kestrel
