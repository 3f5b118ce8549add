#pragma once

#include <kestrel/exceptions.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel {

// All latencies and elapsed times are reported in fractional milliseconds
using duration_ms = std::chrono::duration<double, std::milli>;

enum class validation_level {
    basic,          // startup + protocol handshake
    standard,       // + functionality, bounded item count per kind
    comprehensive   // + functionality over every listed item
};

enum class capability_kind {
    tool,
    resource,
    prompt
};

enum class severity_level : std::uint8_t {
    low,
    medium,
    high,
    critical
};

enum class security_category {
    dependency,
    code,
    configuration
};

inline auto to_string(validation_level level) -> std::string_view {
    switch (level) {
        case validation_level::basic: return "basic";
        case validation_level::standard: return "standard";
        case validation_level::comprehensive: return "comprehensive";
    }
    return "unknown";
}

inline auto parse_validation_level(std::string_view text) -> validation_level {
    if (text == "basic") return validation_level::basic;
    if (text == "standard") return validation_level::standard;
    if (text == "comprehensive") return validation_level::comprehensive;
    throw configuration_error("Unknown validation level: " + std::string(text));
}

inline auto to_string(capability_kind kind) -> std::string_view {
    switch (kind) {
        case capability_kind::tool: return "tools";
        case capability_kind::resource: return "resources";
        case capability_kind::prompt: return "prompts";
    }
    return "unknown";
}

inline auto to_string(severity_level severity) -> std::string_view {
    switch (severity) {
        case severity_level::low: return "low";
        case severity_level::medium: return "medium";
        case severity_level::high: return "high";
        case severity_level::critical: return "critical";
    }
    return "unknown";
}

inline auto to_string(security_category category) -> std::string_view {
    switch (category) {
        case security_category::dependency: return "dependency";
        case security_category::code: return "code";
        case security_category::configuration: return "configuration";
    }
    return "unknown";
}

inline auto operator<<(std::ostream& os, validation_level level) -> std::ostream& {
    return os << to_string(level);
}

inline auto operator<<(std::ostream& os, severity_level severity) -> std::ostream& {
    return os << to_string(severity);
}

inline auto operator<<(std::ostream& os, security_category category) -> std::ostream& {
    return os << to_string(category);
}

// ISO-8601 local timestamp with millisecond precision
inline auto current_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    ::localtime_r(&time_t_now, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

//=============================================================================
// Basic validation results
//=============================================================================

struct server_startup_result {
    bool success{false};
    std::optional<std::int64_t> pid;
    duration_ms startup_time{0};
    std::vector<std::string> errors;
    std::vector<std::string> logs;
};

struct protocol_compliance_result {
    bool success{false};
    bool skipped{false};
    // Method names in the order they were confirmed
    std::vector<std::string> supported_capabilities;
    std::set<std::string> missing_capabilities;
    // Capability kinds the server advertised in its initialize result
    std::vector<std::string> advertised_capabilities;
    std::optional<std::string> protocol_version;
    std::vector<std::string> errors;
};

struct functionality_test_result {
    bool success{false};
    bool skipped{false};
    std::map<std::string, bool> tested_tools;
    std::map<std::string, bool> tested_resources;
    std::map<std::string, bool> tested_prompts;
    std::vector<std::string> errors;
    std::map<std::string, double> performance_metrics;

    auto total_tested() const -> std::size_t {
        return tested_tools.size() + tested_resources.size() + tested_prompts.size();
    }
};

struct validation_report {
    std::string project_path;
    validation_level level{validation_level::standard};
    bool overall_success{false};
    server_startup_result startup_result;
    protocol_compliance_result protocol_result;
    functionality_test_result functionality_result;
    std::map<std::string, double> performance_metrics;
    std::vector<std::string> recommendations;
    std::string timestamp;
    duration_ms total_execution_time{0};
};

//=============================================================================
// Comprehensive testing results
//=============================================================================

struct performance_benchmark {
    std::string operation_name;
    std::size_t total_requests{0};
    std::size_t successful_requests{0};
    std::size_t failed_requests{0};
    duration_ms min_response_time{0};
    duration_ms average_response_time{0};
    duration_ms max_response_time{0};
    // max(nearest_rank_95_response_time, average_response_time)
    duration_ms percentile_95_response_time{0};
    duration_ms nearest_rank_95_response_time{0};
    double requests_per_second{0.0};
    double error_rate{0.0};
    // Empty when process introspection failed
    std::optional<double> memory_usage_mb;
    std::optional<double> cpu_usage_percent;
};

struct integration_test_result {
    std::string client_name;
    bool connection_successful{false};
    duration_ms handshake_time{0};
    std::vector<std::string> supported_features;
    std::vector<std::string> failed_features;
    double compatibility_score{0.0};
    std::vector<std::string> errors;
};

struct load_test_result {
    std::size_t concurrent_users{0};
    std::size_t total_requests{0};
    std::size_t successful_requests{0};
    std::size_t failed_requests{0};
    double error_rate{0.0};
    double requests_per_second{0.0};
    duration_ms average_response_time{0};
    duration_ms max_response_time{0};
    duration_ms test_duration{0};
    std::optional<double> memory_before_mb;
    std::optional<double> memory_after_mb;
    std::optional<double> cpu_usage_percent;
    std::vector<std::string> errors;
};

struct security_issue {
    security_category category{security_category::code};
    std::string type;
    std::string file;
    std::size_t line{0};
    std::string description;
    severity_level severity{severity_level::low};
};

struct severity_counts {
    std::size_t critical{0};
    std::size_t high{0};
    std::size_t medium{0};
    std::size_t low{0};

    auto add(severity_level severity) -> void {
        switch (severity) {
            case severity_level::critical: ++critical; break;
            case severity_level::high: ++high; break;
            case severity_level::medium: ++medium; break;
            case severity_level::low: ++low; break;
        }
    }

    auto total() const -> std::size_t {
        return critical + high + medium + low;
    }

    auto operator+=(const severity_counts& other) -> severity_counts& {
        critical += other.critical;
        high += other.high;
        medium += other.medium;
        low += other.low;
        return *this;
    }

    friend auto operator==(const severity_counts&, const severity_counts&) -> bool = default;
};

struct security_scan_result {
    security_category category{security_category::code};
    severity_counts counts;
    std::vector<security_issue> issues;
    std::vector<std::string> recommendations;
    // Files that could not be read; the scan skipped them
    std::vector<std::string> warnings;
    std::size_t scanned_files{0};
};

using security_scan_map = std::map<security_category, security_scan_result>;

inline auto total_counts(const security_scan_map& results) -> severity_counts {
    severity_counts totals;
    for (const auto& [category, result] : results) {
        totals += result.counts;
    }
    return totals;
}

struct comprehensive_test_report {
    std::string project_path;
    std::string timestamp;
    bool overall_success{false};
    validation_report basic_validation;
    std::vector<performance_benchmark> performance_benchmarks;
    std::vector<integration_test_result> integration_results;
    std::map<std::string, load_test_result> load_test_results;
    security_scan_map security_scan_results;
    std::vector<std::string> recommendations;
    // Set when the comprehensive sections did not run
    std::optional<std::string> skipped_reason;
    // Last error of every section that failed, keyed by section name
    std::map<std::string, std::string> section_errors;
    // Sections never started because a failed section ended the run
    std::vector<std::string> abandoned_sections;
    duration_ms total_test_duration{0};
};

} // namespace kestrel
