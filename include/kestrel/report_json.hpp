#pragma once

#include <kestrel/types.hpp>

#include <boost/json.hpp>

#include <iomanip>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace kestrel {

namespace detail {

inline auto string_array(const std::vector<std::string>& items) -> boost::json::array {
    boost::json::array array;
    for (const auto& item : items) {
        array.emplace_back(item);
    }
    return array;
}

inline auto string_array(const std::set<std::string>& items) -> boost::json::array {
    boost::json::array array;
    for (const auto& item : items) {
        array.emplace_back(item);
    }
    return array;
}

inline auto bool_map(const std::map<std::string, bool>& items) -> boost::json::object {
    boost::json::object obj;
    for (const auto& [key, value] : items) {
        obj[key] = value;
    }
    return obj;
}

inline auto number_map(const std::map<std::string, double>& items) -> boost::json::object {
    boost::json::object obj;
    for (const auto& [key, value] : items) {
        obj[key] = value;
    }
    return obj;
}

inline auto optional_number(const std::optional<double>& value) -> boost::json::value {
    if (value) {
        return *value;
    }
    return nullptr;
}

} // namespace detail

//=============================================================================
// Basic validation
//=============================================================================

inline auto to_json(const server_startup_result& result) -> boost::json::object {
    boost::json::object obj;
    obj["success"] = result.success;
    if (result.pid) {
        obj["pid"] = *result.pid;
    } else {
        obj["pid"] = nullptr;
    }
    obj["startup_time_ms"] = result.startup_time.count();
    obj["errors"] = detail::string_array(result.errors);
    obj["logs"] = detail::string_array(result.logs);
    return obj;
}

inline auto to_json(const protocol_compliance_result& result) -> boost::json::object {
    boost::json::object obj;
    obj["success"] = result.success;
    obj["skipped"] = result.skipped;
    obj["supported_capabilities"] = detail::string_array(result.supported_capabilities);
    obj["missing_capabilities"] = detail::string_array(result.missing_capabilities);
    obj["advertised_capabilities"] = detail::string_array(result.advertised_capabilities);
    if (result.protocol_version) {
        obj["protocol_version"] = *result.protocol_version;
    } else {
        obj["protocol_version"] = nullptr;
    }
    obj["errors"] = detail::string_array(result.errors);
    return obj;
}

inline auto to_json(const functionality_test_result& result) -> boost::json::object {
    boost::json::object obj;
    obj["success"] = result.success;
    obj["skipped"] = result.skipped;
    obj["tested_tools"] = detail::bool_map(result.tested_tools);
    obj["tested_resources"] = detail::bool_map(result.tested_resources);
    obj["tested_prompts"] = detail::bool_map(result.tested_prompts);
    obj["errors"] = detail::string_array(result.errors);
    obj["performance_metrics"] = detail::number_map(result.performance_metrics);
    return obj;
}

inline auto to_json(const validation_report& report) -> boost::json::object {
    boost::json::object obj;
    obj["project_path"] = report.project_path;
    obj["validation_level"] = std::string(to_string(report.level));
    obj["overall_success"] = report.overall_success;
    obj["startup_result"] = to_json(report.startup_result);
    obj["protocol_result"] = to_json(report.protocol_result);
    obj["functionality_result"] = to_json(report.functionality_result);
    obj["performance_metrics"] = detail::number_map(report.performance_metrics);
    obj["recommendations"] = detail::string_array(report.recommendations);
    obj["timestamp"] = report.timestamp;
    obj["total_execution_time_ms"] = report.total_execution_time.count();
    return obj;
}

//=============================================================================
// Comprehensive testing
//=============================================================================

inline auto to_json(const performance_benchmark& benchmark) -> boost::json::object {
    boost::json::object obj;
    obj["operation_name"] = benchmark.operation_name;
    obj["total_requests"] = benchmark.total_requests;
    obj["successful_requests"] = benchmark.successful_requests;
    obj["failed_requests"] = benchmark.failed_requests;
    obj["min_response_time_ms"] = benchmark.min_response_time.count();
    obj["average_response_time_ms"] = benchmark.average_response_time.count();
    obj["max_response_time_ms"] = benchmark.max_response_time.count();
    obj["percentile_95_response_time_ms"] = benchmark.percentile_95_response_time.count();
    obj["nearest_rank_95_response_time_ms"] = benchmark.nearest_rank_95_response_time.count();
    obj["requests_per_second"] = benchmark.requests_per_second;
    obj["error_rate"] = benchmark.error_rate;
    obj["memory_usage_mb"] = detail::optional_number(benchmark.memory_usage_mb);
    obj["cpu_usage_percent"] = detail::optional_number(benchmark.cpu_usage_percent);
    return obj;
}

inline auto to_json(const integration_test_result& result) -> boost::json::object {
    boost::json::object obj;
    obj["client_name"] = result.client_name;
    obj["connection_successful"] = result.connection_successful;
    obj["handshake_time_ms"] = result.handshake_time.count();
    obj["supported_features"] = detail::string_array(result.supported_features);
    obj["failed_features"] = detail::string_array(result.failed_features);
    obj["compatibility_score"] = result.compatibility_score;
    obj["errors"] = detail::string_array(result.errors);
    return obj;
}

inline auto to_json(const load_test_result& result) -> boost::json::object {
    boost::json::object obj;
    obj["concurrent_users"] = result.concurrent_users;
    obj["total_requests"] = result.total_requests;
    obj["successful_requests"] = result.successful_requests;
    obj["failed_requests"] = result.failed_requests;
    obj["error_rate"] = result.error_rate;
    obj["requests_per_second"] = result.requests_per_second;
    obj["average_response_time_ms"] = result.average_response_time.count();
    obj["max_response_time_ms"] = result.max_response_time.count();
    obj["test_duration_ms"] = result.test_duration.count();
    obj["memory_before_mb"] = detail::optional_number(result.memory_before_mb);
    obj["memory_after_mb"] = detail::optional_number(result.memory_after_mb);
    obj["cpu_usage_percent"] = detail::optional_number(result.cpu_usage_percent);
    obj["errors"] = detail::string_array(result.errors);
    return obj;
}

inline auto to_json(const security_issue& issue) -> boost::json::object {
    boost::json::object obj;
    obj["category"] = std::string(to_string(issue.category));
    obj["type"] = issue.type;
    obj["file"] = issue.file;
    obj["line"] = issue.line;
    obj["description"] = issue.description;
    obj["severity"] = std::string(to_string(issue.severity));
    return obj;
}

inline auto to_json(const severity_counts& counts) -> boost::json::object {
    boost::json::object obj;
    obj["critical_issues"] = counts.critical;
    obj["high_issues"] = counts.high;
    obj["medium_issues"] = counts.medium;
    obj["low_issues"] = counts.low;
    obj["total_issues"] = counts.total();
    return obj;
}

inline auto to_json(const security_scan_result& result) -> boost::json::object {
    auto obj = to_json(result.counts);
    boost::json::array issues;
    for (const auto& issue : result.issues) {
        issues.emplace_back(to_json(issue));
    }
    obj["issues"] = std::move(issues);
    obj["recommendations"] = detail::string_array(result.recommendations);
    obj["warnings"] = detail::string_array(result.warnings);
    obj["scanned_files"] = result.scanned_files;
    return obj;
}

inline auto to_json(const comprehensive_test_report& report) -> boost::json::object {
    boost::json::object obj;
    obj["project_path"] = report.project_path;
    obj["timestamp"] = report.timestamp;
    obj["overall_success"] = report.overall_success;
    obj["basic_validation"] = to_json(report.basic_validation);

    boost::json::array benchmarks;
    for (const auto& benchmark : report.performance_benchmarks) {
        benchmarks.emplace_back(to_json(benchmark));
    }
    obj["performance_benchmarks"] = std::move(benchmarks);

    boost::json::array integration;
    for (const auto& result : report.integration_results) {
        integration.emplace_back(to_json(result));
    }
    obj["integration_results"] = std::move(integration);

    boost::json::object load;
    for (const auto& [key, result] : report.load_test_results) {
        load[key] = to_json(result);
    }
    obj["load_test_results"] = std::move(load);

    boost::json::object security;
    for (const auto& [category, result] : report.security_scan_results) {
        security[std::string(to_string(category))] = to_json(result);
    }
    security["totals"] = to_json(total_counts(report.security_scan_results));
    obj["security_scan_results"] = std::move(security);

    obj["recommendations"] = detail::string_array(report.recommendations);
    if (report.skipped_reason) {
        obj["skipped_reason"] = *report.skipped_reason;
    } else {
        obj["skipped_reason"] = nullptr;
    }
    boost::json::object section_errors;
    for (const auto& [section, error] : report.section_errors) {
        section_errors[section] = error;
    }
    obj["section_errors"] = std::move(section_errors);
    obj["abandoned_sections"] = detail::string_array(report.abandoned_sections);
    obj["total_test_duration_ms"] = report.total_test_duration.count();
    return obj;
}

//=============================================================================
// Text summaries
//=============================================================================

inline auto format_summary(const validation_report& report) -> std::string {
    auto status = [](bool passed, bool skipped) -> std::string {
        if (skipped) {
            return "SKIPPED";
        }
        return passed ? "PASS" : "FAIL";
    };

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "Validation of " << report.project_path << " (" << to_string(report.level) << ")\n";
    out << "  Startup:       " << status(report.startup_result.success, false)
        << " (" << report.startup_result.startup_time.count() << " ms)\n";
    out << "  Protocol:      " << status(report.protocol_result.success, report.protocol_result.skipped) << "\n";
    out << "  Functionality: "
        << status(report.functionality_result.success, report.functionality_result.skipped)
        << " (" << report.functionality_result.total_tested() << " items tested)\n";

    for (const auto* errors : {&report.startup_result.errors,
                               &report.protocol_result.errors,
                               &report.functionality_result.errors}) {
        for (const auto& error : *errors) {
            out << "    - " << error << "\n";
        }
    }
    out << "  Overall:       " << (report.overall_success ? "PASS" : "FAIL") << "\n";
    return out.str();
}

inline auto format_summary(const comprehensive_test_report& report) -> std::string {
    std::ostringstream out;
    out << format_summary(report.basic_validation);
    out << std::fixed << std::setprecision(1);

    if (report.skipped_reason) {
        out << "Comprehensive tests skipped: " << *report.skipped_reason << "\n";
    }
    for (const auto& [section, error] : report.section_errors) {
        out << "Section " << section << " failed: " << error << "\n";
    }
    if (!report.abandoned_sections.empty()) {
        out << "Sections not run:";
        for (const auto& section : report.abandoned_sections) {
            out << " " << section;
        }
        out << "\n";
    }

    if (!report.performance_benchmarks.empty()) {
        out << "Performance benchmarks:\n";
        for (const auto& benchmark : report.performance_benchmarks) {
            out << "  " << benchmark.operation_name
                << ": avg " << benchmark.average_response_time.count() << " ms"
                << ", p95 " << benchmark.percentile_95_response_time.count() << " ms"
                << ", " << benchmark.requests_per_second << " req/s"
                << ", error rate " << benchmark.error_rate * 100.0 << "%\n";
        }
    }

    if (!report.integration_results.empty()) {
        out << "Client integration:\n";
        for (const auto& result : report.integration_results) {
            out << "  " << result.client_name << ": " << result.compatibility_score * 100.0 << "% compatible"
                << (result.connection_successful ? "" : " (connection failed)") << "\n";
        }
    }

    if (!report.load_test_results.empty()) {
        out << "Load testing:\n";
        for (const auto& [key, result] : report.load_test_results) {
            out << "  " << result.concurrent_users << " users: "
                << result.successful_requests << "/" << result.total_requests << " succeeded"
                << ", " << result.requests_per_second << " req/s"
                << ", error rate " << result.error_rate * 100.0 << "%\n";
        }
    }

    if (!report.security_scan_results.empty()) {
        auto totals = total_counts(report.security_scan_results);
        out << "Security scan: " << totals.critical << " critical, " << totals.high << " high, "
            << totals.medium << " medium, " << totals.low << " low\n";
    }

    if (!report.recommendations.empty()) {
        out << "Recommendations:\n";
        for (const auto& recommendation : report.recommendations) {
            out << "  - " << recommendation << "\n";
        }
    }

    out << "Overall: " << (report.overall_success ? "PASS" : "FAIL")
        << " in " << report.total_test_duration.count() << " ms\n";
    return out.str();
}

} // namespace kestrel
