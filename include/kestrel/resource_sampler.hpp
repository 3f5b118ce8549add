#pragma once

#include <kestrel/exceptions.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace kestrel {

// One reading of a process's resident memory and accumulated CPU time
struct resource_sample {
    double memory_mb{0.0};
    double cpu_seconds{0.0};
    std::chrono::steady_clock::time_point taken_at;
};

/**
 * @brief Read memory and CPU usage of @p pid from /proc
 *
 * @throws resource_sample_error when the process is gone or /proc is unreadable
 */
inline auto sample_process(pid_t pid) -> resource_sample {
    const auto base = "/proc/" + std::to_string(pid);
    resource_sample sample;
    sample.taken_at = std::chrono::steady_clock::now();

    std::ifstream status(base + "/status");
    if (!status) {
        throw resource_sample_error("Cannot open " + base + "/status");
    }

    bool found_rss = false;
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream fields(line.substr(6));
            std::uint64_t kilobytes = 0;
            if (!(fields >> kilobytes)) {
                throw resource_sample_error("Malformed VmRSS line for pid " + std::to_string(pid));
            }
            sample.memory_mb = static_cast<double>(kilobytes) / 1024.0;
            found_rss = true;
            break;
        }
    }
    if (!found_rss) {
        // Zombies have no VmRSS
        throw resource_sample_error("No resident memory reported for pid " + std::to_string(pid));
    }

    std::ifstream stat(base + "/stat");
    std::string stat_line;
    if (!stat || !std::getline(stat, stat_line)) {
        throw resource_sample_error("Cannot read " + base + "/stat");
    }

    // The command name may contain spaces; fields resume after the last ')'
    auto rparen = stat_line.rfind(')');
    if (rparen == std::string::npos) {
        throw resource_sample_error("Malformed stat line for pid " + std::to_string(pid));
    }
    std::istringstream rest(stat_line.substr(rparen + 1));
    std::vector<std::string> fields;
    std::string field;
    while (rest >> field) {
        fields.push_back(field);
    }
    // fields[0] is the state (field 3); utime and stime are fields 14 and 15
    if (fields.size() < 13) {
        throw resource_sample_error("Truncated stat line for pid " + std::to_string(pid));
    }

    auto ticks_per_second = ::sysconf(_SC_CLK_TCK);
    if (ticks_per_second <= 0) {
        throw resource_sample_error("Cannot determine clock tick rate");
    }
    auto utime = std::stoull(fields[11]);
    auto stime = std::stoull(fields[12]);
    sample.cpu_seconds = static_cast<double>(utime + stime) / static_cast<double>(ticks_per_second);
    return sample;
}

// Sampling failures yield std::nullopt; the caller reports null resource fields
inline auto try_sample_process(pid_t pid) -> std::optional<resource_sample> {
    try {
        return sample_process(pid);
    } catch (const resource_sample_error&) {
        return std::nullopt;
    } catch (const std::logic_error&) {
        // std::stoull on a non-numeric field
        return std::nullopt;
    }
}

// CPU usage between two samples as a percentage of one core
inline auto cpu_percent_between(const resource_sample& before, const resource_sample& after) -> double {
    auto wall = std::chrono::duration<double>(after.taken_at - before.taken_at).count();
    if (wall <= 0.0) {
        return 0.0;
    }
    auto used = after.cpu_seconds - before.cpu_seconds;
    return used > 0.0 ? used / wall * 100.0 : 0.0;
}

} // namespace kestrel
