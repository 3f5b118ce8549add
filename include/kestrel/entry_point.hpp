#pragma once

#include <kestrel/process.hpp>

#include <boost/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace kestrel {

namespace detail {

inline auto read_package_manifest(const std::filesystem::path& path) -> std::optional<boost::json::object> {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    boost::json::error_code ec;
    auto parsed = boost::json::parse(buffer.str(), ec);
    if (ec || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed.as_object();
}

} // namespace detail

/**
 * @brief Work out how to start the server in @p project_path
 *
 * An explicit override always wins. Otherwise, in order: a Python main module
 * (main.py, server.py, app.py), a package.json start script or main field, a
 * pyproject.toml. Returns std::nullopt when nothing is recognised.
 *
 * @throws configuration_error when the override cannot be tokenised
 */
inline auto detect_entry_command(const std::filesystem::path& project_path,
                                 std::string_view override_command = {}) -> std::optional<entry_command> {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (!override_command.empty()) {
        return parse_command(override_command);
    }

    for (std::string_view module : {"main.py", "server.py", "app.py"}) {
        if (fs::is_regular_file(project_path / module, ec)) {
            return entry_command{{"python3", std::string(module)}};
        }
    }

    auto package_json = project_path / "package.json";
    if (fs::is_regular_file(package_json, ec)) {
        if (auto manifest = detail::read_package_manifest(package_json)) {
            if (const auto* scripts = manifest->if_contains("scripts");
                scripts != nullptr && scripts->is_object() && scripts->as_object().contains("start")) {
                return entry_command{{"npm", "start"}};
            }
            if (const auto* main = manifest->if_contains("main"); main != nullptr && main->is_string()) {
                return entry_command{{"node", std::string(main->as_string())}};
            }
        }
    }

    if (fs::is_regular_file(project_path / "pyproject.toml", ec)) {
        return entry_command{{"poetry", "run", "python", "-m", "server"}};
    }

    return std::nullopt;
}

} // namespace kestrel
