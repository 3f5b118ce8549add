#pragma once

#include <kestrel/exceptions.hpp>
#include <kestrel/types.hpp>

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace kestrel {

namespace security_issue_types {
    inline constexpr std::string_view dependency = "dependency_vulnerability";
    inline constexpr std::string_view code = "code_security";
    inline constexpr std::string_view configuration = "configuration_security";
}

// A package whose releases below fixed_version carry a known vulnerability
struct vulnerable_package {
    std::string name;
    std::string fixed_version;
    severity_level severity;
    std::string description;
};

inline auto python_vulnerable_packages() -> const std::vector<vulnerable_package>& {
    static const std::vector<vulnerable_package> table{
        {"requests", "2.20.0", severity_level::medium, "Outdated requests library with known vulnerabilities"},
        {"flask", "1.0", severity_level::high, "Outdated Flask version with security issues"},
        {"django", "3.2", severity_level::high, "Outdated Django version with security vulnerabilities"},
        {"pyyaml", "5.4", severity_level::medium, "PyYAML version vulnerable to code execution"},
    };
    return table;
}

inline auto node_vulnerable_packages() -> const std::vector<vulnerable_package>& {
    static const std::vector<vulnerable_package> table{
        {"lodash", "4.17.21", severity_level::medium, "Outdated lodash version vulnerable to prototype pollution"},
    };
    return table;
}

struct code_pattern {
    std::regex matcher;
    severity_level severity;
    std::string description;
};

inline auto make_pattern(const char* expression, severity_level severity, std::string description) -> code_pattern {
    return code_pattern{
        std::regex(expression, std::regex::ECMAScript | std::regex::icase),
        severity,
        std::move(description)
    };
}

inline auto python_code_patterns() -> const std::vector<code_pattern>& {
    static const std::vector<code_pattern> table{
        make_pattern(R"(eval\s*\()", severity_level::critical, "Use of eval() function - code injection risk"),
        make_pattern(R"(exec\s*\()", severity_level::critical, "Use of exec() function - code injection risk"),
        make_pattern(R"(subprocess\.(call|run|Popen|check_call|check_output)\s*\(.*shell\s*=\s*True)",
                     severity_level::high, "Shell injection vulnerability"),
        make_pattern(R"(os\.system\s*\()", severity_level::high, "Command injection vulnerability"),
        make_pattern(R"(pickle\.loads?\s*\()", severity_level::high, "Unsafe pickle deserialization"),
        make_pattern(R"(yaml\.load\s*\()", severity_level::medium, "Unsafe YAML loading - use safe_load"),
        make_pattern(R"(\binput\s*\(.*\))", severity_level::low, "Use of input() function in Python 2 style"),
        make_pattern(R"(password\s*=\s*['"][^'"]+['"])", severity_level::medium, "Hardcoded password detected"),
        make_pattern(R"(api_key\s*=\s*['"][^'"]+['"])", severity_level::medium, "Hardcoded API key detected"),
        make_pattern(R"(secret\s*=\s*['"][^'"]+['"])", severity_level::medium, "Hardcoded secret detected"),
    };
    return table;
}

inline auto script_code_patterns() -> const std::vector<code_pattern>& {
    static const std::vector<code_pattern> table{
        make_pattern(R"(eval\s*\()", severity_level::critical, "Use of eval() - code injection risk"),
        make_pattern(R"(innerHTML\s*=)", severity_level::medium, "Potential XSS vulnerability with innerHTML"),
        make_pattern(R"(document\.write\s*\()", severity_level::medium, "Use of document.write - XSS risk"),
        make_pattern(R"(\.exec\s*\()", severity_level::high, "Command execution detected"),
        make_pattern(R"(password\s*[:=]\s*['"][^'"]+['"])", severity_level::medium, "Hardcoded password detected"),
    };
    return table;
}

struct sensitive_file {
    std::string name;
    severity_level severity;
    std::string description;
};

inline auto sensitive_files() -> const std::vector<sensitive_file>& {
    static const std::vector<sensitive_file> table{
        {".env", severity_level::high, "Environment file with potential secrets"},
        {".env.local", severity_level::high, "Local environment file with potential secrets"},
        {"config.json", severity_level::medium, "Configuration file that may contain secrets"},
        {"secrets.json", severity_level::critical, "Secrets file detected"},
        {"private.key", severity_level::critical, "Private key file detected"},
        {"id_rsa", severity_level::critical, "SSH private key detected"},
    };
    return table;
}

inline auto required_gitignore_entries() -> const std::vector<std::string>& {
    static const std::vector<std::string> entries{".env", "*.key", "secrets.*", "config.json"};
    return entries;
}

namespace detail {

// Lines longer than this are skipped; minified bundles make std::regex recurse too deeply
inline constexpr std::size_t max_scanned_line_length = 4096;

inline auto is_skipped_directory(const std::filesystem::path& dir) -> bool {
    static const std::set<std::string> skipped{".git", "node_modules", "venv", ".venv", "__pycache__"};
    return skipped.contains(dir.filename().string());
}

inline auto display_path(const std::filesystem::path& root, const std::filesystem::path& file) -> std::string {
    auto relative = file.lexically_relative(root);
    return relative.empty() ? file.generic_string() : relative.generic_string();
}

/**
 * @brief Regular files under @p root with one of @p extensions, sorted
 *
 * Vendor and VCS directories are not descended into. Directories that cannot
 * be listed are reported through @p warnings.
 */
inline auto collect_files(const std::filesystem::path& root,
                          const std::set<std::string>& extensions,
                          std::vector<std::string>& warnings) -> std::vector<std::filesystem::path> {
    namespace fs = std::filesystem;
    std::vector<fs::path> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        warnings.push_back("Cannot list " + root.string() + ": " + ec.message());
        return files;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            if (is_skipped_directory(it->path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(type_ec) && extensions.contains(it->path().extension().string())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        warnings.push_back("Directory walk under " + root.string() + " stopped: " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

/**
 * @brief Whole file as text
 *
 * @throws scan_io_error if the file cannot be opened or read
 */
inline auto read_text(const std::filesystem::path& file) -> std::string {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw scan_io_error(file.string(), "Cannot open " + file.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw scan_io_error(file.string(), "Read failed for " + file.string());
    }
    return content.str();
}

inline auto split_lines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

inline auto add_issue(security_scan_result& result, std::string_view type, std::string file,
                      std::size_t line, std::string description, severity_level severity) -> void {
    result.issues.push_back(security_issue{
        result.category,
        std::string(type),
        std::move(file),
        line,
        std::move(description),
        severity
    });
    result.counts.add(severity);
}

} // namespace detail

/**
 * @brief Three-way numeric version comparison; "1.2" == "1.2.0"
 *
 * Non-numeric suffixes within a component ("0rc1") are ignored past the
 * leading digits.
 */
inline auto compare_versions(std::string_view lhs, std::string_view rhs) -> int {
    auto components = [](std::string_view text) {
        std::vector<unsigned long> parts;
        std::size_t pos = 0;
        while (pos <= text.size()) {
            auto dot = text.find('.', pos);
            auto piece = text.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
            unsigned long value = 0;
            for (char c : piece) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    break;
                }
                value = value * 10 + static_cast<unsigned long>(c - '0');
            }
            parts.push_back(value);
            if (dot == std::string_view::npos) {
                break;
            }
            pos = dot + 1;
        }
        return parts;
    };

    auto a = components(lhs);
    auto b = components(rhs);
    auto n = std::max(a.size(), b.size());
    a.resize(n, 0);
    b.resize(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) {
            return a[i] < b[i] ? -1 : 1;
        }
    }
    return 0;
}

/**
 * @brief Does a dependency declared with @p version_spec fall in the vulnerable range?
 *
 * The first version number in the specifier is taken as the declared version. A
 * declaration with no version at all is treated as vulnerable since nothing
 * rules the old releases out.
 */
inline auto declared_version_vulnerable(std::string_view version_spec, std::string_view fixed_version) -> bool {
    static const std::regex version_pattern(R"(([0-9]+(\.[0-9]+)*))");
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(version_spec.begin(), version_spec.end(), match, version_pattern)) {
        return true;
    }
    return compare_versions(match.str(1), fixed_version) < 0;
}

// One dependency declared in a Python manifest
struct python_requirement {
    std::size_t line{0};
    // Lowercase, with runs of '-', '_' and '.' folded to '-'
    std::string name;
    std::string specifier;
};

namespace detail {

inline auto normalize_package_name(std::string_view name) -> std::string {
    std::string normalized;
    bool separator = false;
    for (char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            separator = true;
            continue;
        }
        if (separator && !normalized.empty()) {
            normalized += '-';
        }
        separator = false;
        normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return normalized;
}

/**
 * @brief `name[extras] specifier ; markers` as written on a requirements line
 *        or inside a PEP 508 string
 *
 * Environment markers are dropped. A direct URL reference (`name @ url`)
 * declares no version. std::nullopt when the text does not start with a
 * package name (pip options, blank lines).
 */
inline auto parse_requirement(std::string_view text, std::size_t line) -> std::optional<python_requirement> {
    static const std::regex pattern(R"(^\s*([A-Za-z0-9][A-Za-z0-9_.-]*)\s*(\[[^\]]*\])?\s*([^;]*))");
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(text.begin(), text.end(), match, pattern)) {
        return std::nullopt;
    }
    auto specifier = match.str(3);
    if (!specifier.empty() && specifier.front() == '@') {
        specifier.clear();
    }
    return python_requirement{line, normalize_package_name(match.str(1)), std::move(specifier)};
}

// A TOML line split into its string literals and the text around them. Each
// literal is left as an empty "" in the outside text; a '#' outside a string
// ends the line.
struct toml_line {
    std::vector<std::string> strings;
    std::string outside;
};

inline auto split_toml_line(std::string_view line) -> toml_line {
    toml_line split;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '#') {
            break;
        }
        if (c != '"' && c != '\'') {
            split.outside += c;
            continue;
        }
        std::string literal;
        for (++i; i < line.size() && line[i] != c; ++i) {
            if (c == '"' && line[i] == '\\' && i + 1 < line.size()) {
                ++i;
            }
            literal += line[i];
        }
        split.strings.push_back(std::move(literal));
        split.outside += "\"\"";
    }
    return split;
}

inline auto trim(std::string_view text) -> std::string_view {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

inline auto requirements_txt_entries(const std::vector<std::string>& lines) -> std::vector<python_requirement> {
    std::vector<python_requirement> entries;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string_view line = lines[i];
        line = line.substr(0, line.find('#'));
        if (line.size() > max_scanned_line_length) {
            continue;
        }
        if (auto entry = parse_requirement(line, i + 1)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

/**
 * @brief Dependencies declared in pyproject.toml
 *
 * Reads the PEP 621 `dependencies` array of [project], every array of
 * [project.optional-dependencies], and the Poetry dependency tables
 * ([tool.poetry.dependencies], [tool.poetry.dev-dependencies],
 * [tool.poetry.group.<name>.dependencies]). Everything else in the file is
 * ignored.
 */
inline auto pyproject_entries(const std::vector<std::string>& lines) -> std::vector<python_requirement> {
    enum class table { other, project, optional_dependencies, poetry_dependencies };

    static const std::regex key_value(R"(^\s*([A-Za-z0-9_.-]+)\s*=\s*(.*)$)");
    static const std::regex inline_version(R"(version\s*=\s*["']([^"']*)["'])");

    std::vector<python_requirement> entries;
    auto current = table::other;
    bool in_array = false;

    auto take_strings = [&entries](const toml_line& split, std::size_t line) {
        for (const auto& literal : split.strings) {
            if (auto entry = parse_requirement(literal, line)) {
                entries.push_back(std::move(*entry));
            }
        }
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].size() > max_scanned_line_length) {
            continue;
        }
        auto split = split_toml_line(lines[i]);
        auto outside = trim(split.outside);

        if (in_array) {
            take_strings(split, i + 1);
            in_array = outside.find(']') == std::string_view::npos;
            continue;
        }

        if (!outside.empty() && outside.front() == '[') {
            auto header = std::string(trim(outside.substr(1, outside.find(']') - 1)));
            bool poetry_group = header.rfind("tool.poetry.group.", 0) == 0
                                && header.size() > 13
                                && header.compare(header.size() - 13, 13, ".dependencies") == 0;
            if (header == "project") {
                current = table::project;
            } else if (header == "project.optional-dependencies") {
                current = table::optional_dependencies;
            } else if (header == "tool.poetry.dependencies" || header == "tool.poetry.dev-dependencies"
                       || poetry_group) {
                current = table::poetry_dependencies;
            } else {
                current = table::other;
            }
            continue;
        }

        std::string outside_text(outside);
        std::smatch match;
        if (current == table::other || !std::regex_match(outside_text, match, key_value)) {
            continue;
        }
        auto key = match.str(1);
        auto value = match.str(2);

        if (current == table::project || current == table::optional_dependencies) {
            bool array = !value.empty() && value.front() == '[';
            if (array && (current == table::optional_dependencies || key == "dependencies")) {
                take_strings(split, i + 1);
                in_array = value.find(']') == std::string::npos;
            }
            continue;
        }

        if (key == "python") {
            continue;
        }
        std::string specifier;
        if (!value.empty() && value.front() == '"' && !split.strings.empty()) {
            specifier = split.strings.front();
        } else if (!value.empty() && value.front() == '{') {
            std::smatch version;
            if (std::regex_search(lines[i], version, inline_version)) {
                specifier = version.str(1);
            }
        }
        entries.push_back(python_requirement{i + 1, normalize_package_name(key), std::move(specifier)});
    }
    return entries;
}

} // namespace detail

/**
 * @brief Dependency pass: requirements*.txt, pyproject.toml and package.json
 *        at the project root against the vulnerable-package tables
 */
inline auto scan_dependencies(const std::filesystem::path& project) -> security_scan_result {
    namespace fs = std::filesystem;
    security_scan_result result;
    result.category = security_category::dependency;

    std::vector<fs::path> python_manifests;
    std::error_code ec;
    for (fs::directory_iterator it(project, ec), end; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        bool requirements = name.rfind("requirements", 0) == 0 && it->path().extension() == ".txt";
        if (requirements || name == "pyproject.toml") {
            python_manifests.push_back(it->path());
        }
    }
    if (ec) {
        result.warnings.push_back("Cannot list " + project.string() + ": " + ec.message());
    }
    std::sort(python_manifests.begin(), python_manifests.end());

    for (const auto& manifest : python_manifests) {
        std::string text;
        try {
            text = detail::read_text(manifest);
        } catch (const scan_io_error& e) {
            result.warnings.emplace_back(e.what());
            continue;
        }
        ++result.scanned_files;

        auto lines = detail::split_lines(text);
        auto entries = manifest.filename() == "pyproject.toml" ? detail::pyproject_entries(lines)
                                                                : detail::requirements_txt_entries(lines);
        for (const auto& package : python_vulnerable_packages()) {
            for (const auto& entry : entries) {
                if (entry.name != package.name) {
                    continue;
                }
                if (declared_version_vulnerable(entry.specifier, package.fixed_version)) {
                    detail::add_issue(result, security_issue_types::dependency,
                                      detail::display_path(project, manifest), entry.line,
                                      package.description, package.severity);
                }
            }
        }
    }

    auto package_json = project / "package.json";
    if (fs::exists(package_json, ec)) {
        try {
            auto text = detail::read_text(package_json);
            ++result.scanned_files;
            boost::json::error_code parse_ec;
            auto doc = boost::json::parse(text, parse_ec);
            if (parse_ec || !doc.is_object()) {
                result.warnings.push_back("Cannot parse package.json: " + parse_ec.message());
            } else {
                for (const char* section : {"dependencies", "devDependencies"}) {
                    const auto* deps = doc.as_object().if_contains(section);
                    if (!deps || !deps->is_object()) {
                        continue;
                    }
                    for (const auto& package : node_vulnerable_packages()) {
                        const auto* version = deps->as_object().if_contains(package.name);
                        if (!version) {
                            continue;
                        }
                        auto spec = version->is_string() ? std::string(version->as_string()) : std::string{};
                        if (declared_version_vulnerable(spec, package.fixed_version)) {
                            detail::add_issue(result, security_issue_types::dependency, "package.json", 0,
                                              package.description, package.severity);
                        }
                    }
                }
            }
        } catch (const scan_io_error& e) {
            result.warnings.emplace_back(e.what());
        }
    }

    if (result.counts.critical > 0 || result.counts.high > 0) {
        result.recommendations.emplace_back("Update vulnerable dependencies to latest secure versions");
    } else if (result.counts.medium > 0) {
        result.recommendations.emplace_back("Review outdated dependencies and upgrade where possible");
    }
    return result;
}

/**
 * @brief Code pass: every .py, .js and .ts file, line by line, against the
 *        dangerous-pattern tables
 *
 * Every matching pattern on a line is one issue.
 */
inline auto scan_code(const std::filesystem::path& project) -> security_scan_result {
    security_scan_result result;
    result.category = security_category::code;

    auto files = detail::collect_files(project, {".py", ".js", ".ts"}, result.warnings);
    for (const auto& file : files) {
        std::string text;
        try {
            text = detail::read_text(file);
        } catch (const scan_io_error& e) {
            result.warnings.emplace_back(e.what());
            continue;
        }
        ++result.scanned_files;

        const auto& patterns = file.extension() == ".py" ? python_code_patterns() : script_code_patterns();
        auto lines = detail::split_lines(text);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (lines[i].size() > detail::max_scanned_line_length) {
                continue;
            }
            for (const auto& pattern : patterns) {
                if (std::regex_search(lines[i], pattern.matcher)) {
                    detail::add_issue(result, security_issue_types::code, detail::display_path(project, file),
                                      i + 1, pattern.description, pattern.severity);
                }
            }
        }
    }

    if (result.counts.critical > 0) {
        result.recommendations.emplace_back("Fix critical security vulnerabilities immediately");
    }
    if (result.counts.high > 0) {
        result.recommendations.emplace_back("Address high-severity security issues");
    }
    if (result.counts.medium > 0) {
        result.recommendations.emplace_back("Review and fix medium-severity security issues");
    }
    return result;
}

/**
 * @brief Configuration pass: sensitive files at the project root, the
 *        .gitignore, and world-writable scripts
 */
inline auto scan_configuration(const std::filesystem::path& project) -> security_scan_result {
    namespace fs = std::filesystem;
    security_scan_result result;
    result.category = security_category::configuration;

    std::error_code ec;
    for (const auto& file : sensitive_files()) {
        if (fs::exists(project / file.name, ec)) {
            detail::add_issue(result, security_issue_types::configuration, file.name, 0,
                              file.description, file.severity);
        }
    }

    auto gitignore = project / ".gitignore";
    if (fs::exists(gitignore, ec)) {
        try {
            auto lines = detail::split_lines(detail::read_text(gitignore));
            ++result.scanned_files;
            std::set<std::string> entries;
            for (auto& line : lines) {
                auto first = line.find_first_not_of(" \t");
                auto last = line.find_last_not_of(" \t");
                if (first != std::string::npos) {
                    entries.insert(line.substr(first, last - first + 1));
                }
            }
            for (const auto& required : required_gitignore_entries()) {
                if (!entries.contains(required)) {
                    detail::add_issue(result, security_issue_types::configuration, ".gitignore", 0,
                                      "Missing " + required + " in .gitignore", severity_level::low);
                }
            }
        } catch (const scan_io_error& e) {
            result.warnings.emplace_back(e.what());
        }
    } else {
        detail::add_issue(result, security_issue_types::configuration, ".gitignore", 0,
                          "Missing .gitignore file", severity_level::medium);
    }

    for (const auto& script : detail::collect_files(project, {".sh", ".py"}, result.warnings)) {
        std::error_code status_ec;
        auto status = fs::status(script, status_ec);
        if (status_ec) {
            result.warnings.push_back("Cannot stat " + script.string() + ": " + status_ec.message());
            continue;
        }
        if ((status.permissions() & fs::perms::others_write) != fs::perms::none) {
            detail::add_issue(result, security_issue_types::configuration, detail::display_path(project, script),
                              0, "File is world-writable", severity_level::medium);
        }
    }

    if (result.counts.critical > 0 || result.counts.high > 0) {
        result.recommendations.emplace_back("Secure sensitive configuration files and credentials");
    }
    if (result.counts.low > 0) {
        result.recommendations.emplace_back("Add secret-bearing files to .gitignore");
    }
    return result;
}

/**
 * @brief Run all three passes over @p project
 *
 * Reads only; never modifies the tree. Files are visited in sorted order, so
 * an unchanged tree always yields the same issues in the same order.
 *
 * @throws scan_io_error if @p project is not a directory
 */
inline auto scan_project(const std::filesystem::path& project) -> security_scan_map {
    std::error_code ec;
    if (!std::filesystem::is_directory(project, ec)) {
        throw scan_io_error(project.string(), "Project directory does not exist: " + project.string());
    }

    security_scan_map results;
    results.emplace(security_category::dependency, scan_dependencies(project));
    results.emplace(security_category::code, scan_code(project));
    results.emplace(security_category::configuration, scan_configuration(project));
    return results;
}

} // namespace kestrel
