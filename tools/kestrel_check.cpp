#include <kestrel/comprehensive_tester.hpp>
#include <kestrel/config.hpp>
#include <kestrel/console_logger.hpp>
#include <kestrel/exceptions.hpp>
#include <kestrel/process.hpp>
#include <kestrel/progress.hpp>
#include <kestrel/recovery.hpp>
#include <kestrel/report_json.hpp>
#include <kestrel/validation_engine.hpp>

#include <boost/json.hpp>
#include <folly/init/Init.h>
#include <gflags/gflags.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

DEFINE_string(level, "standard", "Validation level: basic, standard or comprehensive");
DEFINE_int32(max_workers, 0, "Worker threads for load testing (0 keeps the configured value)");
DEFINE_int32(timeout, 0, "Per-call timeout in milliseconds (0 keeps the configured value)");
DEFINE_string(output_format, "text", "Report format: text or json");
DEFINE_string(output_file, "", "Write the report here instead of stdout");
DEFINE_string(entry_command, "", "Command that starts the server, overriding detection");
DEFINE_string(config, "", "JSON configuration file");
DEFINE_bool(skip_performance, false, "Skip performance benchmarks");
DEFINE_bool(skip_integration, false, "Skip client integration tests");
DEFINE_bool(skip_load_testing, false, "Skip load testing");
DEFINE_bool(skip_security, false, "Skip the security scan");
DEFINE_bool(basic_only, false, "Run basic validation only");
DEFINE_bool(verbose, false, "Log debug output");

namespace {
    constexpr int exit_success = 0;
    constexpr int exit_failure = 1;
    constexpr int exit_usage = 2;

    using cli_types = kestrel::default_engine_types;

    // Command-line flags override the file configuration
    auto build_config() -> kestrel::kestrel_config {
        auto config = FLAGS_config.empty() ? kestrel::kestrel_config{} : kestrel::load_config(FLAGS_config);

        config.engine.level = kestrel::parse_validation_level(FLAGS_level);
        if (FLAGS_timeout < 0) {
            throw kestrel::configuration_error("--timeout must not be negative");
        }
        if (FLAGS_timeout > 0) {
            config.engine.call_timeout = std::chrono::milliseconds{FLAGS_timeout};
        }
        if (FLAGS_max_workers < 0) {
            throw kestrel::configuration_error("--max_workers must not be negative");
        }
        if (FLAGS_max_workers > 0) {
            config.tester.max_workers = static_cast<std::size_t>(FLAGS_max_workers);
        }
        if (!FLAGS_entry_command.empty()) {
            config.engine.entry_command = FLAGS_entry_command;
        }
        if (FLAGS_output_format != "text" && FLAGS_output_format != "json") {
            throw kestrel::configuration_error("--output_format must be text or json");
        }

        config.tester.run_performance = config.tester.run_performance && !FLAGS_skip_performance;
        config.tester.run_integration = config.tester.run_integration && !FLAGS_skip_integration;
        config.tester.run_load = config.tester.run_load && !FLAGS_skip_load_testing;
        config.tester.run_security = config.tester.run_security && !FLAGS_skip_security;

        kestrel::validate_engine_config(config.engine);
        kestrel::validate_tester_config(config.tester);
        return config;
    }

    auto emit(const std::string& text) -> bool {
        if (FLAGS_output_file.empty()) {
            std::cout << text;
            if (!text.empty() && text.back() != '\n') {
                std::cout << "\n";
            }
            return true;
        }
        std::ofstream out(FLAGS_output_file);
        if (!out) {
            std::cerr << "Cannot write report to " << FLAGS_output_file << "\n";
            return false;
        }
        out << text << "\n";
        return static_cast<bool>(out);
    }

    template<typename Report>
    auto render(const Report& report) -> std::string {
        if (FLAGS_output_format == "json") {
            return boost::json::serialize(kestrel::to_json(report));
        }
        return kestrel::format_summary(report);
    }
}

auto main(int argc, char* argv[]) -> int {
    gflags::SetUsageMessage("kestrel_check [flags] <project_path>");
    folly::Init init(&argc, &argv);

    if (argc != 2) {
        std::cerr << "Usage: kestrel_check [flags] <project_path>\n";
        return exit_usage;
    }
    const std::filesystem::path project = argv[1];

    kestrel::kestrel_config config;
    try {
        config = build_config();
    } catch (const kestrel::configuration_error& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return exit_usage;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(project, ec)) {
        std::cerr << "Project directory does not exist: " << project.string() << "\n";
        return exit_usage;
    }

    // JSON on stdout must stay parseable; only errors reach the console then
    auto min_level = FLAGS_verbose ? kestrel::log_level::debug : kestrel::log_level::info;
    if (FLAGS_output_format == "json" && FLAGS_output_file.empty()) {
        min_level = kestrel::log_level::error;
    }
    kestrel::console_logger logger(min_level);
    kestrel::logging_progress_reporter<kestrel::console_logger> progress(logger);
    auto recovery = kestrel::recovery_table::defaults();
    kestrel::recovery_error_handler errors(recovery);
    kestrel::process_registry registry;

    try {
        if (FLAGS_basic_only) {
            kestrel::validation_engine<cli_types> engine(config.engine, registry, logger, progress, errors);
            auto report = engine.validate(project);
            registry.terminate_all(config.engine.stop_grace_period);
            if (!emit(render(report))) {
                return exit_failure;
            }
            return report.overall_success ? exit_success : exit_failure;
        }

        kestrel::comprehensive_tester<cli_types> tester(
            config.engine, config.tester, registry, logger, progress, errors);
        auto report = tester.run(project);
        if (!emit(render(report))) {
            return exit_failure;
        }
        return report.overall_success ? exit_success : exit_failure;
    } catch (const kestrel::configuration_error& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        registry.terminate_all(config.engine.stop_grace_period);
        return exit_usage;
    } catch (const std::exception& e) {
        logger.critical(e.what());
        registry.terminate_all(config.engine.stop_grace_period);
        return exit_failure;
    }
}
