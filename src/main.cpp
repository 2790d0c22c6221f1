#include <iostream>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "mqm_collector/collector.h"
#include "mqm_collector/config.h"
#include "mqm_collector/errors.h"
#include "mqm_collector/json_emitter.h"

using mqm_collector::StatusKind;

// Logs never go to stdout: the agent parses stdout as the collector payload
static void setup_logger(const std::string& level, const std::string& format,
                         bool verbose, const std::string& output_file) {
    spdlog::level::level_enum lvl = spdlog::level::warn;
    if (verbose)                 lvl = spdlog::level::debug;
    else if (level == "debug")   lvl = spdlog::level::debug;
    else if (level == "info")    lvl = spdlog::level::info;
    else if (level == "error")   lvl = spdlog::level::err;
    else if (level == "trace")   lvl = spdlog::level::trace;

    std::shared_ptr<spdlog::logger> logger;
    if (!output_file.empty()) {
        try {
            logger = spdlog::basic_logger_mt("mqm", output_file);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << output_file << ": " << e.what() << "\n";
        }
    }
    if (!logger) {
        logger = spdlog::stderr_color_mt("mqm");
    }

    logger->set_level(lvl);

    if (format == "json") {
        logger->set_pattern("{\"time\":\"%Y-%m-%dT%H:%M:%S%z\",\"level\":\"%l\",\"msg\":\"%v\"}");
    } else {
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    }

    spdlog::set_default_logger(logger);
    spdlog::set_level(lvl);
}

struct CliOverrides {
    std::string config_file;
    std::string registry;
    std::string mqm_path;
    std::string service_user;
    std::string log_level;
    std::string log_format;
    bool        verbose{false};
    bool        include_system{false};
};

static mqm_collector::Config load(const CliOverrides& cli) {
    auto cfg = mqm_collector::load_config(cli.config_file);

    // Override config with CLI flags
    if (!cli.registry.empty())     cfg.registry.path = cli.registry;
    if (!cli.mqm_path.empty())     cfg.mq.mqm_path = cli.mqm_path;
    if (!cli.service_user.empty()) cfg.mq.service_user = cli.service_user;
    if (!cli.log_level.empty())    cfg.logging.level = cli.log_level;
    if (!cli.log_format.empty())   cfg.logging.format = cli.log_format;
    if (cli.verbose)               cfg.logging.verbose = true;
    if (cli.include_system)        cfg.collector.include_system = true;

    cfg.validate();
    return cfg;
}

static int run_collector(StatusKind kind, const CliOverrides& cli) {
    mqm_collector::Config cfg;
    try {
        cfg = load(cli);
    } catch (const mqm_collector::CollectorError& e) {
        setup_logger("warn", "text", cli.verbose, "");
        spdlog::error("Failed to load configuration: {}", e.what());
        std::cout << mqm_collector::error_json(e.what()) << std::endl;
        return e.exit_code();
    }

    setup_logger(cfg.logging.level, cfg.logging.format, cfg.logging.verbose, cfg.logging.output_file);
    spdlog::debug("IBM MQ Status Collector v{} ({})", PROJECT_VERSION,
                  mqm_collector::status_kind_name(kind));

    mqm_collector::Collector collector(cfg);
    auto result = collector.run(kind);
    std::cout << result.payload << std::endl;
    return result.exit_code;
}

static void print_version() {
    std::cout << "IBM MQ Status Collector\n"
              << "Version: " << PROJECT_VERSION << "\n"
              << "Language: C++20\n";
}

static int validate_config(const std::string& config_file) {
    setup_logger("info", "text", false, "");

    if (config_file.empty()) {
        spdlog::error("Configuration file path is required");
        return 1;
    }

    try {
        auto cfg = mqm_collector::load_config(config_file);
        cfg.validate();
    } catch (const std::exception& e) {
        spdlog::error("Validation failed: {}", e.what());
        return 1;
    }

    std::cout << "Configuration file '" << config_file << "' is valid\n";
    return 0;
}

int main(int argc, char** argv) {
    CLI::App app{"IBM MQ status collector for Zabbix"};
    app.set_version_flag("--version", std::string(PROJECT_VERSION));

    // Global flags
    CliOverrides cli;
    app.add_option("-c,--config", cli.config_file, "Configuration file path");
    app.add_option("--registry", cli.registry, "Queue manager registry (cache) file");
    app.add_option("--mqm-path", cli.mqm_path, "Directory holding the IBM MQ tools");
    app.add_option("--service-user", cli.service_user, "Identity the MQ tools must run as");
    app.add_flag("-v,--verbose", cli.verbose, "Enable debug logging on stderr");
    app.add_option("--log-level", cli.log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--log-format", cli.log_format, "Log format (json, text)");

    // Collector subcommands
    auto* mgr_cmd = app.add_subcommand("manager", "Queue manager status (refreshes the registry)");
    auto* csv_cmd = app.add_subcommand("command-server", "Command server status per active queue manager");
    auto* dlq_cmd = app.add_subcommand("dead-letter", "Dead-letter queue depth per active queue manager");
    auto* age_cmd = app.add_subcommand("oldest-message", "Oldest message age per queue");
    age_cmd->add_flag("--include-system", cli.include_system,
                      "Include SYSTEM.* queues and the dead-letter queue");
    auto* lst_cmd = app.add_subcommand("listener", "Listener count and names per active queue manager");

    auto* ver_cmd = app.add_subcommand("version", "Print version information");

    auto* cfg_cmd = app.add_subcommand("config", "Configuration management");
    auto* gen_cmd = cfg_cmd->add_subcommand("generate", "Generate sample configuration");
    auto* val_cmd = cfg_cmd->add_subcommand("validate", "Validate configuration file");
    std::string val_config;
    val_cmd->add_option("-c,--config", val_config, "Configuration file path");
    cfg_cmd->require_subcommand(1);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    if (ver_cmd->parsed()) {
        print_version();
        return 0;
    }
    if (gen_cmd->parsed()) {
        std::cout << mqm_collector::render_config(mqm_collector::default_config());
        return 0;
    }
    if (val_cmd->parsed()) {
        return validate_config(val_config.empty() ? cli.config_file : val_config);
    }

    if (mgr_cmd->parsed()) return run_collector(StatusKind::Manager, cli);
    if (csv_cmd->parsed()) return run_collector(StatusKind::CommandServer, cli);
    if (dlq_cmd->parsed()) return run_collector(StatusKind::DeadLetter, cli);
    if (age_cmd->parsed()) return run_collector(StatusKind::OldestMessage, cli);
    if (lst_cmd->parsed()) return run_collector(StatusKind::Listener, cli);

    return 0;
}
