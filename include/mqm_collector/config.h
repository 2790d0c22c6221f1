#pragma once

#include <string>

namespace mqm_collector {

struct RegistryConfig {
    std::string path{"/opt/zabbix/logs/queue_manager_cache.json"};

    // Directory holding the registry; the manager collector must be able to write here
    [[nodiscard]] std::string directory() const;
};

struct MQConfig {
    std::string mqm_path{"/opt/mqm/bin"};
    std::string service_user{"mqm"};

    [[nodiscard]] std::string tool_path(const std::string& tool) const;
};

struct CollectorConfig {
    bool include_system{false};
};

struct LoggingConfig {
    std::string level{"warn"};
    std::string format{"text"};
    std::string output_file;
    bool        verbose{false};
};

struct Config {
    RegistryConfig  registry;
    MQConfig        mq;
    CollectorConfig collector;
    LoggingConfig   logging;

    [[nodiscard]] std::string to_string() const;
    void validate() const; // throws CollectorError(ConfigurationError) on failure
};

// Load configuration from YAML file, environment variables, and defaults
Config load_config(const std::string& config_path);

// Return a default configuration
Config default_config();

// Render a configuration as YAML (used by "config generate")
std::string render_config(const Config& cfg);

} // namespace mqm_collector
