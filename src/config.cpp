#include "mqm_collector/config.h"
#include "mqm_collector/errors.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace mqm_collector {

namespace {
constexpr const char* REGISTRY_FILE_NAME = "queue_manager_cache.json";
}

std::string RegistryConfig::directory() const {
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return ".";
    return parent.string();
}

std::string MQConfig::tool_path(const std::string& tool) const {
    return (std::filesystem::path(mqm_path) / tool).string();
}

Config default_config() {
    Config cfg;
    cfg.registry.path = std::string("/opt/zabbix/logs/") + REGISTRY_FILE_NAME;

    cfg.mq.mqm_path     = "/opt/mqm/bin";
    cfg.mq.service_user = "mqm";

    cfg.collector.include_system = false;

    cfg.logging.level   = "warn";
    cfg.logging.format  = "text";
    cfg.logging.verbose = false;

    return cfg;
}

// Helper to read an env var
static std::string get_env(const char* name) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : std::string{};
}

static bool env_flag(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes";
}

Config load_config(const std::string& config_path) {
    Config cfg = default_config();

    // Try to load YAML file
    std::string path = config_path;
    if (path.empty()) {
        // Search standard locations
        for (const auto& candidate : {"config.yaml", "configs/default.yaml",
                                       "./config/config.yaml"}) {
            std::ifstream f(candidate);
            if (f.good()) { path = candidate; break; }
        }
    }

    if (!path.empty()) {
        try {
            YAML::Node root = YAML::LoadFile(path);
            spdlog::debug("Loaded configuration from {}", path);

            if (auto reg = root["registry"]) {
                if (reg["path"]) cfg.registry.path = reg["path"].as<std::string>(cfg.registry.path);
            }

            if (auto mq = root["mq"]) {
                if (mq["mqm_path"])     cfg.mq.mqm_path     = mq["mqm_path"].as<std::string>(cfg.mq.mqm_path);
                if (mq["service_user"]) cfg.mq.service_user = mq["service_user"].as<std::string>(cfg.mq.service_user);
            }

            if (auto col = root["collector"]) {
                if (col["include_system"]) cfg.collector.include_system = col["include_system"].as<bool>(false);
            }

            if (auto log = root["logging"]) {
                if (log["level"])       cfg.logging.level       = log["level"].as<std::string>("warn");
                if (log["format"])      cfg.logging.format      = log["format"].as<std::string>("text");
                if (log["output_file"]) cfg.logging.output_file = log["output_file"].as<std::string>("");
                if (log["verbose"])     cfg.logging.verbose     = log["verbose"].as<bool>(false);
            }
        } catch (const YAML::Exception& e) {
            throw CollectorError(ErrorKind::ConfigurationError,
                                 "Error reading config file '" + path + "': " + e.what());
        }
    }

    // Override with environment variables (names shared with the agent's UserParameter setup)
    auto env_val = get_env("ZABBIX_LOG_DIR");
    if (!env_val.empty())
        cfg.registry.path = (std::filesystem::path(env_val) / REGISTRY_FILE_NAME).string();

    env_val = get_env("CACHE_FILE");
    if (!env_val.empty()) cfg.registry.path = env_val;

    env_val = get_env("QM_FILE");
    if (!env_val.empty()) cfg.registry.path = env_val;

    env_val = get_env("MQM_PATH");
    if (!env_val.empty()) cfg.mq.mqm_path = env_val;

    env_val = get_env("MQM_USER");
    if (!env_val.empty()) cfg.mq.service_user = env_val;

    env_val = get_env("INCLUDE_SYSTEM");
    if (!env_val.empty()) cfg.collector.include_system = env_flag(env_val);

    if (!get_env("DEBUG").empty()) cfg.logging.verbose = true;

    return cfg;
}

static bool is_valid_user_name(const std::string& name) {
    if (name.empty() || name.front() == '-') return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

void Config::validate() const {
    if (registry.path.empty())
        throw CollectorError(ErrorKind::ConfigurationError, "registry path is required");
    if (mq.mqm_path.empty())
        throw CollectorError(ErrorKind::ConfigurationError, "MQ tool directory is required");
    if (!is_valid_user_name(mq.service_user))
        throw CollectorError(ErrorKind::ConfigurationError,
                             "service user '" + mq.service_user + "' is not a valid user name");

    static const char* levels[] = {"trace", "debug", "info", "warn", "error"};
    if (std::none_of(std::begin(levels), std::end(levels),
                     [&](const char* l) { return logging.level == l; }))
        throw CollectorError(ErrorKind::ConfigurationError,
                             "unknown log level '" + logging.level + "'");
    if (logging.format != "json" && logging.format != "text")
        throw CollectorError(ErrorKind::ConfigurationError,
                             "log format must be json or text");
}

std::string Config::to_string() const {
    std::ostringstream oss;
    oss << "Registry: " << registry.path
        << ", MQMPath: " << mq.mqm_path
        << ", ServiceUser: " << mq.service_user
        << ", IncludeSystem: " << (collector.include_system ? "true" : "false")
        << ", LogLevel: " << (logging.verbose ? "debug" : logging.level);
    return oss.str();
}

std::string render_config(const Config& cfg) {
    std::ostringstream oss;
    oss << "# IBM MQ Status Collector Configuration\n"
        << "# Save this as config.yaml\n\n"
        << "# Queue manager registry written by the manager collector\n"
        << "registry:\n"
        << "  path: \"" << cfg.registry.path << "\"\n\n"
        << "# IBM MQ administrative tools\n"
        << "mq:\n"
        << "  mqm_path: \"" << cfg.mq.mqm_path << "\"\n"
        << "  service_user: \"" << cfg.mq.service_user << "\"\n\n"
        << "# Collection Configuration\n"
        << "collector:\n"
        << "  include_system: " << (cfg.collector.include_system ? "true" : "false") << "\n\n"
        << "# Logging Configuration (always written to stderr or output_file)\n"
        << "logging:\n"
        << "  level: \"" << cfg.logging.level << "\"\n"
        << "  format: \"" << cfg.logging.format << "\"\n"
        << "  output_file: \"" << cfg.logging.output_file << "\"\n"
        << "  verbose: " << (cfg.logging.verbose ? "true" : "false") << "\n";
    return oss.str();
}

} // namespace mqm_collector
