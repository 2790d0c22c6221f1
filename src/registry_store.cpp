#include "mqm_collector/registry_store.h"
#include "mqm_collector/config.h"
#include "mqm_collector/errors.h"
#include "mqm_collector/json_emitter.h"
#include "mqm_collector/scratch_file.h"

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mqm_collector {

namespace {

// Only the integers 0..2 are states; anything else counts as not running
int32_t manager_state_from(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v <= static_cast<uint64_t>(manager_state::STANDBY_RUNNING)) return static_cast<int32_t>(v);
    } else if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v >= manager_state::NOT_RUNNING && v <= manager_state::STANDBY_RUNNING)
            return static_cast<int32_t>(v);
    }
    spdlog::debug("Ignoring registry Q_STATUS {}", value.dump());
    return manager_state::NOT_RUNNING;
}

} // namespace

RegistryStore::RegistryStore(std::string path) : path_(std::move(path)) {}

std::vector<ManagerStatus> RegistryStore::load() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw CollectorError(ErrorKind::MissingRegistry,
                             "The file '" + path_ + "' does not exist.");
    }

    std::ifstream file(path_);
    if (!file) {
        throw CollectorError(ErrorKind::RegistryParseFailure,
                             "Failed to parse queue manager cache file");
    }

    auto root = nlohmann::json::parse(file, nullptr, false);
    if (root.is_discarded() || !root.is_array()) {
        spdlog::debug("Registry {} is not a JSON array", path_);
        throw CollectorError(ErrorKind::RegistryParseFailure,
                             "Failed to parse queue manager cache file");
    }

    std::vector<ManagerStatus> snapshot;
    snapshot.reserve(root.size());
    for (const auto& entry : root) {
        if (!entry.is_object()) {
            throw CollectorError(ErrorKind::RegistryParseFailure,
                                 "Failed to parse queue manager cache file");
        }

        ManagerStatus status;
        auto st = entry.find("Q_STATUS");
        if (st != entry.end()) status.state = manager_state_from(*st);

        auto qm = entry.find("Q_MANAGER");
        if (qm != entry.end() && qm->is_string()) {
            status.name = qm->get<std::string>();
        } else if (status.state == manager_state::RUNNING) {
            throw CollectorError(ErrorKind::RegistryParseFailure,
                                 "Failed to parse queue manager cache file");
        }
        snapshot.push_back(std::move(status));
    }

    spdlog::debug("Loaded {} registry entries from {}", snapshot.size(), path_);
    return snapshot;
}

void RegistryStore::replace(const std::vector<ManagerStatus>& snapshot) const {
    std::vector<StatusRecord> records(snapshot.begin(), snapshot.end());

    ScratchFile scratch(path_);
    scratch.write(to_json(records) + "\n");
    scratch.commit();
    spdlog::debug("Registry {} replaced with {} entries", path_, snapshot.size());
}

void RegistryStore::ensure_writable() const {
    const std::filesystem::path dir = RegistryConfig{path_}.directory();

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw CollectorError(ErrorKind::RegistryUnwritable,
                             "Directory '" + dir.string() + "' does not exist.");
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        throw CollectorError(ErrorKind::RegistryUnwritable,
                             "Cannot write to '" + dir.string() + "'. Check directory permissions.");
    }
}

std::vector<std::string> active_managers(const std::vector<ManagerStatus>& snapshot) {
    std::vector<std::string> names;
    for (const auto& s : snapshot) {
        if (s.state == manager_state::RUNNING) names.push_back(s.name);
    }
    return names;
}

std::vector<std::string> resolve_active_managers(const RegistryStore& store) {
    auto names = active_managers(store.load());
    if (names.empty()) {
        spdlog::debug("No active queue managers found");
    } else {
        std::string joined;
        for (const auto& n : names) joined += (joined.empty() ? "" : " ") + n;
        spdlog::debug("Active QMs: {}", joined);
    }
    return names;
}

} // namespace mqm_collector
