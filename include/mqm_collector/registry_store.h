#pragma once

#include <string>
#include <vector>

#include "mqm_collector/records.h"

namespace mqm_collector {

// The queue manager registry: a JSON array of {"Q_MANAGER","Q_STATUS"}
// objects shared by every collector. Only the manager collector replaces it,
// always through a scratch file and rename, so readers see either the old
// or the new snapshot and never a partial one.
class RegistryStore {
public:
    explicit RegistryStore(std::string path);

    [[nodiscard]] const std::string& path() const { return path_; }

    // Throws CollectorError(MissingRegistry) or CollectorError(RegistryParseFailure)
    [[nodiscard]] std::vector<ManagerStatus> load() const;

    // Atomic replace. Throws std::runtime_error on I/O failure.
    void replace(const std::vector<ManagerStatus>& snapshot) const;

    // Throws CollectorError(RegistryUnwritable) when the registry directory is
    // missing or not writable by the caller.
    void ensure_writable() const;

private:
    std::string path_;
};

// Names of managers whose Q_STATUS is Running, in registry order
[[nodiscard]] std::vector<std::string> active_managers(const std::vector<ManagerStatus>& snapshot);

// Load the registry and return the active subset
[[nodiscard]] std::vector<std::string> resolve_active_managers(const RegistryStore& store);

} // namespace mqm_collector
