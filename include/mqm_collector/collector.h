#pragma once

#include <memory>
#include <string>

#include "mqm_collector/config.h"
#include "mqm_collector/execution_context.h"
#include "mqm_collector/records.h"
#include "mqm_collector/registry_store.h"

namespace mqm_collector {

struct CollectionResult {
    std::string payload;   // JSON array, or the error envelope
    int         exit_code{0};
};

// One invocation of one collector: registry -> privilege bridge -> queries
// -> records -> JSON. Single-threaded; queue managers are handled in
// registry order.
class Collector {
public:
    explicit Collector(const Config& config);
    Collector(const Config& config, std::unique_ptr<PrivilegeBridge> bridge);

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    // Throws CollectorError for fatal preconditions
    [[nodiscard]] std::string collect(StatusKind kind);

    // collect() with fatal errors rendered as the error envelope
    [[nodiscard]] CollectionResult run(StatusKind kind);

private:
    std::string collect_managers();
    std::string collect_for_active(StatusKind kind);
    void        refresh_registry(const std::vector<StatusRecord>& records);

    Config                           config_;
    RegistryStore                    registry_;
    std::unique_ptr<PrivilegeBridge> bridge_;
};

} // namespace mqm_collector
