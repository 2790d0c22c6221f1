#include "mqm_collector/collector.h"
#include "mqm_collector/errors.h"
#include "mqm_collector/json_emitter.h"
#include "mqm_collector/mq_admin.h"
#include "mqm_collector/query_runner.h"
#include "mqm_collector/record_assembler.h"

#include <iostream>

#include <spdlog/spdlog.h>

namespace mqm_collector {

Collector::Collector(const Config& config)
    : Collector(config, std::make_unique<PrivilegeBridge>(config.mq)) {}

Collector::Collector(const Config& config, std::unique_ptr<PrivilegeBridge> bridge)
    : config_(config), registry_(config.registry.path), bridge_(std::move(bridge)) {}

CollectionResult Collector::run(StatusKind kind) {
    try {
        return {collect(kind), exit_code::SUCCESS};
    } catch (const CollectorError& e) {
        spdlog::debug("{} collector aborted ({}): {}", status_kind_name(kind),
                      error_kind_name(e.kind()), e.what());
        return {error_json(e.what()), e.exit_code()};
    } catch (const std::exception& e) {
        spdlog::error("{} collector failed: {}", status_kind_name(kind), e.what());
        return {error_json(e.what()), exit_code::NO_DEPENDENCY};
    }
}

std::string Collector::collect(StatusKind kind) {
    spdlog::debug("Starting {} collection: {}", status_kind_name(kind), config_.to_string());

    auto payload = kind == StatusKind::Manager ? collect_managers() : collect_for_active(kind);

    spdlog::debug("JSON output: {}", payload);
    return payload;
}

std::string Collector::collect_managers() {
    // dspmq works for any member of the mqm group, so no identity switch
    auto context = bridge_->caller_context();
    MQAdmin admin(config_.mq, *context);
    admin.ensure_tool(tools::DSPMQ);
    registry_.ensure_writable();

    QueryRunner runner(admin, QueryOptions{config_.collector.include_system});
    std::vector<std::string> rows;
    try {
        rows = runner.manager_rows();
    } catch (const std::exception& e) {
        spdlog::warn("dspmq failed: {}", e.what());
    }

    RecordAssembler assembler(StatusKind::Manager);
    auto records = assembler.assemble(rows);
    refresh_registry(records);
    return to_json(records);
}

void Collector::refresh_registry(const std::vector<StatusRecord>& records) {
    std::vector<ManagerStatus> snapshot;
    snapshot.reserve(records.size());
    for (const auto& r : records) {
        if (const auto* s = std::get_if<ManagerStatus>(&r)) snapshot.push_back(*s);
    }

    try {
        registry_.replace(snapshot);
    } catch (const std::exception& e) {
        // Registry readers keep the previous snapshot; the scrape itself still succeeds
        spdlog::error("Failed to write cache file {}: {}", registry_.path(), e.what());
        std::cerr << error_json("Failed to write cache file") << std::endl;
    }
}

std::string Collector::collect_for_active(StatusKind kind) {
    auto qmgrs = resolve_active_managers(registry_);
    if (qmgrs.empty()) return to_json(std::vector<StatusRecord>{});

    auto context = bridge_->acquire();
    MQAdmin admin(config_.mq, *context);
    admin.ensure_tool(required_tool(kind));

    QueryRunner runner(admin, QueryOptions{config_.collector.include_system});
    auto rows = runner.run(kind, qmgrs);

    RecordAssembler assembler(kind);
    auto records = assembler.assemble(rows);
    spdlog::debug("{} collection: {} queue managers, {} records",
                  status_kind_name(kind), qmgrs.size(), records.size());
    return to_json(records);
}

} // namespace mqm_collector
