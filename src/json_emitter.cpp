#include "mqm_collector/json_emitter.h"

#include <type_traits>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mqm_collector {

using ordered_json = nlohmann::ordered_json;

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string csv;
    for (const auto& n : names) {
        if (!csv.empty()) csv += ',';
        csv += n;
    }
    return csv;
}

ordered_json record_to_json(const StatusRecord& record) {
    return std::visit([](const auto& r) -> ordered_json {
        using T = std::decay_t<decltype(r)>;
        ordered_json obj = ordered_json::object();
        if constexpr (std::is_same_v<T, ManagerStatus>) {
            obj["Q_MANAGER"] = r.name;
            obj["Q_STATUS"]  = r.state;
        } else if constexpr (std::is_same_v<T, CommandServerStatus>) {
            // String-typed unlike ManagerStatus; consumers already depend on it
            obj["Q_MANAGER"] = r.name;
            obj["Q_STATUS"]  = r.is_invalid() ? std::string(INVALID_TAG) : std::to_string(*r.state);
        } else if constexpr (std::is_same_v<T, DeadLetterQueueStatus>) {
            obj["Q_MANAGER"] = r.name;
            obj["Q_STATUS"]  = r.depth;
            obj["Q_DLNAME"]  = r.dlq_name;
        } else if constexpr (std::is_same_v<T, MessageAgeRecord>) {
            obj["Q_MANAGER"] = r.manager_name;
            obj["Q_NAME"]    = r.queue_name;
            obj["Q_MSGAGE"]  = r.age_seconds;
        } else if constexpr (std::is_same_v<T, ListenerStatus>) {
            obj["Q_MANAGER"] = r.manager_name;
            obj["Q_COUNT"]   = r.count;
            obj["LISTENER"]  = r.invalid ? std::string(INVALID_TAG) : join_names(r.listener_names);
        }
        return obj;
    }, record);
}

} // namespace

std::string to_json(const std::vector<StatusRecord>& records) noexcept {
    try {
        ordered_json arr = ordered_json::array();
        for (const auto& r : records) arr.push_back(record_to_json(r));
        // Invalid UTF-8 from tool output is replaced rather than thrown
        return arr.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
    } catch (const std::exception& e) {
        spdlog::error("Failed to serialize {} records: {}", records.size(), e.what());
        return "[]";
    }
}

std::string error_json(const std::string& message) noexcept {
    try {
        ordered_json obj = ordered_json::object();
        obj["error"] = message.empty() ? std::string("Unknown error") : message;
        return obj.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
    } catch (const std::exception& e) {
        spdlog::error("Failed to serialize error message: {}", e.what());
        return R"({"error":"Unknown error"})";
    }
}

} // namespace mqm_collector
