#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mqm_collector {

// Tag carried in place of data for queue manager names that were never queried
constexpr const char* INVALID_TAG = "INVALID";

namespace manager_state {
    constexpr int32_t NOT_RUNNING     = 0;
    constexpr int32_t RUNNING         = 1;
    constexpr int32_t STANDBY_RUNNING = 2;
} // namespace manager_state

enum class StatusKind {
    Manager,
    CommandServer,
    DeadLetter,
    OldestMessage,
    Listener,
};

const char* status_kind_name(StatusKind kind);

struct ManagerStatus {
    std::string name;
    int32_t     state{manager_state::NOT_RUNNING};
};

struct CommandServerStatus {
    std::string            name;
    std::optional<int32_t> state; // empty when the name was rejected

    [[nodiscard]] bool is_invalid() const { return !state.has_value(); }
};

struct DeadLetterQueueStatus {
    std::string name;
    int64_t     depth{-1}; // -1: no DLQ configured or the depth query failed
    std::string dlq_name;
};

struct MessageAgeRecord {
    std::string manager_name;
    std::string queue_name;
    uint64_t    age_seconds{0};
};

struct ListenerStatus {
    std::string              manager_name;
    uint32_t                 count{0};
    std::vector<std::string> listener_names;
    bool                     invalid{false};
};

using StatusRecord = std::variant<
    ManagerStatus,
    CommandServerStatus,
    DeadLetterQueueStatus,
    MessageAgeRecord,
    ListenerStatus
>;

// Queue manager names are restricted to [A-Za-z0-9._-]+ before they are
// handed to any administrative tool.
[[nodiscard]] bool is_valid_resource_name(const std::string& name);

} // namespace mqm_collector
