#pragma once

#include <string>
#include <vector>

#include "mqm_collector/mq_admin.h"
#include "mqm_collector/records.h"
#include "mqm_collector/stanza_parser.h"

namespace mqm_collector {

struct QueryOptions {
    bool include_system{false}; // keep SYSTEM.* queues and the DLQ in age rows
};

// Administrative tool each status kind depends on
const char* required_tool(StatusKind kind);

// Queries each queue manager in order and turns the raw tool output into
// intermediate rows (see intermediate_row.h). A failure on one queue manager
// yields sentinel rows for it and never stops the batch.
//
// Row shapes, one field per column:
//   Manager        name, state
//   CommandServer  name, "1" | "0"
//   DeadLetter     name, depth, dlq_name
//   OldestMessage  name, queue, age        (one per queue; queue empty on failure)
//   Listener       name, count, csv_names
//   any kind       name, "INVALID"         (name failed validation)
class QueryRunner {
public:
    QueryRunner(MQAdmin& admin, QueryOptions options);

    [[nodiscard]] std::vector<std::string> run(StatusKind kind,
                                               const std::vector<std::string>& qmgrs);

    // dspmq -x; not tied to the registry
    [[nodiscard]] std::vector<std::string> manager_rows();

    static const StanzaLayout& manager_layout();
    static const StanzaLayout& queue_status_layout();
    static const StanzaLayout& listener_layout();

private:
    std::vector<std::string> rows_for(StatusKind kind, const std::string& qmgr);
    std::vector<std::string> sentinel_rows(StatusKind kind, const std::string& qmgr) const;

    std::string              command_server_row(const std::string& qmgr);
    std::string              dead_letter_row(const std::string& qmgr);
    std::vector<std::string> message_age_rows(const std::string& qmgr);
    std::string              listener_row(const std::string& qmgr);

    [[nodiscard]] bool is_excluded_queue(const std::string& queue, const std::string& dlq) const;

    MQAdmin&     admin_;
    QueryOptions options_;
};

} // namespace mqm_collector
