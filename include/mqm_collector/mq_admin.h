#pragma once

#include <optional>
#include <string>

#include "mqm_collector/config.h"
#include "mqm_collector/execution_context.h"

namespace mqm_collector {

namespace tools {
    constexpr const char* DSPMQ    = "dspmq";
    constexpr const char* DSPMQCSV = "dspmqcsv";
    constexpr const char* RUNMQSC  = "runmqsc";
} // namespace tools

// Issues IBM MQ administrative commands through an execution context and
// returns their raw text output
class MQAdmin {
public:
    MQAdmin(const MQConfig& config, ExecutionContext& context);

    MQAdmin(const MQAdmin&) = delete;
    MQAdmin& operator=(const MQAdmin&) = delete;

    // Throws CollectorError(AdministrativeToolMissing)
    void ensure_tool(const std::string& tool) const;

    // Pipe one MQSC command into runmqsc for a queue manager
    std::string runmqsc(const std::string& qmgr, const std::string& command);

    // dspmq -x
    std::string display_queue_managers();

    // dspmqcsv <qmgr>
    std::string display_command_server(const std::string& qmgr);

    // DEADQ attribute of the queue manager; empty when none is configured
    std::optional<std::string> dead_letter_queue(const std::string& qmgr);

private:
    std::string run(const std::vector<std::string>& argv, const std::string& input);

    MQConfig          config_;
    ExecutionContext* context_;
};

} // namespace mqm_collector
