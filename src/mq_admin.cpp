#include "mqm_collector/mq_admin.h"
#include "mqm_collector/errors.h"
#include "mqm_collector/stanza_parser.h"

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace mqm_collector {

MQAdmin::MQAdmin(const MQConfig& config, ExecutionContext& context)
    : config_(config), context_(&context) {}

void MQAdmin::ensure_tool(const std::string& tool) const {
    auto path = config_.tool_path(tool);
    if (::access(path.c_str(), X_OK) != 0) {
        throw CollectorError(ErrorKind::AdministrativeToolMissing,
                             tool + " command not found. Please ensure IBM MQ is installed and in PATH.");
    }
}

std::string MQAdmin::run(const std::vector<std::string>& argv, const std::string& input) {
    CommandSpec cmd{argv, input};
    auto out = context_->run(cmd);
    spdlog::debug("{} ({}) exited with {}, {} bytes of output",
                  argv.front(), context_->describe(), out.exit_status, out.output.size());
    return std::move(out.output);
}

std::string MQAdmin::runmqsc(const std::string& qmgr, const std::string& command) {
    spdlog::debug("runmqsc {}: {}", qmgr, command);
    return run({config_.tool_path(tools::RUNMQSC), qmgr}, command + "\n");
}

std::string MQAdmin::display_queue_managers() {
    return run({config_.tool_path(tools::DSPMQ), "-x"}, "");
}

std::string MQAdmin::display_command_server(const std::string& qmgr) {
    return run({config_.tool_path(tools::DSPMQCSV), qmgr}, "");
}

std::optional<std::string> MQAdmin::dead_letter_queue(const std::string& qmgr) {
    auto out = runmqsc(qmgr, "DISPLAY QMGR DEADQ");
    auto dlq = find_attribute(out, "DEADQ");
    if (!dlq || dlq->empty()) {
        spdlog::debug("No DEADQ set for {}", qmgr);
        return std::nullopt;
    }
    spdlog::debug("DLQ for {}: {}", qmgr, *dlq);
    return dlq;
}

} // namespace mqm_collector
