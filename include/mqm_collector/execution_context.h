#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mqm_collector/config.h"

namespace mqm_collector {

struct CommandSpec {
    std::vector<std::string> argv;
    std::string              input; // written to the child's stdin
};

struct CommandOutput {
    int         exit_status{0};
    std::string output; // stdout and stderr, merged
};

// Spawn argv[0] (PATH lookup) with LC_ALL=C, feed input and wait for it.
// Throws std::runtime_error when the process cannot be created; a program
// that cannot be executed reports exit status 127.
CommandOutput run_process(const std::vector<std::string>& argv, const std::string& input);

// Where administrative commands run. Implementations hide the OS-specific
// identity switch.
class ExecutionContext {
public:
    virtual ~ExecutionContext() = default;

    // No-op check that the context is usable without prompting
    virtual bool probe() = 0;

    // Throws std::runtime_error when the command cannot be started
    virtual CommandOutput run(const CommandSpec& cmd) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

// Runs commands as the calling user
class DirectContext : public ExecutionContext {
public:
    bool probe() override { return true; }
    CommandOutput run(const CommandSpec& cmd) override;
    [[nodiscard]] std::string describe() const override { return "direct"; }
};

// Runs commands through "sudo -n -u <user>"
class SudoContext : public ExecutionContext {
public:
    explicit SudoContext(std::string user) : user_(std::move(user)) {}

    bool probe() override;
    CommandOutput run(const CommandSpec& cmd) override;
    [[nodiscard]] std::string describe() const override { return "sudo -n -u " + user_; }

private:
    std::string user_;
};

enum class PrivilegeMode {
    SelfIdentity,
    DelegatedNonInteractive,
    Denied,
};

const char* privilege_mode_name(PrivilegeMode mode);

[[nodiscard]] PrivilegeMode decide_privilege(bool is_service_identity, bool delegation_available);

// Chooses how administrative queries are executed. Re-evaluated on every
// acquire(); nothing is cached between invocations.
class PrivilegeBridge {
public:
    explicit PrivilegeBridge(MQConfig config);
    virtual ~PrivilegeBridge() = default;

    PrivilegeBridge(const PrivilegeBridge&) = delete;
    PrivilegeBridge& operator=(const PrivilegeBridge&) = delete;

    // Throws CollectorError(PrivilegeDenied)
    std::unique_ptr<ExecutionContext> acquire();

    // Context for tools that need no service identity (dspmq)
    virtual std::unique_ptr<ExecutionContext> caller_context() const;

    [[nodiscard]] PrivilegeMode last_mode() const { return last_mode_; }

protected:
    [[nodiscard]] virtual std::string current_user() const;
    virtual std::unique_ptr<ExecutionContext> delegated_context() const;

    [[nodiscard]] const MQConfig& config() const { return config_; }

private:
    MQConfig      config_;
    PrivilegeMode last_mode_{PrivilegeMode::Denied};
};

} // namespace mqm_collector
