#include "mqm_collector/execution_context.h"
#include "mqm_collector/errors.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <pwd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace mqm_collector {

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

CommandOutput run_process(const std::vector<std::string>& argv, const std::string& input) {
    if (argv.empty()) throw std::runtime_error("Empty command");

    // A child that exits before reading its stdin must not kill the collector
    static const bool sigpipe_ignored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)sigpipe_ignored;

    int pipe_stdin[2]  = {-1, -1};
    int pipe_stdout[2] = {-1, -1};

    if (::pipe(pipe_stdin) == -1) {
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (::pipe(pipe_stdout) == -1) {
        int err = errno;
        close_fd(pipe_stdin[0]);
        close_fd(pipe_stdin[1]);
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        close_fd(pipe_stdin[0]);
        close_fd(pipe_stdin[1]);
        close_fd(pipe_stdout[0]);
        close_fd(pipe_stdout[1]);
        throw std::runtime_error(std::string("Failed to fork: ") + std::strerror(err));
    }

    if (pid == 0) { // Child
        ::dup2(pipe_stdin[0], STDIN_FILENO);
        ::dup2(pipe_stdout[1], STDOUT_FILENO);
        ::dup2(pipe_stdout[1], STDERR_FILENO);
        ::close(pipe_stdin[0]);
        ::close(pipe_stdin[1]);
        ::close(pipe_stdout[0]);
        ::close(pipe_stdout[1]);

        ::setenv("LC_ALL", "C", 1);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    // Parent
    close_fd(pipe_stdin[0]);
    close_fd(pipe_stdout[1]);

    size_t written = 0;
    while (written < input.size()) {
        ssize_t n = ::write(pipe_stdin[1], input.data() + written, input.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break; // EPIPE: the child does not read stdin
        }
        written += static_cast<size_t>(n);
    }
    close_fd(pipe_stdin[1]);

    CommandOutput result;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(pipe_stdout[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        result.output.append(buf, static_cast<size_t>(n));
    }
    close_fd(pipe_stdout[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_status = 128 + WTERMSIG(status);
    }
    return result;
}

CommandOutput DirectContext::run(const CommandSpec& cmd) {
    return run_process(cmd.argv, cmd.input);
}

bool SudoContext::probe() {
    try {
        auto out = run_process({"sudo", "-n", "-u", user_, "/bin/sh", "-c", "true"}, "");
        spdlog::debug("sudo probe for {} exited with {}", user_, out.exit_status);
        return out.exit_status == 0;
    } catch (const std::exception& e) {
        spdlog::debug("sudo probe for {} failed: {}", user_, e.what());
        return false;
    }
}

CommandOutput SudoContext::run(const CommandSpec& cmd) {
    std::vector<std::string> argv{"sudo", "-n", "-u", user_, "--"};
    argv.insert(argv.end(), cmd.argv.begin(), cmd.argv.end());
    return run_process(argv, cmd.input);
}

const char* privilege_mode_name(PrivilegeMode mode) {
    switch (mode) {
    case PrivilegeMode::SelfIdentity:            return "self";
    case PrivilegeMode::DelegatedNonInteractive: return "delegated";
    case PrivilegeMode::Denied:                  return "denied";
    }
    return "unknown";
}

PrivilegeMode decide_privilege(bool is_service_identity, bool delegation_available) {
    if (is_service_identity) return PrivilegeMode::SelfIdentity;
    if (delegation_available) return PrivilegeMode::DelegatedNonInteractive;
    return PrivilegeMode::Denied;
}

PrivilegeBridge::PrivilegeBridge(MQConfig config) : config_(std::move(config)) {}

std::string PrivilegeBridge::current_user() const {
    const struct passwd* pw = ::getpwuid(::geteuid());
    if (pw && pw->pw_name) return pw->pw_name;
    return {};
}

std::unique_ptr<ExecutionContext> PrivilegeBridge::caller_context() const {
    return std::make_unique<DirectContext>();
}

std::unique_ptr<ExecutionContext> PrivilegeBridge::delegated_context() const {
    return std::make_unique<SudoContext>(config_.service_user);
}

std::unique_ptr<ExecutionContext> PrivilegeBridge::acquire() {
    const bool is_self = current_user() == config_.service_user;

    std::unique_ptr<ExecutionContext> delegated;
    bool delegation_ok = false;
    if (!is_self) {
        delegated = delegated_context();
        delegation_ok = delegated && delegated->probe();
    }

    last_mode_ = decide_privilege(is_self, delegation_ok);
    spdlog::debug("Privilege mode for {}: {}", config_.service_user, privilege_mode_name(last_mode_));

    switch (last_mode_) {
    case PrivilegeMode::SelfIdentity:
        return caller_context();
    case PrivilegeMode::DelegatedNonInteractive:
        return delegated;
    case PrivilegeMode::Denied:
        break;
    }
    throw CollectorError(ErrorKind::PrivilegeDenied,
                         "Cannot run as " + config_.service_user +
                         " non-interactively (configure sudoers).");
}

} // namespace mqm_collector
