#pragma once

#include <stdexcept>
#include <string>

namespace mqm_collector {

// Fatal preconditions. Each aborts the invocation before any queue manager
// is queried and maps to one process exit code.
enum class ErrorKind {
    MissingDependency,
    AdministrativeToolMissing,
    ConfigurationError,
    MissingRegistry,
    RegistryUnwritable,
    RegistryParseFailure,
    PrivilegeDenied,
};

namespace exit_code {
    constexpr int SUCCESS        = 0;
    constexpr int NO_DEPENDENCY  = 1;
    constexpr int NO_REGISTRY    = 2;
    constexpr int DENIED_OR_PARSE = 3;
} // namespace exit_code

[[nodiscard]] int exit_code_for(ErrorKind kind);
const char* error_kind_name(ErrorKind kind);

class CollectorError : public std::runtime_error {
public:
    CollectorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] int exit_code() const { return exit_code_for(kind_); }

private:
    ErrorKind kind_;
};

} // namespace mqm_collector
