#include "mqm_collector/errors.h"

namespace mqm_collector {

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingDependency:
    case ErrorKind::AdministrativeToolMissing:
    case ErrorKind::ConfigurationError:
        return exit_code::NO_DEPENDENCY;
    case ErrorKind::MissingRegistry:
    case ErrorKind::RegistryUnwritable:
        return exit_code::NO_REGISTRY;
    case ErrorKind::RegistryParseFailure:
    case ErrorKind::PrivilegeDenied:
        return exit_code::DENIED_OR_PARSE;
    }
    return exit_code::NO_DEPENDENCY;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingDependency:         return "missing_dependency";
    case ErrorKind::AdministrativeToolMissing: return "administrative_tool_missing";
    case ErrorKind::ConfigurationError:        return "configuration_error";
    case ErrorKind::MissingRegistry:           return "missing_registry";
    case ErrorKind::RegistryUnwritable:        return "registry_unwritable";
    case ErrorKind::RegistryParseFailure:      return "registry_parse_failure";
    case ErrorKind::PrivilegeDenied:           return "privilege_denied";
    }
    return "unknown";
}

} // namespace mqm_collector
