#include "mqm_collector/records.h"

#include <algorithm>
#include <cctype>

namespace mqm_collector {

const char* status_kind_name(StatusKind kind) {
    switch (kind) {
    case StatusKind::Manager:       return "manager";
    case StatusKind::CommandServer: return "command-server";
    case StatusKind::DeadLetter:    return "dead-letter";
    case StatusKind::OldestMessage: return "oldest-message";
    case StatusKind::Listener:      return "listener";
    }
    return "unknown";
}

bool is_valid_resource_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

} // namespace mqm_collector
