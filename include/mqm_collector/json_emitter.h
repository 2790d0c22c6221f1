#pragma once

#include <string>
#include <vector>

#include "mqm_collector/records.h"

namespace mqm_collector {

// Compact JSON array of records, keys in wire order. Never throws; an empty
// list renders as "[]".
std::string to_json(const std::vector<StatusRecord>& records) noexcept;

// {"error":"<message>"}
std::string error_json(const std::string& message) noexcept;

} // namespace mqm_collector
