#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mqm_collector/records.h"

namespace mqm_collector {

// Turns intermediate rows into typed records for one status kind. Rows
// that do not have the expected shape are dropped and counted.
class RecordAssembler {
public:
    explicit RecordAssembler(StatusKind kind) : kind_(kind) {}

    [[nodiscard]] std::vector<StatusRecord> assemble(const std::vector<std::string>& rows);

    [[nodiscard]] size_t dropped() const { return dropped_; }

private:
    bool assemble_row(const std::vector<std::string>& fields, std::vector<StatusRecord>& out) const;

    StatusKind kind_;
    size_t     dropped_{0};
};

} // namespace mqm_collector
