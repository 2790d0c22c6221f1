#include "mqm_collector/record_assembler.h"
#include "mqm_collector/intermediate_row.h"

#include <charconv>
#include <optional>

#include <spdlog/spdlog.h>

namespace mqm_collector {

namespace {

template <typename T>
std::optional<T> parse_number(const std::string& s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::vector<std::string> split_csv(const std::string& csv) {
    std::vector<std::string> names;
    if (csv.empty()) return names;
    size_t start = 0;
    for (;;) {
        auto pos = csv.find(',', start);
        auto name = csv.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!name.empty()) names.push_back(std::move(name));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return names;
}

bool is_invalid_row(const std::vector<std::string>& fields) {
    return fields.size() == 2 && fields[1] == INVALID_TAG;
}

} // namespace

std::vector<StatusRecord> RecordAssembler::assemble(const std::vector<std::string>& rows) {
    std::vector<StatusRecord> records;
    records.reserve(rows.size());
    dropped_ = 0;

    for (const auto& row : rows) {
        if (row.empty()) continue;
        auto fields = split_row(row);
        // An empty name is only carried by INVALID rows
        if ((fields.front().empty() && !is_invalid_row(fields)) || !assemble_row(fields, records)) {
            spdlog::debug("Dropping malformed {} row with {} fields", status_kind_name(kind_), fields.size());
            ++dropped_;
        }
    }

    if (dropped_ > 0) {
        spdlog::debug("Assembler dropped {} of {} {} rows", dropped_, rows.size(), status_kind_name(kind_));
    }
    return records;
}

bool RecordAssembler::assemble_row(const std::vector<std::string>& fields,
                                   std::vector<StatusRecord>& out) const {
    const auto& name = fields[0];
    const bool invalid = is_invalid_row(fields);

    switch (kind_) {
    case StatusKind::Manager: {
        if (fields.size() != 2) return false;
        auto state = parse_number<int32_t>(fields[1]);
        if (!state || *state < manager_state::NOT_RUNNING || *state > manager_state::STANDBY_RUNNING)
            return false;
        out.emplace_back(ManagerStatus{name, *state});
        return true;
    }
    case StatusKind::CommandServer: {
        if (invalid) {
            out.emplace_back(CommandServerStatus{name, std::nullopt});
            return true;
        }
        if (fields.size() != 2 || (fields[1] != "0" && fields[1] != "1")) return false;
        out.emplace_back(CommandServerStatus{name, fields[1] == "1" ? 1 : 0});
        return true;
    }
    case StatusKind::DeadLetter: {
        if (invalid) {
            out.emplace_back(DeadLetterQueueStatus{name, -1, INVALID_TAG});
            return true;
        }
        if (fields.size() != 3) return false;
        auto depth = parse_number<int64_t>(fields[1]);
        if (!depth || *depth < -1) return false;
        out.emplace_back(DeadLetterQueueStatus{name, *depth, fields[2]});
        return true;
    }
    case StatusKind::OldestMessage: {
        if (invalid) {
            out.emplace_back(MessageAgeRecord{name, INVALID_TAG, 0});
            return true;
        }
        // Empty queue name: the manager could not be queried
        if (fields.size() != 3) return false;
        auto age = parse_number<uint64_t>(fields[2]);
        if (!age) return false;
        out.emplace_back(MessageAgeRecord{name, fields[1], *age});
        return true;
    }
    case StatusKind::Listener: {
        if (invalid) {
            out.emplace_back(ListenerStatus{name, 0, {}, true});
            return true;
        }
        if (fields.size() != 3) return false;
        auto count = parse_number<uint32_t>(fields[1]);
        if (!count) return false;
        auto names = split_csv(fields[2]);
        if (names.size() != *count) return false;
        out.emplace_back(ListenerStatus{name, *count, std::move(names), false});
        return true;
    }
    }
    return false;
}

} // namespace mqm_collector
