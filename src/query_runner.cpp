#include "mqm_collector/query_runner.h"
#include "mqm_collector/intermediate_row.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

#include <spdlog/spdlog.h>

namespace mqm_collector {

namespace {

bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

// Digit strings only; values that overflow T are rejected like any other junk
template <typename T>
std::optional<T> parse_count(const std::string& s) {
    if (!is_digits(s)) return std::nullopt;
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

int32_t manager_state_from(const std::string& status) {
    if (status == "Running") return manager_state::RUNNING;
    if (status == "Running as standby") return manager_state::STANDBY_RUNNING;
    return manager_state::NOT_RUNNING;
}

} // namespace

const char* required_tool(StatusKind kind) {
    switch (kind) {
    case StatusKind::Manager:       return tools::DSPMQ;
    case StatusKind::CommandServer: return tools::DSPMQCSV;
    case StatusKind::DeadLetter:
    case StatusKind::OldestMessage:
    case StatusKind::Listener:      return tools::RUNMQSC;
    }
    return tools::RUNMQSC;
}

const StanzaLayout& QueryRunner::manager_layout() {
    static const StanzaLayout layout{"QMNAME", {{"STATUS", "", false}}};
    return layout;
}

const StanzaLayout& QueryRunner::queue_status_layout() {
    static const StanzaLayout layout{"QUEUE", {{"MSGAGE", "", true}}};
    return layout;
}

const StanzaLayout& QueryRunner::listener_layout() {
    static const StanzaLayout layout{"LISTENER", {}};
    return layout;
}

QueryRunner::QueryRunner(MQAdmin& admin, QueryOptions options)
    : admin_(admin), options_(options) {}

std::vector<std::string> QueryRunner::run(StatusKind kind, const std::vector<std::string>& qmgrs) {
    std::vector<std::string> rows;
    for (const auto& qmgr : qmgrs) {
        if (!is_valid_resource_name(qmgr)) {
            spdlog::warn("Skipping queue manager with invalid name '{}'", qmgr);
            rows.push_back(encode_row({qmgr, INVALID_TAG}));
            continue;
        }

        spdlog::debug("Processing QM: {}", qmgr);
        try {
            auto qm_rows = rows_for(kind, qmgr);
            rows.insert(rows.end(), qm_rows.begin(), qm_rows.end());
        } catch (const std::exception& e) {
            spdlog::warn("{} query for {} failed: {}", status_kind_name(kind), qmgr, e.what());
            auto sentinel = sentinel_rows(kind, qmgr);
            rows.insert(rows.end(), sentinel.begin(), sentinel.end());
        }
    }
    return rows;
}

std::vector<std::string> QueryRunner::rows_for(StatusKind kind, const std::string& qmgr) {
    switch (kind) {
    case StatusKind::CommandServer: return {command_server_row(qmgr)};
    case StatusKind::DeadLetter:    return {dead_letter_row(qmgr)};
    case StatusKind::OldestMessage: return message_age_rows(qmgr);
    case StatusKind::Listener:      return {listener_row(qmgr)};
    case StatusKind::Manager:       break;
    }
    return {};
}

std::vector<std::string> QueryRunner::sentinel_rows(StatusKind kind, const std::string& qmgr) const {
    switch (kind) {
    case StatusKind::CommandServer: return {encode_row({qmgr, "0"})};
    case StatusKind::DeadLetter:    return {encode_row({qmgr, "-1", ""})};
    case StatusKind::Listener:      return {encode_row({qmgr, "0", ""})};
    case StatusKind::OldestMessage: return {encode_row({qmgr, "", "0"})};
    case StatusKind::Manager:       break;
    }
    return {};
}

std::vector<std::string> QueryRunner::manager_rows() {
    std::vector<std::string> rows;
    StanzaParser parser(manager_layout());
    for (const auto& stanza : parser.parse(admin_.display_queue_managers())) {
        const auto& name = stanza.at("QMNAME");
        if (name.empty()) continue;
        rows.push_back(encode_row({name, std::to_string(manager_state_from(stanza.at("STATUS")))}));
    }
    spdlog::debug("dspmq reported {} queue managers", rows.size());
    return rows;
}

std::string QueryRunner::command_server_row(const std::string& qmgr) {
    auto out = admin_.display_command_server(qmgr);
    bool running = out.find("Running") != std::string::npos;
    return encode_row({qmgr, running ? "1" : "0"});
}

std::string QueryRunner::dead_letter_row(const std::string& qmgr) {
    auto dlq = admin_.dead_letter_queue(qmgr);
    if (!dlq) return encode_row({qmgr, "-1", ""});

    auto out = admin_.runmqsc(qmgr, "DISPLAY QSTATUS(" + *dlq + ") CURDEPTH");
    auto raw = find_attribute(out, "CURDEPTH");
    std::optional<int64_t> depth;
    if (raw) depth = parse_count<int64_t>(*raw);
    if (!depth) {
        spdlog::debug("Could not retrieve CURDEPTH for {}/{}; setting -1", qmgr, *dlq);
        return encode_row({qmgr, "-1", *dlq});
    }

    spdlog::debug("CURDEPTH for {}/{}: {}", qmgr, *dlq, *depth);
    return encode_row({qmgr, std::to_string(*depth), *dlq});
}

bool QueryRunner::is_excluded_queue(const std::string& queue, const std::string& dlq) const {
    if (options_.include_system) return false;
    if (queue.rfind("SYSTEM.", 0) == 0) return true;
    return !dlq.empty() && queue == dlq;
}

std::vector<std::string> QueryRunner::message_age_rows(const std::string& qmgr) {
    // Looked up on every run so a DEADQ change is picked up immediately
    auto dlq = admin_.dead_letter_queue(qmgr).value_or("");

    StanzaParser parser(queue_status_layout());
    auto stanzas = parser.parse(admin_.runmqsc(qmgr, "DISPLAY QSTATUS(*) ALL"));
    if (stanzas.empty()) {
        spdlog::debug("No QUEUE() lines for {} with QSTATUS ALL; trying DISPLAY QSTATUS(*)", qmgr);
        stanzas = parser.parse(admin_.runmqsc(qmgr, "DISPLAY QSTATUS(*)"));
    }
    spdlog::debug("MQ_OUT queue stanzas for {}: {}", qmgr, stanzas.size());

    std::vector<std::string> rows;
    for (const auto& stanza : stanzas) {
        const auto& queue = stanza.at("QUEUE");
        if (queue.empty() || is_excluded_queue(queue, dlq)) continue;

        auto age = parse_count<uint64_t>(stanza.at("MSGAGE"));
        rows.push_back(encode_row({qmgr, queue, std::to_string(age.value_or(0))}));
    }
    return rows;
}

std::string QueryRunner::listener_row(const std::string& qmgr) {
    auto out = admin_.runmqsc(qmgr, "DISPLAY LSSTATUS(*)");
    if (out.empty()) return encode_row({qmgr, "0", ""});

    StanzaParser parser(listener_layout());
    std::string csv;
    uint32_t count = 0;
    for (const auto& stanza : parser.parse(out)) {
        auto name = stanza.at("LISTENER");
        name.erase(std::remove(name.begin(), name.end(), ','), name.end());
        if (name.empty()) continue;
        if (!csv.empty()) csv += ',';
        csv += name;
        ++count;
    }
    return encode_row({qmgr, std::to_string(count), csv});
}

} // namespace mqm_collector
