#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mqm_collector {

// One attribute to extract from a stanza, e.g. MSGAGE(120)
struct FieldSpec {
    std::string name;
    std::string default_value;        // used when the attribute is absent
    bool        strip_whitespace{true}; // false keeps inner spaces ("Running as standby")
};

// A record-boundary marker plus the attributes to pull out of each record
struct StanzaLayout {
    std::string            marker;
    std::vector<FieldSpec> fields;
};

// Flat attribute map for one record. The marker value is stored under the
// marker name; every declared field is always present.
using Stanza = std::map<std::string, std::string>;

// Parser for MQSC / dspmq text output:
//
//   AMQ8450I: Display queue status details.
//      QUEUE(APP.IN)                           TYPE(QUEUE)
//      CURDEPTH(3)                             MSGAGE(120)
//
// A stanza starts at a line whose first token is MARKER(...) and runs until
// the next marker line or end of input. Attributes may sit on any physical
// line of the stanza, in any order.
class StanzaParser {
public:
    explicit StanzaParser(StanzaLayout layout);

    [[nodiscard]] std::vector<Stanza> parse(const std::string& text) const;

    [[nodiscard]] const StanzaLayout& layout() const { return layout_; }

    // True when the first non-blank token of line is "<marker>("
    static bool is_marker_line(const std::string& line, const std::string& marker);

    // Raw value of NAME(value) on a line; NAME must start a token
    static std::optional<std::string> extract_attribute(const std::string& line,
                                                        const std::string& name);

    static std::string strip_whitespace(const std::string& s);
    static std::string trim(const std::string& s);

private:
    [[nodiscard]] Stanza new_stanza(const std::string& line) const;
    void collect_fields(const std::string& line, Stanza& stanza,
                        std::map<std::string, bool>& seen) const;

    StanzaLayout layout_;
};

// First NAME(value) anywhere in text, for single-valued replies such as
// DISPLAY QMGR DEADQ
std::optional<std::string> find_attribute(const std::string& text, const std::string& name,
                                          bool strip = true);

} // namespace mqm_collector
