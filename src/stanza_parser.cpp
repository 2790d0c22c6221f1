#include "mqm_collector/stanza_parser.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

namespace mqm_collector {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

StanzaParser::StanzaParser(StanzaLayout layout) : layout_(std::move(layout)) {}

std::string StanzaParser::strip_whitespace(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    std::copy_if(s.begin(), s.end(), std::back_inserter(result),
                 [](char c) { return !is_space(c); });
    return result;
}

std::string StanzaParser::trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last  = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (first >= last) return {};
    return std::string(first, last);
}

bool StanzaParser::is_marker_line(const std::string& line, const std::string& marker) {
    auto pos = line.find_first_not_of(" \t\r");
    if (pos == std::string::npos) return false;
    return line.compare(pos, marker.size(), marker) == 0 &&
           pos + marker.size() < line.size() &&
           line[pos + marker.size()] == '(';
}

std::optional<std::string> StanzaParser::extract_attribute(const std::string& line,
                                                           const std::string& name) {
    const std::string token = name + "(";
    size_t pos = 0;
    while ((pos = line.find(token, pos)) != std::string::npos) {
        // DEADQ( must not match inside e.g. XDEADQ(
        if (pos == 0 || is_space(line[pos - 1])) {
            auto start = pos + token.size();
            auto end = line.find(')', start);
            if (end == std::string::npos) return std::nullopt;
            return line.substr(start, end - start);
        }
        pos += token.size();
    }
    return std::nullopt;
}

Stanza StanzaParser::new_stanza(const std::string& line) const {
    Stanza stanza;
    auto marker_value = extract_attribute(line, layout_.marker);
    stanza[layout_.marker] = marker_value ? strip_whitespace(*marker_value) : std::string{};
    for (const auto& f : layout_.fields) stanza[f.name] = f.default_value;
    return stanza;
}

void StanzaParser::collect_fields(const std::string& line, Stanza& stanza,
                                  std::map<std::string, bool>& seen) const {
    for (const auto& f : layout_.fields) {
        if (seen[f.name]) continue;
        auto value = extract_attribute(line, f.name);
        if (!value) continue;
        stanza[f.name] = f.strip_whitespace ? strip_whitespace(*value) : trim(*value);
        seen[f.name] = true;
    }
}

std::vector<Stanza> StanzaParser::parse(const std::string& text) const {
    std::vector<Stanza> stanzas;
    std::map<std::string, bool> seen;
    bool in_stanza = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (is_marker_line(line, layout_.marker)) {
            stanzas.push_back(new_stanza(line));
            seen.clear();
            in_stanza = true;
        }
        if (!in_stanza) continue;
        collect_fields(line, stanzas.back(), seen);
    }

    spdlog::trace("Parsed {} {} stanzas", stanzas.size(), layout_.marker);
    return stanzas;
}

std::optional<std::string> find_attribute(const std::string& text, const std::string& name,
                                          bool strip) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto value = StanzaParser::extract_attribute(line, name);
        if (value) return strip ? StanzaParser::strip_whitespace(*value) : StanzaParser::trim(*value);
    }
    return std::nullopt;
}

} // namespace mqm_collector
