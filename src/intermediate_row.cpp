#include "mqm_collector/intermediate_row.h"

#include <algorithm>

namespace mqm_collector {

std::string encode_row(const std::vector<std::string>& fields) {
    std::string row;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) row += ROW_DELIMITER;
        std::remove_copy(fields[i].begin(), fields[i].end(), std::back_inserter(row), ROW_DELIMITER);
    }
    return row;
}

std::vector<std::string> split_row(const std::string& row) {
    std::vector<std::string> fields;
    size_t start = 0;
    for (;;) {
        auto pos = row.find(ROW_DELIMITER, start);
        if (pos == std::string::npos) {
            fields.push_back(row.substr(start));
            break;
        }
        fields.push_back(row.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

} // namespace mqm_collector
