#pragma once

#include <string>
#include <vector>

namespace mqm_collector {

// Rows passed from the query runner to the record assembler. Fields are
// separated by ASCII unit separator, which MQ tools never print.
constexpr char ROW_DELIMITER = '\x1f';

std::string encode_row(const std::vector<std::string>& fields);
std::vector<std::string> split_row(const std::string& row);

} // namespace mqm_collector
