// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_RESULT_H_
#define CHINAGTFS_RESULT_H_

#include <string>
#include <utility>

namespace chinagtfs
{
enum result_code
{
    OK,
    MISSING_TABLE,
    CITY_NOT_FOUND,
    ROUTE_TIMING_MISSING,
    INVALID_REFERENCE,
    INVALID_ARCHIVE_PATH
};

const char* to_string(result_code code);

struct result
{
    result() = default;
    result(result_code && in_code) : code(in_code) {} //NOLINT
    result(const result_code & in_code, std::string msg) : code(in_code), message(std::move(msg)) {}
    bool operator==(result_code result_code) const { return code == result_code; }
    bool operator!=(result_code result_code) const { return !(*this == result_code); }

    result_code code = OK;
    std::string message;
};

}  // namespace chinagtfs

#endif  // CHINAGTFS_RESULT_H_
