// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_CSV_H_
#define CHINAGTFS_METROMAN_CSV_H_

#include <string>
#include <vector>

namespace chinagtfs::metroman
{
const std::string comma_delimiter = ",";
const std::string bracket_delimiter = "<,>";

// Splits on CRLF, tolerating bare LF. Empty records are skipped.
std::vector<std::string> split_records(const std::string& contents);

std::vector<std::string> split_fields(const std::string& record, const std::string& delimiter);

// The field at index, or an empty string past the end of the record.
const std::string& field(const std::vector<std::string>& fields, size_t index);

// Malformed numbers parse as zero.
int parse_int(const std::string& text);
double parse_double(const std::string& text);

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_CSV_H_
