// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/metroman/csv.h>

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace chinagtfs::metroman
{
// _____________________________________________________________________________
std::vector<std::string> split_records(const std::string& contents)
{
    std::vector<std::string> ret;

    size_t start = 0;
    while (start < contents.size())
    {
        size_t end = contents.find('\n', start);
        if (end == std::string::npos)
            end = contents.size();

        size_t record_end = end;
        if (record_end > start && contents[record_end - 1] == '\r')
            --record_end;

        if (record_end > start)
            ret.push_back(contents.substr(start, record_end - start));

        start = end + 1;
    }

    return ret;
}

// _____________________________________________________________________________
std::vector<std::string> split_fields(const std::string& record, const std::string& delimiter)
{
    std::vector<std::string> ret;

    size_t start = 0;
    while (true)
    {
        const size_t end = record.find(delimiter, start);
        if (end == std::string::npos)
        {
            ret.push_back(record.substr(start));
            break;
        }
        ret.push_back(record.substr(start, end - start));
        start = end + delimiter.size();
    }

    return ret;
}

// _____________________________________________________________________________
const std::string& field(const std::vector<std::string>& fields, size_t index)
{
    static const std::string empty;
    if (index >= fields.size())
        return empty;
    return fields[index];
}

// _____________________________________________________________________________
int parse_int(const std::string& text)
{
    if (text.empty())
        return 0;

    char* rem = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &rem, 10);
    if (*rem || errno == ERANGE || value > INT_MAX || value < INT_MIN)
        return 0;
    return static_cast<int>(value);
}

// _____________________________________________________________________________
double parse_double(const std::string& text)
{
    if (text.empty())
        return 0.0;

    char* rem = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &rem);
    if (*rem || errno == ERANGE)
        return 0.0;
    return value;
}

}  // namespace chinagtfs::metroman
