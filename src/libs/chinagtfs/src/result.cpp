// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/result.h>

namespace chinagtfs
{
const char* to_string(result_code code)
{
    switch (code)
    {
        case OK:
            return "ok";
        case MISSING_TABLE:
            return "missing table";
        case CITY_NOT_FOUND:
            return "city not found";
        case ROUTE_TIMING_MISSING:
            return "route timing missing";
        case INVALID_REFERENCE:
            return "invalid reference";
        case INVALID_ARCHIVE_PATH:
            return "invalid archive path";
    }
    return "unknown";
}
}  // namespace chinagtfs
