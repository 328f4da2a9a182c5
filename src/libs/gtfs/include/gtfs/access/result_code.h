#pragma once

namespace chinagtfs::gtfs::access
{
enum result_code
{
    OK,
    // the output directory is missing and cannot be created
    ERROR_INVALID_GTFS_PATH,
    ERROR_FILE_WRITE
};

inline const char* to_string(result_code code)
{
    switch (code)
    {
        case OK:
            return "OK";
        case ERROR_INVALID_GTFS_PATH:
            return "ERROR_INVALID_GTFS_PATH";
        case ERROR_FILE_WRITE:
            return "ERROR_FILE_WRITE";
    }
    return "UNKNOWN";
}
}
