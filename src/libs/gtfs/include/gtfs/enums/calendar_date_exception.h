#pragma once

namespace chinagtfs::gtfs
{
enum class calendar_date_exception
{
    Added = 1,  // Service has been added for the specified date
    Removed = 2
};
}
