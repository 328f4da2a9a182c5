#pragma once

namespace chinagtfs::gtfs
{
enum class stop_time_point
{
    Approximate = 0,
    Exact = 1
};
}
