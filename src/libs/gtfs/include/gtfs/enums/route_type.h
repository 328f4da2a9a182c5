#pragma once

namespace chinagtfs::gtfs
{
// Basic GTFS route types, https://gtfs.org/schedule/reference/#routestxt
enum class route_type
{
    Tram = 0,
    Subway = 1,
    Rail = 2,
    Bus = 3,
    Ferry = 4,
    CableTram = 5,
    AerialLift = 6,
    Funicular = 7,
    Trolleybus = 11,
    Monorail = 12
};
}
