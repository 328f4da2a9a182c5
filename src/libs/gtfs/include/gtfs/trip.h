#pragma once
#include <gtfs/enums/trip_direction_id.h>
#include <gtfs/record.h>
#include <gtfs/types.h>

#include <functional>
#include <optional>
#include <vector>

namespace chinagtfs::gtfs
{
struct stop_time;
struct route;
struct shape;
class feed;

struct trip: public record
{
    trip(chinagtfs::gtfs::feed& feed):
        record(feed)
    {
    }

    // Required:
    Id route_id;
    Id service_id;
    Id trip_id;

    // Optional:
    Text trip_headsign;
    Text trip_short_name;
    trip_direction_id direction_id = trip_direction_id::DefaultDirection;
    Id block_id;
    Id shape_id;

    std::optional<std::reference_wrapper<const chinagtfs::gtfs::route>> route() const;
    std::optional<std::reference_wrapper<const chinagtfs::gtfs::shape>> shape() const;
    const std::vector<std::reference_wrapper<stop_time>>& stop_times() const;
};
}
