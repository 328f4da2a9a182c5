#pragma once
#include <gtfs/record.h>
#include <gtfs/types.h>
#include <gtfs/enums/stop_location_type.h>

namespace chinagtfs::gtfs
{
class feed;

struct stop: public record
{
    stop(chinagtfs::gtfs::feed& feed);

    // Required:
    Id stop_id;

    // Conditionally required:
    Text stop_name;

    double stop_lat = 0.0;
    double stop_lon = 0.0;
    Id zone_id;
    Id parent_station;

    // Optional:
    Text stop_code;
    Text stop_desc;
    Text stop_url;
    stop_location_type location_type = stop_location_type::StopOrPlatform;
    Timezone stop_timezone;
    Text wheelchair_boarding;
    Id level_id;
    Text platform_code;
};
}
