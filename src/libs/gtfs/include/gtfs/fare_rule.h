#pragma once
#include <gtfs/types.h>

namespace chinagtfs::gtfs
{
// Optional dataset file. Distance based fares are expressed as one rule per
// ordered pair of stop zones.
struct fare_rule
{
    // Required:
    Id fare_id;

    // Optional:
    Id route_id;
    Id origin_id;       // zone_id of the boarding stop
    Id destination_id;  // zone_id of the alighting stop
    Id contains_id;
};
}
