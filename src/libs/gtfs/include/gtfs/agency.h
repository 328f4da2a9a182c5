#pragma once
#include <gtfs/types.h>
#include <gtfs/record.h>

#include <functional>
#include <vector>

namespace chinagtfs::gtfs
{
struct route;

struct agency: public record
{
    agency(chinagtfs::gtfs::feed& feed):
        record(feed)
    {}

    // Conditionally optional:
    Id agency_id;

    // Required:
    Text agency_name;
    Text agency_url;
    Timezone agency_timezone;

    // Optional:
    LanguageCode agency_lang;
    Text agency_phone;
    Text agency_fare_url;
    Text agency_email;

    const std::vector<std::reference_wrapper<route>>& routes() const;
};
}
