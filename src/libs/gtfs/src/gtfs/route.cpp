#include <gtfs/route.h>
#include <gtfs/feed.h>
namespace chinagtfs::gtfs
{
std::optional<std::reference_wrapper<const agency>> route::agency() const
{
    auto it = feed.agencies.find(agency_id);
    if (agency_id.empty() || it == feed.agencies.end())
        return std::nullopt;

    return std::cref(it->second);
}
const std::vector<std::reference_wrapper<trip>>& route::trips() const
{
    return feed.trips_provider().get_for_route(route_id);
}

}
