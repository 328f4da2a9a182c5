#include <gtfs/trip.h>
#include <gtfs/feed.h>
namespace chinagtfs::gtfs
{
std::optional<std::reference_wrapper<const chinagtfs::gtfs::route>> trip::route() const
{
    auto it = feed.routes.find(route_id);
    if (it == feed.routes.end())
        return std::nullopt;

    return std::cref(it->second);
}
std::optional<std::reference_wrapper<const chinagtfs::gtfs::shape>> trip::shape() const
{
    auto it = feed.shapes.find(shape_id);
    if (it == feed.shapes.end())
        return std::nullopt;

    return std::cref(it->second);
}
const std::vector<std::reference_wrapper<stop_time>>& trip::stop_times() const
{
    return feed.stop_time_provider().get_for_trip(trip_id);
}
}
