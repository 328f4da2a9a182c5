#include <gtfs/feed.h>
namespace chinagtfs::gtfs
{
namespace
{
template <typename T>
const std::vector<std::reference_wrapper<T>>& find_or_empty(
        const std::map<Id, std::vector<std::reference_wrapper<T>>>& map, const Id& id)
{
    static const std::vector<std::reference_wrapper<T>> empty;
    auto it = map.find(id);
    if (it == map.end())
        return empty;
    return it->second;
}
}

stop_time_provider::stop_time_provider(feed& feed) :
    feed_(feed)
{
}
const std::vector<std::reference_wrapper<stop_time>>& stop_time_provider::get_for_trip(const Id& id) const
{
    return find_or_empty(trip_based_map, id);
}
void stop_time_provider::prepare()
{
    trip_based_map.clear();
    for (auto& st : feed_.stop_times)
    {
        trip_based_map[st.trip_id].push_back(std::ref(st));
    }
}

feed::feed() :
    stop_time_provider_(*this),
    routes_provider_(*this),
    trips_provider_(*this)
{
}
const chinagtfs::gtfs::stop_time_provider& feed::stop_time_provider() const
{
    return stop_time_provider_;
}
void feed::build()
{
    stop_time_provider_.prepare();
    routes_provider_.prepare();
    trips_provider_.prepare();
}
const chinagtfs::gtfs::routes_provider& feed::routes_provider() const
{
    return routes_provider_;
}
const chinagtfs::gtfs::trips_provider& feed::trips_provider() const
{
    return trips_provider_;
}

routes_provider::routes_provider(feed& feed) :
    feed_(feed)
{
}
void routes_provider::prepare()
{
    agency_based_map.clear();
    for (auto& r : feed_.routes)
    {
        agency_based_map[r.second.agency_id].push_back(std::ref(r.second));
    }
}
const std::vector<std::reference_wrapper<chinagtfs::gtfs::route>>& routes_provider::get_for_agency(const Id& id) const
{
    return find_or_empty(agency_based_map, id);
}

trips_provider::trips_provider(feed& feed) :
        feed_(feed)
{
}
void trips_provider::prepare()
{
    route_based_map.clear();
    for (auto& t : feed_.trips)
    {
        route_based_map[t.second.route_id].push_back(std::ref(t.second));
    }
}
const std::vector<std::reference_wrapper<chinagtfs::gtfs::trip>>& trips_provider::get_for_route(const Id& id) const
{
    return find_or_empty(route_based_map, id);
}
}
