// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/metroman/model.h>

#include <algorithm>

namespace chinagtfs::metroman
{
namespace
{
std::optional<size_t> find_index(const std::unordered_map<std::string, size_t>& map, const std::string& code)
{
    auto it = map.find(code);
    if (it == map.end())
        return std::nullopt;
    return it->second;
}
}  // namespace

// _____________________________________________________________________________
bool schedule::any_day_of_week() const
{
    return std::any_of(days_of_week.begin(), days_of_week.end(), [](bool day) { return day; });
}

// _____________________________________________________________________________
bool route::has_timetable() const
{
    return !trips.empty();
}

// _____________________________________________________________________________
std::optional<int> fare_matrix::price(size_t from, size_t to) const
{
    if (from >= prices.size() || to >= prices[from].size())
        return std::nullopt;
    return prices[from][to];
}

// _____________________________________________________________________________
std::optional<size_t> city::find_station(const std::string& station_code) const
{
    return find_index(station_by_code, station_code);
}

// _____________________________________________________________________________
std::optional<size_t> city::find_line(const std::string& line_code) const
{
    return find_index(line_by_code, line_code);
}

// _____________________________________________________________________________
std::optional<size_t> city::find_route(const std::string& route_code) const
{
    return find_index(route_by_code, route_code);
}

// _____________________________________________________________________________
std::optional<size_t> city::find_schedule(const std::string& schedule_code) const
{
    return find_index(schedule_by_code, schedule_code);
}

// _____________________________________________________________________________
size_t city::trip_count() const
{
    size_t count = 0;
    for (const auto& r : routes)
        for (const auto& collection : r.trips)
            count += collection.size();
    return count;
}

}  // namespace chinagtfs::metroman
