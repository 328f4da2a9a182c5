// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_ASSEMBLY_FEEDBUILDER_H_
#define CHINAGTFS_ASSEMBLY_FEEDBUILDER_H_

#include <chinagtfs/assembly/feed_options.h>
#include <chinagtfs/geo/coordinate.h>
#include <chinagtfs/metroman/model.h>

#include <gtfs/feed.h>

#include <string>
#include <vector>

namespace chinagtfs::assembly
{
/*
 * Projects a loaded city into a GTFS feed.
 */
class feed_builder
{
public:
    feed_builder(const metroman::city& c, feed_options options);

    // Adds every entity of the city and indexes the feed.
    void build(gtfs::feed& feed) const;

    void add_agency(gtfs::feed& feed) const;
    void add_stops(gtfs::feed& feed) const;
    void add_routes(gtfs::feed& feed) const;
    void add_calendar(gtfs::feed& feed) const;
    void add_trips(gtfs::feed& feed) const;
    void add_shapes(gtfs::feed& feed) const;
    void add_fares(gtfs::feed& feed) const;

    // Number of dangling references and empty routes or trips in a built
    // feed, each one logged.
    size_t check(const gtfs::feed& feed) const;

    // Polyline of the route along the station paths of its line, empty if
    // the line has no path for any of its hops.
    std::vector<geo::coordinate> route_shape(const metroman::route& r) const;

    static std::string agency_name(const std::string& city_code);
    static std::string zone_id(const std::string& station_code);
    static std::string trip_id(const std::string& route_code, const std::string& schedule_code, size_t n);
    static std::string shape_id(const std::string& route_code);
    static std::string fare_id(const std::string& from_code, const std::string& to_code);

private:
    const metroman::city& city_;
    feed_options options_;
};

}  // namespace chinagtfs::assembly

#endif  // CHINAGTFS_ASSEMBLY_FEEDBUILDER_H_
