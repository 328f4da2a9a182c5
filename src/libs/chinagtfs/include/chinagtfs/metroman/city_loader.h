// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_CITYLOADER_H_
#define CHINAGTFS_METROMAN_CITYLOADER_H_

#include <chinagtfs/metroman/bundle.h>
#include <chinagtfs/metroman/model.h>
#include <chinagtfs/metroman/station_geometry.h>
#include <chinagtfs/result.h>

#include <string>

namespace chinagtfs::metroman
{
/*
 * Parses the tables of one city archive into a city graph. Tables are read
 * in dependency order, a missing required table aborts the load.
 */
class city_loader
{
public:
    city_loader(const bundle& archive, std::string version, const station_geometry_source* geometries = nullptr);

    // On failure out is left untouched.
    result load(const std::string& city_code, city& out) const;

private:
    result read_table(const std::string& table, std::string& contents) const;

    result read_entities(city& c) const;
    result read_line_stations(city& c) const;
    result read_route_stations(city& c) const;
    result read_fares(city& c) const;
    result read_holidays(city& c) const;
    result read_schedules(city& c) const;
    result read_route_schedules(city& c) const;
    result read_paths(city& c) const;
    void read_timings(city& c) const;

    void apply_station_geometry(station& s) const;

    const bundle& archive_;
    std::string version_;
    const station_geometry_source* geometries_;
};

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_CITYLOADER_H_
