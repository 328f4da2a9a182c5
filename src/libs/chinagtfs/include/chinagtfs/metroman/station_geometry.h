// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_STATIONGEOMETRY_H_
#define CHINAGTFS_METROMAN_STATIONGEOMETRY_H_

#include <chinagtfs/geo/coordinate.h>
#include <chinagtfs/result.h>

#include <map>
#include <optional>
#include <string>

namespace chinagtfs::metroman
{
/*
 * Looks up the raw encoded map geometry of a station.
 */
class station_geometry_source
{
public:
    virtual ~station_geometry_source() = default;

    virtual std::optional<std::string> find(const std::string& station_code) const = 0;
};

/*
 * Station code -> encoded geometry, read from "station_code,encoded" records.
 */
class station_geometry_table : public station_geometry_source
{
public:
    station_geometry_table() = default;

    static station_geometry_table parse(const std::string& contents);

    void add(const std::string& station_code, const std::string& encoded);
    std::optional<std::string> find(const std::string& station_code) const override;

    size_t size() const
    {
        return geometries_.size();
    }

private:
    std::map<std::string, std::string> geometries_;
};

result read_station_geometry_table(const std::string& path, station_geometry_table& table);

/**
 * The WGS-84 position of the first point of the first non empty geometry,
 * std::nullopt if nothing decodes.
 */
std::optional<geo::coordinate> station_position(const std::string& encoded);

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_STATIONGEOMETRY_H_
