// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/geo/coordinate_transform.h>
#include <chinagtfs/geo/geometry_codec.h>
#include <chinagtfs/metroman/csv.h>
#include <chinagtfs/metroman/station_geometry.h>

#include <logging/logger.h>

#include <fstream>
#include <sstream>

namespace chinagtfs::metroman
{
// _____________________________________________________________________________
station_geometry_table station_geometry_table::parse(const std::string& contents)
{
    station_geometry_table ret;
    for (const auto& record : split_records(contents))
    {
        // the encoded geometry never contains a comma
        const size_t separator = record.find(',');
        if (separator == std::string::npos || separator == 0)
        {
            LOG(WARN) << "Ignoring station geometry record '" << record << "'";
            continue;
        }
        ret.add(record.substr(0, separator), record.substr(separator + 1));
    }
    return ret;
}

// _____________________________________________________________________________
void station_geometry_table::add(const std::string& station_code, const std::string& encoded)
{
    geometries_[station_code] = encoded;
}

// _____________________________________________________________________________
std::optional<std::string> station_geometry_table::find(const std::string& station_code) const
{
    auto it = geometries_.find(station_code);
    if (it == geometries_.end())
        return std::nullopt;
    return it->second;
}

// _____________________________________________________________________________
result read_station_geometry_table(const std::string& path, station_geometry_table& table)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return {INVALID_ARCHIVE_PATH, "Could not open station geometry table " + path};

    std::stringstream contents;
    contents << in.rdbuf();
    table = station_geometry_table::parse(contents.str());

    LOG(DEBUG) << "Read " << table.size() << " station geometries from " << path;
    return OK;
}

// _____________________________________________________________________________
std::optional<geo::coordinate> station_position(const std::string& encoded)
{
    for (const auto& geometry : geo::decode_combined(encoded))
    {
        if (!geometry.points.empty())
            return geo::mercator_to_wgs84(geometry.points.front());
    }
    return std::nullopt;
}

}  // namespace chinagtfs::metroman
