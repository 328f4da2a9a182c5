// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_CONFIG_CONFIG_H_
#define CHINAGTFS_CONFIG_CONFIG_H_

#include <chinagtfs/assembly/feed_options.h>

#include <sstream>
#include <string>
#include <vector>

namespace chinagtfs::config
{

struct config
{
    std::string input_path{"."};
    std::string versions_path;
    std::string output_path{"gtfs-out"};
    std::string station_geometry_path;
    std::string log_level{"info"};
    std::vector<std::string> cities;
    bool all_cities{false};
    assembly::feed_options feed;

    std::string to_string() const
    {
        std::stringstream ss;
        ss << "input-path: " << input_path << "\n"
           << "versions-path: " << versions_path << "\n"
           << "output-path: " << output_path << "\n"
           << "station-geometry-path: " << station_geometry_path << "\n"
           << "log-level: " << log_level << "\n"
           << "all-cities: " << all_cities << "\n"
           << "agency-url: " << feed.agency_url << "\n"
           << "timezone: " << feed.timezone << "\n"
           << "lang: " << feed.language << "\n"
           << "currency: " << feed.currency << "\n"
           << "write-fares: " << feed.write_fares << "\n"
           << "write-shapes: " << feed.write_shapes << "\n"
           << "cities: ";

        for (const auto& c : cities)
        {
            ss << c << " ";
        }

        ss << "\n";

        return ss.str();
    }
};

}  // namespace chinagtfs::config

#endif  // CHINAGTFS_CONFIG_CONFIG_H_
