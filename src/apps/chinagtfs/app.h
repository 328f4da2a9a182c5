#ifndef CHINAGTFS_APP_H
#define CHINAGTFS_APP_H

#include <chinagtfs/config/config.h>
#include <chinagtfs/metroman/registry.h>
#include <chinagtfs/metroman/station_geometry.h>
#include <chinagtfs/metroman/version_table.h>

#include <string>
#include <vector>

enum class ret_code
{
    SUCCESS = 0,
    NO_VERSION_TABLE = 1,
    STATION_GEOMETRY_ERR = 2,
    CITY_NOT_FOUND = 3,
    CITY_LOAD_ERR = 4,
    GTFS_WRITE_ERR = 5
};

class app
{
public:
    app(int argc, char* argv[]);
    ret_code run();

    const chinagtfs::config::config& config() const
    {
        return cfg_;
    }

private:
    std::vector<std::string> cities_to_convert() const;
    ret_code convert(chinagtfs::metroman::registry& registry, const std::string& city_code) const;

    chinagtfs::config::config cfg_;
    chinagtfs::metroman::version_table versions_;
    chinagtfs::metroman::station_geometry_table geometries_;
};

#endif//CHINAGTFS_APP_H
