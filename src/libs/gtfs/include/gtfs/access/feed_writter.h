#pragma once
#include <gtfs/access/result.h>

#include <functional>
#include <iosfwd>
#include <string>

namespace chinagtfs::gtfs
{
class feed;
namespace access
{
/**
 * @brief writes the tables of a feed as GTFS csv files into a directory,
 * the directory is created when missing
 */
class feed_writter
{
public:
    struct write_config
    {
        // Write required files:
        bool agencies = true;
        bool stops = true;
        bool routes = true;
        bool trips = true;
        bool stop_times = true;

        // Write conditionally required files:
        bool calendar = true;
        bool calendar_dates = true;

        // Write optional files:
        bool shapes = true;
        bool fare_attributes = true;
        bool fare_rules = true;
    };

    feed_writter(const feed& feed, const std::string& directory);
    result write(const write_config& config) noexcept;

protected:
    static result write_csv(const std::string & path, const std::string & file,
                                  const std::function<void(std::ofstream & out)> & write_header,
                                  const std::function<void(std::ofstream & out)> & write_entities);

    result write_agencies() const;
    result write_routes() const;
    result write_shapes() const;
    result write_trips() const;
    result write_stops() const;
    result write_stop_times() const;
    result write_calendar() const;
    result write_calendar_dates() const;
    result write_fare_attributes() const;
    result write_fare_rules() const;
private:
    const feed& feed_;
    std::string gtfs_directory_;
};
}
}
