// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_MODEL_H_
#define CHINAGTFS_METROMAN_MODEL_H_

#include <chinagtfs/geo/coordinate.h>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chinagtfs::metroman
{
// Names as published by the operator. Not every entity fills every name.
struct names
{
    std::string english;
    std::string simplified;
    std::string traditional;
    std::string japanese;
    std::string english_short;
    std::string short_name;
};

struct station
{
    std::string code;
    names name;
    // Position in file order, contiguous from 0.
    size_t index = 0;
    geo::coordinate position;  // WGS-84
    int map_x = 0;
    int map_y = 0;
};

using station_pair = std::pair<std::string, std::string>;

struct line
{
    std::string code;
    names name;
    std::string color;  // #RRGGBB
    std::vector<size_t> stations;
    // polylines (WGS-84) between consecutive stations, keyed by (from code, to code)
    std::map<station_pair, std::vector<geo::coordinate>> station_paths;
};

struct station_visit
{
    size_t station = 0;
    // used as both arrival and departure
    int minutes = 0;
};

struct trip
{
    std::vector<station_visit> visits;
    bool ended = false;

    int first_minutes() const
    {
        return visits.empty() ? 0 : visits.front().minutes;
    }
};

struct schedule
{
    std::string code;
    std::array<bool, 7> days_of_week{};  // monday first
    bool holidays = false;

    bool any_day_of_week() const;
};

struct route
{
    std::string code;
    names name;
    std::vector<size_t> stations;
    std::optional<size_t> line;
    // 0, 1, 2... in way.csv order per line
    size_t index_within_line = 0;
    std::vector<std::string> schedules;
    // station index -> position of its hop within the raw schedule dump
    std::map<size_t, size_t> station_to_schedule_index;
    // one collection per entry of schedules
    std::vector<std::vector<trip>> trips;

    // at least one trip collection was reconstructed
    bool has_timetable() const;
};

struct fare_matrix
{
    std::string code;
    // prices[from][to], indexed like stations
    std::vector<std::vector<int>> prices;
    std::vector<size_t> stations;

    std::optional<int> price(size_t from, size_t to) const;
};

struct holiday
{
    int year = 0;
    int month = 0;
    int day = 0;
};

/*
 * The entity graph of one city. Entities refer to each other by index into
 * the vectors below; the graph is immutable once loaded.
 */
struct city
{
    std::string code;
    std::string version;

    std::vector<station> stations;
    std::vector<line> lines;
    std::vector<route> routes;
    std::vector<schedule> schedules;
    std::vector<fare_matrix> fares;
    std::vector<holiday> holidays;

    std::unordered_map<std::string, size_t> station_by_code;
    std::unordered_map<std::string, size_t> line_by_code;
    std::unordered_map<std::string, size_t> route_by_code;
    std::unordered_map<std::string, size_t> schedule_by_code;

    std::optional<size_t> find_station(const std::string& station_code) const;
    std::optional<size_t> find_line(const std::string& line_code) const;
    std::optional<size_t> find_route(const std::string& route_code) const;
    std::optional<size_t> find_schedule(const std::string& schedule_code) const;

    size_t trip_count() const;
};

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_MODEL_H_
