#pragma once
#include <gtfs/exceptions.h>
#include <fstream>
#include <string>
#include <type_traits>
#include <vector>

namespace chinagtfs::gtfs
{

// File names defined in GTFS-----------------------------------------------------------------------
const std::string file_agency = "agency.txt";
const std::string file_stops = "stops.txt";
const std::string file_routes = "routes.txt";
const std::string file_trips = "trips.txt";
const std::string file_stop_times = "stop_times.txt";
const std::string file_calendar = "calendar.txt";
const std::string file_calendar_dates = "calendar_dates.txt";
const std::string file_fare_attributes = "fare_attributes.txt";
const std::string file_fare_rules = "fare_rules.txt";
const std::string file_shapes = "shapes.txt";

constexpr char csv_separator = ',';
constexpr char quote = '"';

std::string append_leading_zero(const std::string& s, bool check = true);

std::string add_trailing_slash(const std::string & path);

void write_joined(std::ofstream & out, std::vector<std::string> && elements);

std::string quote_text(const std::string & text);

// Csv field values that contain quotation marks or commas must be enclosed within quotation marks.
std::string wrap(const std::string & text);

// Save to csv coordinates with custom precision.
std::string wrap(double val);

// Save to csv enum value as unsigned integer.
template <typename T>
std::enable_if_t<std::is_integral<T>::value || std::is_enum<T>::value, std::string> wrap(const T & val)
{
    return std::to_string(static_cast<int>(val));
}

}
