// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/geo/coordinate_transform.h>
#include <chinagtfs/metroman/city_loader.h>
#include <chinagtfs/metroman/csv.h>
#include <chinagtfs/metroman/trip_builder.h>

#include <logging/logger.h>
#include <logging/scoped_timer.h>

#include <algorithm>
#include <utility>

namespace chinagtfs::metroman
{
namespace
{
const std::string table_uno = "uno";
const std::string table_line = "line";
const std::string table_way = "way";
const std::string table_fare = "fare";
const std::string table_holiday = "holiday";
const std::string table_schedule = "schedule";
const std::string table_wayschedule = "wayschedule";
const std::string table_path_latlng = "path_latlng";
const std::string table_path_rail = "path_rail";

names read_names(const std::vector<std::string>& fields)
{
    names ret;
    ret.english = field(fields, 2);
    ret.simplified = field(fields, 3);
    ret.traditional = field(fields, 4);
    ret.japanese = field(fields, 5);
    ret.english_short = field(fields, 6);
    ret.short_name = field(fields, 7);
    return ret;
}

// station indices as listed from the given field on, out of range indices are dropped
std::vector<size_t> read_station_indices(const std::vector<std::string>& fields, size_t first, const city& c,
                                         const std::string& owner)
{
    std::vector<size_t> ret;
    for (size_t i = first; i < fields.size(); ++i)
    {
        const int index = parse_int(fields[i]);
        if (index < 0 || static_cast<size_t>(index) >= c.stations.size())
        {
            LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] " << owner << " references station index "
                      << fields[i] << " of " << c.stations.size();
            continue;
        }
        ret.push_back(static_cast<size_t>(index));
    }
    return ret;
}

std::vector<std::string> split_list(const std::string& text)
{
    if (text.empty())
        return {};
    return split_fields(text, "|");
}
}  // namespace

// _____________________________________________________________________________
city_loader::city_loader(const bundle& archive, std::string version, const station_geometry_source* geometries) :
    archive_{archive},
    version_{std::move(version)},
    geometries_{geometries}
{
}

// _____________________________________________________________________________
result city_loader::load(const std::string& city_code, city& out) const
{
    logging::scoped_timer timer("load " + city_code);

    city c;
    c.code = city_code;
    c.version = version_;

    if (auto res = read_entities(c); res != OK)
        return res;
    if (auto res = read_line_stations(c); res != OK)
        return res;
    if (auto res = read_route_stations(c); res != OK)
        return res;
    if (auto res = read_fares(c); res != OK)
        return res;
    if (auto res = read_holidays(c); res != OK)
        return res;
    if (auto res = read_schedules(c); res != OK)
        return res;
    if (auto res = read_route_schedules(c); res != OK)
        return res;
    if (auto res = read_paths(c); res != OK)
        return res;
    read_timings(c);

    LOG(INFO) << "City " << city_code << " (" << version_ << "): " << c.stations.size() << " stations, "
              << c.lines.size() << " lines, " << c.routes.size() << " routes, " << c.schedules.size()
              << " schedules, " << c.trip_count() << " trips";

    out = std::move(c);
    return OK;
}

// _____________________________________________________________________________
result city_loader::read_table(const std::string& table, std::string& contents) const
{
    const auto path = table_path(version_, table);
    auto found = archive_.read(path);
    if (!found)
        return {MISSING_TABLE, "Archive has no table " + path};

    LOG(DEBUG) << "Reading " << path << " (" << found->size() << " bytes)";
    contents = std::move(*found);
    return OK;
}

// _____________________________________________________________________________
result city_loader::read_entities(city& c) const
{
    std::string contents;
    if (auto res = read_table(table_uno, contents); res != OK)
        return res;

    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, bracket_delimiter);
        const auto& tag = field(fields, 1);

        if (tag == "MS")
        {
            station s;
            s.code = fields[0];
            s.name = read_names(fields);
            s.index = c.stations.size();
            s.position = geo::gcj02_to_wgs84({parse_double(field(fields, 8)), parse_double(field(fields, 9))});
            s.map_x = parse_int(field(fields, 10));
            s.map_y = parse_int(field(fields, 11));
            apply_station_geometry(s);

            c.station_by_code[s.code] = s.index;
            c.stations.push_back(std::move(s));
        }
        else if (tag == "ML" || tag == "WL")
        {
            // metro and walking lines
            line l;
            l.code = fields[0];
            l.name = read_names(fields);
            l.color = field(fields, 12);

            c.line_by_code[l.code] = c.lines.size();
            c.lines.push_back(std::move(l));
        }
        else if (tag == "MW" || tag == "WW")
        {
            route r;
            r.code = fields[0];
            r.name = read_names(fields);

            c.route_by_code[r.code] = c.routes.size();
            c.routes.push_back(std::move(r));
        }
        else
        {
            LOG(TRACE) << "Skipping " << table_uno << " record with tag '" << tag << "'";
        }
    }

    return OK;
}

// _____________________________________________________________________________
result city_loader::read_line_stations(city& c) const
{
    std::string contents;
    if (auto res = read_table(table_line, contents); res != OK)
        return res;

    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, comma_delimiter);
        auto line_index = c.find_line(fields[0]);
        if (!line_index)
        {
            LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] " << table_line << " references unknown line "
                      << fields[0];
            continue;
        }

        auto& l = c.lines[*line_index];
        auto stations = read_station_indices(fields, 1, c, "line " + l.code);
        l.stations.insert(l.stations.end(), stations.begin(), stations.end());
    }

    return OK;
}

// _____________________________________________________________________________
result city_loader::read_route_stations(city& c) const
{
    std::string contents;
    if (auto res = read_table(table_way, contents); res != OK)
        return res;

    std::map<size_t, size_t> routes_per_line;
    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, comma_delimiter);
        auto route_index = c.find_route(fields[0]);
        if (!route_index)
        {
            LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] " << table_way << " references unknown route "
                      << fields[0];
            continue;
        }

        auto& r = c.routes[*route_index];
        const int line_index = parse_int(field(fields, 1));
        if (line_index < 0 || static_cast<size_t>(line_index) >= c.lines.size())
        {
            LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] route " << r.code << " references line index "
                      << field(fields, 1) << " of " << c.lines.size();
            continue;
        }

        auto stations = read_station_indices(fields, 3, c, "route " + r.code);
        r.stations.insert(r.stations.end(), stations.begin(), stations.end());

        // the terminal station has no hop of its own in the schedule dump,
        // the remaining hops are dumped in station index order
        std::vector<size_t> hop_stations;
        if (!r.stations.empty())
            hop_stations.assign(r.stations.begin(), r.stations.end() - 1);
        std::sort(hop_stations.begin(), hop_stations.end());

        r.station_to_schedule_index.clear();
        for (size_t i = 0; i < hop_stations.size(); ++i)
            r.station_to_schedule_index[hop_stations[i]] = i;

        r.line = static_cast<size_t>(line_index);
        r.index_within_line = routes_per_line[*r.line]++;
    }

    return OK;
}

// _____________________________________________________________________________
result city_loader::read_fares(city& c) const
{
    std::string contents;
    if (auto res = read_table(table_fare, contents); res != OK)
        return res;

    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, comma_delimiter);

        fare_matrix fare;
        fare.code = fields[0];

        auto station_codes = split_list(field(fields, 4));
        if (station_codes.empty())
        {
            auto route_codes = split_list(field(fields, 1));
            std::optional<size_t> route_index;
            if (!route_codes.empty())
                route_index = c.find_route(route_codes.front());

            if (!route_index)
            {
                LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] fare " << fare.code
                          << " lists neither stations nor a known route, skipping";
                continue;
            }
            fare.stations = c.routes[*route_index].stations;
        }
        else
        {
            bool known = true;
            for (const auto& code : station_codes)
            {
                auto station_index = c.find_station(code);
                if (!station_index)
                {
                    LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] fare " << fare.code
                              << " references unknown station " << code << ", skipping";
                    known = false;
                    break;
                }
                fare.stations.push_back(*station_index);
            }
            if (!known)
                continue;
        }

        const auto& matrix_table = field(fields, 3);
        if (!matrix_table.empty())
        {
            const auto path = version_ + "/" + matrix_table;
            auto matrix = archive_.read(path);
            if (!matrix)
                return {MISSING_TABLE, "Archive has no fare matrix " + path};

            LOG(DEBUG) << "Reading " << path << " (" << matrix->size() << " bytes)";
            for (const auto& row : split_records(*matrix))
            {
                std::vector<int> prices;
                for (const auto& price : split_fields(row, comma_delimiter))
                    prices.push_back(parse_int(price));
                fare.prices.push_back(std::move(prices));
            }

            // one row and one column per station
            const auto n = fare.stations.size();
            bool square = fare.prices.size() == n;
            for (const auto& row : fare.prices)
                square = square && row.size() == n;
            if (!square)
            {
                LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] fare " << fare.code << " matrix " << path
                          << " does not match its " << n << " stations, skipping";
                continue;
            }
        }
        else
        {
            // every station pair has the same fixed price
            const int fixed_price = parse_int(field(fields, 2));
            fare.prices.assign(fare.stations.size(), std::vector<int>(fare.stations.size(), fixed_price));
        }

        c.fares.push_back(std::move(fare));
    }

    return OK;
}

// _____________________________________________________________________________
result city_loader::read_holidays(city& c) const
{
    std::string contents;
    if (auto res = read_table(table_holiday, contents); res != OK)
        return res;

    for (const auto& record : split_records(contents))
    {
        if (record.size() < 8)
        {
            LOG(WARN) << "Skipping malformed holiday '" << record << "'";
            continue;
        }
        c.holidays.push_back({parse_int(record.substr(0, 4)), parse_int(record.substr(4, 2)),
                              parse_int(record.substr(6, 2))});
    }

    return OK;
}

// _____________________________________________________________________________
result city_loader::read_schedules(city& c) const
{
    std::string contents;
    if (auto res = read_table(table_schedule, contents); res != OK)
        return res;

    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, bracket_delimiter);

        schedule s;
        s.code = fields[0];
        for (size_t day = 0; day < s.days_of_week.size(); ++day)
        {
            const auto& bit = field(fields, day + 1);
            s.days_of_week[day] = !bit.empty() && bit.front() == '1';
        }
        const auto& holiday_flag = field(fields, 9);
        s.holidays = !holiday_flag.empty() && holiday_flag.front() == '1';

        if (auto existing = c.find_schedule(s.code))
        {
            LOG(WARN) << "Schedule " << s.code << " is defined twice, keeping the last definition";
            c.schedules[*existing] = std::move(s);
            continue;
        }

        c.schedule_by_code[s.code] = c.schedules.size();
        c.schedules.push_back(std::move(s));
    }

    return OK;
}

// _____________________________________________________________________________
result city_loader::read_route_schedules(city& c) const
{
    std::string contents;
    if (auto res = read_table(table_wayschedule, contents); res != OK)
        return res;

    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, comma_delimiter);
        auto route_index = c.find_route(fields[0]);
        if (!route_index)
        {
            LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] " << table_wayschedule
                      << " references unknown route " << fields[0];
            continue;
        }

        auto& r = c.routes[*route_index];
        r.schedules.clear();
        for (size_t i = 2; i < fields.size(); ++i)
        {
            if (!c.find_schedule(fields[i]))
            {
                LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] route " << r.code
                          << " references unknown schedule " << fields[i];
                continue;
            }
            r.schedules.push_back(fields[i]);
        }
    }

    return OK;
}

// _____________________________________________________________________________
result city_loader::read_paths(city& c) const
{
    std::string latlng_contents;
    if (auto res = read_table(table_path_latlng, latlng_contents); res != OK)
        return res;

    std::string rail_contents;
    if (auto res = read_table(table_path_rail, rail_contents); res != OK)
        return res;

    std::vector<geo::coordinate> coordinates;
    for (const auto& record : split_records(latlng_contents))
    {
        auto fields = split_fields(record, comma_delimiter);
        coordinates.push_back(geo::gcj02_to_wgs84({parse_double(field(fields, 0)), parse_double(field(fields, 1))}));
    }

    for (const auto& record : split_records(rail_contents))
    {
        auto fields = split_fields(record, comma_delimiter);
        auto line_index = c.find_line(fields[0]);
        if (!line_index)
        {
            LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] " << table_path_rail
                      << " references unknown line " << fields[0];
            continue;
        }

        const int first = parse_int(field(fields, 3));
        const int last = parse_int(field(fields, 4));
        if (first < 0 || last < first || static_cast<size_t>(last) >= coordinates.size())
        {
            LOG(WARN) << "[" << to_string(INVALID_REFERENCE) << "] path " << field(fields, 1) << "_"
                      << field(fields, 2) << " of line " << fields[0] << " spans [" << first << ", " << last
                      << "] of " << coordinates.size() << " coordinates";
            continue;
        }

        c.lines[*line_index].station_paths[{field(fields, 1), field(fields, 2)}] =
                std::vector<geo::coordinate>(coordinates.begin() + first, coordinates.begin() + last + 1);
    }

    return OK;
}

// _____________________________________________________________________________
void city_loader::read_timings(city& c) const
{
    for (auto& r : c.routes)
    {
        auto contents = archive_.read(table_path(version_, r.code));
        if (!contents)
        {
            // walking routes have no timing table
            LOG(DEBUG) << "[" << to_string(ROUTE_TIMING_MISSING) << "] route " << r.code;
            continue;
        }

        LOG(DEBUG) << "Reading " << table_path(version_, r.code) << " (" << contents->size() << " bytes)";
        r.trips = reconstruct_trips(parse_timing_table(*contents), r);
    }
}

// _____________________________________________________________________________
void city_loader::apply_station_geometry(station& s) const
{
    if (geometries_ == nullptr)
        return;

    auto encoded = geometries_->find(s.code);
    if (!encoded)
        return;

    if (auto position = station_position(*encoded))
    {
        LOG(TRACE) << "Station " << s.code << " positioned from its map geometry";
        s.position = *position;
    }
    else
    {
        LOG(DEBUG) << "Geometry of station " << s.code << " does not decode, keeping the archive position";
    }
}

}  // namespace chinagtfs::metroman
