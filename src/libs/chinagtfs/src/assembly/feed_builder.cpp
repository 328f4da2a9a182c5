// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/assembly/feed_builder.h>

#include <gtfs/exceptions.h>

#include <logging/logger.h>

#include <algorithm>
#include <utility>

namespace chinagtfs::assembly
{
namespace
{
const gtfs::date service_start("20000101");
const gtfs::date service_end("99991231");

gtfs::calendar_availability availability(bool available)
{
    return available ? gtfs::calendar_availability::Available : gtfs::calendar_availability::NotAvailable;
}
}  // namespace

// _____________________________________________________________________________
feed_builder::feed_builder(const metroman::city& c, feed_options options) :
    city_{c},
    options_{std::move(options)}
{
}

// _____________________________________________________________________________
void feed_builder::build(gtfs::feed& feed) const
{
    add_agency(feed);
    add_stops(feed);
    add_routes(feed);
    add_calendar(feed);
    add_trips(feed);
    if (options_.write_shapes)
        add_shapes(feed);
    if (options_.write_fares)
        add_fares(feed);

    feed.build();
    if (auto problems = check(feed); problems > 0)
        LOG(WARN) << "Feed of " << city_.code << " has " << problems << " inconsistencies";

    LOG(INFO) << "Feed of " << city_.code << ": " << feed.stops.size() << " stops, " << feed.routes.size()
              << " routes, " << feed.trips.size() << " trips, " << feed.stop_times.size() << " stop times, "
              << feed.shapes.size() << " shapes, " << feed.fare_attributes.size() << " fares";
}

// _____________________________________________________________________________
size_t feed_builder::check(const gtfs::feed& feed) const
{
    size_t problems = 0;

    for (const auto& [id, agency] : feed.agencies)
        LOG(DEBUG) << "Agency " << id << " runs " << agency.routes().size() << " routes";

    for (const auto& [id, route] : feed.routes)
    {
        if (!route.agency())
        {
            LOG(WARN) << "Route " << id << " references unknown agency " << route.agency_id;
            ++problems;
        }
        if (route.trips().empty())
        {
            LOG(WARN) << "Route " << id << " has no trips";
            ++problems;
        }
    }

    for (const auto& [id, trip] : feed.trips)
    {
        if (!trip.route())
        {
            LOG(WARN) << "Trip " << id << " references unknown route " << trip.route_id;
            ++problems;
        }
        if (!trip.shape_id.empty() && !trip.shape())
        {
            LOG(WARN) << "Trip " << id << " references unknown shape " << trip.shape_id;
            ++problems;
        }
        if (trip.stop_times().size() < 2)
        {
            LOG(WARN) << "Trip " << id << " has " << trip.stop_times().size() << " stop times";
            ++problems;
        }
    }

    return problems;
}

// _____________________________________________________________________________
void feed_builder::add_agency(gtfs::feed& feed) const
{
    gtfs::agency a(feed);
    a.agency_id = city_.code;
    a.agency_name = agency_name(city_.code);
    a.agency_url = options_.agency_url;
    a.agency_timezone = options_.timezone;
    a.agency_lang = options_.language;
    feed.agencies.emplace(a.agency_id, std::move(a));
}

// _____________________________________________________________________________
void feed_builder::add_stops(gtfs::feed& feed) const
{
    for (const auto& station : city_.stations)
    {
        gtfs::stop s(feed);
        s.stop_id = station.code;
        s.stop_code = station.name.simplified;
        s.stop_name = station.name.english;
        s.stop_lat = station.position.lat;
        s.stop_lon = station.position.lng;
        s.zone_id = zone_id(station.code);
        s.location_type = gtfs::stop_location_type::StopOrPlatform;
        s.stop_timezone = options_.timezone;
        feed.stops.emplace(s.stop_id, std::move(s));
    }
}

// _____________________________________________________________________________
void feed_builder::add_routes(gtfs::feed& feed) const
{
    for (const auto& r : city_.routes)
    {
        if (!r.has_timetable())
            continue;

        gtfs::route route(feed);
        route.route_id = r.code;
        route.agency_id = city_.code;
        route.route_short_name = r.name.simplified;
        route.route_long_name = r.name.english;
        route.route_type = gtfs::rt::Rail;
        if (r.line)
        {
            const auto& color = city_.lines[*r.line].color;
            route.route_color = !color.empty() && color.front() == '#' ? color.substr(1) : color;
        }
        route.route_text_color = "000000";
        feed.routes.emplace(route.route_id, std::move(route));
    }
}

// _____________________________________________________________________________
void feed_builder::add_calendar(gtfs::feed& feed) const
{
    std::vector<gtfs::date> holidays;
    for (const auto& h : city_.holidays)
    {
        try
        {
            holidays.emplace_back(static_cast<uint16_t>(h.year), static_cast<uint16_t>(h.month),
                                  static_cast<uint16_t>(h.day));
        }
        catch (const gtfs::invalid_field_format& e)
        {
            LOG(WARN) << "Skipping holiday of " << city_.code << ": " << e.what();
        }
    }

    for (const auto& s : city_.schedules)
    {
        if (s.any_day_of_week() || s.holidays)
        {
            gtfs::calendar_item item;
            item.service_id = s.code;
            for (size_t day = 0; day < item.days.size(); ++day)
                item.days[day] = availability(s.days_of_week[day]);
            item.start_date = service_start;
            item.end_date = service_end;
            feed.calendar.emplace(item.service_id, item);
        }

        const auto exception_type =
                s.holidays ? gtfs::calendar_date_exception::Added : gtfs::calendar_date_exception::Removed;
        for (const auto& d : holidays)
            feed.calendar_dates.push_back({s.code, d, exception_type});
    }
}

// _____________________________________________________________________________
void feed_builder::add_trips(gtfs::feed& feed) const
{
    for (const auto& r : city_.routes)
    {
        if (!r.has_timetable())
            continue;

        const bool has_shape = options_.write_shapes && !route_shape(r).empty();
        const auto direction = r.index_within_line % 2 == 0 ? gtfs::trip_direction_id::DefaultDirection
                                                             : gtfs::trip_direction_id::OppositeDirection;

        for (size_t schedule_index = 0; schedule_index < r.trips.size(); ++schedule_index)
        {
            if (schedule_index >= r.schedules.size())
                break;
            const auto& schedule_code = r.schedules[schedule_index];

            auto trips = r.trips[schedule_index];
            std::stable_sort(trips.begin(), trips.end(), [](const metroman::trip& a, const metroman::trip& b) {
                return a.first_minutes() < b.first_minutes();
            });

            for (size_t n = 0; n < trips.size(); ++n)
            {
                const auto id = trip_id(r.code, schedule_code, n);

                std::vector<gtfs::stop_time> stop_times;
                try
                {
                    for (const auto& visit : trips[n].visits)
                    {
                        gtfs::stop_time st(feed);
                        st.trip_id = id;
                        st.stop_id = city_.stations[visit.station].code;
                        st.stop_sequence = stop_times.size();
                        st.arrival_time = gtfs::time::from_minutes(visit.minutes);
                        st.departure_time = st.arrival_time;
                        st.timepoint = gtfs::stop_time_point::Exact;
                        stop_times.push_back(std::move(st));
                    }
                }
                catch (const gtfs::invalid_field_format& e)
                {
                    LOG(WARN) << "Skipping trip " << id << ": " << e.what();
                    continue;
                }

                gtfs::trip t(feed);
                t.route_id = r.code;
                t.service_id = schedule_code;
                t.trip_id = id;
                t.trip_headsign = r.name.english;
                t.direction_id = direction;
                if (has_shape)
                    t.shape_id = shape_id(r.code);
                feed.trips.emplace(t.trip_id, std::move(t));

                for (auto& st : stop_times)
                    feed.stop_times.push_back(std::move(st));
            }
        }
    }
}

// _____________________________________________________________________________
void feed_builder::add_shapes(gtfs::feed& feed) const
{
    for (const auto& r : city_.routes)
    {
        if (!r.has_timetable())
            continue;

        auto coordinates = route_shape(r);
        if (coordinates.empty())
        {
            LOG(DEBUG) << "Route " << r.code << " has no shape";
            continue;
        }

        gtfs::shape s;
        s.shape_id = shape_id(r.code);
        for (const auto& c : coordinates)
            s.points.push_back({s.shape_id, c.lat, c.lng, s.points.size()});
        feed.shapes.emplace(s.shape_id, std::move(s));
    }
}

// _____________________________________________________________________________
void feed_builder::add_fares(gtfs::feed& feed) const
{
    for (const auto& matrix : city_.fares)
    {
        for (size_t from = 0; from < matrix.stations.size(); ++from)
        {
            for (size_t to = 0; to < matrix.stations.size(); ++to)
            {
                auto price = matrix.price(from, to);
                if (!price)
                {
                    LOG(WARN) << "Fare " << matrix.code << " has no price for " << from << " -> " << to;
                    continue;
                }

                const auto& from_code = city_.stations[matrix.stations[from]].code;
                const auto& to_code = city_.stations[matrix.stations[to]].code;
                const auto id = fare_id(from_code, to_code);
                if (feed.fare_attributes.count(id) != 0)
                    continue;

                gtfs::fare_attributes_item attributes;
                attributes.fare_id = id;
                attributes.price = *price;
                attributes.currency_type = options_.currency;
                attributes.payment_method = gtfs::fare_payment::BeforeBoarding;
                attributes.transfers = gtfs::fare_transfers::No;
                feed.fare_attributes.emplace(id, std::move(attributes));

                gtfs::fare_rule rule;
                rule.fare_id = id;
                rule.origin_id = zone_id(from_code);
                rule.destination_id = zone_id(to_code);
                feed.fare_rules.push_back(std::move(rule));
            }
        }
    }
}

// _____________________________________________________________________________
std::vector<geo::coordinate> feed_builder::route_shape(const metroman::route& r) const
{
    std::vector<geo::coordinate> ret;
    if (!r.line || r.stations.size() < 2)
        return ret;

    const auto& paths = city_.lines[*r.line].station_paths;
    for (size_t i = 0; i + 1 < r.stations.size(); ++i)
    {
        const auto& from = city_.stations[r.stations[i]].code;
        const auto& to = city_.stations[r.stations[i + 1]].code;

        auto forward = paths.find({from, to});
        if (forward != paths.end())
        {
            ret.insert(ret.end(), forward->second.begin(), forward->second.end());
            continue;
        }

        auto backward = paths.find({to, from});
        if (backward != paths.end())
            ret.insert(ret.end(), backward->second.rbegin(), backward->second.rend());
    }
    return ret;
}

// _____________________________________________________________________________
std::string feed_builder::agency_name(const std::string& city_code)
{
    return "China-GTFS " + city_code;
}

// _____________________________________________________________________________
std::string feed_builder::zone_id(const std::string& station_code)
{
    return "zone_" + station_code;
}

// _____________________________________________________________________________
std::string feed_builder::trip_id(const std::string& route_code, const std::string& schedule_code, size_t n)
{
    return route_code + "_trip_" + schedule_code + "_" + std::to_string(n);
}

// _____________________________________________________________________________
std::string feed_builder::shape_id(const std::string& route_code)
{
    return "shape_" + route_code;
}

// _____________________________________________________________________________
std::string feed_builder::fare_id(const std::string& from_code, const std::string& to_code)
{
    return "fare_" + from_code + "_" + to_code;
}

}  // namespace chinagtfs::assembly
