#include <catch2/catch.hpp>
#include <gtfs/access/feed_writter.h>
#include <gtfs/feed.h>
#include <gtfs/misc.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace
{
std::vector<std::string> read_lines(const std::filesystem::path& path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

void fill_feed(chinagtfs::gtfs::feed& feed)
{
    using namespace chinagtfs::gtfs;

    agency a(feed);
    a.agency_id = "sh";
    a.agency_name = "China-GTFS sh";
    a.agency_timezone = "Asia/Shanghai";
    a.agency_lang = "zh";
    feed.agencies.emplace(a.agency_id, std::move(a));

    for (const auto& [id, name] : std::vector<std::pair<std::string, std::string>>{{"0101", "Xinzhuang"}, {"0102", "Waihuanlu, South"}})
    {
        stop s(feed);
        s.stop_id = id;
        s.stop_name = name;
        s.stop_lat = 31.11;
        s.stop_lon = 121.38;
        s.zone_id = "zone_" + id;
        feed.stops.emplace(id, std::move(s));
    }

    route r(feed);
    r.route_id = "L1";
    r.agency_id = "sh";
    r.route_short_name = "1";
    r.route_color = "E4002B";
    r.route_text_color = "000000";
    feed.routes.emplace(r.route_id, std::move(r));

    trip t(feed);
    t.route_id = "L1";
    t.service_id = "S1";
    t.trip_id = "L1_trip_S1_0";
    feed.trips.emplace(t.trip_id, std::move(t));

    for (size_t i = 0; i < 2; ++i)
    {
        stop_time st(feed);
        st.trip_id = "L1_trip_S1_0";
        st.stop_id = i == 0 ? "0101" : "0102";
        st.stop_sequence = i;
        st.arrival_time = chinagtfs::gtfs::time::from_minutes(480 + 5 * static_cast<int>(i));
        st.departure_time = st.arrival_time;
        feed.stop_times.push_back(std::move(st));
    }

    calendar_item item;
    item.service_id = "S1";
    item[monday] = calendar_availability::Available;
    item.start_date = date("20000101");
    item.end_date = date("99991231");
    feed.calendar.emplace(item.service_id, item);

    feed.calendar_dates.push_back({"S1", date(2024, 10, 1), calendar_date_exception::Removed});

    fare_attributes_item fare;
    fare.fare_id = "fare_0101_0102";
    fare.price = 3;
    fare.currency_type = "CNY";
    fare.transfers = fare_transfers::No;
    feed.fare_attributes.emplace(fare.fare_id, fare);
    feed.fare_rules.push_back({"fare_0101_0102", "", "zone_0101", "zone_0102", ""});

    feed.build();
}
}

TEST_CASE("Feed navigation after build", "[feed]")
{
    chinagtfs::gtfs::feed feed;
    fill_feed(feed);

    const auto& route = feed.routes.at("L1");
    REQUIRE(route.trips().size() == 1);
    REQUIRE(route.agency().has_value());
    CHECK(route.agency()->get().agency_name == "China-GTFS sh");

    const auto& trip = feed.trips.at("L1_trip_S1_0");
    CHECK(trip.stop_times().size() == 2);
    CHECK(trip.route().has_value());
    CHECK_FALSE(trip.shape().has_value());

    CHECK(feed.agencies.at("sh").routes().size() == 1);
    CHECK(feed.trips_provider().get_for_route("unknown").empty());
}

TEST_CASE("Feed is written as GTFS csv files", "[writer]")
{
    const auto directory = std::filesystem::temp_directory_path() / "chinagtfs_feed_writing_tests" / "sh";
    std::filesystem::remove_all(directory);

    chinagtfs::gtfs::feed feed;
    fill_feed(feed);

    chinagtfs::gtfs::access::feed_writter writer(feed, directory.string());
    auto res = writer.write({});
    REQUIRE(res == chinagtfs::gtfs::access::result_code::OK);

    SECTION("every table is present")
    {
        for (const auto& file : {chinagtfs::gtfs::file_agency, chinagtfs::gtfs::file_stops,
                                 chinagtfs::gtfs::file_routes, chinagtfs::gtfs::file_trips,
                                 chinagtfs::gtfs::file_stop_times, chinagtfs::gtfs::file_calendar,
                                 chinagtfs::gtfs::file_calendar_dates, chinagtfs::gtfs::file_shapes,
                                 chinagtfs::gtfs::file_fare_attributes, chinagtfs::gtfs::file_fare_rules})
        {
            CHECK(std::filesystem::exists(directory / file));
        }
    }

    SECTION("stops quote names with commas")
    {
        auto lines = read_lines(directory / chinagtfs::gtfs::file_stops);
        REQUIRE(lines.size() == 3);
        CHECK(lines[0].rfind("stop_id,stop_code,stop_name", 0) == 0);
        CHECK(lines[2].find("\"Waihuanlu, South\"") != std::string::npos);
        CHECK(lines[2].find("31.110000,121.380000") != std::string::npos);
    }

    SECTION("stop times")
    {
        auto lines = read_lines(directory / chinagtfs::gtfs::file_stop_times);
        REQUIRE(lines.size() == 3);
        CHECK(lines[1] == "L1_trip_S1_0,08:00:00,08:00:00,0101,0,,0,0,1");
        CHECK(lines[2] == "L1_trip_S1_0,08:05:00,08:05:00,0102,1,,0,0,1");
    }

    SECTION("calendar")
    {
        auto calendar = read_lines(directory / chinagtfs::gtfs::file_calendar);
        REQUIRE(calendar.size() == 2);
        CHECK(calendar[1] == "S1,1,0,0,0,0,0,0,20000101,99991231");

        auto dates = read_lines(directory / chinagtfs::gtfs::file_calendar_dates);
        REQUIRE(dates.size() == 2);
        CHECK(dates[1] == "S1,20241001,2");
    }

    SECTION("fares")
    {
        auto attributes = read_lines(directory / chinagtfs::gtfs::file_fare_attributes);
        REQUIRE(attributes.size() == 2);
        CHECK(attributes[1] == "fare_0101_0102,3.000000,CNY,1,0,,");

        auto rules = read_lines(directory / chinagtfs::gtfs::file_fare_rules);
        REQUIRE(rules.size() == 2);
        CHECK(rules[1] == "fare_0101_0102,,zone_0101,zone_0102,");
    }

    std::filesystem::remove_all(directory.parent_path());
}

TEST_CASE("Writing into an unusable directory fails", "[writer]")
{
    const auto blocker = std::filesystem::temp_directory_path() / "chinagtfs_feed_writing_blocker";
    std::filesystem::remove_all(blocker);
    {
        std::ofstream file(blocker);
        file << "not a directory";
    }

    chinagtfs::gtfs::feed feed;
    chinagtfs::gtfs::access::feed_writter writer(feed, (blocker / "out").string());
    auto res = writer.write({});
    CHECK(res == chinagtfs::gtfs::access::result_code::ERROR_INVALID_GTFS_PATH);
    CHECK_FALSE(res.message.empty());

    std::filesystem::remove(blocker);
}
