#include "city_fixture.h"

#include <catch2/catch.hpp>
#include <chinagtfs/geo/coordinate_transform.h>
#include <chinagtfs/metroman/city_loader.h>

#include <optional>
#include <vector>

namespace chinagtfs::metroman
{
using tests::fixture_version;
using tests::make_city_archive;

TEST_CASE("City archive is loaded", "[city_loader]")
{
    auto archive = make_city_archive();
    city_loader loader(archive, fixture_version);

    city c;
    auto res = loader.load("sh", c);
    REQUIRE(res == OK);
    CHECK(c.code == "sh");
    CHECK(c.version == fixture_version);

    SECTION("stations")
    {
        REQUIRE(c.stations.size() == 3);
        for (size_t i = 0; i < c.stations.size(); ++i)
            CHECK(c.stations[i].index == i);

        const auto& first = c.stations[0];
        CHECK(first.code == "0101");
        CHECK(first.name.english == "Xinzhuang");
        CHECK(first.name.simplified == "莘庄");
        CHECK(first.name.traditional == "莘莊");
        CHECK(first.name.japanese == "シンジュアン");
        CHECK(first.name.english_short == "XZ");
        CHECK(first.name.short_name == "莘");
        CHECK(first.map_x == 10);
        CHECK(first.map_y == 20);

        // archive positions are GCJ-02
        CHECK(first.position.lat == Catch::Detail::Approx(31.11290).margin(1e-4));
        CHECK(first.position.lng == Catch::Detail::Approx(121.38037).margin(1e-4));

        CHECK(c.find_station("0103") == std::optional<size_t>(2));
        CHECK_FALSE(c.find_station("0104").has_value());
    }

    SECTION("lines")
    {
        REQUIRE(c.lines.size() == 2);
        const auto& l1 = c.lines[*c.find_line("L1")];
        CHECK(l1.color == "#E4002B");
        CHECK(l1.name.english == "Line 1");
        CHECK(l1.stations == std::vector<size_t>{0, 1, 2});
        CHECK(c.lines[*c.find_line("W1")].stations.empty());
    }

    SECTION("routes")
    {
        REQUIRE(c.routes.size() == 3);

        const auto& r1 = c.routes[*c.find_route("R1")];
        CHECK(r1.stations == std::vector<size_t>{0, 1, 2});
        CHECK(r1.line == std::optional<size_t>(0));
        CHECK(r1.index_within_line == 0);
        CHECK(r1.station_to_schedule_index == std::map<size_t, size_t>{{0, 0}, {1, 1}});
        CHECK(r1.schedules == std::vector<std::string>{"S1", "S2"});

        const auto& r2 = c.routes[*c.find_route("R2")];
        CHECK(r2.stations == std::vector<size_t>{2, 1, 0});
        CHECK(r2.index_within_line == 1);
        CHECK(r2.station_to_schedule_index == std::map<size_t, size_t>{{1, 0}, {2, 1}});
        CHECK(r2.schedules == std::vector<std::string>{"S1"});

        const auto& r3 = c.routes[*c.find_route("R3")];
        CHECK(r3.stations.empty());
        CHECK_FALSE(r3.line.has_value());
        CHECK_FALSE(r3.has_timetable());
    }

    SECTION("schedules and holidays")
    {
        REQUIRE(c.schedules.size() == 2);
        const auto& weekdays = c.schedules[*c.find_schedule("S1")];
        CHECK(weekdays.days_of_week == std::array<bool, 7>{true, true, true, true, true, false, false});
        CHECK_FALSE(weekdays.holidays);

        const auto& weekends = c.schedules[*c.find_schedule("S2")];
        CHECK(weekends.days_of_week == std::array<bool, 7>{false, false, false, false, false, true, true});
        CHECK(weekends.holidays);

        REQUIRE(c.holidays.size() == 2);
        CHECK(c.holidays[1].year == 2024);
        CHECK(c.holidays[1].month == 10);
        CHECK(c.holidays[1].day == 2);
    }

    SECTION("fares")
    {
        REQUIRE(c.fares.size() == 2);

        const auto& fixed = c.fares[0];
        CHECK(fixed.code == "F1");
        CHECK(fixed.stations == std::vector<size_t>{0, 1, 2});
        CHECK(fixed.prices == std::vector<std::vector<int>>(3, std::vector<int>(3, 3)));

        const auto& matrix = c.fares[1];
        CHECK(matrix.stations == std::vector<size_t>{0, 2});
        CHECK(matrix.price(0, 1) == std::optional<int>(4));
        CHECK(matrix.price(1, 1) == std::optional<int>(3));
        CHECK_FALSE(matrix.price(2, 0).has_value());
    }

    SECTION("station paths")
    {
        const auto& paths = c.lines[*c.find_line("L1")].station_paths;
        REQUIRE(paths.size() == 2);
        CHECK(paths.at({"0101", "0102"}).size() == 3);
        CHECK(paths.at({"0102", "0103"}).size() == 2);
        CHECK(paths.at({"0102", "0103"}).back() == geo::gcj02_to_wgs84({31.131, 121.402}));
    }

    SECTION("trips")
    {
        const auto& r1 = c.routes[*c.find_route("R1")];
        REQUIRE(r1.trips.size() == 2);
        REQUIRE(r1.trips[0].size() == 1);
        REQUIRE(r1.trips[0][0].visits.size() == 3);
        CHECK(r1.trips[0][0].visits[2].minutes == 490);
        CHECK(r1.trips[1][0].first_minutes() == 600);

        const auto& r2 = c.routes[*c.find_route("R2")];
        REQUIRE(r2.trips.size() == 1);
        REQUIRE(r2.trips[0].size() == 1);
        const auto& visits = r2.trips[0][0].visits;
        REQUIRE(visits.size() == 3);
        CHECK(visits[0].station == 2);
        CHECK(visits[0].minutes == 500);
        CHECK(visits[2].station == 0);
        CHECK(visits[2].minutes == 510);

        CHECK(c.routes[*c.find_route("R3")].trips.empty());
        CHECK(c.trip_count() == 3);
    }
}

TEST_CASE("Station indices are stable across reloads", "[city_loader]")
{
    auto archive = make_city_archive();
    city_loader loader(archive, fixture_version);

    city first;
    city second;
    REQUIRE(loader.load("sh", first) == OK);
    REQUIRE(loader.load("sh", second) == OK);

    REQUIRE(first.stations.size() == second.stations.size());
    for (size_t i = 0; i < first.stations.size(); ++i)
    {
        CHECK(first.stations[i].code == second.stations[i].code);
        CHECK(first.station_by_code.at(first.stations[i].code) == i);
        CHECK(second.station_by_code.at(second.stations[i].code) == i);
    }
}

TEST_CASE("Missing tables abort the load", "[city_loader]")
{
    for (const auto* table : {"uno.csv", "line.csv", "way.csv", "fare.csv", "holiday.csv", "schedule.csv",
                              "wayschedule.csv", "path_latlng.csv", "path_rail.csv", "fare_matrix.csv"})
    {
        auto archive = make_city_archive(table);
        city_loader loader(archive, fixture_version);

        city c;
        c.code = "untouched";
        auto res = loader.load("sh", c);
        CHECK(res == MISSING_TABLE);
        CHECK(res.message.find(table) != std::string::npos);
        CHECK(c.code == "untouched");
    }
}

TEST_CASE("Missing timing tables are not fatal", "[city_loader]")
{
    auto archive = make_city_archive("R1.csv");
    city_loader loader(archive, fixture_version);

    city c;
    REQUIRE(loader.load("sh", c) == OK);
    CHECK(c.routes[*c.find_route("R1")].trips.empty());
    CHECK(c.routes[*c.find_route("R2")].has_timetable());
}

TEST_CASE("Fares that do not fit their stations are skipped", "[city_loader]")
{
    auto archive = make_city_archive();
    archive.add(fixture_version + "/fare_3.csv", "1,2,3\r\n2,1,2\r\n3,2,1\r\n");

    SECTION("unknown station code")
    {
        archive.add(fixture_version + "/fare.csv", "F1,R1,3,,\r\nF3,,0,fare_3.csv,0101|0199|0103\r\n");
        city_loader loader(archive, fixture_version);

        city c;
        REQUIRE(loader.load("sh", c) == OK);
        REQUIRE(c.fares.size() == 1);
        CHECK(c.fares[0].code == "F1");
    }
    SECTION("matrix smaller than the station list")
    {
        archive.add(fixture_version + "/fare.csv", "F4,,0,fare_matrix.csv,0101|0102|0103\r\nF5,R1,0,fare_matrix.csv,\r\n");
        city_loader loader(archive, fixture_version);

        city c;
        REQUIRE(loader.load("sh", c) == OK);
        CHECK(c.fares.empty());
    }
    SECTION("matching matrix keeps every pair")
    {
        archive.add(fixture_version + "/fare.csv", "F3,,0,fare_3.csv,0101|0102|0103\r\n");
        city_loader loader(archive, fixture_version);

        city c;
        REQUIRE(loader.load("sh", c) == OK);
        REQUIRE(c.fares.size() == 1);
        CHECK(c.fares[0].stations == std::vector<size_t>{0, 1, 2});
        CHECK(c.fares[0].price(0, 2) == std::optional<int>(3));
        CHECK(c.fares[0].price(2, 1) == std::optional<int>(2));
    }
}

TEST_CASE("One timing record per hop chains a single trip", "[city_loader]")
{
    auto archive = make_city_archive();
    archive.add(fixture_version + "/uno.csv",
                "0101<,>MS<,>Xinzhuang<,>莘庄<,>莘莊<,><,>XZ<,>莘<,>31.111<,>121.385<,>10<,>20\r\n"
                "0102<,>MS<,>Waihuanlu<,>外环路<,>外環路<,><,>WHL<,>外<,>31.120<,>121.393<,>11<,>21\r\n"
                "0103<,>MS<,>Lianhua Road<,>莲花路<,>蓮花路<,><,>LHR<,>莲<,>31.131<,>121.402<,>12<,>22\r\n"
                "0104<,>MS<,>Jinjiang Park<,>锦江乐园<,>錦江樂園<,><,>JJP<,>锦<,>31.142<,>121.414<,>13<,>23\r\n"
                "L1<,>ML<,>Line 1<,>1号线<,>1號線<,><,>1<,>1<,><,><,><,><,>#E4002B\r\n"
                "R1<,>MW<,>Line 1 to Jinjiang Park<,>1号线 往锦江乐园<,><,><,><,>\r\n");
    archive.add(fixture_version + "/line.csv", "L1,0,1,2,3\r\n");
    archive.add(fixture_version + "/way.csv", "R1,0,x,0,1,2,3\r\n");
    archive.add(fixture_version + "/fare.csv", "F1,R1,3,,\r\n");
    archive.add(fixture_version + "/wayschedule.csv", "R1,x,S1\r\n");
    archive.add(fixture_version + "/R1.csv", "480,485\r\n485,490\r\n490,495\r\n");

    city_loader loader(archive, fixture_version);
    city c;
    REQUIRE(loader.load("sh", c) == OK);

    const auto& r1 = c.routes[*c.find_route("R1")];
    REQUIRE(r1.stations.size() == 4);
    REQUIRE(r1.trips.size() == 1);
    REQUIRE(r1.trips[0].size() == 1);

    const auto& visits = r1.trips[0][0].visits;
    REQUIRE(visits.size() == 4);
    for (size_t i = 0; i < visits.size(); ++i)
    {
        CHECK(visits[i].station == i);
        CHECK(visits[i].minutes == 480 + 5 * static_cast<int>(i));
    }
    CHECK(c.trip_count() == 1);
}

TEST_CASE("Station geometries override archive positions", "[city_loader]")
{
    auto archive = make_city_archive();

    station_geometry_table geometries;
    geometries.add("0101", ".=hWJPNB0A8wcA");
    geometries.add("0102", ".AB");

    city_loader loader(archive, fixture_version, &geometries);
    city c;
    REQUIRE(loader.load("sh", c) == OK);

    CHECK(c.stations[0].position.lat == Catch::Detail::Approx(39.90714).margin(1e-4));
    CHECK(c.stations[0].position.lng == Catch::Detail::Approx(116.39126).margin(1e-4));

    // undecodable geometry keeps the archive position
    CHECK(c.stations[1].position == geo::gcj02_to_wgs84({31.120, 121.393}));
}
}
