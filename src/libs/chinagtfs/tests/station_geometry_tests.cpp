#include <catch2/catch.hpp>
#include <chinagtfs/metroman/station_geometry.h>

#include <filesystem>
#include <fstream>

namespace chinagtfs::metroman
{
namespace
{
// Tian'anmen, Baidu Mercator in centimeters
const std::string tiananmen = ".=hWJPNB0A8wcA";
}

TEST_CASE("Station geometry records", "[station_geometry]")
{
    auto table = station_geometry_table::parse("0101," + tiananmen + "\r\nbad\r\n,x\r\n0102,a,b\r\n");
    CHECK(table.size() == 2);
    CHECK(table.find("0101") == std::optional<std::string>(tiananmen));
    CHECK(table.find("0102") == std::optional<std::string>("a,b"));
    CHECK_FALSE(table.find("bad").has_value());
}

TEST_CASE("Station position from its geometry", "[station_geometry]")
{
    SECTION("first point of the first decodable geometry")
    {
        auto position = station_position(".AB|" + tiananmen + "|.=kBAAAAIDAAAA");
        REQUIRE(position.has_value());
        CHECK(position->lat == Catch::Detail::Approx(39.90714).margin(1e-4));
        CHECK(position->lng == Catch::Detail::Approx(116.39126).margin(1e-4));
    }
    SECTION("nothing decodes")
    {
        CHECK_FALSE(station_position("").has_value());
        CHECK_FALSE(station_position(".AB|?x").has_value());
    }
}

TEST_CASE("Station geometry files", "[station_geometry]")
{
    const auto path = std::filesystem::temp_directory_path() / "chinagtfs_station_geometry_tests.csv";
    {
        std::ofstream out(path, std::ios::binary);
        out << "0101," << tiananmen << "\n";
    }

    station_geometry_table table;
    REQUIRE(read_station_geometry_table(path.string(), table) == OK);
    CHECK(table.size() == 1);

    std::filesystem::remove(path);
    CHECK(read_station_geometry_table(path.string(), table) == INVALID_ARCHIVE_PATH);
}
}
