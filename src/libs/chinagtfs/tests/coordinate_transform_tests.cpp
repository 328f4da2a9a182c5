#include <catch2/catch.hpp>
#include <chinagtfs/geo/coordinate_transform.h>

#include <cmath>

namespace chinagtfs::geo
{
TEST_CASE("Positions outside China are not shifted", "[transform]")
{
    const coordinate paris{48.8566, 2.3522};
    CHECK(out_of_china(paris));
    CHECK(gcj02_to_wgs84(paris) == paris);
    CHECK(wgs84_to_gcj02(paris) == paris);

    CHECK(out_of_china({0.5, 120.0}));
    CHECK(out_of_china({31.0, 140.0}));
    CHECK_FALSE(out_of_china({31.2304, 121.4737}));
}

TEST_CASE("GCJ-02 offset in Shanghai", "[transform]")
{
    const coordinate wgs{31.2304, 121.4737};
    auto gcj = wgs84_to_gcj02(wgs);
    CHECK(gcj.lat - wgs.lat == Catch::Detail::Approx(-0.00194).margin(0.0001));
    CHECK(gcj.lng - wgs.lng == Catch::Detail::Approx(0.00452).margin(0.0001));

    auto back = gcj02_to_wgs84(gcj);
    CHECK(std::abs(back.lat - wgs.lat) < 1e-4);
    CHECK(std::abs(back.lng - wgs.lng) < 1e-4);
}

TEST_CASE("BD-09 and GCJ-02 round trip", "[transform]")
{
    const coordinate gcj{39.9085, 116.3975};
    auto bd = gcj02_to_bd09(gcj);
    CHECK(bd.lat == Catch::Detail::Approx(39.9149).margin(0.001));
    CHECK(bd.lng == Catch::Detail::Approx(116.4039).margin(0.001));

    auto back = bd09_to_gcj02(bd);
    CHECK(back.lat == Catch::Detail::Approx(gcj.lat).margin(1e-5));
    CHECK(back.lng == Catch::Detail::Approx(gcj.lng).margin(1e-5));
}

TEST_CASE("Baidu Mercator to BD-09", "[transform]")
{
    auto bd = mercator_to_bd09({12958160.97, 4825907.72});
    CHECK(bd.lat == Catch::Detail::Approx(39.91489).margin(1e-4));
    CHECK(bd.lng == Catch::Detail::Approx(116.40387).margin(1e-4));

    auto mirrored = mercator_to_bd09({-12958160.97, -4825907.72});
    CHECK(mirrored.lat == Catch::Detail::Approx(-bd.lat));
    CHECK(mirrored.lng == Catch::Detail::Approx(-bd.lng));
}

TEST_CASE("Baidu Mercator to WGS-84", "[transform]")
{
    auto wgs = mercator_to_wgs84({12958160.97, 4825907.72});
    CHECK(wgs.lat == Catch::Detail::Approx(39.90714).margin(1e-4));
    CHECK(wgs.lng == Catch::Detail::Approx(116.39126).margin(1e-4));
}
}
