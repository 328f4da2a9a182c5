// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/geo/coordinate_transform.h>

#include <array>
#include <cmath>

namespace chinagtfs::geo
{
namespace
{
constexpr double pi = 3.14159265358979324;
constexpr double x_pi = pi * 3000.0 / 180.0;

// Krasovsky 1940
constexpr double axis = 6378245.0;
constexpr double eccentricity = 0.00669342162296594323;

constexpr std::array<double, 6> mercator_bands = {12890594.86, 8362377.87, 5591021, 3481989.83, 1678043.12, 0};

constexpr std::array<std::array<double, 10>, 6> mercator_to_lnglat = {{
        {1.410526172116255e-8, 0.00000898305509648872, -1.9939833816331, 200.9824383106796,
         -187.2403703815547, 91.6087516669843, -23.38765649603339, 2.57121317296198,
         -0.03801003308653, 17337981.2},
        {-7.435856389565537e-9, 0.000008983055097726239, -0.78625201886289, 96.32687599759846,
         -1.85204757529826, -59.36935905485877, 47.40033549296737, -16.50741931063887,
         2.28786674699375, 10260144.86},
        {-3.030883460898826e-8, 0.00000898305509983578, 0.30071316287616, 59.74293618442277,
         7.357984074871, -25.38371002664745, 13.45380521110908, -3.29883767235584,
         0.32710905363475, 6856817.37},
        {-1.981981304930552e-8, 0.000008983055099779535, 0.03278182852591, 40.31678527705744,
         0.65659298677277, -4.44255534477492, 0.85341911805263, 0.12923347998204,
         -0.04625736007561, 4482777.06},
        {3.09191371068437e-9, 0.000008983055096812155, 0.00006995724062, 23.10934304144901,
         -0.00023663490511, -0.6321817810242, -0.00663494467273, 0.03430082397953,
         -0.00466043876332, 2555164.4},
        {2.890871144776878e-9, 0.000008983055095805407, -3.068298e-8, 7.47137025468032,
         -0.00000353937994, -0.02145144861037, -0.00001234426596, 0.00010322952773,
         -0.00000323890364, 826088.5},
}};

double sign(double val)
{
    return std::signbit(val) ? -1.0 : 1.0;
}

double transform_lat(double x, double y)
{
    double ret = -100.0 + 2.0 * x + 3.0 * y + 0.2 * y * y + 0.1 * x * y + 0.2 * std::sqrt(std::abs(x));
    ret += (20.0 * std::sin(6.0 * x * pi) + 20.0 * std::sin(2.0 * x * pi)) * 2.0 / 3.0;
    ret += (20.0 * std::sin(y * pi) + 40.0 * std::sin(y / 3.0 * pi)) * 2.0 / 3.0;
    ret += (160.0 * std::sin(y / 12.0 * pi) + 320 * std::sin(y * pi / 30.0)) * 2.0 / 3.0;
    return ret;
}

double transform_lng(double x, double y)
{
    double ret = 300.0 + x + 2.0 * y + 0.1 * x * x + 0.1 * x * y + 0.1 * std::sqrt(std::abs(x));
    ret += (20.0 * std::sin(6.0 * x * pi) + 20.0 * std::sin(2.0 * x * pi)) * 2.0 / 3.0;
    ret += (20.0 * std::sin(x * pi) + 40.0 * std::sin(x / 3.0 * pi)) * 2.0 / 3.0;
    ret += (150.0 * std::sin(x / 12.0 * pi) + 300.0 * std::sin(x / 30.0 * pi)) * 2.0 / 3.0;
    return ret;
}

// offset between WGS-84 and GCJ-02 at the given position
coordinate gcj02_delta(const coordinate& position)
{
    double d_lat = transform_lat(position.lng - 105.0, position.lat - 35.0);
    double d_lng = transform_lng(position.lng - 105.0, position.lat - 35.0);
    const double rad_lat = position.lat / 180.0 * pi;
    double magic = std::sin(rad_lat);
    magic = 1 - eccentricity * magic * magic;
    const double sqrt_magic = std::sqrt(magic);
    d_lat = (d_lat * 180.0) / ((axis * (1 - eccentricity)) / (magic * sqrt_magic) * pi);
    d_lng = (d_lng * 180.0) / (axis / sqrt_magic * std::cos(rad_lat) * pi);
    return {d_lat, d_lng};
}
}  // namespace

// _____________________________________________________________________________
coordinate mercator_to_bd09(const mercator& point)
{
    const double y_abs = std::abs(point.y);

    const auto* table = &mercator_to_lnglat.back();
    for (size_t i = 0; i < mercator_bands.size(); ++i)
    {
        if (y_abs >= mercator_bands[i])
        {
            table = &mercator_to_lnglat[i];
            break;
        }
    }

    const auto& c = *table;
    const double lng = c[0] + c[1] * std::abs(point.x);
    const double d = y_abs / c[9];
    const double lat = c[2] + c[3] * d + c[4] * d * d + c[5] * d * d * d + c[6] * d * d * d * d +
                       c[7] * d * d * d * d * d + c[8] * d * d * d * d * d * d;

    return {lat * sign(point.y), lng * sign(point.x)};
}

// _____________________________________________________________________________
coordinate bd09_to_gcj02(const coordinate& bd09)
{
    const double x = bd09.lng - 0.0065;
    const double y = bd09.lat - 0.006;
    const double z = std::sqrt(x * x + y * y) - 0.00002 * std::sin(y * x_pi);
    const double theta = std::atan2(y, x) - 0.000003 * std::cos(x * x_pi);

    return {z * std::sin(theta), z * std::cos(theta)};
}

// _____________________________________________________________________________
coordinate gcj02_to_bd09(const coordinate& gcj02)
{
    const double x = gcj02.lng;
    const double y = gcj02.lat;
    const double z = std::sqrt(x * x + y * y) + 0.00002 * std::sin(y * x_pi);
    const double theta = std::atan2(y, x) + 0.000003 * std::cos(x * x_pi);

    return {z * std::sin(theta) + 0.006, z * std::cos(theta) + 0.0065};
}

// _____________________________________________________________________________
bool out_of_china(const coordinate& position)
{
    if (position.lng < 72.004 || position.lng > 137.8347)
        return true;
    return position.lat < 0.8293 || position.lat > 55.8271;
}

// _____________________________________________________________________________
coordinate gcj02_to_wgs84(const coordinate& gcj02)
{
    if (out_of_china(gcj02))
        return gcj02;

    const auto delta = gcj02_delta(gcj02);
    return {gcj02.lat - delta.lat, gcj02.lng - delta.lng};
}

// _____________________________________________________________________________
coordinate wgs84_to_gcj02(const coordinate& wgs84)
{
    if (out_of_china(wgs84))
        return wgs84;

    const auto delta = gcj02_delta(wgs84);
    return {wgs84.lat + delta.lat, wgs84.lng + delta.lng};
}

// _____________________________________________________________________________
coordinate mercator_to_wgs84(const mercator& point)
{
    return gcj02_to_wgs84(bd09_to_gcj02(mercator_to_bd09(point)));
}

}  // namespace chinagtfs::geo
