// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_GEO_COORDINATE_H_
#define CHINAGTFS_GEO_COORDINATE_H_

namespace chinagtfs::geo
{
// A geographic position in degrees. Which datum (WGS-84, GCJ-02 or BD-09)
// depends on where the value came from.
struct coordinate
{
    double lat = 0.0;
    double lng = 0.0;
};

// A point in the projected Baidu Mercator plane.
struct mercator
{
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const coordinate& lhs, const coordinate& rhs)
{
    return lhs.lat == rhs.lat && lhs.lng == rhs.lng;
}

inline bool operator==(const mercator& lhs, const mercator& rhs)
{
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

}  // namespace chinagtfs::geo

#endif  // CHINAGTFS_GEO_COORDINATE_H_
