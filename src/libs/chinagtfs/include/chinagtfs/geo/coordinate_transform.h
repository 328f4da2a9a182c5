// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_GEO_COORDINATETRANSFORM_H_
#define CHINAGTFS_GEO_COORDINATETRANSFORM_H_

#include <chinagtfs/geo/coordinate.h>

namespace chinagtfs::geo
{
// Baidu Mercator to BD-09, using the six band polynomial of the provider.
coordinate mercator_to_bd09(const mercator& point);

coordinate bd09_to_gcj02(const coordinate& bd09);
coordinate gcj02_to_bd09(const coordinate& gcj02);

// Positions outside of the mainland bounding box are returned unchanged.
coordinate gcj02_to_wgs84(const coordinate& gcj02);
coordinate wgs84_to_gcj02(const coordinate& wgs84);

bool out_of_china(const coordinate& position);

// Mercator -> BD-09 -> GCJ-02 -> WGS-84
coordinate mercator_to_wgs84(const mercator& point);

}  // namespace chinagtfs::geo

#endif  // CHINAGTFS_GEO_COORDINATETRANSFORM_H_
