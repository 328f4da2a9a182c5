// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_VERSION_H_
#define CHINAGTFS_VERSION_H_

#ifndef CHINAGTFS_VERSION
#define CHINAGTFS_VERSION "0.1.0"
#endif

namespace chinagtfs
{
inline const char* short_version()
{
    return CHINAGTFS_VERSION;
}

inline const char* long_version()
{
    return "v" CHINAGTFS_VERSION;
}
}  // namespace chinagtfs

#endif  // CHINAGTFS_VERSION_H_
