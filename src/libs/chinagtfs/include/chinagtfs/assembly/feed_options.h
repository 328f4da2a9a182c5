// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_ASSEMBLY_FEEDOPTIONS_H_
#define CHINAGTFS_ASSEMBLY_FEEDOPTIONS_H_

#include <string>

namespace chinagtfs::assembly
{
struct feed_options
{
    std::string agency_url = "https://tgrcode.com/";
    std::string timezone = "Asia/Shanghai";
    std::string language = "zh";
    std::string currency = "CNY";

    bool write_fares = true;
    bool write_shapes = true;
};

}  // namespace chinagtfs::assembly

#endif  // CHINAGTFS_ASSEMBLY_FEEDOPTIONS_H_
