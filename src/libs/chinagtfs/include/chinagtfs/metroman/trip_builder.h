// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_TRIPBUILDER_H_
#define CHINAGTFS_METROMAN_TRIPBUILDER_H_

#include <chinagtfs/metroman/model.h>

#include <map>
#include <string>
#include <vector>

namespace chinagtfs::metroman
{
// One record of a route timing table, minutes of the day.
struct timing_record
{
    int depart = 0;
    int arrive_next = 0;
};

// arrival at the next station -> departure, for one hop
using hop_timings = std::map<int, int>;
// [schedule][hop]
using schedule_timings = std::vector<std::vector<hop_timings>>;

// "depart,arrive_next" per record, malformed numbers parse as zero
std::vector<timing_record> parse_timing_table(const std::string& contents);

/**
 * Splits the raw dump of a route into hop maps per schedule.
 *
 * When the dump holds exactly (stations - 1) * schedules records it is read
 * as one record per hop per schedule. Otherwise records are appended in file
 * order and a departure earlier than the previous one starts the next hop,
 * or the next schedule once the current one holds stations - 1 hops.
 */
schedule_timings segment_timings(const std::vector<timing_record>& records, size_t station_count,
                                 size_t schedule_count);

/**
 * Chains the hop maps of one schedule into trips, walking the hops in route
 * station order.
 */
std::vector<trip> build_trips(const std::vector<hop_timings>& hops, const std::vector<size_t>& stations,
                              const std::map<size_t, size_t>& station_to_schedule_index);

// segment_timings followed by build_trips for every schedule
std::vector<std::vector<trip>> reconstruct_trips(const std::vector<timing_record>& records, const route& r);

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_TRIPBUILDER_H_
