// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/metroman/csv.h>
#include <chinagtfs/metroman/trip_builder.h>

#include <logging/logger.h>

#include <utility>

namespace chinagtfs::metroman
{
namespace
{
trip make_trip(size_t from_station, int depart, size_t to_station, int arrive)
{
    trip t;
    t.visits.push_back({from_station, depart});
    t.visits.push_back({to_station, arrive});
    return t;
}

const hop_timings& hop_for_station(const std::vector<hop_timings>& hops, size_t station,
                                   const std::map<size_t, size_t>& station_to_schedule_index)
{
    static const hop_timings empty;

    auto it = station_to_schedule_index.find(station);
    if (it == station_to_schedule_index.end() || it->second >= hops.size())
    {
        LOG(DEBUG) << "No timings for the hop departing station " << station;
        return empty;
    }
    return hops[it->second];
}
}  // namespace

// _____________________________________________________________________________
std::vector<timing_record> parse_timing_table(const std::string& contents)
{
    std::vector<timing_record> ret;
    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, comma_delimiter);
        ret.push_back({parse_int(field(fields, 0)), parse_int(field(fields, 1))});
    }
    return ret;
}

// _____________________________________________________________________________
schedule_timings segment_timings(const std::vector<timing_record>& records, size_t station_count,
                                 size_t schedule_count)
{
    schedule_timings ret;
    const size_t hop_count = station_count > 0 ? station_count - 1 : 0;

    if (records.size() == hop_count * schedule_count)
    {
        // one record per hop, there is no way to detect a hop change
        size_t index = 0;
        for (size_t s = 0; s < schedule_count; ++s)
        {
            std::vector<hop_timings> hops;
            for (size_t h = 0; h < hop_count; ++h, ++index)
                hops.push_back({{records[index].arrive_next, records[index].depart}});
            ret.push_back(std::move(hops));
        }
        return ret;
    }

    if (records.empty())
        return ret;

    std::vector<hop_timings> hops(1);
    size_t hop = 0;
    int last_depart = 0;

    for (const auto& record : records)
    {
        if (record.depart < last_depart)
        {
            if (hops.size() == hop_count)
            {
                ret.push_back(std::move(hops));
                hops = std::vector<hop_timings>(1);
                hop = 0;
            }
            else
            {
                ++hop;
                hops.emplace_back();
            }
        }

        hops[hop][record.arrive_next] = record.depart;
        last_depart = record.depart;
    }
    ret.push_back(std::move(hops));

    return ret;
}

// _____________________________________________________________________________
std::vector<trip> build_trips(const std::vector<hop_timings>& hops, const std::vector<size_t>& stations,
                              const std::map<size_t, size_t>& station_to_schedule_index)
{
    std::vector<trip> trips;
    if (stations.size() < 2)
        return trips;

    // arrival at the station after the hop -> trip, for the current and the previous hop
    std::map<int, size_t> arrival_trip;
    std::map<int, size_t> last_arrival_trip;

    for (size_t i = 0; i + 1 < stations.size(); ++i)
    {
        const auto& timings = hop_for_station(hops, stations[i], station_to_schedule_index);

        std::vector<bool> ended_before(trips.size());
        for (size_t t = 0; t < trips.size(); ++t)
        {
            ended_before[t] = trips[t].ended;
            trips[t].ended = true;
        }

        if (i == 0)
        {
            for (const auto& [arrival, depart] : timings)
            {
                trips.push_back(make_trip(stations[0], depart, stations[1], arrival));
                arrival_trip[arrival] = trips.size() - 1;
            }
            continue;
        }

        last_arrival_trip = std::move(arrival_trip);
        arrival_trip.clear();

        for (const auto& [arrival, depart] : timings)
        {
            // a trip is extended at most once per hop
            auto it = last_arrival_trip.find(depart);
            if (it != last_arrival_trip.end() && !ended_before[it->second] && trips[it->second].ended)
            {
                auto& continued = trips[it->second];
                continued.visits.push_back({stations[i + 1], arrival});
                continued.ended = false;
                arrival_trip[arrival] = it->second;
            }
            else
            {
                trips.push_back(make_trip(stations[i], depart, stations[i + 1], arrival));
                arrival_trip[arrival] = trips.size() - 1;
            }
        }
    }

    return trips;
}

// _____________________________________________________________________________
std::vector<std::vector<trip>> reconstruct_trips(const std::vector<timing_record>& records, const route& r)
{
    auto timings = segment_timings(records, r.stations.size(), r.schedules.size());

    if (timings.size() > r.schedules.size())
    {
        LOG(WARN) << "Route " << r.code << " has timings for " << timings.size() << " schedules but only "
                  << r.schedules.size() << " are assigned, dropping the rest";
        timings.resize(r.schedules.size());
    }

    std::vector<std::vector<trip>> ret;
    for (const auto& hops : timings)
        ret.push_back(build_trips(hops, r.stations, r.station_to_schedule_index));

    return ret;
}

}  // namespace chinagtfs::metroman
