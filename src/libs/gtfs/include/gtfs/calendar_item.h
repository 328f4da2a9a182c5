#pragma once
#include <gtfs/date.h>
#include <gtfs/enums/calendar_availability.h>
#include <gtfs/types.h>

#include <array>

namespace chinagtfs::gtfs
{
enum weekday
{
    monday,
    tuesday,
    wednesday,
    thursday,
    friday,
    saturday,
    sunday,
    days_per_week
};

// One weekly service pattern, valid from start_date to end_date inclusive.
struct calendar_item
{
    // Required:
    Id service_id;

    // indexed by weekday, every day defaults to NotAvailable
    std::array<calendar_availability, days_per_week> days{};

    date start_date;
    date end_date;

    calendar_availability& operator[](weekday day) { return days[day]; }
    calendar_availability operator[](weekday day) const { return days[day]; }
};
}
