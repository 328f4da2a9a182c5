#pragma once
#include <gtfs/date.h>
#include <gtfs/enums/calendar_date_exception.h>
#include <gtfs/types.h>

namespace chinagtfs::gtfs
{
// Adds or removes service of one calendar entry on a single date, e.g. a
// public holiday.
struct calendar_date
{
    // Required:
    Id service_id;
    chinagtfs::gtfs::date date;
    calendar_date_exception exception_type = calendar_date_exception::Removed;
};
}
