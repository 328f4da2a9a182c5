#pragma once

namespace chinagtfs::gtfs
{
enum class calendar_availability
{
    NotAvailable = 0,
    Available = 1
};
}
