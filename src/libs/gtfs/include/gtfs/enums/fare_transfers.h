#pragma once

namespace chinagtfs::gtfs
{
enum class fare_transfers
{
    No = 0,
    Once = 1,
    Twice = 2,
    Unlimited = 3  // written as an empty field
};
}
