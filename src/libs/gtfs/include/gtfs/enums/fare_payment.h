#pragma once

namespace chinagtfs::gtfs
{
enum class fare_payment
{
    OnBoard = 0,
    BeforeBoarding = 1
};
}
