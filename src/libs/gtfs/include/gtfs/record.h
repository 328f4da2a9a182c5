#pragma once

namespace chinagtfs::gtfs
{
class feed;

/**
 * @brief base of the entities that resolve their references through the owning feed
 */
class record
{
public:
    record(chinagtfs::gtfs::feed& feed): //NOLINT
        feed(feed)
    {
    }

    record(const record& record) = delete;
    record& operator=(const record& record) = delete;

    record(record&& record) noexcept:
        feed(record.feed)
    {
    }

    // the owning feed never changes, only the payload of the derived entity moves
    record& operator=(record&&) noexcept
    {
        return *this;
    }

    virtual ~record() = default;

protected:
    chinagtfs::gtfs::feed& feed;
};
}
