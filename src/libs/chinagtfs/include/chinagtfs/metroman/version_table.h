// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_VERSIONTABLE_H_
#define CHINAGTFS_METROMAN_VERSIONTABLE_H_

#include <chinagtfs/result.h>

#include <map>
#include <optional>
#include <string>

namespace chinagtfs::metroman
{
/*
 * City code -> current archive version. Built once before any city is
 * loaded and only read afterwards.
 */
class version_table
{
public:
    version_table() = default;

    // "city,version,extra" per record, records of any other arity are ignored
    static version_table parse(const std::string& contents);

    void add(const std::string& city_code, const std::string& version);
    std::optional<std::string> find(const std::string& city_code) const;

    const std::map<std::string, std::string>& entries() const
    {
        return versions_;
    }

    size_t size() const
    {
        return versions_.size();
    }

private:
    std::map<std::string, std::string> versions_;
};

result read_version_table(const std::string& path, version_table& table);

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_VERSIONTABLE_H_
