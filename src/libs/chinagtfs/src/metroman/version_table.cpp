// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/metroman/csv.h>
#include <chinagtfs/metroman/version_table.h>

#include <logging/logger.h>

#include <fstream>
#include <sstream>

namespace chinagtfs::metroman
{
// _____________________________________________________________________________
version_table version_table::parse(const std::string& contents)
{
    version_table ret;
    for (const auto& record : split_records(contents))
    {
        auto fields = split_fields(record, comma_delimiter);
        if (fields.size() != 3)
        {
            LOG(DEBUG) << "Ignoring version record '" << record << "'";
            continue;
        }
        ret.add(fields[0], fields[1]);
    }
    return ret;
}

// _____________________________________________________________________________
void version_table::add(const std::string& city_code, const std::string& version)
{
    versions_[city_code] = version;
}

// _____________________________________________________________________________
std::optional<std::string> version_table::find(const std::string& city_code) const
{
    auto it = versions_.find(city_code);
    if (it == versions_.end())
        return std::nullopt;
    return it->second;
}

// _____________________________________________________________________________
result read_version_table(const std::string& path, version_table& table)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return {INVALID_ARCHIVE_PATH, "Could not open version table " + path};

    std::stringstream contents;
    contents << in.rdbuf();
    table = version_table::parse(contents.str());

    LOG(DEBUG) << "Read " << table.size() << " city versions from " << path;
    return OK;
}

}  // namespace chinagtfs::metroman
