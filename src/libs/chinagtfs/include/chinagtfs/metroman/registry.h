// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_METROMAN_REGISTRY_H_
#define CHINAGTFS_METROMAN_REGISTRY_H_

#include <chinagtfs/metroman/bundle.h>
#include <chinagtfs/metroman/model.h>
#include <chinagtfs/metroman/station_geometry.h>
#include <chinagtfs/metroman/version_table.h>
#include <chinagtfs/result.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace chinagtfs::metroman
{
/*
 * Opens the archive of one city at one version.
 */
class archive_provider
{
public:
    virtual ~archive_provider() = default;

    // nullptr if there is no such archive
    virtual std::unique_ptr<bundle> open(const std::string& city_code, const std::string& version) const = 0;
};

/*
 * Archives extracted below a common root, one directory per city:
 * <root>/<city>/<version>/<table>.csv
 */
class directory_archive_provider : public archive_provider
{
public:
    explicit directory_archive_provider(std::string root);

    std::unique_ptr<bundle> open(const std::string& city_code, const std::string& version) const override;

private:
    std::string root_;
};

/*
 * Loaded city graphs by city code.
 */
class registry
{
public:
    registry(const version_table& versions, const archive_provider& archives,
             const station_geometry_source* geometries = nullptr);

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;

    // replaces the graph of city_code only when the load succeeds
    result load(const std::string& city_code);

    std::optional<std::string> version(const std::string& city_code) const;
    std::optional<std::reference_wrapper<const metroman::city>> city(const std::string& city_code) const;

    size_t size() const
    {
        return cities_.size();
    }

private:
    const version_table& versions_;
    const archive_provider& archives_;
    const station_geometry_source* geometries_;
    std::map<std::string, metroman::city> cities_;
};

}  // namespace chinagtfs::metroman

#endif  // CHINAGTFS_METROMAN_REGISTRY_H_
