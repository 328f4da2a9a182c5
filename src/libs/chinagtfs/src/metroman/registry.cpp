// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/metroman/city_loader.h>
#include <chinagtfs/metroman/registry.h>

#include <logging/logger.h>

#include <filesystem>
#include <utility>

namespace chinagtfs::metroman
{
// _____________________________________________________________________________
directory_archive_provider::directory_archive_provider(std::string root) : root_{std::move(root)}
{
}

// _____________________________________________________________________________
std::unique_ptr<bundle> directory_archive_provider::open(const std::string& city_code,
                                                         const std::string& version) const
{
    const auto city_root = std::filesystem::path(root_) / city_code;
    std::error_code ec;
    if (!std::filesystem::is_directory(city_root / version, ec))
        return nullptr;

    return std::make_unique<directory_bundle>(city_root.string());
}

// _____________________________________________________________________________
registry::registry(const version_table& versions, const archive_provider& archives,
                   const station_geometry_source* geometries) :
    versions_{versions},
    archives_{archives},
    geometries_{geometries}
{
}

// _____________________________________________________________________________
result registry::load(const std::string& city_code)
{
    auto city_version = versions_.find(city_code);
    if (!city_version)
        return {CITY_NOT_FOUND, "No version known for city " + city_code};

    auto archive = archives_.open(city_code, *city_version);
    if (!archive)
        return {INVALID_ARCHIVE_PATH, "No archive for city " + city_code + " at version " + *city_version};

    metroman::city loaded;
    city_loader loader(*archive, *city_version, geometries_);
    auto res = loader.load(city_code, loaded);
    if (res != OK)
    {
        LOG(ERROR) << "Loading " << city_code << " failed: [" << to_string(res.code) << "] " << res.message;
        return res;
    }

    cities_[city_code] = std::move(loaded);
    return OK;
}

// _____________________________________________________________________________
std::optional<std::string> registry::version(const std::string& city_code) const
{
    return versions_.find(city_code);
}

// _____________________________________________________________________________
std::optional<std::reference_wrapper<const metroman::city>> registry::city(const std::string& city_code) const
{
    auto it = cities_.find(city_code);
    if (it == cities_.end())
        return std::nullopt;
    return std::cref(it->second);
}

}  // namespace chinagtfs::metroman
