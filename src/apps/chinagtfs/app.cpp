#include "app.h"

#include <chinagtfs/assembly/feed_builder.h>
#include <chinagtfs/config/config_reader.h>

#include <logging/logger.h>
#include <logging/scoped_timer.h>

#include <gtfs/access/feed_writter.h>
#include <gtfs/feed.h>

#include <filesystem>

namespace
{
void read_config(chinagtfs::config::config& cfg, int argc, char** argv)
{
    chinagtfs::config::config_reader reader(cfg);
    reader.read(argc, argv);
}
}  // namespace

app::app(int argc, char** argv) :
    cfg_{}
{
    read_config(cfg_, argc, argv);
}

ret_code app::run()
{
    LOG(INFO) << "Reading city versions from " << cfg_.versions_path << " ...";
    if (auto res = chinagtfs::metroman::read_version_table(cfg_.versions_path, versions_);
        res != chinagtfs::OK)
    {
        LOG(ERROR) << "Could not read the version table, reason was:";
        LOG(ERROR) << res.message;
        return ret_code::NO_VERSION_TABLE;
    }
    LOG(INFO) << "Done, " << versions_.size() << " cities known.";

    const chinagtfs::metroman::station_geometry_source* geometries = nullptr;
    if (!cfg_.station_geometry_path.empty())
    {
        if (auto res = chinagtfs::metroman::read_station_geometry_table(cfg_.station_geometry_path, geometries_);
            res != chinagtfs::OK)
        {
            LOG(ERROR) << "Could not read station geometries, reason was:";
            LOG(ERROR) << res.message;
            return ret_code::STATION_GEOMETRY_ERR;
        }
        LOG(INFO) << "Read " << geometries_.size() << " station geometries.";
        geometries = &geometries_;
    }

    chinagtfs::metroman::directory_archive_provider archives(cfg_.input_path);
    chinagtfs::metroman::registry registry(versions_, archives, geometries);

    ret_code ret = ret_code::SUCCESS;
    for (const auto& city_code : cities_to_convert())
    {
        // one broken city does not stop the others
        if (auto city_ret = convert(registry, city_code); city_ret != ret_code::SUCCESS)
            ret = city_ret;
    }

    return ret;
}

std::vector<std::string> app::cities_to_convert() const
{
    if (!cfg_.all_cities)
        return cfg_.cities;

    std::vector<std::string> ret;
    for (const auto& entry : versions_.entries())
        ret.push_back(entry.first);
    return ret;
}

ret_code app::convert(chinagtfs::metroman::registry& registry, const std::string& city_code) const
{
    logging::scoped_timer timer("convert " + city_code);

    if (auto res = registry.load(city_code); res != chinagtfs::OK)
    {
        LOG(ERROR) << "Could not load city " << city_code << ", reason was:";
        LOG(ERROR) << "[" << chinagtfs::to_string(res.code) << "] " << res.message;
        return res == chinagtfs::CITY_NOT_FOUND ? ret_code::CITY_NOT_FOUND : ret_code::CITY_LOAD_ERR;
    }

    auto city = registry.city(city_code);
    if (!city)
        return ret_code::CITY_LOAD_ERR;

    chinagtfs::gtfs::feed feed;
    chinagtfs::assembly::feed_builder builder(city->get(), cfg_.feed);
    builder.build(feed);

    const auto output_path = (std::filesystem::path(cfg_.output_path) / city_code).string();
    LOG(INFO) << "Writing output GTFS to " << output_path << " ...";

    chinagtfs::gtfs::access::feed_writter writter(feed, output_path);
    chinagtfs::gtfs::access::feed_writter::write_config config;
    config.shapes = cfg_.feed.write_shapes;
    config.fare_attributes = cfg_.feed.write_fares;
    config.fare_rules = cfg_.feed.write_fares;
    if (auto res = writter.write(config); res != chinagtfs::gtfs::access::result_code::OK)
    {
        LOG(ERROR) << "Could not write final GTFS feed, reason was:";
        LOG(ERROR) << "[" << chinagtfs::gtfs::access::to_string(res.code) << "] " << res.message;
        return ret_code::GTFS_WRITE_ERR;
    }

    LOG(INFO) << "Done.";
    return ret_code::SUCCESS;
}
