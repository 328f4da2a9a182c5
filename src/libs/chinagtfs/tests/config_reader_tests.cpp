#include <catch2/catch.hpp>
#include <chinagtfs/config/config_reader.h>

#include <string>
#include <vector>

namespace chinagtfs::config
{
namespace
{
config read(std::vector<std::string> args)
{
    args.insert(args.begin(), "chinagtfs");

    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    config cfg;
    config_reader reader(cfg);
    reader.read(static_cast<int>(args.size()), argv.data());
    return cfg;
}
}  // namespace

TEST_CASE("Defaults", "[config]")
{
    auto cfg = read({"-V", "versions.csv", "sh"});
    CHECK(cfg.versions_path == "versions.csv");
    CHECK(cfg.input_path == ".");
    CHECK(cfg.output_path == "gtfs-out");
    CHECK(cfg.station_geometry_path.empty());
    CHECK(cfg.log_level == "info");
    CHECK(cfg.cities == std::vector<std::string>{"sh"});
    CHECK_FALSE(cfg.all_cities);
    CHECK(cfg.feed.timezone == "Asia/Shanghai");
    CHECK(cfg.feed.language == "zh");
    CHECK(cfg.feed.currency == "CNY");
    CHECK(cfg.feed.write_fares);
    CHECK(cfg.feed.write_shapes);
}

TEST_CASE("Cities from options and positional parameters", "[config]")
{
    auto cfg = read({"-i", "archives", "--versions", "v.csv", "-c", "sh", "--city", "bj", "-o", "out", "gz"});
    CHECK(cfg.input_path == "archives");
    CHECK(cfg.versions_path == "v.csv");
    CHECK(cfg.output_path == "out");
    CHECK(cfg.cities == std::vector<std::string>{"sh", "bj", "gz"});
}

TEST_CASE("Feed and logging options", "[config]")
{
    auto cfg = read({"--all", "-V", "v.csv", "--no-fares", "--no-shapes", "--timezone", "Asia/Urumqi",
                     "--lang", "en", "--currency", "HKD", "--agency-url", "https://example.org/",
                     "--log-level", "debug", "-g", "geometries.csv"});
    CHECK(cfg.all_cities);
    CHECK(cfg.cities.empty());
    CHECK_FALSE(cfg.feed.write_fares);
    CHECK_FALSE(cfg.feed.write_shapes);
    CHECK(cfg.feed.timezone == "Asia/Urumqi");
    CHECK(cfg.feed.language == "en");
    CHECK(cfg.feed.currency == "HKD");
    CHECK(cfg.feed.agency_url == "https://example.org/");
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.station_geometry_path == "geometries.csv");

    const auto text = cfg.to_string();
    CHECK(text.find("all-cities: 1") != std::string::npos);
    CHECK(text.find("currency: HKD") != std::string::npos);
}
}
