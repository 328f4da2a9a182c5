#include <catch2/catch.hpp>
#include <chinagtfs/metroman/version_table.h>

#include <filesystem>
#include <fstream>

namespace chinagtfs::metroman
{
TEST_CASE("Version records need exactly three fields", "[version_table]")
{
    auto table = version_table::parse("sh,20240101,x\r\nbj,20231201\r\ngz,20240202,y,z\r\nsz,20240303,\r\n");
    CHECK(table.size() == 2);
    CHECK(table.find("sh") == std::optional<std::string>("20240101"));
    CHECK(table.find("sz") == std::optional<std::string>("20240303"));
    CHECK_FALSE(table.find("bj").has_value());
    CHECK_FALSE(table.find("gz").has_value());
}

TEST_CASE("Later versions replace earlier ones", "[version_table]")
{
    version_table table;
    table.add("sh", "20240101");
    table.add("sh", "20240601");
    CHECK(table.size() == 1);
    CHECK(table.find("sh") == std::optional<std::string>("20240601"));
    CHECK(table.entries().begin()->first == "sh");
}

TEST_CASE("Version table files", "[version_table]")
{
    const auto path = std::filesystem::temp_directory_path() / "chinagtfs_version_table_tests.csv";
    {
        std::ofstream out(path, std::ios::binary);
        out << "sh,20240101,x\r\nbj,20231201,y\r\n";
    }

    version_table table;
    auto res = read_version_table(path.string(), table);
    REQUIRE(res == OK);
    CHECK(table.size() == 2);
    CHECK(table.find("bj") == std::optional<std::string>("20231201"));

    std::filesystem::remove(path);

    version_table missing;
    res = read_version_table(path.string(), missing);
    CHECK(res == INVALID_ARCHIVE_PATH);
    CHECK_FALSE(res.message.empty());
    CHECK(missing.size() == 0);
}
}
