#include <catch2/catch.hpp>
#include <chinagtfs/geo/codec_errors.h>
#include <chinagtfs/geo/value_codec.h>

#include <string>

namespace chinagtfs::geo
{
namespace
{
const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

TEST_CASE("Every symbol of the alphabet decodes to its position", "[value_codec]")
{
    REQUIRE(alphabet.size() == symbol_count);
    for (size_t i = 0; i < alphabet.size(); ++i)
        CHECK(decode_symbol(alphabet[i]) == static_cast<int>(i));
}

TEST_CASE("Bytes outside the alphabet are rejected", "[value_codec]")
{
    for (int byte = 0; byte < 256; ++byte)
    {
        const char symbol = static_cast<char>(byte);
        if (alphabet.find(symbol) != std::string::npos)
            continue;
        CHECK_THROWS_AS(decode_symbol(symbol), invalid_symbol);
    }
}

TEST_CASE("Groups are decoded least significant symbol first", "[value_codec]")
{
    CHECK(decode_group("BA", 2) == 1);
    CHECK(decode_group("AB", 2) == 64);
    CHECK(decode_group("//", 2) == 4095);
    CHECK(decode_group("kBAAAA", 6) == 100);
    CHECK(decode_group("AAAg", 4) == int64_t{1} << 23);
    CHECK_THROWS_AS(decode_group("A!", 2), invalid_symbol);
}
}
