#include <catch2/catch.hpp>
#include <chinagtfs/metroman/csv.h>

namespace chinagtfs::metroman
{
TEST_CASE("Records are split on CRLF and LF", "[csv]")
{
    auto records = split_records("a\r\nb\n\r\nc");
    REQUIRE(records.size() == 3);
    CHECK(records[0] == "a");
    CHECK(records[1] == "b");
    CHECK(records[2] == "c");

    CHECK(split_records("").empty());
    CHECK(split_records("\r\n\r\n").empty());
}

TEST_CASE("Fields keep empty values", "[csv]")
{
    auto fields = split_fields("0101<,>MS<,><,>People's Square", bracket_delimiter);
    REQUIRE(fields.size() == 4);
    CHECK(fields[1] == "MS");
    CHECK(fields[2].empty());
    CHECK(fields[3] == "People's Square");

    CHECK(split_fields("a,,b", comma_delimiter).size() == 3);
    CHECK(split_fields("", comma_delimiter).size() == 1);

    CHECK(field(fields, 3) == "People's Square");
    CHECK(field(fields, 4).empty());
}

TEST_CASE("Malformed numbers parse as zero", "[csv]")
{
    CHECK(parse_int("42") == 42);
    CHECK(parse_int("-7") == -7);
    CHECK(parse_int("") == 0);
    CHECK(parse_int("abc") == 0);
    CHECK(parse_int("12x") == 0);
    CHECK(parse_int("99999999999") == 0);

    CHECK(parse_double("31.25") == Catch::Detail::Approx(31.25));
    CHECK(parse_double("-0.5") == Catch::Detail::Approx(-0.5));
    CHECK(parse_double("x") == 0.0);
    CHECK(parse_double("") == 0.0);
}
}
