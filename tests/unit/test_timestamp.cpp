#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"

using namespace marginalia;
using namespace std::chrono;

namespace {

Timestamp from_days(year_month_day ymd) {
    return Timestamp(time_point_cast<milliseconds>(sys_days{ymd}));
}

} // namespace

TEST_CASE("Timestamp breaks an instant into UTC fields", "[timestamp]") {
    // 2024-01-05T10:30:15.250Z
    const Timestamp ts(1'704'450'615'250);

    const auto c = ts.to_civil();
    REQUIRE(c.year == 2024);
    REQUIRE(c.month == 1);
    REQUIRE(c.day == 5);
    REQUIRE(c.hour == 10);
    REQUIRE(c.minute == 30);
    REQUIRE(c.second == 15);
    REQUIRE(c.millisecond == 250);
}

TEST_CASE("Timestamp epoch origin", "[timestamp]") {
    REQUIRE(Timestamp{}.to_civil() == CivilTime{});
    REQUIRE(Timestamp(86'400'000).to_iso_date() == "1970-01-02");
}

TEST_CASE("Timestamp formats ISO strings", "[timestamp]") {
    const auto ts = from_days(year{2024} / January / 5) + hours(10);
    REQUIRE(ts.to_iso_string() == "2024-01-05T10:00:00.000Z");
    REQUIRE(ts.to_iso_date() == "2024-01-05");
}

TEST_CASE("Timestamp handles leap days and pre-epoch dates", "[timestamp]") {
    const auto leap = from_days(year{2024} / February / 29);
    REQUIRE(leap.to_iso_date() == "2024-02-29");
    REQUIRE((leap + hours(24)).to_iso_date() == "2024-03-01");

    const Timestamp old(-1000);
    REQUIRE(old.to_civil() == CivilTime{1969, 12, 31, 23, 59, 59, 0});
    REQUIRE(old.to_iso_string() == "1969-12-31T23:59:59.000Z");
}

TEST_CASE("Timestamp compares by instant", "[timestamp]") {
    const auto a = from_days(year{2024} / January / 1);
    const auto b = a + hours(1);

    REQUIRE(a < b);
    REQUIRE((b - a) == milliseconds(3'600'000));
    REQUIRE((b - hours(1)) == a);
}
