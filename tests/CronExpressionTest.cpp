#include "engine/Error.hpp"
#include "schedule/CronExpression.hpp"

#include <ctime>
#include <string>

#include <doctest/doctest.h>

using rf::schedule::CronExpression;

namespace
{

// Unix time of a local wall-clock minute. June and July keep clear of DST
// switches.
std::int64_t local(int year, int month, int day, int hour, int minute,
                   int second = 0)
{
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return static_cast<std::int64_t>(std::mktime(&tm));
}

std::int64_t next(char const *expression, std::int64_t after)
{
    auto result = CronExpression::parse(expression).next_after(after);
    REQUIRE(result.has_value());
    return *result;
}

bool rejects(char const *expression)
{
    try
    {
        CronExpression::parse(expression);
    }
    catch (rf::Error const &ex)
    {
        return ex.kind() == rf::ErrorKind::Validation;
    }
    return false;
}

} // namespace

TEST_CASE("steps, lists and ranges")
{
    CHECK(next("*/15 * * * *", local(2026, 6, 13, 10, 7, 30)) ==
          local(2026, 6, 13, 10, 15));
    CHECK(next("5,35 * * * *", local(2026, 6, 13, 10, 10)) ==
          local(2026, 6, 13, 10, 35));
    CHECK(next("10-20/5 * * * *", local(2026, 6, 13, 10, 12)) ==
          local(2026, 6, 13, 10, 15));
    CHECK(next("10-20/5 * * * *", local(2026, 6, 13, 10, 20)) ==
          local(2026, 6, 13, 11, 10));
    CHECK(next("5/20 * * * *", local(2026, 6, 13, 10, 46)) ==
          local(2026, 6, 13, 11, 5));
}

TEST_CASE("next run is strictly after the reference time")
{
    CHECK(next("30 10 * * *", local(2026, 6, 13, 10, 30)) ==
          local(2026, 6, 14, 10, 30));
    CHECK(next("* * * * *", local(2026, 6, 13, 10, 30)) ==
          local(2026, 6, 13, 10, 31));
}

TEST_CASE("weekday ranges skip the weekend")
{
    // 2026-06-13 is a Saturday
    CHECK(next("0 9 * * 1-5", local(2026, 6, 13, 10, 0)) ==
          local(2026, 6, 15, 9, 0));
    CHECK(next("0 9 * * mon-fri", local(2026, 6, 15, 8, 59)) ==
          local(2026, 6, 15, 9, 0));
}

TEST_CASE("sunday is 0, 7 or sun")
{
    auto const after = local(2026, 6, 13, 10, 0);
    auto const expected = local(2026, 6, 14, 0, 0);
    CHECK(next("0 0 * * 0", after) == expected);
    CHECK(next("0 0 * * 7", after) == expected);
    CHECK(next("0 0 * * SUN", after) == expected);
}

TEST_CASE("month names and rollover into the next year")
{
    CHECK(next("0 0 1 jan *", local(2026, 6, 13, 10, 0)) ==
          local(2027, 1, 1, 0, 0));
    CHECK(next("0 12 15 6,7 *", local(2026, 6, 15, 12, 0)) ==
          local(2026, 7, 15, 12, 0));
}

TEST_CASE("restricted day-of-month and day-of-week match either")
{
    // the 1st of the month or any Friday
    CHECK(next("0 0 1 * 5", local(2026, 6, 20, 10, 0)) ==
          local(2026, 6, 26, 0, 0));
    CHECK(next("0 0 1 * 5", local(2026, 6, 27, 10, 0)) ==
          local(2026, 7, 1, 0, 0));
}

TEST_CASE("macros")
{
    CHECK(next("@daily", local(2026, 6, 13, 10, 0)) ==
          local(2026, 6, 14, 0, 0));
    CHECK(next("@hourly", local(2026, 6, 13, 10, 7)) ==
          local(2026, 6, 13, 11, 0));
    CHECK(next("@monthly", local(2026, 6, 13, 10, 0)) ==
          local(2026, 7, 1, 0, 0));
    CHECK(CronExpression::parse("@daily").text() == "@daily");
}

TEST_CASE("an impossible date has no next run")
{
    CHECK_FALSE(CronExpression::parse("0 0 30 2 *")
                    .next_after(local(2026, 6, 13, 10, 0))
                    .has_value());
}

TEST_CASE("matches checks a broken-down local time")
{
    auto const expr = CronExpression::parse("0 9 * * 1-5");
    std::tm monday{};
    monday.tm_year = 2026 - 1900;
    monday.tm_mon = 5;
    monday.tm_mday = 15;
    monday.tm_hour = 9;
    monday.tm_min = 0;
    monday.tm_wday = 1;
    CHECK(expr.matches(monday));
    monday.tm_min = 1;
    CHECK_FALSE(expr.matches(monday));
    monday.tm_min = 0;
    monday.tm_wday = 6;
    CHECK_FALSE(expr.matches(monday));
}

TEST_CASE("malformed expressions are rejected")
{
    CHECK(rejects(""));
    CHECK(rejects("* * *"));
    CHECK(rejects("* * * * * *"));
    CHECK(rejects("61 * * * *"));
    CHECK(rejects("* 24 * * *"));
    CHECK(rejects("* * 0 * *"));
    CHECK(rejects("* * * 13 *"));
    CHECK(rejects("*/0 * * * *"));
    CHECK(rejects("5-1 * * * *"));
    CHECK(rejects("1,,2 * * * *"));
    CHECK(rejects("a b c d e"));
    CHECK(rejects("@sometimes"));
}
