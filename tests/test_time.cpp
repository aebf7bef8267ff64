#include <tidy/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tidy;

TEST_CASE("time: calendar fields in UTC", "[core][time]") {
    auto dt = make_datetime(1984, 1, 1, 13, 45, 30, 250);
    REQUIRE(dt.has_value());
    auto f = datetime_fields(*dt);
    CHECK(f.year == 1984);
    CHECK(f.month == 1);
    CHECK(f.day == 1);
    CHECK(f.hours == 13);
    CHECK(f.minutes == 45);
    CHECK(f.seconds == 30);
    CHECK(f.millis == 250);
}

TEST_CASE("time: weekday is ISO numbered", "[core][time]") {
    // 1984-01-01 was a Sunday, 1984-01-02 a Monday.
    CHECK(datetime_fields(*make_datetime(1984, 1, 1)).weekday == 7);
    CHECK(datetime_fields(*make_datetime(1984, 1, 2)).weekday == 1);
    CHECK(datetime_fields(Datetime{0}).weekday == 4);
}

TEST_CASE("time: instants before the epoch", "[core][time]") {
    auto f = datetime_fields(Datetime{-1});
    CHECK(f.year == 1969);
    CHECK(f.month == 12);
    CHECK(f.day == 31);
    CHECK(f.hours == 23);
    CHECK(f.millis == 999);
}

TEST_CASE("time: invalid calendar dates are rejected", "[core][time]") {
    CHECK_FALSE(make_datetime(2023, 2, 29).has_value());
    CHECK(make_datetime(2024, 2, 29).has_value());
    CHECK_FALSE(make_datetime(2024, 13, 1).has_value());
    CHECK_FALSE(make_datetime(2024, 1, 1, 24).has_value());
}

TEST_CASE("time: ISO-8601 parsing", "[core][time]") {
    auto day = parse_datetime("1984-01-01");
    REQUIRE(day.has_value());
    CHECK(*day == *make_datetime(1984, 1, 1));

    auto full = parse_datetime("1984-01-01T10:20:30.5Z");
    REQUIRE(full.has_value());
    CHECK(*full == *make_datetime(1984, 1, 1, 10, 20, 30, 500));

    auto spaced = parse_datetime("1984-01-01 10:20");
    REQUIRE(spaced.has_value());
    CHECK(*spaced == *make_datetime(1984, 1, 1, 10, 20));

    auto offset = parse_datetime("1984-01-01T10:00:00+02:00");
    REQUIRE(offset.has_value());
    CHECK(*offset == *make_datetime(1984, 1, 1, 8));

    CHECK_FALSE(parse_datetime("abc").has_value());
    CHECK_FALSE(parse_datetime("1984-02-30").has_value());
    CHECK_FALSE(parse_datetime("1984-01-01T10").has_value());
    CHECK_FALSE(parse_datetime("").has_value());
}

TEST_CASE("time: canonical format round-trips", "[core][time]") {
    auto dt = *make_datetime(2001, 9, 9, 1, 46, 40, 7);
    auto text = format_datetime(dt);
    CHECK(text == "2001-09-09T01:46:40.007Z");
    CHECK(parse_datetime(text) == dt);
}

TEST_CASE("time: years outside 0000-9999 are not representable", "[core][time]") {
    CHECK_FALSE(make_datetime(10000, 1, 1).has_value());
    CHECK_FALSE(make_datetime(-1, 12, 31).has_value());

    auto first = make_datetime(0, 1, 1);
    REQUIRE(first.has_value());
    CHECK(first->millis == kMinDatetimeMillis);
    CHECK(format_datetime(*first) == "0000-01-01T00:00:00.000Z");

    auto last = make_datetime(9999, 12, 31, 23, 59, 59, 999);
    REQUIRE(last.has_value());
    CHECK(last->millis == kMaxDatetimeMillis);
    CHECK(parse_datetime(format_datetime(*last)) == last);

    CHECK_FALSE(parse_datetime("9999-12-31T23:30:00-01:00").has_value());
    CHECK_FALSE(parse_datetime("0000-01-01T00:30:00+01:00").has_value());
}
