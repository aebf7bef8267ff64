#include <tidy/core/time.hpp>

#include <fmt/format.h>

#include <cctype>
#include <chrono>

namespace tidy {

namespace {

constexpr std::int64_t kMillisPerDay = 86'400'000;

// Reads exactly `width` digits starting at `pos`.
auto read_digits(std::string_view text, std::size_t& pos, std::size_t width)
    -> std::optional<unsigned> {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    unsigned value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char ch = text[pos + i];
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned>(ch - '0');
    }
    pos += width;
    return value;
}

auto expect_char(std::string_view text, std::size_t& pos, char ch) -> bool {
    if (pos < text.size() && text[pos] == ch) {
        ++pos;
        return true;
    }
    return false;
}

}  // namespace

auto datetime_fields(Datetime dt) -> DatetimeFields {
    using namespace std::chrono;
    sys_time<milliseconds> tp{milliseconds{dt.millis}};
    auto day_point = floor<days>(tp);
    year_month_day ymd{day_point};
    hh_mm_ss<milliseconds> hms{tp - day_point};
    weekday wd{day_point};
    return DatetimeFields{
        .year = static_cast<int>(ymd.year()),
        .month = static_cast<unsigned>(ymd.month()),
        .day = static_cast<unsigned>(ymd.day()),
        .weekday = wd.iso_encoding(),
        .hours = static_cast<unsigned>(hms.hours().count()),
        .minutes = static_cast<unsigned>(hms.minutes().count()),
        .seconds = static_cast<unsigned>(hms.seconds().count()),
        .millis = static_cast<unsigned>(hms.subseconds().count()),
    };
}

auto make_datetime(int year, unsigned month, unsigned day, unsigned hours, unsigned minutes,
                   unsigned seconds, unsigned millis) -> std::optional<Datetime> {
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                       std::chrono::day{day}};
    if (year < 0 || year > 9999 || !ymd.ok() || hours > 23 || minutes > 59 || seconds > 59 ||
        millis > 999) {
        return std::nullopt;
    }
    std::int64_t day_count = sys_days{ymd}.time_since_epoch().count();
    std::int64_t ms = day_count * kMillisPerDay +
                      ((static_cast<std::int64_t>(hours) * 60 + minutes) * 60 + seconds) * 1000 +
                      millis;
    return Datetime{ms};
}

auto parse_datetime(std::string_view text) -> std::optional<Datetime> {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }

    std::size_t pos = 0;
    auto year = read_digits(text, pos, 4);
    if (!year || !expect_char(text, pos, '-')) {
        return std::nullopt;
    }
    auto month = read_digits(text, pos, 2);
    if (!month || !expect_char(text, pos, '-')) {
        return std::nullopt;
    }
    auto day = read_digits(text, pos, 2);
    if (!day) {
        return std::nullopt;
    }

    unsigned hours = 0;
    unsigned minutes = 0;
    unsigned seconds = 0;
    unsigned millis = 0;
    std::int64_t offset_minutes = 0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        auto hh = read_digits(text, pos, 2);
        if (!hh || !expect_char(text, pos, ':')) {
            return std::nullopt;
        }
        auto mm = read_digits(text, pos, 2);
        if (!mm) {
            return std::nullopt;
        }
        hours = *hh;
        minutes = *mm;
        if (expect_char(text, pos, ':')) {
            auto ss = read_digits(text, pos, 2);
            if (!ss) {
                return std::nullopt;
            }
            seconds = *ss;
            if (expect_char(text, pos, '.')) {
                // Keep millisecond precision; extra fraction digits are dropped.
                std::size_t digits = 0;
                while (pos < text.size() &&
                       std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
                    if (digits < 3) {
                        millis = millis * 10 + static_cast<unsigned>(text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
                for (std::size_t i = digits; i < 3; ++i) {
                    millis *= 10;
                }
            }
        }
        if (expect_char(text, pos, 'Z')) {
            offset_minutes = 0;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            auto oh = read_digits(text, pos, 2);
            if (!oh || !expect_char(text, pos, ':')) {
                return std::nullopt;
            }
            auto om = read_digits(text, pos, 2);
            if (!om || *oh > 23 || *om > 59) {
                return std::nullopt;
            }
            offset_minutes = sign * static_cast<std::int64_t>(*oh * 60 + *om);
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    auto result = make_datetime(static_cast<int>(*year), *month, *day, hours, minutes, seconds,
                                millis);
    if (!result) {
        return std::nullopt;
    }
    result->millis -= offset_minutes * 60'000;
    if (!in_datetime_range(result->millis)) {
        return std::nullopt;
    }
    return result;
}

auto format_datetime(Datetime dt) -> std::string {
    auto f = datetime_fields(dt);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", f.year, f.month, f.day,
                       f.hours, f.minutes, f.seconds, f.millis);
}

}  // namespace tidy
