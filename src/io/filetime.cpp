// ==============================================================================
// filetime.cpp - Windows FILETIME и временные метки
// ==============================================================================

#include <artifacts/filetime.hpp>
#include <iomanip>
#include <limits>
#include <sstream>

namespace artifacts {

namespace {

constexpr std::int64_t TICKS_PER_SECOND = 10000000;
constexpr std::int64_t SECONDS_PER_DAY = 86400;

struct CivilDate {
    std::int64_t year = 1970;
    unsigned month = 1;
    unsigned day = 1;
};

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Алгоритмы days_from_civil / civil_from_days (пролептический григорианский
// календарь, дни относительно 1970-01-01)
CivilDate civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;

    CivilDate date;
    date.day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    date.year = yoe + era * 400 + (date.month <= 2 ? 1 : 0);
    return date;
}

std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
    static constexpr unsigned DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : DAYS[m - 1];
}

/// Прочитать ровно count десятичных цифр
bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, std::int64_t& out) {
    if (pos + count > text.size()) {
        return false;
    }
    std::int64_t value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

}  // namespace

Timestamp timestamp_from_filetime(std::uint64_t filetime) {
    std::int64_t ticks;
    if (filetime >= FILETIME_UNIX_EPOCH) {
        std::uint64_t delta = filetime - FILETIME_UNIX_EPOCH;
        constexpr auto max_ticks = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        ticks = delta > max_ticks ? std::numeric_limits<std::int64_t>::max()
                                  : static_cast<std::int64_t>(delta);
    } else {
        ticks = -static_cast<std::int64_t>(FILETIME_UNIX_EPOCH - filetime);
    }
    return Timestamp(FileTimeTicks(ticks));
}

std::uint64_t filetime_from_timestamp(Timestamp timestamp) {
    std::int64_t ticks = timestamp.time_since_epoch().count();
    if (ticks >= 0) {
        return FILETIME_UNIX_EPOCH + static_cast<std::uint64_t>(ticks);
    }
    // -(ticks + 1) + 1 не переполняется для INT64_MIN
    std::uint64_t before = static_cast<std::uint64_t>(-(ticks + 1)) + 1;
    return before > FILETIME_UNIX_EPOCH ? 0 : FILETIME_UNIX_EPOCH - before;
}

std::string timestamp_to_iso8601(Timestamp timestamp) {
    std::int64_t ticks = timestamp.time_since_epoch().count();
    std::int64_t seconds = floor_div(ticks, TICKS_PER_SECOND);
    std::int64_t sub_ticks = ticks - seconds * TICKS_PER_SECOND;
    std::int64_t days = floor_div(seconds, SECONDS_PER_DAY);
    std::int64_t second_of_day = seconds - days * SECONDS_PER_DAY;

    CivilDate date = civil_from_days(days);

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << "-" << std::setw(2) << date.month
        << "-" << std::setw(2) << date.day << "T" << std::setw(2) << (second_of_day / 3600) << ":"
        << std::setw(2) << ((second_of_day / 60) % 60) << ":" << std::setw(2)
        << (second_of_day % 60) << "." << std::setw(6) << (sub_ticks / 10) << "Z";
    return oss.str();
}

std::string filetime_to_iso8601(std::uint64_t filetime) {
    return timestamp_to_iso8601(timestamp_from_filetime(filetime));
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    std::size_t pos = 0;
    std::int64_t year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (!expect(text, pos, 'T') && !expect(text, pos, ' ')) {
        return std::nullopt;
    }
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 ||
        day > static_cast<std::int64_t>(days_in_month(year, static_cast<unsigned>(month))) ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    // Дробная часть: значимы первые 7 цифр (100 нс), остальные отбрасываются
    std::int64_t fraction = 0;
    if (expect(text, pos, '.')) {
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 7) {
                fraction = fraction * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 7; ++i) {
            fraction *= 10;
        }
    }

    expect(text, pos, 'Z');
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    std::int64_t seconds = days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
    return Timestamp(FileTimeTicks(seconds * TICKS_PER_SECOND + fraction));
}

}  // namespace artifacts
