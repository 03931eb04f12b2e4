#include "hsync/core/clock.hpp"
#include "hsync/core/platform.hpp"

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace hsync::core {
namespace {

bool read_digits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // namespace

std::string to_iso8601(Timestamp t) {
    const auto ms_total = t.time_since_epoch().count();
    auto seconds = static_cast<std::time_t>(ms_total / 1000);
    auto millis = static_cast<int>(ms_total % 1000);
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    std::tm tm{};
    utc_breakdown(seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

Result<Timestamp> parse_iso8601(const std::string& text) {
    std::size_t pos = 0;
    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    const bool date_ok = read_digits(text, pos, 4, year) && expect(text, pos, '-') &&
                         read_digits(text, pos, 2, month) && expect(text, pos, '-') &&
                         read_digits(text, pos, 2, day);
    if (!date_ok || pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return Err<Timestamp>(ErrorKind::Validation, "invalid ISO 8601 date: '" + text + "'");
    }
    ++pos;

    const bool time_ok = read_digits(text, pos, 2, hour) && expect(text, pos, ':') &&
                         read_digits(text, pos, 2, minute) && expect(text, pos, ':') &&
                         read_digits(text, pos, 2, second);
    if (!time_ok || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return Err<Timestamp>(ErrorKind::Validation, "invalid ISO 8601 time: '" + text + "'");
    }

    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int scale = 100;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (scale > 0) {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return Err<Timestamp>(ErrorKind::Validation, "empty fraction in timestamp: '" + text + "'");
        }
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        const char marker = text[pos];
        if (marker == 'Z' || marker == 'z') {
            ++pos;
        } else if (marker == '+' || marker == '-') {
            ++pos;
            int off_h = 0, off_m = 0;
            if (!read_digits(text, pos, 2, off_h)) {
                return Err<Timestamp>(ErrorKind::Validation, "invalid UTC offset: '" + text + "'");
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (!read_digits(text, pos, 2, off_m)) {
                return Err<Timestamp>(ErrorKind::Validation, "invalid UTC offset: '" + text + "'");
            }
            offset_minutes = (off_h * 60 + off_m) * (marker == '-' ? -1 : 1);
        }
    }
    if (pos != text.size()) {
        return Err<Timestamp>(ErrorKind::Validation, "trailing characters in timestamp: '" + text + "'");
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    const std::time_t seconds = utc_mktime(&tm);
    const auto epoch_ms = static_cast<long long>(seconds) * 1000 + millis -
                          static_cast<long long>(offset_minutes) * 60 * 1000;
    return Ok(Timestamp{std::chrono::milliseconds{epoch_ms}});
}

} // namespace hsync::core
