#include "infrastructure/system/time_utils.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace CKW::TimeUtils {

std::string toRfc3339(const TimePoint& tp) {
    const std::int64_t micros = toUnixMicros(tp);
    std::int64_t seconds = micros / 1000000;
    std::int64_t fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << fraction << "Z";
    return ss.str();
}

std::optional<TimePoint> fromRfc3339(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(ss, rest);
    std::size_t pos = 0;

    // EN: Fractional seconds, truncated to microseconds.
    // FR: Fractions de seconde, tronquées à la microseconde.
    std::int64_t fraction_micros = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 6) {
                fraction_micros = fraction_micros * 10 + (rest[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            fraction_micros *= 10;
        }
    }

    std::int64_t offset_seconds = 0;
    if (pos < rest.size()) {
        const char sign = rest[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int hours = 0;
            int minutes = 0;
            if (std::sscanf(rest.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
                return std::nullopt;
            }
            offset_seconds = (hours * 3600 + minutes * 60) * (sign == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos < rest.size()) {
        return std::nullopt;
    }

    const std::int64_t seconds = static_cast<std::int64_t>(timegm(&tm)) - offset_seconds;
    return fromUnixMicros(seconds * 1000000 + fraction_micros);
}

std::int64_t toUnixMicros(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixMicros(std::int64_t micros) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(micros)));
}

TimePoint truncateToMicros(const TimePoint& tp) {
    return fromUnixMicros(toUnixMicros(tp));
}

} // namespace CKW::TimeUtils
