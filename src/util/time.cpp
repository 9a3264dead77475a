/*
 * Timestamp helpers implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/util/time.hpp>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace transferd {

static std::tm local_tm(std::time_t t) {
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &t);
#else
    localtime_r(&t, &out);
#endif
    return out;
}

static long micros_of(Clock::time_point tp) {
    auto since = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since);
    return static_cast<long>(std::chrono::duration_cast<std::chrono::microseconds>(since - secs).count());
}

std::string iso_timestamp(Clock::time_point tp) {
    std::tm tm = local_tm(Clock::to_time_t(tp));
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, micros_of(tp));
    return buf;
}

std::optional<Clock::time_point> parse_iso_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return std::nullopt;
    long micros = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek()) && digits.size() < 6) digits.push_back(static_cast<char>(in.get()));
        while (digits.size() < 6) digits.push_back('0');
        micros = std::stol(digits);
    }
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t) + std::chrono::microseconds(micros);
}

std::string compact_timestamp(Clock::time_point tp) {
    std::tm tm = local_tm(Clock::to_time_t(tp));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d_%06ld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, micros_of(tp));
    return buf;
}

} // namespace transferd
