/*
 * Timestamp helpers - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace transferd {

using Clock = std::chrono::system_clock;

// Local time, "2025-03-01T14:05:09.123456" (same shape as Python's isoformat()).
std::string iso_timestamp(Clock::time_point tp = Clock::now());

// Accepts the format above, with or without the fractional part.
std::optional<Clock::time_point> parse_iso_timestamp(const std::string& text);

// "20250301_140509_123456", sorts lexicographically in time order. Used for backup names.
std::string compact_timestamp(Clock::time_point tp = Clock::now());

} // namespace transferd
