/*
 * Retry backoff - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstdint>
#include <string>

namespace transferd {

// One scheduled re-execution. Discarded when the job's generation moved on
// (a manual start or stop happened after it was scheduled).
struct RetryTask {
    std::string id;
    int attempt = 0;              // 1 for the first retry
    std::uint64_t generation = 0;
};

// min(2^retry_count, cap), in backoff units (seconds in production).
inline long long compute_backoff(int retry_count, int cap) {
    if (retry_count < 0) retry_count = 0;
    if (retry_count >= 62) return cap;
    long long d = 1LL << retry_count;
    return d < cap ? d : cap;
}

} // namespace transferd
