/*
 * Best-effort progress parsing of rsync / rclone output - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <transferd/storage/record.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace transferd {

// rsync: "sent N bytes", --progress lines ("1,234,567  45%  1.23MB/s  0:00:12"),
// "xfr#N, to-chk=R/T" counters, "total size is N", "files..." while scanning.
std::optional<Progress> parse_rsync_progress(const std::string& line);

// rclone: "Transferred: 10.5M / 100.0M, 10%, 1.2M/s, ETA 1m30s",
// "Transferred: 3 / 10, 30%" file counters, "Checking" / "files..." while scanning.
std::optional<Progress> parse_rclone_progress(const std::string& line);

// rsync for jobs, rclone for operations. nullopt when the line says nothing.
std::optional<Progress> parse_progress(RecordKind kind, const std::string& line);

// Fields of p as a merge patch for the record's "progress" object.
nlohmann::json progress_patch(const Progress& p);

} // namespace transferd
