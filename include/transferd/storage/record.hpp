/*
 * Job / operation record model - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

// Status strings are lowercase identifiers only: they end up as UI state classes.
enum class Status {
    Created,
    Pending,
    PendingRestart,
    Initializing,
    PreviewFailed,
    PendingApproval,
    Scanning,
    Running,
    Paused,
    Stopped,
    Completed,
    Failed
};

const char* to_string(Status s);
std::optional<Status> parse_status(const std::string& text);

// Job = local rsync transfer, Operation = rclone operation (possibly remote).
enum class RecordKind { Job, Operation };

const char* to_string(RecordKind k);
std::optional<RecordKind> parse_kind(const std::string& text);
const char* id_prefix(RecordKind k); // "job" | "rclone"

// True for statuses that imply a live worker (or one about to exist).
bool is_transient(RecordKind kind, Status s);

struct Progress {
    std::optional<std::string> status;  // running | scanning
    std::optional<int> percent;
    std::optional<std::int64_t> bytes_transferred;
    std::optional<std::int64_t> total_bytes;
    std::optional<std::int64_t> files_transferred;
    std::optional<std::int64_t> total_files;
    std::optional<std::string> speed;
    std::optional<std::string> eta;
    std::optional<std::string> transferred_display;
    std::optional<int> retry_attempt;

    bool empty() const;
};

struct Record {
    std::string id;
    RecordKind kind = RecordKind::Job;
    std::string name;
    std::string source;
    std::string destination;
    std::string operation_type;               // rclone verb, empty for rsync jobs
    nlohmann::json options = nlohmann::json::object(); // tool options, opaque to the engine
    std::vector<std::string> excludes;
    Status status = Status::Created;
    int retry_count = 0;
    int max_retries = -1;                     // -1: use the store default on create
    std::string created_at;
    std::string updated_at;
    std::optional<std::string> started_at;
    std::optional<std::string> completed_at;
    std::optional<std::string> failed_at;
    std::optional<std::string> stopped_at;
    std::optional<Progress> progress;
    std::optional<std::string> error_message;
    std::optional<int> return_code;
};

void to_json(nlohmann::json& j, Status s);
void from_json(const nlohmann::json& j, Status& s);
void to_json(nlohmann::json& j, const Progress& p);
void from_json(const nlohmann::json& j, Progress& p);
void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

// Splits a whitespace separated pattern list ("*.tmp .DS_Store").
std::vector<std::string> split_patterns(const std::string& text);

} // namespace transferd
