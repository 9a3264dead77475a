/*
 * Persistent record store - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <transferd/storage/record.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

struct StoreOptions {
    std::filesystem::path path;          // e.g. jobs.json
    std::string collection_key = "jobs"; // top-level array name in the document
    RecordKind kind = RecordKind::Job;
    int default_max_retries = 5;
    std::size_t backup_keep = 5;
};

StoreOptions job_store_options(const std::filesystem::path& path, std::size_t backup_keep = 5);
StoreOptions operation_store_options(const std::filesystem::path& path, std::size_t backup_keep = 5);

// JSON file backed store of records. Every call is serialized by one
// recursive mutex; every write goes backup -> temp file -> rename, and the
// in-memory copy only changes after the rename succeeded.
class RecordStore {
public:
    // Throws StorageCorruptionError / StorageIOError when the file cannot be loaded.
    explicit RecordStore(StoreOptions opts);

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    // Assigns id, status=created, timestamps, retry_count=0 and max_retries
    // (draft value if non-negative, store default otherwise). Returns the id.
    std::string create(Record draft);

    std::optional<Record> get(const std::string& id) const;
    std::vector<Record> list() const;
    std::vector<Record> list_by_status(Status status) const;

    // JSON merge patch applied to the whole record. Unknown id: warning, no-op.
    void update(const std::string& id, const nlohmann::json& fields);

    bool remove(const std::string& id);

    // Returns the new count, nullopt when the id is unknown.
    std::optional<int> increment_retry_count(const std::string& id);

    RecordKind kind() const { return m_opts.kind; }
    const std::filesystem::path& path() const { return m_opts.path; }

private:
    void load();
    // Throws StorageCorruptionError when the collection or a record is malformed.
    std::vector<Record> decode(const nlohmann::json& doc) const;
    void persist(const std::vector<Record>& next);
    std::vector<Record>::iterator find(const std::string& id);
    std::vector<Record>::const_iterator find(const std::string& id) const;

    StoreOptions m_opts;
    mutable std::recursive_mutex m_mutex;
    std::vector<Record> m_records;
};

} // namespace transferd
