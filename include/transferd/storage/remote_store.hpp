/*
 * rclone remote definitions store - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

// Backend types offered when defining a remote.
const std::vector<std::string>& remote_types();

// Named remote definitions kept in { "remotes": [ {...}, ... ] }. Each entry is
// a JSON object with at least a "name"; the rest is passed through as given.
// Same write path as RecordStore: backup, temp file, rename.
class RemoteStore {
public:
    // Throws StorageCorruptionError / StorageIOError when the file cannot be loaded.
    explicit RemoteStore(std::filesystem::path path, std::size_t backup_keep = 5);

    RemoteStore(const RemoteStore&) = delete;
    RemoteStore& operator=(const RemoteStore&) = delete;

    std::vector<nlohmann::json> list() const;
    std::optional<nlohmann::json> get(const std::string& name) const;

    // Sets created_at. Throws StorageValidationError for a missing, malformed
    // or already used name. Returns the name.
    std::string add(nlohmann::json remote);

    // Merge patch; name and created_at cannot change. False when the name is unknown.
    bool update(const std::string& name, const nlohmann::json& fields);

    bool remove(const std::string& name);

    const std::filesystem::path& path() const { return m_path; }

private:
    void load();
    void persist(const std::vector<nlohmann::json>& next);
    std::vector<nlohmann::json> decode(const nlohmann::json& doc) const;
    std::vector<nlohmann::json>::const_iterator find(const std::string& name) const;

    std::filesystem::path m_path;
    std::size_t m_backup_keep;
    mutable std::mutex m_mutex;
    std::vector<nlohmann::json> m_remotes;
};

} // namespace transferd
