/*
 * Crash-safe file helpers - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

// "<prefix>_<uuid4>", e.g. job_0f8fad5b-d9cb-469f-a165-70867728950e
std::string generate_unique_id(const std::string& prefix);

// jobs.json -> jobs.tmp
std::filesystem::path temp_path_for(const std::filesystem::path& target);

// Serializes to the temp file then renames it over the target.
// Throws StorageIOError; the target is untouched on failure.
void atomic_write(const std::filesystem::path& target, const nlohmann::json& doc, int indent = 2);

// Copies target to "<stem>.backup.<timestamp><ext>" and prunes to keep_count.
// Returns nullopt if target does not exist or the copy failed (logged, not thrown).
std::optional<std::filesystem::path> backup_file(const std::filesystem::path& target, std::size_t keep_count);

// Newest first.
std::vector<std::filesystem::path> list_backups(const std::filesystem::path& target);
void cleanup_old_backups(const std::filesystem::path& target, std::size_t keep_count);
std::optional<std::filesystem::path> find_latest_backup(const std::filesystem::path& target);

// Throws to reject a document that parses but has the wrong shape.
using DocumentCheck = std::function<void(const nlohmann::json&)>;

// Loads a JSON object document. Missing or empty file -> fallback.
// Unparsable file, or one the check rejects -> newest backup that passes
// (warning logged), otherwise StorageCorruptionError. Unreadable file -> StorageIOError.
nlohmann::json load_json_document(const std::filesystem::path& target, const nlohmann::json& fallback,
                                  const DocumentCheck& check = nullptr);

// Moves the corrupt target aside (".corrupted") and restores the newest backup.
bool recover_from_backup(const std::filesystem::path& target);

} // namespace transferd
