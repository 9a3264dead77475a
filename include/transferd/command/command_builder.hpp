/*
 * rsync / rclone argument vector builders - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <transferd/storage/record.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

// Maps a record to the argv of the external tool. Must be pure.
using CommandBuilder = std::function<std::vector<std::string>(const Record&)>;

// Flags are taken when the option is truthy (true, non-empty string, non-zero number).
// Empty source/destination become "[SOURCE]"/"[DESTINATION]" placeholders for display.
std::vector<std::string> build_rsync_command(const std::string& source, const std::string& destination,
                                             const nlohmann::json& args,
                                             const std::vector<std::string>& excludes,
                                             const std::string& binary = "rsync");

std::vector<std::string> build_rclone_command(const std::string& operation, const std::string& source,
                                              const std::string& destination, const nlohmann::json& args,
                                              const std::vector<std::string>& excludes,
                                              const std::string& binary = "rclone");

nlohmann::json default_rsync_args();
nlohmann::json default_rclone_args();

// Human readable warnings about destructive option combinations (not errors).
std::vector<std::string> rsync_option_warnings(const nlohmann::json& args);
std::vector<std::string> rclone_option_warnings(const nlohmann::json& args);

const std::vector<std::string>& rclone_operations();

// For display and the job log only, never passed to a shell.
std::string join_command(const std::vector<std::string>& argv);

// rsync for jobs, "rclone <operation_type>" for operations.
CommandBuilder default_command_builder(RecordKind kind, const std::string& rsync_binary = "rsync",
                                       const std::string& rclone_binary = "rclone");

// Same record with dry-run forced on, used by the operation preview.
Record with_dry_run(Record record);

bool option_enabled(const nlohmann::json& args, const char* key);
std::optional<std::string> option_value(const nlohmann::json& args, const char* key);

} // namespace transferd
