/*
 * Engine configuration - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace transferd {

struct EngineConfig {
    std::string data_dir = ".";
    std::string jobs_file = "jobs.json";
    std::string operations_file = "rclone_operations.json";
    std::string remotes_file = "rclone_remotes.json";
    std::string log_dir = "logs";
    int backup_keep = 5;
    int job_retry_cap_seconds = 60;
    int operation_retry_cap_seconds = 30;
    int job_default_max_retries = 5;
    int operation_default_max_retries = 3;
    int zombie_grace_seconds = 300;
    int stop_grace_seconds = 10;
    int kill_wait_seconds = 5;
    int worker_join_seconds = 5;
    int preview_timeout_seconds = 60;
    std::string rsync_binary = "rsync";
    std::string rclone_binary = "rclone";
    std::string log_level = "info";

    // Relative file names are resolved against data_dir.
    std::filesystem::path jobs_path() const;
    std::filesystem::path operations_path() const;
    std::filesystem::path remotes_path() const;
    std::filesystem::path log_path() const;
};

const std::vector<std::string>& config_keys();

// Throws std::invalid_argument for a malformed number. Unknown keys: warning, false.
bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value);

// key=value lines, '#' comments. A missing file is not an error.
void load_config_file(EngineConfig& cfg, const std::filesystem::path& path);

// TRANSFERD_<KEY> for every known key.
void apply_env_overrides(EngineConfig& cfg);

// $HOME/.transferdrc, empty path when HOME is unset.
std::filesystem::path default_config_path();

// Defaults <- rc file (rc_path or the default one) <- environment.
EngineConfig load_config(const std::filesystem::path& rc_path = {});

// Sets the spdlog default level ("trace" ... "off"); unknown names fall back to info.
void apply_log_level(const std::string& level);

} // namespace transferd
