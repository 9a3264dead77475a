/*
 * Engine configuration implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace transferd {
namespace fs = std::filesystem;

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static int to_int(const std::string& key, const std::string& val, int min_value) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(val, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("config key '" + key + "' expects an integer, got '" + val + "'");
    }
    if (pos != val.size()) throw std::invalid_argument("config key '" + key + "' expects an integer, got '" + val + "'");
    if (v < min_value) throw std::invalid_argument("config key '" + key + "' must be >= " + std::to_string(min_value));
    return v;
}

static fs::path under_data_dir(const std::string& data_dir, const std::string& name) {
    fs::path p(name);
    if (p.is_absolute()) return p;
    return fs::path(data_dir) / p;
}

fs::path EngineConfig::jobs_path() const { return under_data_dir(data_dir, jobs_file); }
fs::path EngineConfig::operations_path() const { return under_data_dir(data_dir, operations_file); }
fs::path EngineConfig::remotes_path() const { return under_data_dir(data_dir, remotes_file); }
fs::path EngineConfig::log_path() const { return under_data_dir(data_dir, log_dir); }

const std::vector<std::string>& config_keys() {
    static const std::vector<std::string> keys{
        "data_dir", "jobs_file", "operations_file", "remotes_file", "log_dir", "backup_keep",
        "job_retry_cap_seconds", "operation_retry_cap_seconds",
        "job_default_max_retries", "operation_default_max_retries",
        "zombie_grace_seconds", "stop_grace_seconds", "kill_wait_seconds",
        "worker_join_seconds", "preview_timeout_seconds",
        "rsync_binary", "rclone_binary", "log_level"};
    return keys;
}

bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value) {
    const std::string val = trim(value);
    if(key=="data_dir") cfg.data_dir=val;
    else if(key=="jobs_file") cfg.jobs_file=val;
    else if(key=="operations_file") cfg.operations_file=val;
    else if(key=="remotes_file") cfg.remotes_file=val;
    else if(key=="log_dir") cfg.log_dir=val;
    else if(key=="backup_keep") cfg.backup_keep=to_int(key,val,1);
    else if(key=="job_retry_cap_seconds") cfg.job_retry_cap_seconds=to_int(key,val,1);
    else if(key=="operation_retry_cap_seconds") cfg.operation_retry_cap_seconds=to_int(key,val,1);
    else if(key=="job_default_max_retries") cfg.job_default_max_retries=to_int(key,val,0);
    else if(key=="operation_default_max_retries") cfg.operation_default_max_retries=to_int(key,val,0);
    else if(key=="zombie_grace_seconds") cfg.zombie_grace_seconds=to_int(key,val,0);
    else if(key=="stop_grace_seconds") cfg.stop_grace_seconds=to_int(key,val,0);
    else if(key=="kill_wait_seconds") cfg.kill_wait_seconds=to_int(key,val,0);
    else if(key=="worker_join_seconds") cfg.worker_join_seconds=to_int(key,val,0);
    else if(key=="preview_timeout_seconds") cfg.preview_timeout_seconds=to_int(key,val,1);
    else if(key=="rsync_binary") cfg.rsync_binary=val;
    else if(key=="rclone_binary") cfg.rclone_binary=val;
    else if(key=="log_level") cfg.log_level=val;
    else { spdlog::warn("unknown config key '{}' ignored", key); return false; }
    return true;
}

void load_config_file(EngineConfig& cfg, const fs::path& path) {
    std::ifstream in(path);
    if (!in) return;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) { spdlog::warn("{}: ignoring line without '=': {}", path.string(), line); continue; }
        apply_config_value(cfg, trim(line.substr(0, eq)), line.substr(eq+1));
    }
}

void apply_env_overrides(EngineConfig& cfg) {
    for (const auto& key : config_keys()) {
        std::string var = "TRANSFERD_" + key;
        std::transform(var.begin(), var.end(), var.begin(), [](unsigned char c){ return (char)std::toupper(c); });
        const char* v = std::getenv(var.c_str());
        if (v) apply_config_value(cfg, key, v);
    }
}

fs::path default_config_path() {
    std::string home = getenv_or("HOME");
#ifdef _WIN32
    if (home.empty()) home = getenv_or("USERPROFILE");
#endif
    if (home.empty()) return {};
    return fs::path(home) / ".transferdrc";
}

EngineConfig load_config(const fs::path& rc_path) {
    EngineConfig cfg;
    fs::path rc = rc_path.empty() ? default_config_path() : rc_path;
    if (!rc.empty()) load_config_file(cfg, rc);
    apply_env_overrides(cfg);
    return cfg;
}

void apply_log_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::warn("unknown log_level '{}', using info", level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}

} // namespace transferd
