/*
 * Per-job append-only log files - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace spdlog { class logger; }

namespace transferd {

// <dir>/<id>.log, one "[YYYY-MM-DD HH:MM:SS] message" line per write, flushed immediately.
class JobLogBook {
public:
    explicit JobLogBook(std::filesystem::path dir);

    std::filesystem::path path_for(const std::string& id) const;

    // Failures to open the file are reported on the default logger only.
    void write(const std::string& id, const std::string& message);

    // Drops the open file; the next write reopens it in append mode.
    void close(const std::string& id);

private:
    std::shared_ptr<spdlog::logger> logger_for(const std::string& id);

    std::filesystem::path m_dir;
    std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // namespace transferd
