/*
 * Per-job log files implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/exec/job_log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <system_error>

namespace transferd {
namespace fs = std::filesystem;

JobLogBook::JobLogBook(fs::path dir) : m_dir(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec) spdlog::warn("cannot create log directory {}: {}", m_dir.string(), ec.message());
}

fs::path JobLogBook::path_for(const std::string& id) const { return m_dir / (id + ".log"); }

std::shared_ptr<spdlog::logger> JobLogBook::logger_for(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_loggers.find(id);
    if (it != m_loggers.end()) return it->second;
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_for(id).string(), false);
    // not registered globally: job ids come and go
    auto logger = std::make_shared<spdlog::logger>("job:" + id, std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] %v");
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::trace);
    m_loggers.emplace(id, logger);
    return logger;
}

void JobLogBook::write(const std::string& id, const std::string& message) {
    try {
        logger_for(id)->info("{}", message);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("job log {} unavailable: {}", path_for(id).string(), e.what());
    }
}

void JobLogBook::close(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loggers.erase(id);
}

} // namespace transferd
