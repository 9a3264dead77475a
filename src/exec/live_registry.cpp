/*
 * Live registry implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/exec/live_registry.hpp>
#include <algorithm>

namespace transferd {

LiveEntry::LiveEntry() : m_finished(m_done.get_future().share()) {}

void LiveEntry::set_process(std::shared_ptr<Process> p) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_process = std::move(p);
}

std::shared_ptr<Process> LiveEntry::process() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_process;
}

void LiveEntry::finish() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finish_called) return;
    m_finish_called = true;
    m_done.set_value();
}

bool LiveEntry::wait_finished(std::chrono::milliseconds timeout) const {
    return m_finished.wait_for(timeout) == std::future_status::ready;
}

std::shared_ptr<LiveEntry> LiveRegistry::try_insert(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(id)) return nullptr;
    auto entry = std::make_shared<LiveEntry>();
    m_entries.emplace(id, entry);
    return entry;
}

std::shared_ptr<LiveEntry> LiveRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : it->second;
}

bool LiveRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(id) != 0;
}

bool LiveRegistry::erase(const std::string& id, const std::shared_ptr<LiveEntry>& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second != entry) return false;
    m_entries.erase(it);
    return true;
}

std::vector<std::string> LiveRegistry::ids() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (auto &kv : m_entries) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::shared_ptr<LiveEntry>> LiveRegistry::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<LiveEntry>> out;
    for (auto &kv : m_entries) out.push_back(kv.second);
    return out;
}

std::size_t LiveRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace transferd
