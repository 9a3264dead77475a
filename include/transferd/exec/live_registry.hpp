/*
 * In-memory registry of live job workers - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <transferd/exec/process.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace transferd {

// One per executing job: cancellation token, paused flag, the OS process
// once spawned, and a completion signal for whoever waits on the worker.
class LiveEntry {
public:
    LiveEntry();

    void cancel() { m_cancel = true; }
    bool cancelled() const { return m_cancel; }

    void set_paused(bool p) { m_paused = p; }
    bool paused() const { return m_paused; }

    void set_process(std::shared_ptr<Process> p);
    std::shared_ptr<Process> process() const;

    // Called once by the worker when it is done with the job.
    void finish();
    bool wait_finished(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> m_cancel{false};
    std::atomic<bool> m_paused{false};
    mutable std::mutex m_mutex;
    std::shared_ptr<Process> m_process;
    std::promise<void> m_done;
    std::shared_future<void> m_finished;
    bool m_finish_called = false;
};

// At most one entry per id; insertion is an atomic check-and-insert.
class LiveRegistry {
public:
    // nullptr when id already has an entry.
    std::shared_ptr<LiveEntry> try_insert(const std::string& id);

    std::shared_ptr<LiveEntry> find(const std::string& id) const;
    bool contains(const std::string& id) const;

    // Removes the entry only if it is still `entry` (a newer worker may own the id).
    bool erase(const std::string& id, const std::shared_ptr<LiveEntry>& entry);

    std::vector<std::string> ids() const;
    std::vector<std::shared_ptr<LiveEntry>> entries() const;
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<LiveEntry>> m_entries;
};

} // namespace transferd
