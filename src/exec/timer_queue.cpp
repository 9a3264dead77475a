/*
 * Timer queue implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/exec/timer_queue.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace transferd {

TimerQueue::TimerQueue() : m_thread([this]{ run(); }) {}

TimerQueue::~TimerQueue() { shutdown(); }

TimerQueue::Handle TimerQueue::schedule_after(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stop) return 0;
    Handle h = m_next++;
    m_tasks.emplace(Key{std::chrono::steady_clock::now() + delay, h}, std::move(task));
    m_cv.notify_all();
    return h;
}

bool TimerQueue::cancel(Handle h) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
        if (it->first.second == h) { m_tasks.erase(it); return true; }
    }
    return false;
}

void TimerQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
        m_tasks.clear();
    }
    m_cv.notify_all();
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) m_thread.join();
}

std::size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop) {
        if (m_tasks.empty()) { m_cv.wait(lock); continue; }
        auto due = m_tasks.begin()->first.first;
        if (std::chrono::steady_clock::now() < due) { m_cv.wait_until(lock, due); continue; }
        Task task = std::move(m_tasks.begin()->second);
        m_tasks.erase(m_tasks.begin());
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("timer task failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace transferd
