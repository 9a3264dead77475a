/*
 * Single-thread delayed task queue - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace transferd {

// Tasks run on the queue's own thread, one at a time, in deadline order.
// A task must not block for long: it delays every task behind it.
class TimerQueue {
public:
    using Task = std::function<void()>;
    using Handle = std::uint64_t;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // Returns 0 after shutdown (task dropped).
    Handle schedule_after(std::chrono::milliseconds delay, Task task);

    // False if the task already ran or never existed.
    bool cancel(Handle h);

    // Drops pending tasks and joins the thread. Idempotent.
    void shutdown();

    std::size_t pending() const;

private:
    void run();

    using Key = std::pair<std::chrono::steady_clock::time_point, Handle>;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<Key, Task> m_tasks;
    Handle m_next = 1;
    bool m_stop = false;
    std::thread m_thread;
};

} // namespace transferd
