/*
 * Process supervisor: execution, retry, signals and reconciliation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <transferd/command/command_builder.hpp>
#include <transferd/exec/job_log.hpp>
#include <transferd/exec/live_registry.hpp>
#include <transferd/exec/process.hpp>
#include <transferd/exec/retry.hpp>
#include <transferd/exec/timer_queue.hpp>
#include <transferd/storage/record_store.hpp>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

struct EngineConfig;

// Invoked on the worker thread for every recognized progress line.
using ProgressCallback = std::function<void(const std::string& id, const Progress& progress)>;

struct SupervisorOptions {
    int retry_cap = 60;                                 // in backoff units
    std::chrono::milliseconds backoff_unit{1000};
    std::chrono::milliseconds stop_grace{10000};        // SIGINT -> SIGTERM
    std::chrono::milliseconds kill_wait{5000};          // SIGTERM -> SIGKILL
    std::chrono::milliseconds worker_join{5000};
    std::chrono::seconds zombie_grace{300};             // operations only
    std::chrono::seconds preview_timeout{60};

    static SupervisorOptions from_config(const EngineConfig& cfg, RecordKind kind);
};

struct PreviewResult {
    bool success = false;
    bool timeout = false;
    std::string error;
    std::int64_t files = 0;           // lines reporting a file the run would touch
    std::string stats;                // last "Transferred:" line
    std::vector<std::string> output;  // tail of the dry-run output
};

// Runs the records of one store. The store and log book must outlive it.
class Supervisor {
public:
    Supervisor(RecordStore& store, JobLogBook& logs, CommandBuilder builder,
               std::shared_ptr<ProcessController> controller = make_process_controller(),
               SupervisorOptions opts = {});

    // Cancels pending retries, stops live process groups and waits for every worker.
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // False when the record is absent or already live. Resets retry_count to 0.
    bool start(const std::string& id, ProgressCallback on_progress = nullptr);

    // SIGINT, then SIGTERM after stop_grace, then SIGKILL after kill_wait.
    // Also cancels a pending retry. False when there is nothing to stop.
    bool stop(const std::string& id);

    bool pause(const std::string& id);
    bool resume(const std::string& id);

    // Marks the record pending_restart and starts it.
    bool restart(const std::string& id);

    // Stops the job if needed and deletes the record.
    bool remove(const std::string& id);

    // Starts every failed record whose retry budget is not exhausted. Returns how many started.
    int restart_failed();

    bool is_running(const std::string& id) const;
    bool is_paused(const std::string& id) const;
    bool retry_pending(const std::string& id) const;
    // OS pid of the live process, nullopt between attempts.
    std::optional<long> pid(const std::string& id) const;
    std::vector<std::string> running_ids() const;
    std::filesystem::path log_file(const std::string& id) const;
    bool supports_pause() const;

    // Transient records with no live worker become failed. Returns the count.
    int reconcile_zombies();

    // Operations only: dry run bounded by preview_timeout, then pending_approval or preview_failed.
    PreviewResult preview(const std::string& id);

    // pending_approval -> created -> start.
    bool approve(const std::string& id);

    // True once the job has no worker and no pending retry.
    bool wait_idle(const std::string& id, std::chrono::milliseconds timeout) const;

    RecordStore& store() { return m_store; }
    RecordKind kind() const { return m_store.kind(); }

private:
    void launch(const std::string& id, const std::shared_ptr<LiveEntry>& entry, int attempt, std::uint64_t generation);
    void run_attempt(const std::string& id, const std::shared_ptr<LiveEntry>& entry, int attempt, std::uint64_t generation);
    struct PlannedRetry {
        std::chrono::milliseconds delay;
        RetryTask task;
    };
    // Bumps retry_count and logs the schedule; nullopt when the budget is spent.
    std::optional<PlannedRetry> plan_retry(const std::string& id, std::uint64_t generation);
    void fire_retry(const RetryTask& task);
    void notify(const std::string& id, const Progress& p);
    std::uint64_t bump_generation(const std::string& id);
    void worker_exited();
    const char* noun() const;

    RecordStore& m_store;
    JobLogBook& m_logs;
    CommandBuilder m_builder;
    std::shared_ptr<ProcessController> m_controller;
    SupervisorOptions m_opts;
    LiveRegistry m_registry;

    // generations, pending retries, callbacks and the worker count
    mutable std::mutex m_mutex;
    std::condition_variable m_workers_cv;
    std::map<std::string, std::uint64_t> m_generation;
    std::map<std::string, TimerQueue::Handle> m_pending_retry;
    std::map<std::string, ProgressCallback> m_callbacks;
    int m_active_workers = 0;
    bool m_shutting_down = false;

    TimerQueue m_timer;
};

} // namespace transferd
