/*
 * Process supervisor implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/exec/supervisor.hpp>
#include <transferd/exec/progress_parser.hpp>
#include <transferd/config.hpp>
#include <transferd/storage/errors.hpp>
#include <transferd/util/time.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <optional>
#include <thread>

namespace transferd {

using nlohmann::json;

static const size_t kPreviewTail = 50;

SupervisorOptions SupervisorOptions::from_config(const EngineConfig& cfg, RecordKind kind) {
    SupervisorOptions o;
    o.retry_cap = kind == RecordKind::Job ? cfg.job_retry_cap_seconds : cfg.operation_retry_cap_seconds;
    o.backoff_unit = std::chrono::seconds(1);
    o.stop_grace = std::chrono::seconds(cfg.stop_grace_seconds);
    o.kill_wait = std::chrono::seconds(cfg.kill_wait_seconds);
    o.worker_join = std::chrono::seconds(cfg.worker_join_seconds);
    o.zombie_grace = std::chrono::seconds(cfg.zombie_grace_seconds);
    o.preview_timeout = std::chrono::seconds(cfg.preview_timeout_seconds);
    return o;
}

// Fresh progress for a new attempt: every field of the previous attempt is cleared.
static json running_patch(int attempt) {
    json progress = {
        {"status", "running"}, {"percent", 0}, {"bytes_transferred", 0},
        {"total_bytes", nullptr}, {"files_transferred", nullptr}, {"total_files", nullptr},
        {"speed", nullptr}, {"eta", nullptr}, {"transferred_display", nullptr},
        {"retry_attempt", attempt > 0 ? json(attempt) : json(nullptr)},
    };
    return json{
        {"status", "running"}, {"started_at", iso_timestamp()},
        {"completed_at", nullptr}, {"failed_at", nullptr}, {"stopped_at", nullptr},
        {"error_message", nullptr}, {"return_code", nullptr},
        {"progress", progress},
    };
}

static json stopped_patch() { return json{{"status", "stopped"}, {"stopped_at", iso_timestamp()}}; }

static json failed_patch(const std::string& message) {
    return json{{"status", "failed"}, {"failed_at", iso_timestamp()}, {"error_message", message}};
}

static std::string describe_delay(std::chrono::milliseconds d) {
    if (d.count() % 1000 == 0) return std::to_string(d.count() / 1000) + "s";
    return std::to_string(d.count()) + "ms";
}

Supervisor::Supervisor(RecordStore& store, JobLogBook& logs, CommandBuilder builder,
                       std::shared_ptr<ProcessController> controller, SupervisorOptions opts)
    : m_store(store), m_logs(logs), m_builder(std::move(builder)),
      m_controller(std::move(controller)), m_opts(opts) {}

Supervisor::~Supervisor() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutting_down = true;
        m_pending_retry.clear();
    }
    m_timer.shutdown();

    for (auto &entry : m_registry.entries()) {
        entry->cancel();
        auto proc = entry->process();
        if (!proc || !proc->running()) continue;
        m_controller->terminate(*proc);
        if (entry->paused()) m_controller->resume(*proc);
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_workers_cv.wait_for(lock, m_opts.kill_wait, [this]{ return m_active_workers == 0; })) {
        lock.unlock();
        spdlog::warn("{} workers still running at shutdown, killing", m_registry.size());
        for (auto &entry : m_registry.entries()) {
            if (auto proc = entry->process()) m_controller->kill(*proc);
        }
        lock.lock();
        m_workers_cv.wait(lock, [this]{ return m_active_workers == 0; });
    }
}

const char* Supervisor::noun() const { return kind() == RecordKind::Job ? "Job" : "Operation"; }

std::uint64_t Supervisor::bump_generation(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ++m_generation[id];
}

void Supervisor::worker_exited() {
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_active_workers;
    m_workers_cv.notify_all();
}

bool Supervisor::start(const std::string& id, ProgressCallback on_progress) {
    if (!m_store.get(id)) {
        spdlog::warn("{} {} not found", noun(), id);
        return false;
    }
    std::shared_ptr<LiveEntry> entry;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutting_down) return false;
        entry = m_registry.try_insert(id);
        if (!entry) {
            spdlog::warn("{} {} is already running", noun(), id);
            return false;
        }
        generation = ++m_generation[id];
        // a manual start supersedes a pending retry
        auto it = m_pending_retry.find(id);
        if (it != m_pending_retry.end()) { m_timer.cancel(it->second); m_pending_retry.erase(it); }
        if (on_progress) m_callbacks[id] = std::move(on_progress);
    }
    try {
        m_store.update(id, json{{"retry_count", 0}});
    } catch (const StorageError&) {
        m_registry.erase(id, entry);
        entry->finish();
        throw;
    }
    launch(id, entry, 0, generation);
    return true;
}

void Supervisor::launch(const std::string& id, const std::shared_ptr<LiveEntry>& entry, int attempt,
                        std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_active_workers;
    }
    try {
        std::thread([this, id, entry, attempt, generation]{
            run_attempt(id, entry, attempt, generation);
            worker_exited();
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("cannot start worker for {}: {}", id, e.what());
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_active_workers;
            m_registry.erase(id, entry);
        }
        entry->finish();
        throw;
    }
}

void Supervisor::notify(const std::string& id, const Progress& p) {
    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_callbacks.find(id);
        if (it == m_callbacks.end()) return;
        cb = it->second;
    }
    try {
        cb(id, p);
    } catch (const std::exception& e) {
        spdlog::warn("progress callback for {} threw: {}", id, e.what());
    }
}

void Supervisor::run_attempt(const std::string& id, const std::shared_ptr<LiveEntry>& entry, int attempt,
                             std::uint64_t generation) {
    std::shared_ptr<Process> proc;
    bool retry_eligible = false;
    try {
        auto rec = m_store.get(id);
        if (!rec) throw std::runtime_error("record " + id + " no longer exists");
        auto argv = m_builder(*rec);
        if (attempt == 0) m_logs.write(id, std::string("Starting ") + (kind() == RecordKind::Job ? "job: " : "operation: ") + rec->name);
        else m_logs.write(id, "Retry attempt " + std::to_string(attempt) + "/" + std::to_string(rec->max_retries) + ": " + rec->name);
        m_logs.write(id, "Command: " + join_command(argv));

        if (entry->cancelled()) {
            m_logs.write(id, std::string(noun()) + " stopped before the process was started");
            m_store.update(id, stopped_patch());
        } else {
            proc = m_controller->spawn(argv);
            spdlog::info("{} {} started, pid {}", noun(), id, proc->pid());
            m_store.update(id, running_patch(attempt));
            entry->set_process(proc);
            if (entry->cancelled()) m_controller->kill(*proc); // stop() ran before the process was visible

            bool scanning = false;
            while (auto line = proc->read_line()) {
                if (entry->cancelled()) break;
                m_logs.write(id, *line);
                std::optional<Progress> parsed;
                try {
                    parsed = parse_progress(kind(), *line);
                } catch (const std::exception& e) {
                    spdlog::warn("{} {}: progress line skipped: {}", noun(), id, e.what());
                }
                if (!parsed) continue;
                json patch{{"progress", progress_patch(*parsed)}};
                if (kind() == RecordKind::Operation && parsed->status && !entry->paused()) {
                    if (*parsed->status == "scanning" && !scanning) { patch["status"] = "scanning"; scanning = true; }
                    else if (*parsed->status == "running" && scanning) { patch["status"] = "running"; scanning = false; }
                }
                m_store.update(id, patch);
                notify(id, *parsed);
            }

            ExitStatus es;
            if (!entry->cancelled()) es = proc->wait();
            if (entry->cancelled()) {
                m_logs.write(id, std::string(noun()) + " stopped by user");
                m_store.update(id, stopped_patch());
            } else if (es.code && *es.code == 0) {
                m_logs.write(id, std::string(noun()) + " completed successfully");
                m_store.update(id, json{{"status", "completed"}, {"completed_at", iso_timestamp()},
                                        {"progress", {{"percent", 100}, {"status", "completed"}}}});
                spdlog::info("{} {} completed", noun(), id);
            } else if (es.code) {
                std::string msg = std::string(noun()) + " failed with return code " + std::to_string(*es.code);
                m_logs.write(id, msg);
                json patch = failed_patch(msg);
                patch["return_code"] = *es.code;
                m_store.update(id, patch);
                spdlog::info("{} {} failed with return code {}", noun(), id, *es.code);
                retry_eligible = true;
            } else {
                std::string msg = "Process died unexpectedly";
                if (es.signal) msg += " (signal " + std::to_string(*es.signal) + ")";
                m_logs.write(id, msg);
                m_store.update(id, failed_patch(msg));
                spdlog::warn("{} {}: {}", noun(), id, msg);
            }
        }
    } catch (const std::exception& e) {
        std::string msg = std::string(noun()) + " execution error: " + e.what();
        spdlog::error("{}: {}", id, msg);
        m_logs.write(id, msg);
        try {
            m_store.update(id, failed_patch(msg));
        } catch (const StorageError& se) {
            spdlog::error("cannot record failure of {}: {}", id, se.what());
        }
    }

    if (proc && proc->running()) {
        m_controller->terminate(*proc);
        if (entry->paused()) m_controller->resume(*proc);
        if (!proc->wait_for(m_opts.kill_wait)) {
            m_controller->kill(*proc);
            proc->wait_for(m_opts.kill_wait);
        }
    }
    entry->set_process(nullptr);

    std::optional<PlannedRetry> retry;
    if (retry_eligible) {
        try {
            retry = plan_retry(id, generation);
        } catch (const StorageError& e) {
            spdlog::error("cannot schedule retry of {}: {}", id, e.what());
        }
    }
    {
        // Armed together with the erase: the job is never seen idle between a
        // failure and its retry, and the timer never finds this entry still present.
        std::lock_guard<std::mutex> lock(m_mutex);
        if (retry && !m_shutting_down && m_generation[id] == generation) {
            RetryTask task = retry->task;
            auto handle = m_timer.schedule_after(retry->delay, [this, task]{ fire_retry(task); });
            if (handle) m_pending_retry[id] = handle;
        }
        m_registry.erase(id, entry);
    }
    entry->finish();
}

std::optional<Supervisor::PlannedRetry> Supervisor::plan_retry(const std::string& id, std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutting_down || m_generation[id] != generation) return std::nullopt;
    }
    auto rec = m_store.get(id);
    if (!rec) return std::nullopt;
    if (rec->retry_count >= rec->max_retries) {
        m_logs.write(id, "Max retries (" + std::to_string(rec->max_retries) + ") exceeded, giving up");
        spdlog::warn("{} {} failed, retries exhausted", noun(), id);
        return std::nullopt;
    }
    int k = rec->retry_count;
    m_store.increment_retry_count(id);
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_opts.backoff_unit * compute_backoff(k, m_opts.retry_cap));
    m_logs.write(id, "Scheduling retry in " + describe_delay(delay) + " (attempt " + std::to_string(k + 1) +
                         "/" + std::to_string(rec->max_retries) + ")");
    return PlannedRetry{delay, RetryTask{id, k + 1, generation}};
}

void Supervisor::fire_retry(const RetryTask& task) {
    std::shared_ptr<LiveEntry> entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutting_down) return;
        auto it = m_pending_retry.find(task.id);
        if (it == m_pending_retry.end() || m_generation[task.id] != task.generation) return;
        m_pending_retry.erase(it);
        entry = m_registry.try_insert(task.id);
    }
    if (!entry) {
        spdlog::info("retry of {} skipped, a newer run owns it", task.id);
        return;
    }
    if (!m_store.get(task.id)) {
        spdlog::warn("retry of {} abandoned, record deleted", task.id);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_registry.erase(task.id, entry);
        }
        entry->finish();
        return;
    }
    launch(task.id, entry, task.attempt, task.generation);
}

bool Supervisor::stop(const std::string& id) {
    auto entry = m_registry.find(id);
    if (!entry) {
        bool cancelled_retry = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_pending_retry.find(id);
            if (it != m_pending_retry.end()) {
                m_timer.cancel(it->second);
                m_pending_retry.erase(it);
                ++m_generation[id];
                cancelled_retry = true;
            }
        }
        if (!cancelled_retry) {
            spdlog::info("{} {} is not running", noun(), id);
            return false;
        }
        m_logs.write(id, "Pending retry cancelled by user");
        m_store.update(id, stopped_patch());
        return true;
    }

    bump_generation(id);
    entry->cancel();
    m_logs.write(id, std::string("Stopping ") + (kind() == RecordKind::Job ? "job" : "operation") + " gracefully...");
    auto proc = entry->process();
    if (proc && proc->running()) {
        bool was_paused = entry->paused();
        auto r = m_controller->interrupt(*proc);
        // a stopped group only acts on the signal once continued
        if (was_paused) m_controller->resume(*proc);
        if (r == SignalResult::Ok) m_logs.write(id, "Sent SIGINT, waiting for cleanup...");
        if (proc->wait_for(m_opts.stop_grace)) {
            m_logs.write(id, std::string(noun()) + " stopped cleanly");
        } else {
            spdlog::warn("{} {} ignored SIGINT for {}ms, sending SIGTERM", noun(), id, m_opts.stop_grace.count());
            m_logs.write(id, "Timeout, sending SIGTERM...");
            m_controller->terminate(*proc);
            if (proc->wait_for(m_opts.kill_wait)) {
                m_logs.write(id, std::string(noun()) + " terminated");
            } else {
                spdlog::warn("{} {} still alive after SIGTERM, sending SIGKILL", noun(), id);
                m_logs.write(id, "Force killing process...");
                m_controller->kill(*proc);
                proc->wait_for(m_opts.kill_wait);
                m_logs.write(id, std::string(noun()) + " force killed");
            }
        }
    }
    if (!entry->wait_finished(m_opts.worker_join))
        spdlog::warn("worker of {} did not finish within {}ms", id, m_opts.worker_join.count());
    entry->set_paused(false);

    // the process may have finished on its own just before the cancel
    auto rec = m_store.get(id);
    if (rec && rec->status != Status::Completed && rec->status != Status::Failed)
        m_store.update(id, stopped_patch());
    return true;
}

bool Supervisor::pause(const std::string& id) {
    auto entry = m_registry.find(id);
    if (!entry) return false;
    if (!m_controller->supports_pause()) {
        spdlog::warn("pause of {}: {}", id, to_string(SignalResult::Unsupported));
        m_logs.write(id, "Pause is not supported on this platform");
        return false;
    }
    auto proc = entry->process();
    if (!proc || !proc->running() || entry->paused() || entry->cancelled()) return false;
    auto r = m_controller->suspend(*proc);
    if (r != SignalResult::Ok) {
        spdlog::warn("pause of {} failed: {}", id, to_string(r));
        return false;
    }
    entry->set_paused(true);
    m_store.update(id, json{{"status", "paused"}});
    m_logs.write(id, std::string(noun()) + " paused");
    return true;
}

bool Supervisor::resume(const std::string& id) {
    auto entry = m_registry.find(id);
    if (!entry) return false;
    if (!m_controller->supports_pause()) {
        spdlog::warn("resume of {}: {}", id, to_string(SignalResult::Unsupported));
        m_logs.write(id, "Resume is not supported on this platform");
        return false;
    }
    auto proc = entry->process();
    if (!proc || !proc->running() || !entry->paused() || entry->cancelled()) return false;
    auto r = m_controller->resume(*proc);
    if (r != SignalResult::Ok) {
        spdlog::warn("resume of {} failed: {}", id, to_string(r));
        return false;
    }
    entry->set_paused(false);
    m_store.update(id, json{{"status", "running"}});
    m_logs.write(id, std::string(noun()) + " resumed");
    return true;
}

bool Supervisor::restart(const std::string& id) {
    if (!m_store.get(id)) return false;
    if (m_registry.contains(id)) {
        spdlog::warn("{} {} is already running", noun(), id);
        return false;
    }
    m_store.update(id, json{{"status", "pending_restart"}});
    return start(id);
}

bool Supervisor::remove(const std::string& id) {
    if (m_registry.contains(id) || retry_pending(id)) stop(id);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callbacks.erase(id);
        ++m_generation[id];
    }
    bool removed = m_store.remove(id);
    m_logs.close(id);
    return removed;
}

int Supervisor::restart_failed() {
    int count = 0;
    for (const auto& rec : m_store.list_by_status(Status::Failed)) {
        if (rec.retry_count >= rec.max_retries) continue;
        if (start(rec.id)) ++count;
    }
    if (count) spdlog::info("restarted {} failed {}s", count, kind() == RecordKind::Job ? "job" : "operation");
    return count;
}

bool Supervisor::is_running(const std::string& id) const { return m_registry.contains(id); }

bool Supervisor::is_paused(const std::string& id) const {
    auto entry = m_registry.find(id);
    return entry && entry->paused();
}

std::optional<long> Supervisor::pid(const std::string& id) const {
    auto entry = m_registry.find(id);
    if (!entry) return std::nullopt;
    auto proc = entry->process();
    if (!proc) return std::nullopt;
    return proc->pid();
}

bool Supervisor::retry_pending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending_retry.count(id) != 0;
}

std::vector<std::string> Supervisor::running_ids() const { return m_registry.ids(); }

std::filesystem::path Supervisor::log_file(const std::string& id) const { return m_logs.path_for(id); }

bool Supervisor::supports_pause() const { return m_controller->supports_pause(); }

bool Supervisor::wait_idle(const std::string& id, std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_registry.contains(id) && !m_pending_retry.count(id)) return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

int Supervisor::reconcile_zombies() {
    int cleaned = 0;
    auto now = Clock::now();
    for (const auto& rec : m_store.list()) {
        if (!is_transient(kind(), rec.status)) continue;
        if (m_registry.contains(rec.id) || retry_pending(rec.id)) continue;
        if (kind() == RecordKind::Operation) {
            // operations may legitimately sit in a transient state (awaiting approval, previewing)
            auto created = parse_iso_timestamp(rec.created_at);
            if (created && now - *created <= m_opts.zombie_grace) continue;
        }
        std::string msg = std::string(noun()) + " was " + to_string(rec.status) +
                          " but no process is tracked (zombie state cleaned up)";
        m_store.update(rec.id, failed_patch(msg));
        m_logs.write(rec.id, msg);
        ++cleaned;
    }
    if (cleaned) spdlog::info("cleaned up {} zombie {}s", cleaned, kind() == RecordKind::Job ? "job" : "operation");
    return cleaned;
}

PreviewResult Supervisor::preview(const std::string& id) {
    PreviewResult res;
    if (kind() != RecordKind::Operation) { res.error = "Preview is only available for operations"; return res; }
    auto rec = m_store.get(id);
    if (!rec) { res.error = "Operation " + id + " not found"; return res; }
    auto entry = m_registry.try_insert(id);
    if (!entry) { res.error = "Operation " + id + " is running"; return res; }

    std::vector<std::string> lines;
    try {
        m_store.update(id, json{{"status", "initializing"}, {"error_message", nullptr}});
        auto argv = m_builder(with_dry_run(*rec));
        m_logs.write(id, "Preview: " + join_command(argv));
        auto proc = m_controller->spawn(argv);
        entry->set_process(proc);

        std::mutex out_mutex;
        std::thread reader([&]{
            while (auto line = proc->read_line()) {
                std::lock_guard<std::mutex> g(out_mutex);
                lines.push_back(*line);
            }
        });
        if (!proc->wait_for(m_opts.preview_timeout)) {
            res.timeout = true;
            m_controller->kill(*proc);
            proc->wait_for(m_opts.kill_wait);
        }
        reader.join();
        entry->set_process(nullptr);

        auto es = proc->exit_status();
        if (res.timeout) res.error = "Preview timed out after " + std::to_string(m_opts.preview_timeout.count()) + "s";
        else if (!es || !es->code) res.error = "Preview process died unexpectedly";
        else if (*es->code != 0) res.error = "Preview failed with return code " + std::to_string(*es->code);
        else res.success = true;
    } catch (const std::exception& e) {
        res.error = std::string("Preview error: ") + e.what();
    }

    for (const auto& line : lines) {
        m_logs.write(id, line);
        if (line.find("Skipped") != std::string::npos && line.find("dry-run") != std::string::npos) ++res.files;
        if (line.find("Transferred:") != std::string::npos) res.stats = line;
    }
    size_t first = lines.size() > kPreviewTail ? lines.size() - kPreviewTail : 0;
    res.output.assign(lines.begin() + static_cast<std::ptrdiff_t>(first), lines.end());
    if (!res.success && rec->operation_type == "move")
        res.error += " Move operations may have limited preview functionality.";

    try {
        if (res.success) {
            m_store.update(id, json{{"status", "pending_approval"},
                                    {"progress", {{"total_files", res.files},
                                                  {"transferred_display", res.stats.empty() ? json(nullptr) : json(res.stats)}}}});
            m_logs.write(id, "Preview complete - awaiting approval (" + std::to_string(res.files) + " files)");
        } else {
            m_store.update(id, json{{"status", "preview_failed"}, {"error_message", res.error}});
            m_logs.write(id, res.error);
            spdlog::warn("preview of {} failed: {}", id, res.error);
        }
    } catch (const StorageError&) {
        m_registry.erase(id, entry);
        entry->finish();
        throw;
    }
    m_registry.erase(id, entry);
    entry->finish();
    return res;
}

bool Supervisor::approve(const std::string& id) {
    auto rec = m_store.get(id);
    if (!rec) return false;
    if (rec->status != Status::PendingApproval) {
        spdlog::warn("{} {} is not pending approval (status: {})", noun(), id, to_string(rec->status));
        return false;
    }
    m_store.update(id, json{{"status", "created"}});
    m_logs.write(id, std::string(noun()) + " approved");
    return start(id);
}

} // namespace transferd
