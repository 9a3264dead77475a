/*
 * Process control interface - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

enum class SignalResult {
    Ok,
    NotRunning,   // already exited: the caller treats the goal as reached
    Unsupported,  // platform has no equivalent (pause/resume on Windows)
    Failed
};

const char* to_string(SignalResult r);

struct ExitStatus {
    std::optional<int> code;   // set when the process exited normally
    std::optional<int> signal; // terminating signal, POSIX only
};

// A spawned child with stdout+stderr merged into one pipe and stdin on the null device.
// read_line() is meant for one reader thread; the other members may be called from any thread.
class Process {
public:
    virtual ~Process() = default;

    virtual long pid() const = 0;

    // Blocks until a complete line is available. '\r' also ends a line so
    // in-place progress redraws are seen. Empty lines are skipped.
    // Returns nullopt at end of output.
    virtual std::optional<std::string> read_line() = 0;

    virtual bool running() = 0;

    // True once the process has exited (status cached, safe to call repeatedly).
    virtual bool wait_for(std::chrono::milliseconds timeout) = 0;
    virtual ExitStatus wait() = 0;

    // Nonblocking, nullopt while still running.
    virtual std::optional<ExitStatus> exit_status() = 0;
};

// Spawns processes in their own process group and signals the whole group.
class ProcessController {
public:
    virtual ~ProcessController() = default;

    // Throws std::system_error when the process cannot be created or exec fails.
    virtual std::shared_ptr<Process> spawn(const std::vector<std::string>& argv) = 0;

    virtual SignalResult interrupt(Process& p) = 0; // SIGINT
    virtual SignalResult terminate(Process& p) = 0; // SIGTERM
    virtual SignalResult kill(Process& p) = 0;      // SIGKILL
    virtual SignalResult suspend(Process& p) = 0;   // SIGSTOP
    virtual SignalResult resume(Process& p) = 0;    // SIGCONT

    virtual bool supports_pause() const = 0;
};

// POSIX controller on Unix, Windows controller (no pause) on _WIN32.
std::shared_ptr<ProcessController> make_process_controller();

} // namespace transferd
