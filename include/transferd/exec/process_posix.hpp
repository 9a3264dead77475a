/*
 * POSIX process controller - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#ifndef _WIN32
#include <transferd/exec/process.hpp>
#include <mutex>
#include <sys/types.h>

namespace transferd {

class PosixProcess : public Process {
public:
    PosixProcess(pid_t pid, int out_fd);
    ~PosixProcess() override;

    PosixProcess(const PosixProcess&) = delete;
    PosixProcess& operator=(const PosixProcess&) = delete;

    long pid() const override { return m_pid; }
    pid_t pgid() const { return m_pid; } // leader of its own group
    std::optional<std::string> read_line() override;
    bool running() override;
    bool wait_for(std::chrono::milliseconds timeout) override;
    ExitStatus wait() override;
    std::optional<ExitStatus> exit_status() override;

private:
    // Reaps the child at most once; the result is cached.
    bool poll_locked(bool block);

    pid_t m_pid;
    int m_fd;
    std::string m_buf;
    bool m_eof = false;
    std::mutex m_mutex;
    std::optional<ExitStatus> m_status;
};

class PosixProcessController : public ProcessController {
public:
    std::shared_ptr<Process> spawn(const std::vector<std::string>& argv) override;
    SignalResult interrupt(Process& p) override;
    SignalResult terminate(Process& p) override;
    SignalResult kill(Process& p) override;
    SignalResult suspend(Process& p) override;
    SignalResult resume(Process& p) override;
    bool supports_pause() const override { return true; }

private:
    SignalResult signal_group(Process& p, int sig);
};

} // namespace transferd
#endif
