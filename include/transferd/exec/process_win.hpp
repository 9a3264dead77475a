/*
 * Windows process controller - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#ifdef _WIN32
#include <transferd/exec/process.hpp>
#include <windows.h>
#include <mutex>

namespace transferd {

// The child and its descendants live in one job object, the Windows stand-in for a process group.
class WinProcess : public Process {
public:
    WinProcess(HANDLE process, HANDLE job, HANDLE out_read, DWORD pid);
    ~WinProcess() override;

    WinProcess(const WinProcess&) = delete;
    WinProcess& operator=(const WinProcess&) = delete;

    long pid() const override { return static_cast<long>(m_pid); }
    HANDLE job() const { return m_job; }
    std::optional<std::string> read_line() override;
    bool running() override;
    bool wait_for(std::chrono::milliseconds timeout) override;
    ExitStatus wait() override;
    std::optional<ExitStatus> exit_status() override;

private:
    HANDLE m_process;
    HANDLE m_job;
    HANDLE m_out;
    DWORD m_pid;
    std::string m_buf;
    bool m_eof = false;
    std::mutex m_mutex;
};

class WinProcessController : public ProcessController {
public:
    std::shared_ptr<Process> spawn(const std::vector<std::string>& argv) override;
    SignalResult interrupt(Process& p) override;
    SignalResult terminate(Process& p) override;
    SignalResult kill(Process& p) override;
    SignalResult suspend(Process&) override { return SignalResult::Unsupported; }
    SignalResult resume(Process&) override { return SignalResult::Unsupported; }
    bool supports_pause() const override { return false; }
};

} // namespace transferd
#endif
