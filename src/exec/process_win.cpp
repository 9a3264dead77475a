/*
 * Windows process controller implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifdef _WIN32
#include <transferd/exec/process_win.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace transferd {

static std::string quote_arg(const std::string& a) {
    if (!a.empty() && a.find_first_of(" \t\"") == std::string::npos) return a;
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : a) {
        if (c == '\\') { ++backslashes; continue; }
        if (c == '"') out.append(backslashes*2+1, '\\');
        else out.append(backslashes, '\\');
        backslashes = 0;
        out.push_back(c);
    }
    out.append(backslashes*2, '\\');
    out.push_back('"');
    return out;
}

WinProcess::WinProcess(HANDLE process, HANDLE job, HANDLE out_read, DWORD pid)
    : m_process(process), m_job(job), m_out(out_read), m_pid(pid) {}

WinProcess::~WinProcess() {
    if (m_out) CloseHandle(m_out);
    if (m_job) CloseHandle(m_job);
    if (m_process) CloseHandle(m_process);
}

std::optional<std::string> WinProcess::read_line() {
    while (true) {
        auto pos = m_buf.find_first_of("\r\n");
        if (pos != std::string::npos) {
            std::string line = m_buf.substr(0, pos);
            m_buf.erase(0, pos + 1);
            if (line.empty()) continue;
            return line;
        }
        if (m_eof) {
            if (m_buf.empty()) return std::nullopt;
            std::string rest; rest.swap(m_buf);
            return rest;
        }
        char chunk[4096];
        DWORD n = 0;
        if (ReadFile(m_out, chunk, sizeof(chunk), &n, nullptr) && n > 0) m_buf.append(chunk, n);
        else m_eof = true; // ERROR_BROKEN_PIPE once every writer is gone
    }
}

bool WinProcess::running() { return !wait_for(std::chrono::milliseconds(0)); }

bool WinProcess::wait_for(std::chrono::milliseconds timeout) {
    return WaitForSingleObject(m_process, static_cast<DWORD>(timeout.count())) == WAIT_OBJECT_0;
}

ExitStatus WinProcess::wait() {
    WaitForSingleObject(m_process, INFINITE);
    return *exit_status();
}

std::optional<ExitStatus> WinProcess::exit_status() {
    std::lock_guard<std::mutex> lock(m_mutex);
    DWORD code = 0;
    if (!GetExitCodeProcess(m_process, &code)) return ExitStatus{};
    if (code == STILL_ACTIVE && WaitForSingleObject(m_process, 0) != WAIT_OBJECT_0) return std::nullopt;
    ExitStatus es; es.code = static_cast<int>(code);
    return es;
}

std::shared_ptr<Process> WinProcessController::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::system_error(ERROR_INVALID_PARAMETER, std::system_category(), "empty command");
    std::string cmdLine;
    for (size_t i=0;i<argv.size();++i) { if (i) cmdLine.push_back(' '); cmdLine += quote_arg(argv[i]); }

    SECURITY_ATTRIBUTES sa{sizeof(sa), nullptr, TRUE};
    HANDLE readPipe = nullptr, writePipe = nullptr;
    if (!CreatePipe(&readPipe, &writePipe, &sa, 0))
        throw std::system_error(GetLastError(), std::system_category(), "CreatePipe");
    SetHandleInformation(readPipe, HANDLE_FLAG_INHERIT, 0);
    HANDLE nul = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ|FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, nullptr);

    HANDLE job = CreateJobObjectA(nullptr, nullptr);
    if (job) {
        JOBOBJECT_EXTENDED_LIMIT_INFORMATION info{};
        info.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
        SetInformationJobObject(job, JobObjectExtendedLimitInformation, &info, sizeof(info));
    }

    STARTUPINFOA si{}; si.cb=sizeof(si);
    si.hStdInput = nul; si.hStdOutput = writePipe; si.hStdError = writePipe;
    si.dwFlags |= STARTF_USESTDHANDLES;
    PROCESS_INFORMATION pi{};
    BOOL ok = CreateProcessA(nullptr, cmdLine.data(), nullptr, nullptr, TRUE,
                             CREATE_SUSPENDED | CREATE_NEW_PROCESS_GROUP, nullptr, nullptr, &si, &pi);
    DWORD err = ok ? 0 : GetLastError();
    CloseHandle(writePipe);
    if (nul != INVALID_HANDLE_VALUE) CloseHandle(nul);
    if (!ok) {
        CloseHandle(readPipe);
        if (job) CloseHandle(job);
        throw std::system_error(err, std::system_category(), "cannot execute " + argv[0]);
    }
    if (job && !AssignProcessToJobObject(job, pi.hProcess))
        spdlog::warn("AssignProcessToJobObject failed for pid {}: {}", pi.dwProcessId, GetLastError());
    ResumeThread(pi.hThread);
    CloseHandle(pi.hThread);
    return std::make_shared<WinProcess>(pi.hProcess, job, readPipe, pi.dwProcessId);
}

SignalResult WinProcessController::interrupt(Process& p) {
    if (!p.running()) return SignalResult::NotRunning;
    // The child got its own console process group at creation.
    if (GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, static_cast<DWORD>(p.pid()))) return SignalResult::Ok;
    return SignalResult::Unsupported;
}

SignalResult WinProcessController::terminate(Process& p) { return kill(p); }

SignalResult WinProcessController::kill(Process& p) {
    auto* wp = dynamic_cast<WinProcess*>(&p);
    if (!wp) return SignalResult::Failed;
    if (!wp->running()) return SignalResult::NotRunning;
    if (wp->job() && TerminateJobObject(wp->job(), 1)) return SignalResult::Ok;
    spdlog::warn("TerminateJobObject failed for pid {}: {}", wp->pid(), GetLastError());
    return SignalResult::Failed;
}

std::shared_ptr<ProcessController> make_process_controller() {
    return std::make_shared<WinProcessController>();
}

} // namespace transferd
#endif // _WIN32
