/*
 * POSIX process controller implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifndef _WIN32
#include <transferd/exec/process_posix.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace transferd {

static void close_fd(int& fd) { if (fd >= 0) { ::close(fd); fd = -1; } }

// Both ends close-on-exec so a concurrently spawned job never inherits our write end
// (it would keep the reader from seeing end of output).
static void make_pipe(int fds[2]) {
#ifdef __linux__
    if (::pipe2(fds, O_CLOEXEC) != 0) throw std::system_error(errno, std::generic_category(), "pipe2");
#else
    if (::pipe(fds) != 0) throw std::system_error(errno, std::generic_category(), "pipe");
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
}

PosixProcess::PosixProcess(pid_t pid, int out_fd) : m_pid(pid), m_fd(out_fd) {}

PosixProcess::~PosixProcess() {
    close_fd(m_fd);
    std::lock_guard<std::mutex> lock(m_mutex);
    poll_locked(false);
}

std::optional<std::string> PosixProcess::read_line() {
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
        ssize_t n = ::read(m_fd, chunk, sizeof(chunk));
        if (n > 0) { m_buf.append(chunk, static_cast<size_t>(n)); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) spdlog::warn("read from pid {} failed: {}", m_pid, std::strerror(errno));
        m_eof = true;
    }
}

bool PosixProcess::poll_locked(bool block) {
    if (m_status) return true;
    int st = 0;
    pid_t r;
    while ((r = ::waitpid(m_pid, &st, block ? 0 : WNOHANG)) < 0 && errno == EINTR) {}
    if (r == 0) return false;
    ExitStatus es;
    if (r < 0) {
        // ECHILD: reaped elsewhere, exit code lost
        spdlog::warn("waitpid({}) failed: {}", m_pid, std::strerror(errno));
    } else if (WIFEXITED(st)) {
        es.code = WEXITSTATUS(st);
    } else if (WIFSIGNALED(st)) {
        es.signal = WTERMSIG(st);
    }
    m_status = es;
    return true;
}

bool PosixProcess::running() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !poll_locked(false);
}

bool PosixProcess::wait_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (poll_locked(false)) return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

ExitStatus PosixProcess::wait() {
    while (!wait_for(std::chrono::milliseconds(500))) {}
    std::lock_guard<std::mutex> lock(m_mutex);
    return *m_status;
}

std::optional<ExitStatus> PosixProcess::exit_status() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!poll_locked(false)) return std::nullopt;
    return m_status;
}

std::shared_ptr<Process> PosixProcessController::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::system_error(EINVAL, std::generic_category(), "empty command");
    std::vector<char*> cargv; cargv.reserve(argv.size()+1);
    for (auto &s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int out[2], err[2];
    make_pipe(out);
    try { make_pipe(err); } catch (...) { ::close(out[0]); ::close(out[1]); throw; }
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        ::close(out[0]); ::close(out[1]); ::close(err[0]); ::close(err[1]);
        if (devnull >= 0) ::close(devnull);
        throw std::system_error(e, std::generic_category(), "fork");
    }
    if (pid == 0) {
        // own group: stop/pause signal the tool and everything it forks
        setpgid(0,0);
        sigset_t none; sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out[1], STDOUT_FILENO);
        dup2(out[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t w = ::write(err[1], &e, sizeof(e));
        (void)w;
        _exit(127);
    }
    setpgid(pid,pid); // also done in the child, whichever runs first
    ::close(out[1]);
    ::close(err[1]);
    if (devnull >= 0) ::close(devnull);

    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(err[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    ::close(err[0]);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int st=0; while (waitpid(pid,&st,0)<0 && errno==EINTR) {}
        ::close(out[0]);
        throw std::system_error(child_errno, std::generic_category(), "cannot execute " + argv[0]);
    }
    return std::make_shared<PosixProcess>(pid, out[0]);
}

SignalResult PosixProcessController::signal_group(Process& p, int sig) {
    auto* pp = dynamic_cast<PosixProcess*>(&p);
    if (!pp) return SignalResult::Failed;
    if (!pp->running()) return SignalResult::NotRunning;
    if (::killpg(pp->pgid(), sig) == 0) return SignalResult::Ok;
    if (errno == ESRCH) return SignalResult::NotRunning;
    spdlog::warn("killpg({}, {}) failed: {}", pp->pgid(), sig, std::strerror(errno));
    return SignalResult::Failed;
}

SignalResult PosixProcessController::interrupt(Process& p) { return signal_group(p, SIGINT); }
SignalResult PosixProcessController::terminate(Process& p) { return signal_group(p, SIGTERM); }
SignalResult PosixProcessController::kill(Process& p) { return signal_group(p, SIGKILL); }
SignalResult PosixProcessController::suspend(Process& p) { return signal_group(p, SIGSTOP); }
SignalResult PosixProcessController::resume(Process& p) { return signal_group(p, SIGCONT); }

std::shared_ptr<ProcessController> make_process_controller() {
    return std::make_shared<PosixProcessController>();
}

} // namespace transferd
#endif // _WIN32
