/*
 * Queries against the installed rclone binary implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/exec/rclone_info.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace transferd {
using namespace std::chrono_literals;

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

CommandOutput run_command(ProcessController& controller, const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout) {
    CommandOutput out;
    std::shared_ptr<Process> proc;
    try {
        proc = controller.spawn(argv);
    } catch (const std::system_error& e) {
        out.error = e.what();
        spdlog::debug("cannot run {}: {}", argv.empty() ? std::string() : argv[0], e.what());
        return out;
    }
    out.started = true;

    std::mutex lines_mutex;
    std::thread reader([&]{
        while (auto line = proc->read_line()) {
            std::lock_guard<std::mutex> g(lines_mutex);
            out.lines.push_back(*line);
        }
    });
    if (!proc->wait_for(timeout)) {
        out.timed_out = true;
        controller.kill(*proc);
        proc->wait_for(5s);
    }
    reader.join();
    if (auto es = proc->exit_status()) out.exit_code = es->code;
    return out;
}

RcloneInfo::RcloneInfo(std::vector<std::string> command, std::shared_ptr<ProcessController> controller)
    : m_command(std::move(command)), m_controller(std::move(controller)) {}

std::vector<std::string> RcloneInfo::with_args(std::initializer_list<std::string> args) const {
    std::vector<std::string> argv = m_command;
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

bool RcloneInfo::installed() {
    return run_command(*m_controller, with_args({"version"}), 5s).ok();
}

std::optional<std::string> RcloneInfo::version() {
    auto out = run_command(*m_controller, with_args({"version"}), 5s);
    if (!out.ok() || out.lines.empty()) return std::nullopt;
    return trim(out.lines.front());
}

std::vector<std::string> RcloneInfo::list_remotes() {
    std::vector<std::string> names;
    auto out = run_command(*m_controller, with_args({"listremotes"}), 10s);
    if (!out.ok()) return names;
    for (const auto& l : out.lines) {
        std::string name = trim(l);
        if (!name.empty() && name.back() == ':') name.pop_back();
        if (!name.empty()) names.push_back(name);
    }
    return names;
}

RemoteTestResult RcloneInfo::test_remote(const std::string& name) {
    RemoteTestResult res;
    auto out = run_command(*m_controller, with_args({"lsd", name + ":"}), 30s);
    res.output = out.lines;
    if (!out.started) res.message = "Rclone not installed";
    else if (out.timed_out) res.message = "Connection test timed out";
    else if (out.ok()) { res.success = true; res.message = "Remote connection successful"; }
    else res.message = "Remote connection failed";
    return res;
}

} // namespace transferd
