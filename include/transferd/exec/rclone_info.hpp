/*
 * Queries against the installed rclone binary - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <transferd/exec/process.hpp>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

struct CommandOutput {
    bool started = false;             // false when the binary could not be executed
    bool timed_out = false;
    std::optional<int> exit_code;
    std::vector<std::string> lines;   // stdout and stderr, merged
    std::string error;                // spawn failure text

    bool ok() const { return started && !timed_out && exit_code && *exit_code == 0; }
};

// Runs argv to completion, killing its process group after timeout. Never throws for a missing binary.
CommandOutput run_command(ProcessController& controller, const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout);

struct RemoteTestResult {
    bool success = false;
    std::string message;
    std::vector<std::string> output;
};

class RcloneInfo {
public:
    // command is the rclone binary, optionally preceded by a wrapper ({"/bin/sh", "rclone.sh"}).
    explicit RcloneInfo(std::vector<std::string> command = {"rclone"},
                        std::shared_ptr<ProcessController> controller = make_process_controller());

    bool installed();

    // First line of "rclone version", nullopt when rclone is missing or fails.
    std::optional<std::string> version();

    // Remotes from "rclone listremotes", without the trailing ':'.
    std::vector<std::string> list_remotes();

    // "rclone lsd <name>:"
    RemoteTestResult test_remote(const std::string& name);

private:
    std::vector<std::string> with_args(std::initializer_list<std::string> args) const;

    std::vector<std::string> m_command;
    std::shared_ptr<ProcessController> m_controller;
};

} // namespace transferd
