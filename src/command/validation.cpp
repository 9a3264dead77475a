/*
 * Input validation implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/command/validation.hpp>
#include <transferd/command/command_builder.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#ifndef _WIN32
#include <unistd.h>
#else
#include <io.h>
#endif

namespace transferd {
namespace fs = std::filesystem;

static std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (size_t i=0;i<errors.size();++i) { if (i) out += "; "; out += errors[i]; }
    return out;
}

ValidationError::ValidationError(std::vector<std::string> errors)
    : std::runtime_error(join_errors(errors)), m_errors(std::move(errors)) {}

ValidationError::ValidationError(const std::string& message)
    : std::runtime_error(message), m_errors{message} {}

static const char* kSystemDirs[] = {
    "/", "/bin", "/sbin", "/usr", "/usr/bin", "/usr/sbin",
    "/etc", "/boot", "/sys", "/proc", "/dev",
    "/System", "/Library", "/Applications",
    "C:\\", "C:\\Windows", "C:\\Program Files",
};

static bool can_access(const fs::path& p, bool write) {
#ifndef _WIN32
    return ::access(p.c_str(), write ? W_OK : R_OK) == 0;
#else
    return ::_access(p.string().c_str(), write ? 2 : 4) == 0;
#endif
}

std::string sanitize_path(const std::string& path) {
    if (path.empty()) throw ValidationError("Path must be a non-empty string");
    if (path.find('\0') != std::string::npos) throw ValidationError("Path contains null bytes");
    fs::path normalized = fs::path(path).lexically_normal();
    for (auto &part : normalized) {
        if (part == "..") throw ValidationError("Path traversal detected: " + path);
    }
    std::string norm = normalized.string();
    // lexically_normal keeps a trailing separator ("/etc/" -> "/etc/")
    while (norm.size() > 1 && (norm.back() == '/' || norm.back() == '\\')) norm.pop_back();
    const char sep = static_cast<char>(fs::path::preferred_separator);
    for (auto dir : kSystemDirs) {
        std::string d = dir;
        if (norm == d) throw ValidationError("Access to system directory not allowed: " + path);
        if (d == "/" || d.back() == '\\') continue; // root: only an exact match is rejected
        if (norm.rfind(d + sep, 0) == 0) throw ValidationError("Access to system directory not allowed: " + path);
    }
    return norm;
}

bool is_remote_path(const std::string& path) {
    auto colon = path.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    if (colon == 1 && std::isalpha((unsigned char)path[0]) && path.size() > 2 &&
        (path[2] == '\\' || path[2] == '/'))
        return false;
    return path.find('/') == std::string::npos || path.find('/') > colon;
}

static void check_source(const std::string& source) {
    std::string clean = sanitize_path(source);
    std::error_code ec;
    if (!fs::exists(clean, ec)) throw ValidationError("Source path does not exist: " + source);
    if (!can_access(clean, false)) throw ValidationError("Path is not readable: " + source);
}

static void check_destination(const std::string& destination) {
    fs::path p = sanitize_path(destination);
    std::error_code ec;
    if (fs::exists(p, ec)) {
        if (!can_access(p, true)) throw ValidationError("Path is not writable: " + destination);
        return;
    }
    fs::path parent = p.has_parent_path() ? p.parent_path() : fs::path(".");
    if (!fs::exists(parent, ec)) throw ValidationError("Parent directory does not exist: " + parent.string());
    if (!can_access(parent, true)) throw ValidationError("Parent directory is not writable: " + parent.string());
}

static void check_not_circular(const std::string& source, const std::string& destination) {
    std::error_code ec;
    fs::path src = fs::weakly_canonical(fs::path(sanitize_path(source)), ec);
    if (ec) { spdlog::warn("could not resolve {}: {}", source, ec.message()); return; }
    fs::path dst = fs::weakly_canonical(fs::path(sanitize_path(destination)), ec);
    if (ec) { spdlog::warn("could not resolve {}: {}", destination, ec.message()); return; }
    std::string s = src.string(), d = dst.string();
    while (s.size() > 1 && (s.back() == '/' || s.back() == '\\')) s.pop_back();
    while (d.size() > 1 && (d.back() == '/' || d.back() == '\\')) d.pop_back();
    if (s == d) throw ValidationError("Source and destination cannot be the same: " + source);
    const char sep = static_cast<char>(fs::path::preferred_separator);
    if (d.rfind(s + sep, 0) == 0)
        throw ValidationError("Destination cannot be inside source: " + destination + " is inside " + source);
}

static void check_retries(const Record& draft, std::vector<std::string>& errors) {
    if (draft.max_retries != -1 && (draft.max_retries < 0 || draft.max_retries > 100))
        errors.push_back("max_retries must be between 0 and 100: " + std::to_string(draft.max_retries));
}

ValidationResult validate_job(const Record& draft, bool check_paths) {
    ValidationResult res;
    auto &errors = res.errors;
    if (draft.name.empty()) errors.emplace_back("Job name is required");
    if (draft.source.empty()) errors.emplace_back("Source path is required");
    if (draft.destination.empty()) errors.emplace_back("Destination path is required");
    if (draft.name.size() > 200)
        errors.push_back("Job name too long (max 200 characters): " + std::to_string(draft.name.size()));
    check_retries(draft, errors);

    if (check_paths && errors.empty()) {
        try {
            check_source(draft.source);
            check_destination(draft.destination);
            check_not_circular(draft.source, draft.destination);
        } catch (const ValidationError& e) {
            errors.emplace_back(e.what());
        }
    }
    res.ok = errors.empty();
    return res;
}

ValidationResult validate_operation(const Record& draft, bool check_paths) {
    ValidationResult res;
    auto &errors = res.errors;
    if (draft.operation_type.empty()) errors.emplace_back("Operation type is required");
    if (draft.source.empty()) errors.emplace_back("Source is required");
    if (draft.destination.empty()) errors.emplace_back("Destination is required");
    if (!draft.operation_type.empty()) {
        const auto& ops = rclone_operations();
        if (std::find(ops.begin(), ops.end(), draft.operation_type) == ops.end()) {
            std::vector<std::string> sorted = ops;
            std::sort(sorted.begin(), sorted.end());
            std::string allowed;
            for (size_t i=0;i<sorted.size();++i) { if (i) allowed += ", "; allowed += sorted[i]; }
            errors.push_back("Invalid operation type: " + draft.operation_type + ". Allowed: " + allowed);
        }
    }
    check_retries(draft, errors);

    if (check_paths && errors.empty()) {
        if (!is_remote_path(draft.source)) {
            try { check_source(draft.source); }
            catch (const ValidationError& e) { errors.emplace_back(e.what()); }
        }
        if (!is_remote_path(draft.destination)) {
            try { sanitize_path(draft.destination); }
            catch (const ValidationError& e) { errors.emplace_back(e.what()); }
        }
    }
    res.ok = errors.empty();
    return res;
}

void require_valid(const Record& draft, bool check_paths) {
    auto res = draft.kind == RecordKind::Job ? validate_job(draft, check_paths)
                                             : validate_operation(draft, check_paths);
    if (!res.ok) throw ValidationError(res.errors);
}

} // namespace transferd
