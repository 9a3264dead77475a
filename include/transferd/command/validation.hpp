/*
 * Input validation for jobs and operations - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <transferd/storage/record.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace transferd {

// Caller input rejected before any state change.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(std::vector<std::string> errors);
    explicit ValidationError(const std::string& message);
    const std::vector<std::string>& errors() const { return m_errors; }
private:
    std::vector<std::string> m_errors;
};

struct ValidationResult {
    bool ok = true;
    std::vector<std::string> errors;
};

// Normalizes a local path; throws ValidationError on null bytes, ".." or system directories.
std::string sanitize_path(const std::string& path);

// "remote:path" (but not a Windows drive "C:\...")
bool is_remote_path(const std::string& path);

ValidationResult validate_job(const Record& draft, bool check_paths = true);
ValidationResult validate_operation(const Record& draft, bool check_paths = false);

// Dispatches on draft.kind and throws ValidationError with every message.
void require_valid(const Record& draft, bool check_paths);

} // namespace transferd
