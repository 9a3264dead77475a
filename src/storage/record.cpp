/*
 * Job / operation record model implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/storage/record.hpp>
#include <transferd/storage/errors.hpp>
#include <array>
#include <sstream>
#include <utility>

namespace transferd {

using nlohmann::json;

static const std::array<std::pair<Status, const char*>, 12> kStatusNames = {{
    {Status::Created, "created"},
    {Status::Pending, "pending"},
    {Status::PendingRestart, "pending_restart"},
    {Status::Initializing, "initializing"},
    {Status::PreviewFailed, "preview_failed"},
    {Status::PendingApproval, "pending_approval"},
    {Status::Scanning, "scanning"},
    {Status::Running, "running"},
    {Status::Paused, "paused"},
    {Status::Stopped, "stopped"},
    {Status::Completed, "completed"},
    {Status::Failed, "failed"},
}};

const char* to_string(Status s) {
    for (auto &p : kStatusNames) if (p.first == s) return p.second;
    return "created";
}

std::optional<Status> parse_status(const std::string& text) {
    for (auto &p : kStatusNames) if (text == p.second) return p.first;
    return std::nullopt;
}

const char* to_string(RecordKind k) { return k == RecordKind::Job ? "job" : "operation"; }

std::optional<RecordKind> parse_kind(const std::string& text) {
    if (text == "job") return RecordKind::Job;
    if (text == "operation") return RecordKind::Operation;
    return std::nullopt;
}

const char* id_prefix(RecordKind k) { return k == RecordKind::Job ? "job" : "rclone"; }

bool is_transient(RecordKind kind, Status s) {
    switch (s) {
        case Status::Running:
        case Status::Paused:
        case Status::Pending:
            return true;
        case Status::Scanning:
        case Status::PendingApproval:
        case Status::PreviewFailed:
        case Status::Initializing:
            return kind == RecordKind::Operation;
        default:
            return false;
    }
}

bool Progress::empty() const {
    return !status && !percent && !bytes_transferred && !total_bytes && !files_transferred &&
           !total_files && !speed && !eta && !transferred_display && !retry_attempt;
}

void to_json(json& j, Status s) { j = to_string(s); }

void from_json(const json& j, Status& s) {
    auto parsed = parse_status(j.get<std::string>());
    if (!parsed) throw StorageValidationError("unknown status: " + j.get<std::string>());
    s = *parsed;
}

template <typename T>
static void put_opt(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

template <typename T>
static void get_opt(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) { out.reset(); return; }
    out = it->template get<T>();
}

void to_json(json& j, const Progress& p) {
    j = json::object();
    put_opt(j, "status", p.status);
    put_opt(j, "percent", p.percent);
    put_opt(j, "bytes_transferred", p.bytes_transferred);
    put_opt(j, "total_bytes", p.total_bytes);
    put_opt(j, "files_transferred", p.files_transferred);
    put_opt(j, "total_files", p.total_files);
    put_opt(j, "speed", p.speed);
    put_opt(j, "eta", p.eta);
    put_opt(j, "transferred_display", p.transferred_display);
    put_opt(j, "retry_attempt", p.retry_attempt);
}

void from_json(const json& j, Progress& p) {
    get_opt(j, "status", p.status);
    get_opt(j, "percent", p.percent);
    get_opt(j, "bytes_transferred", p.bytes_transferred);
    get_opt(j, "total_bytes", p.total_bytes);
    get_opt(j, "files_transferred", p.files_transferred);
    get_opt(j, "total_files", p.total_files);
    get_opt(j, "speed", p.speed);
    get_opt(j, "eta", p.eta);
    get_opt(j, "transferred_display", p.transferred_display);
    get_opt(j, "retry_attempt", p.retry_attempt);
}

void to_json(json& j, const Record& r) {
    j = json{
        {"id", r.id},
        {"kind", to_string(r.kind)},
        {"name", r.name},
        {"source", r.source},
        {"destination", r.destination},
        {"options", r.options},
        {"excludes", r.excludes},
        {"status", r.status},
        {"retry_count", r.retry_count},
        {"max_retries", r.max_retries},
        {"created_at", r.created_at},
        {"updated_at", r.updated_at},
    };
    if (!r.operation_type.empty()) j["operation_type"] = r.operation_type;
    put_opt(j, "started_at", r.started_at);
    put_opt(j, "completed_at", r.completed_at);
    put_opt(j, "failed_at", r.failed_at);
    put_opt(j, "stopped_at", r.stopped_at);
    put_opt(j, "progress", r.progress);
    put_opt(j, "error_message", r.error_message);
    put_opt(j, "return_code", r.return_code);
}

void from_json(const json& j, Record& r) {
    if (!j.is_object()) throw StorageValidationError("record is not a JSON object");
    r.id = j.at("id").get<std::string>();
    auto kind = parse_kind(j.value("kind", std::string("job")));
    if (!kind) throw StorageValidationError("unknown record kind in " + r.id);
    r.kind = *kind;
    r.name = j.value("name", std::string());
    r.source = j.value("source", std::string());
    r.destination = j.value("destination", std::string());
    r.operation_type = j.value("operation_type", std::string());
    r.options = j.value("options", json::object());
    // Older documents keep the tool options under the tool's name.
    if (!j.contains("options")) {
        for (const char* legacy : {"rsync_args", "rclone_args"}) {
            auto it = j.find(legacy);
            if (it != j.end() && it->is_object()) { r.options = *it; break; }
        }
    }
    // Older documents keep excludes as one space separated string.
    auto ex = j.find("excludes");
    if (ex == j.end() || ex->is_null()) r.excludes.clear();
    else if (ex->is_string()) r.excludes = split_patterns(ex->get<std::string>());
    else r.excludes = ex->get<std::vector<std::string>>();
    r.status = j.value("status", Status::Created);
    r.retry_count = j.value("retry_count", 0);
    r.max_retries = j.value("max_retries", -1);
    r.created_at = j.value("created_at", std::string());
    r.updated_at = j.value("updated_at", std::string());
    get_opt(j, "started_at", r.started_at);
    get_opt(j, "completed_at", r.completed_at);
    get_opt(j, "failed_at", r.failed_at);
    get_opt(j, "stopped_at", r.stopped_at);
    get_opt(j, "progress", r.progress);
    get_opt(j, "error_message", r.error_message);
    get_opt(j, "return_code", r.return_code);
}

std::vector<std::string> split_patterns(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string tok;
    while (in >> tok) out.push_back(tok);
    return out;
}

} // namespace transferd
