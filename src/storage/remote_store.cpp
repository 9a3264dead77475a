/*
 * rclone remote definitions store implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/storage/remote_store.hpp>
#include <transferd/storage/errors.hpp>
#include <transferd/storage/file_util.hpp>
#include <transferd/util/time.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace transferd {
namespace fs = std::filesystem;
using nlohmann::json;

static const char* const kCollection = "remotes";

const std::vector<std::string>& remote_types() {
    static const std::vector<std::string> types{
        "s3", "dropbox", "google_cloud_storage", "azure_blob", "b2", "sftp", "ftp", "local"};
    return types;
}

// rclone addresses a remote as "<name>:path", so the name cannot hold ':' or blanks.
static void check_name(const json& remote) {
    auto it = remote.find("name");
    if (it == remote.end() || !it->is_string() || it->get<std::string>().empty())
        throw StorageValidationError("remote name is required");
    const std::string name = it->get<std::string>();
    bool bad = std::any_of(name.begin(), name.end(), [](unsigned char c){ return c == ':' || std::isspace(c); });
    if (bad) throw StorageValidationError("invalid remote name '" + name + "'");
}

static std::string name_of(const json& remote) { return remote.value("name", std::string()); }

RemoteStore::RemoteStore(fs::path path, std::size_t backup_keep)
    : m_path(std::move(path)), m_backup_keep(backup_keep) {
    std::error_code ec;
    if (m_path.has_parent_path()) {
        fs::create_directories(m_path.parent_path(), ec);
        if (ec) throw StorageIOError("cannot create " + m_path.parent_path().string() + ": " + ec.message());
    }
    load();
}

void RemoteStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    json doc = load_json_document(m_path, json{{kCollection, json::array()}},
                                  [this](const json& d) { decode(d); });
    m_remotes = decode(doc);
    spdlog::debug("loaded {} remotes from {}", m_remotes.size(), m_path.string());
}

std::vector<json> RemoteStore::decode(const json& doc) const {
    auto it = doc.find(kCollection);
    if (it == doc.end() || !it->is_array())
        throw StorageCorruptionError(m_path.string() + " has no 'remotes' array");
    std::vector<json> out;
    for (const auto& item : *it) {
        if (!item.is_object()) throw StorageCorruptionError("remote entry in " + m_path.string() + " is not an object");
        try {
            check_name(item);
        } catch (const StorageValidationError& e) {
            throw StorageCorruptionError(m_path.string() + ": " + e.what());
        }
        out.push_back(item);
    }
    return out;
}

void RemoteStore::persist(const std::vector<json>& next) {
    backup_file(m_path, m_backup_keep);
    atomic_write(m_path, json{{kCollection, next}});
}

std::vector<json>::const_iterator RemoteStore::find(const std::string& name) const {
    return std::find_if(m_remotes.begin(), m_remotes.end(), [&](const json& r){ return name_of(r) == name; });
}

std::vector<json> RemoteStore::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_remotes;
}

std::optional<json> RemoteStore::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = find(name);
    if (it == m_remotes.end()) return std::nullopt;
    return *it;
}

std::string RemoteStore::add(json remote) {
    if (!remote.is_object()) throw StorageValidationError("remote must be a JSON object");
    check_name(remote);
    const std::string name = name_of(remote);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (find(name) != m_remotes.end()) throw StorageValidationError("remote '" + name + "' already exists");
    remote["created_at"] = iso_timestamp();

    std::vector<json> next = m_remotes;
    next.push_back(std::move(remote));
    persist(next);
    m_remotes = std::move(next);
    return name;
}

bool RemoteStore::update(const std::string& name, const json& fields) {
    if (!fields.is_object()) throw StorageValidationError("update patch must be a JSON object");
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = find(name);
    if (it == m_remotes.end()) {
        spdlog::warn("update ignored, remote {} not found in {}", name, m_path.string());
        return false;
    }
    json patch = fields;
    patch.erase("name");
    patch.erase("created_at");
    json merged = *it;
    merged.merge_patch(patch);
    merged["updated_at"] = iso_timestamp();

    std::vector<json> next = m_remotes;
    next[static_cast<std::size_t>(it - m_remotes.begin())] = std::move(merged);
    persist(next);
    m_remotes = std::move(next);
    return true;
}

bool RemoteStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = find(name);
    if (it == m_remotes.end()) return false;
    std::vector<json> next = m_remotes;
    next.erase(next.begin() + (it - m_remotes.begin()));
    persist(next);
    m_remotes = std::move(next);
    return true;
}

} // namespace transferd
