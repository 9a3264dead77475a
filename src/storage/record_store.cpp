/*
 * Persistent record store implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/storage/record_store.hpp>
#include <transferd/storage/errors.hpp>
#include <transferd/storage/file_util.hpp>
#include <transferd/util/time.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace transferd {
namespace fs = std::filesystem;
using nlohmann::json;

StoreOptions job_store_options(const fs::path& path, std::size_t backup_keep) {
    StoreOptions o;
    o.path = path; o.collection_key = "jobs"; o.kind = RecordKind::Job;
    o.default_max_retries = 5; o.backup_keep = backup_keep;
    return o;
}

StoreOptions operation_store_options(const fs::path& path, std::size_t backup_keep) {
    StoreOptions o;
    o.path = path; o.collection_key = "operations"; o.kind = RecordKind::Operation;
    o.default_max_retries = 3; o.backup_keep = backup_keep;
    return o;
}

RecordStore::RecordStore(StoreOptions opts) : m_opts(std::move(opts)) {
    std::error_code ec;
    if (m_opts.path.has_parent_path()) {
        fs::create_directories(m_opts.path.parent_path(), ec);
        if (ec) throw StorageIOError("cannot create " + m_opts.path.parent_path().string() + ": " + ec.message());
    }
    load();
}

void RecordStore::load() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    // A temp file here means a crash between write and rename: the target is still the committed state.
    std::error_code ec;
    fs::path tmp = temp_path_for(m_opts.path);
    if (fs::exists(tmp, ec)) {
        spdlog::warn("removing stale temp file {}", tmp.string());
        fs::remove(tmp, ec);
    }

    json doc = load_json_document(m_opts.path, json{{m_opts.collection_key, json::array()}},
                                  [this](const json& d) { decode(d); });
    m_records = decode(doc);
    spdlog::debug("loaded {} records from {}", m_records.size(), m_opts.path.string());
}

std::vector<Record> RecordStore::decode(const json& doc) const {
    auto it = doc.find(m_opts.collection_key);
    if (it == doc.end() || !it->is_array())
        throw StorageCorruptionError(m_opts.path.string() + " has no '" + m_opts.collection_key + "' array");
    std::vector<Record> loaded;
    loaded.reserve(it->size());
    for (const auto& item : *it) {
        try {
            Record r = item.get<Record>();
            r.kind = m_opts.kind;
            // documents written before max_retries was stored
            if (r.max_retries < 0) r.max_retries = m_opts.default_max_retries;
            loaded.push_back(std::move(r));
        } catch (const std::exception& e) {
            throw StorageCorruptionError("invalid record in " + m_opts.path.string() + ": " + e.what());
        }
    }
    return loaded;
}

void RecordStore::persist(const std::vector<Record>& next) {
    json arr = json::array();
    for (const auto& r : next) arr.push_back(json(r));
    json doc = {{m_opts.collection_key, std::move(arr)}};
    backup_file(m_opts.path, m_opts.backup_keep);
    atomic_write(m_opts.path, doc);
}

std::vector<Record>::iterator RecordStore::find(const std::string& id) {
    return std::find_if(m_records.begin(), m_records.end(), [&](const Record& r){ return r.id == id; });
}

std::vector<Record>::const_iterator RecordStore::find(const std::string& id) const {
    return std::find_if(m_records.begin(), m_records.end(), [&](const Record& r){ return r.id == id; });
}

std::string RecordStore::create(Record draft) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    draft.id = generate_unique_id(id_prefix(m_opts.kind));
    if (find(draft.id) != m_records.end())
        throw StorageIdCollisionError("generated id already exists: " + draft.id);
    draft.kind = m_opts.kind;
    draft.status = Status::Created;
    draft.created_at = iso_timestamp();
    draft.updated_at = draft.created_at;
    draft.retry_count = 0;
    if (draft.max_retries < 0) draft.max_retries = m_opts.default_max_retries;

    std::vector<Record> next = m_records;
    next.push_back(draft);
    persist(next);
    m_records = std::move(next);
    return draft.id;
}

std::optional<Record> RecordStore::get(const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = find(id);
    if (it == m_records.end()) return std::nullopt;
    return *it;
}

std::vector<Record> RecordStore::list() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_records;
}

std::vector<Record> RecordStore::list_by_status(Status status) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    std::vector<Record> out;
    std::copy_if(m_records.begin(), m_records.end(), std::back_inserter(out),
                 [&](const Record& r){ return r.status == status; });
    return out;
}

void RecordStore::update(const std::string& id, const json& fields) {
    if (!fields.is_object()) throw StorageValidationError("update patch must be a JSON object");
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = find(id);
    if (it == m_records.end()) {
        spdlog::warn("update ignored, record {} not found in {}", id, m_opts.path.string());
        return;
    }
    json patch = fields;
    patch.erase("id");
    patch.erase("kind");
    patch.erase("created_at");

    json doc(*it);
    doc.merge_patch(patch);
    Record updated;
    try {
        updated = doc.get<Record>();
    } catch (const StorageValidationError&) {
        throw;
    } catch (const std::exception& e) {
        throw StorageValidationError("update of " + id + " produces an invalid record: " + e.what());
    }
    updated.updated_at = iso_timestamp();

    std::vector<Record> next = m_records;
    next[static_cast<std::size_t>(it - m_records.begin())] = std::move(updated);
    persist(next);
    m_records = std::move(next);
}

bool RecordStore::remove(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = find(id);
    if (it == m_records.end()) return false;
    std::vector<Record> next = m_records;
    next.erase(next.begin() + (it - m_records.begin()));
    persist(next);
    m_records = std::move(next);
    return true;
}

std::optional<int> RecordStore::increment_retry_count(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto current = get(id);
    if (!current) return std::nullopt;
    int next = current->retry_count + 1;
    update(id, json{{"retry_count", next}});
    return next;
}

} // namespace transferd
