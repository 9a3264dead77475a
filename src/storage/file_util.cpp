/*
 * Crash-safe file helpers implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/storage/file_util.hpp>
#include <transferd/storage/errors.hpp>
#include <transferd/util/time.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <random>
#include <system_error>

namespace transferd {
namespace fs = std::filesystem;
using nlohmann::json;

std::string generate_unique_id(const std::string& prefix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng), lo = dist(rng);
    // RFC 4122 version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (unsigned long long)(hi >> 32), (unsigned long long)((hi >> 16) & 0xFFFF),
                  (unsigned long long)(hi & 0xFFFF), (unsigned long long)(lo >> 48),
                  (unsigned long long)(lo & 0xFFFFFFFFFFFFULL));
    return prefix + "_" + buf;
}

fs::path temp_path_for(const fs::path& target) {
    fs::path tmp = target;
    tmp.replace_extension(".tmp");
    return tmp;
}

void atomic_write(const fs::path& target, const json& doc, int indent) {
    fs::path tmp = temp_path_for(target);
    try {
        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc);
            if (!out) throw StorageIOError("cannot open " + tmp.string() + " for writing");
            out << doc.dump(indent) << '\n';
            out.flush();
            if (!out) throw StorageIOError("short write to " + tmp.string());
        }
        fs::rename(tmp, target);
    } catch (const StorageIOError&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw StorageIOError("failed to write " + target.string() + ": " + e.what());
    }
}

static std::string backup_marker(const fs::path& target) {
    return target.stem().string() + ".backup.";
}

std::vector<fs::path> list_backups(const fs::path& target) {
    std::vector<fs::path> out;
    fs::path dir = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;
    const std::string marker = backup_marker(target);
    const std::string ext = target.extension().string();
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string name = it->path().filename().string();
        if (name.rfind(marker, 0) != 0) continue;
        if (name.size() < marker.size() + ext.size()) continue;
        if (name.compare(name.size() - ext.size(), ext.size(), ext) != 0) continue;
        out.push_back(it->path());
    }
    // Timestamp suffixes sort lexicographically in time order.
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() > b.filename().string();
    });
    return out;
}

void cleanup_old_backups(const fs::path& target, std::size_t keep_count) {
    auto backups = list_backups(target);
    for (std::size_t i = keep_count; i < backups.size(); ++i) {
        std::error_code ec;
        fs::remove(backups[i], ec);
        if (ec) spdlog::warn("failed to delete old backup {}: {}", backups[i].string(), ec.message());
    }
}

std::optional<fs::path> find_latest_backup(const fs::path& target) {
    auto backups = list_backups(target);
    if (backups.empty()) return std::nullopt;
    return backups.front();
}

std::optional<fs::path> backup_file(const fs::path& target, std::size_t keep_count) {
    std::error_code ec;
    if (!fs::exists(target, ec)) return std::nullopt;
    fs::path backup = target.parent_path() /
        (backup_marker(target) + compact_timestamp() + target.extension().string());
    fs::copy_file(target, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::warn("failed to create backup of {}: {}", target.string(), ec.message());
        return std::nullopt;
    }
    cleanup_old_backups(target, keep_count);
    return backup;
}

// Empty reason when the document is usable.
static std::string rejection(const json& doc, const DocumentCheck& check) {
    if (doc.is_discarded() || !doc.is_object()) return "not a JSON object";
    if (!check) return {};
    try {
        check(doc);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

static std::optional<json> try_load_backup(const fs::path& p, const DocumentCheck& check) {
    std::ifstream in(p);
    if (!in) return std::nullopt;
    json doc = json::parse(in, nullptr, false);
    std::string why = rejection(doc, check);
    if (!why.empty()) {
        spdlog::warn("backup {} is unusable too ({}), trying an older one", p.string(), why);
        return std::nullopt;
    }
    return doc;
}

json load_json_document(const fs::path& target, const json& fallback, const DocumentCheck& check) {
    std::error_code ec;
    if (!fs::exists(target, ec)) return fallback;
    auto size = fs::file_size(target, ec);
    if (ec) throw StorageIOError("cannot stat " + target.string() + ": " + ec.message());
    if (size == 0) return fallback;

    std::string why;
    {
        std::ifstream in(target);
        if (!in) throw StorageIOError("cannot open " + target.string() + " for reading");
        json doc = json::parse(in, nullptr, false);
        why = rejection(doc, check);
        if (why.empty()) return doc;
    }

    for (const auto& backup : list_backups(target)) {
        auto recovered = try_load_backup(backup, check);
        if (!recovered) continue;
        spdlog::warn("{} is corrupted ({}), recovered from backup {}", target.string(), why, backup.string());
        fs::path aside = target;
        aside += ".corrupted";
        fs::rename(target, aside, ec);
        if (ec) spdlog::warn("could not move corrupted {} aside: {}", target.string(), ec.message());
        try {
            atomic_write(target, *recovered);
        } catch (const StorageIOError& e) {
            spdlog::warn("recovered data not written back: {}", e.what());
        }
        return *recovered;
    }
    throw StorageCorruptionError("failed to load " + target.string() + ": " + why + " and no valid backup found");
}

bool recover_from_backup(const fs::path& target) {
    auto backup = find_latest_backup(target);
    if (!backup) {
        spdlog::warn("no backup found for {}", target.string());
        return false;
    }
    std::error_code ec;
    if (fs::exists(target, ec)) {
        fs::path aside = target;
        aside += ".corrupted";
        fs::rename(target, aside, ec);
        if (ec) {
            spdlog::error("failed to move {} aside: {}", target.string(), ec.message());
            return false;
        }
    }
    fs::copy_file(*backup, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("failed to restore {} from {}: {}", target.string(), backup->string(), ec.message());
        return false;
    }
    spdlog::info("recovered {} from backup {}", target.string(), backup->string());
    return true;
}

} // namespace transferd
