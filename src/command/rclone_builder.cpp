/*
 * rclone argument vector builder - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/command/command_builder.hpp>
#include <cctype>
#include <utility>

namespace transferd {

using nlohmann::json;

namespace {

using Flag = std::pair<const char*, const char*>;

const Flag kCommonFlags[] = {
    {"verbose", "-v"},
    {"progress", "--progress"},
    {"dry_run", "--dry-run"},
};

// valued options emitted as "--flag value"
const Flag kPerformanceValues[] = {
    {"transfers", "--transfers"},
    {"checkers", "--checkers"},
    {"bwlimit", "--bwlimit"},
};

const Flag kTransferFlags[] = {
    {"update", "--update"},
    {"ignore_existing", "--ignore-existing"},
    {"ignore_size", "--ignore-size"},
    {"size_only", "--size-only"},
    {"immutable", "--immutable"},
    {"use_server_modtime", "--use-server-modtime"},
};

const Flag kRetryValues[] = {
    {"retries", "--retries"},
    {"low_level_retries", "--low-level-retries"},
    {"timeout", "--timeout"},
    {"contimeout", "--contimeout"},
    {"buffer_size", "--buffer-size"},
    {"drive_chunk_size", "--drive-chunk-size"},
};

const Flag kAdvancedFlags[] = {
    {"stats_one_line", "--stats-one-line"},
    {"no_traverse", "--no-traverse"},
    {"fast_list", "--fast-list"},
    {"track_renames", "--track-renames"},
    {"no_update_modtime", "--no-update-modtime"},
    {"use_mmap", "--use-mmap"},
    {"inplace", "--inplace"},
};

const Flag kFilterValues[] = {
    {"max_delete", "--max-delete"},
    {"min_size", "--min-size"},
    {"max_size", "--max-size"},
    {"max_age", "--max-age"},
    {"min_age", "--min-age"},
};

template <size_t N>
void add_flags(std::vector<std::string>& cmd, const json& args, const Flag (&table)[N]) {
    for (auto &f : table) if (option_enabled(args, f.first)) cmd.emplace_back(f.second);
}

template <size_t N>
void add_values(std::vector<std::string>& cmd, const json& args, const Flag (&table)[N]) {
    for (auto &f : table) {
        if (auto v = option_value(args, f.first)) { cmd.emplace_back(f.second); cmd.push_back(*v); }
    }
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out; std::string cur;
    for (char c : s) {
        if (std::isspace((unsigned char)c)) { if (!cur.empty()) { out.push_back(cur); cur.clear(); } }
        else cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string trimmed(const std::string& s) {
    size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a,b-a);
}

} // namespace

std::vector<std::string> build_rclone_command(const std::string& operation, const std::string& source,
                                              const std::string& destination, const json& args,
                                              const std::vector<std::string>& excludes,
                                              const std::string& binary) {
    std::vector<std::string> cmd{binary, operation};
    add_flags(cmd, args, kCommonFlags);

    if (operation == "sync") {
        if (option_enabled(args, "delete")) cmd.emplace_back("--delete-during");
        if (option_enabled(args, "create_empty_src_dirs")) cmd.emplace_back("--create-empty-src-dirs");
    }
    if (operation == "move" && option_enabled(args, "delete_empty_src_dirs"))
        cmd.emplace_back("--delete-empty-src-dirs");
    if (operation == "copy" || operation == "sync" || operation == "move") {
        if (option_enabled(args, "checksum")) cmd.emplace_back("--checksum");
        if (option_enabled(args, "ignore_times")) cmd.emplace_back("--ignore-times");
    }

    add_values(cmd, args, kPerformanceValues);
    add_flags(cmd, args, kTransferFlags);
    add_values(cmd, args, kRetryValues);

    if (option_enabled(args, "stats")) {
        cmd.emplace_back("--stats");
        cmd.push_back(option_value(args, "stats_interval").value_or("1m"));
    }
    add_flags(cmd, args, kAdvancedFlags);
    add_values(cmd, args, kFilterValues);

    for (auto &p : excludes) {
        if (p.empty()) continue;
        cmd.emplace_back("--exclude");
        cmd.push_back(p);
    }
    if (auto inc = option_value(args, "includes")) {
        for (auto &p : split_ws(*inc)) { cmd.emplace_back("--include"); cmd.push_back(p); }
    }

    std::string src = trimmed(source), dst = trimmed(destination);
    cmd.push_back(src.empty() ? "[SOURCE]" : src);
    cmd.push_back(dst.empty() ? "[DESTINATION]" : dst);
    return cmd;
}

json default_rclone_args() {
    return json{
        {"verbose", true}, {"progress", true}, {"dry_run", false}, {"delete", false},
        {"checksum", false}, {"ignore_times", false},
        {"transfers", "4"}, {"checkers", "8"}, {"bwlimit", ""},
        {"create_empty_src_dirs", false}, {"delete_empty_src_dirs", false},
        {"update", false}, {"ignore_existing", false}, {"ignore_size", false}, {"size_only", false},
        {"immutable", false}, {"use_server_modtime", false},
        {"retries", "3"}, {"low_level_retries", "10"}, {"timeout", ""}, {"contimeout", ""},
        {"buffer_size", ""}, {"drive_chunk_size", ""},
        {"stats", true}, {"stats_interval", "1m"}, {"stats_one_line", false},
        {"no_traverse", false}, {"fast_list", false},
        {"track_renames", false}, {"no_update_modtime", false}, {"use_mmap", false}, {"inplace", false},
        {"max_delete", ""}, {"min_size", ""}, {"max_size", ""}, {"max_age", ""}, {"min_age", ""},
    };
}

std::vector<std::string> rclone_option_warnings(const json& args) {
    std::vector<std::string> out;
    if (option_enabled(args, "delete"))
        out.emplace_back("sync with --delete will remove files from destination that don't exist in source");
    return out;
}

const std::vector<std::string>& rclone_operations() {
    static const std::vector<std::string> ops{
        "copy", "sync", "move", "check", "delete", "mount", "rcat", "copyto", "moveto"};
    return ops;
}

} // namespace transferd
