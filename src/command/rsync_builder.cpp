/*
 * rsync argument vector builder - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/command/command_builder.hpp>
#include <cctype>
#include <utility>

namespace transferd {

using nlohmann::json;

namespace {
// Order matters: it is the order flags appear on the command line.
const std::pair<const char*, const char*> kRsyncFlags[] = {
    {"archive", "-a"},
    {"verbose", "-v"},
    {"human_readable", "-h"},
    {"progress", "-P"},
    {"compress", "--compress"},
    {"delete", "--delete"},
    {"dry_run", "--dry-run"},
    {"remove_source_files", "--remove-source-files"},
    {"checksum", "--checksum"},
    {"stats", "--stats"},
    {"itemize_changes", "--itemize-changes"},
    {"inplace", "--inplace"},
    {"sparse", "--sparse"},
    {"whole_file", "--whole-file"},
    {"update", "--update"},
    {"ignore_existing", "--ignore-existing"},
};

std::string trimmed(const std::string& s) {
    size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a,b-a);
}
} // namespace

std::vector<std::string> build_rsync_command(const std::string& source, const std::string& destination,
                                             const json& args, const std::vector<std::string>& excludes,
                                             const std::string& binary) {
    std::vector<std::string> cmd{binary};
    for (auto &f : kRsyncFlags) if (option_enabled(args, f.first)) cmd.emplace_back(f.second);

    if (auto bw = option_value(args, "bwlimit")) cmd.push_back("--bwlimit=" + *bw);
    if (auto pd = option_value(args, "partial_dir")) cmd.push_back("--partial-dir=" + *pd);

    for (auto &p : excludes) {
        if (p.empty()) continue;
        cmd.emplace_back("--exclude");
        cmd.push_back(p);
    }
    std::string src = trimmed(source), dst = trimmed(destination);
    cmd.push_back(src.empty() ? "[SOURCE]" : src);
    cmd.push_back(dst.empty() ? "[DESTINATION]" : dst);
    return cmd;
}

json default_rsync_args() {
    return json{
        {"archive", true}, {"verbose", true}, {"human_readable", true}, {"progress", true},
        {"compress", false}, {"delete", false}, {"dry_run", false}, {"remove_source_files", false},
        {"checksum", false}, {"stats", true}, {"itemize_changes", false}, {"inplace", false},
        {"sparse", false}, {"whole_file", false}, {"update", false}, {"ignore_existing", false},
        {"bwlimit", ""}, {"partial_dir", ""},
    };
}

std::vector<std::string> rsync_option_warnings(const json& args) {
    std::vector<std::string> out;
    bool dry = option_enabled(args, "dry_run");
    if (option_enabled(args, "delete") && !dry)
        out.emplace_back("--delete will permanently remove files from destination");
    if (option_enabled(args, "remove_source_files")) {
        if (!dry) out.emplace_back("--remove-source-files will permanently delete source files after transfer");
        if (!option_enabled(args, "checksum"))
            out.emplace_back("consider --checksum together with --remove-source-files");
    }
    return out;
}

} // namespace transferd
