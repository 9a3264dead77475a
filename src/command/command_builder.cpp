/*
 * Shared command builder helpers - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/command/command_builder.hpp>
#include <cctype>

namespace transferd {

using nlohmann::json;

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

bool option_enabled(const json& args, const char* key) {
    if (!args.is_object()) return false;
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_string()) return !trim(it->get<std::string>()).empty();
    if (it->is_number()) return it->get<double>() != 0.0;
    return !it->empty();
}

std::optional<std::string> option_value(const json& args, const char* key) {
    if (!args.is_object()) return std::nullopt;
    auto it = args.find(key);
    if (it == args.end() || it->is_null() || it->is_boolean()) return std::nullopt;
    std::string v;
    if (it->is_string()) v = trim(it->get<std::string>());
    else if (it->is_number_integer()) v = std::to_string(it->get<long long>());
    else if (it->is_number()) v = it->dump();
    if (v.empty()) return std::nullopt;
    return v;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i=0;i<argv.size();++i) {
        if (i) out.push_back(' ');
        const std::string& a = argv[i];
        bool needQ = a.empty() || a.find_first_of(" \t\"'") != std::string::npos;
        if (needQ) out.push_back('"');
        out += a;
        if (needQ) out.push_back('"');
    }
    return out;
}

CommandBuilder default_command_builder(RecordKind kind, const std::string& rsync_binary,
                                       const std::string& rclone_binary) {
    if (kind == RecordKind::Job) {
        return [rsync_binary](const Record& r) {
            return build_rsync_command(r.source, r.destination, r.options, r.excludes, rsync_binary);
        };
    }
    return [rclone_binary](const Record& r) {
        std::string op = r.operation_type.empty() ? std::string("copy") : r.operation_type;
        return build_rclone_command(op, r.source, r.destination, r.options, r.excludes, rclone_binary);
    };
}

Record with_dry_run(Record record) {
    if (!record.options.is_object()) record.options = json::object();
    record.options["dry_run"] = true;
    return record;
}

} // namespace transferd
