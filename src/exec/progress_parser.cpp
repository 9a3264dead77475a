/*
 * Progress parsing implementation - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/exec/progress_parser.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace transferd {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static std::string to_lower(std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); }); return s; }
static bool all_digits(const std::string& s){ return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c)!=0; }); }

// "1,234,567" -> 1234567
static std::optional<std::int64_t> parse_count(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), ','), s.end());
    if (!all_digits(s) || s.size() > 18) return std::nullopt;
    return std::stoll(s);
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out; std::string cur;
    for (char c : s) { if (c == sep) { out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    out.push_back(cur);
    return out;
}

std::optional<Progress> parse_rsync_progress(const std::string& raw) {
    static const std::regex kProgressLine(R"(^\s*([\d,]+)\s+(\d{1,3})%\s+(\S+/s)\s+(\d+:\d{2}:\d{2}))");
    static const std::regex kCheckCounter(R"(xfr#(\d+),\s*(?:to|ir)-chk=(\d+)/(\d+))");
    static const std::regex kTotalSize(R"(total size is ([\d,]+))");

    const std::string line = trim(raw);
    Progress p;

    // "sent 1,234,567 bytes  received 987 bytes  ..."
    if (line.find("sent") != std::string::npos && line.find("bytes") != std::string::npos) {
        std::istringstream in(line);
        std::string tok, prev;
        while (in >> tok) {
            if (prev == "sent") { if (auto n = parse_count(tok)) p.bytes_transferred = *n; break; }
            prev = tok;
        }
    }

    std::smatch m;
    if (std::regex_search(line, m, kProgressLine)) {
        p.transferred_display = m[1].str();
        p.percent = std::min(100, std::stoi(m[2].str()));
        p.speed = m[3].str();
        p.eta = m[4].str();
        p.status = "running";
    }
    if (std::regex_search(line, m, kCheckCounter)) {
        p.files_transferred = parse_count(m[1].str());
        auto remaining = parse_count(m[2].str());
        auto total = parse_count(m[3].str());
        p.total_files = total;
        if (remaining && total && *total > 0 && *remaining <= *total && !p.percent)
            p.percent = static_cast<int>(static_cast<double>(*total - *remaining) * 100.0 / static_cast<double>(*total));
    }
    if (std::regex_search(line, m, kTotalSize)) p.total_bytes = parse_count(m[1].str());

    if (to_lower(line).find("files...") != std::string::npos) p.status = "scanning";

    if (p.empty()) return std::nullopt;
    return p;
}

std::optional<Progress> parse_rclone_progress(const std::string& raw) {
    const std::string line = trim(raw);
    Progress p;

    auto tpos = line.find("Transferred:");
    if (tpos != std::string::npos) {
        auto parts = split(line.substr(tpos + std::string("Transferred:").size()), ',');
        auto amounts = split(parts[0], '/');
        if (amounts.size() >= 2) {
            std::string done = trim(amounts[0]), total = trim(amounts[1]);
            if (all_digits(done) && all_digits(total) && parts.size() <= 2) {
                // file counter line
                p.files_transferred = parse_count(done);
                p.total_files = parse_count(total);
            } else {
                p.transferred_display = done + " / " + total;
            }
        }
        if (parts.size() > 1) {
            std::string pct = trim(parts[1]);
            auto pc = pct.find('%');
            // at most "100", anything longer is part of a file name
            if (pc != std::string::npos && pc > 0 && pc <= 3 && all_digits(pct.substr(0, pc))) {
                p.percent = std::min(100, std::stoi(pct.substr(0, pc)));
                p.status = "running";
            }
        }
        if (parts.size() > 2) {
            std::string speed = trim(parts[2]);
            if (!speed.empty()) p.speed = speed;
        }
        if (parts.size() > 3) {
            std::string eta = trim(parts[3]);
            if (eta.rfind("ETA", 0) == 0) eta = trim(eta.substr(3));
            if (!eta.empty()) p.eta = eta;
        }
    }

    if (to_lower(line).find("files...") != std::string::npos || line.find("Checking") != std::string::npos)
        p.status = "scanning";

    if (p.empty()) return std::nullopt;
    return p;
}

std::optional<Progress> parse_progress(RecordKind kind, const std::string& line) {
    return kind == RecordKind::Job ? parse_rsync_progress(line) : parse_rclone_progress(line);
}

nlohmann::json progress_patch(const Progress& p) { return nlohmann::json(p); }

} // namespace transferd
