// transferd command line front end
#include <transferd/command/command_builder.hpp>
#include <transferd/command/validation.hpp>
#include <transferd/config.hpp>
#include <transferd/exec/rclone_info.hpp>
#include <transferd/exec/supervisor.hpp>
#include <transferd/storage/errors.hpp>
#include <transferd/storage/record_store.hpp>
#include <transferd/storage/remote_store.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <deque>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace transferd;
using nlohmann::json;

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int){ g_interrupted=1; }

static void usage() {
    std::cerr <<
        "Usage: transferd [--config FILE] <command> [args]\n"
        "  list [jobs|ops]                      list records\n"
        "  show <id>                            print a record as JSON\n"
        "  create-job --name N --source S --dest D [--max-retries N] [--exclude P]... [--opt key=value]... [--no-check]\n"
        "  create-op --name N --type T --source S --dest D [--max-retries N] [--exclude P]... [--opt key=value]... [--check] [--preview]\n"
        "  preview <id>                         dry run, then pending_approval or preview_failed\n"
        "  approve <id>                         start an operation that passed preview\n"
        "  run <id>                             start and wait (Ctrl-C stops the transfer)\n"
        "  restart <id>                         restart and wait\n"
        "  restart-failed [jobs|ops]            start failed records with retries left, and wait\n"
        "  reconcile                            mark orphaned running records failed\n"
        "  logs <id> [--tail N]                 print the job log\n"
        "  delete <id>                          delete a record\n"
        "  remotes [list]                       stored remotes and the ones rclone knows\n"
        "  remotes add --name N --type T [--opt key=value]...\n"
        "  remotes update <name> --opt key=value...\n"
        "  remotes delete|test <name>\n"
        "  remotes types                        backend types offered for new remotes\n"
        "  rclone-status                        is rclone installed, and which version\n";
}

// Both stores with their supervisors (declared last, so destroyed first).
struct Engine {
    EngineConfig cfg;
    std::unique_ptr<RecordStore> jobs, ops;
    std::unique_ptr<RemoteStore> remotes;
    std::unique_ptr<JobLogBook> logs;
    std::unique_ptr<Supervisor> job_sup, op_sup;

    explicit Engine(EngineConfig c) : cfg(std::move(c)) {
        auto job_opts = job_store_options(cfg.jobs_path(), static_cast<size_t>(cfg.backup_keep));
        job_opts.default_max_retries = cfg.job_default_max_retries;
        jobs = std::make_unique<RecordStore>(job_opts);
        auto op_opts = operation_store_options(cfg.operations_path(), static_cast<size_t>(cfg.backup_keep));
        op_opts.default_max_retries = cfg.operation_default_max_retries;
        ops = std::make_unique<RecordStore>(op_opts);
        remotes = std::make_unique<RemoteStore>(cfg.remotes_path(), static_cast<size_t>(cfg.backup_keep));
        logs = std::make_unique<JobLogBook>(cfg.log_path());
        job_sup = std::make_unique<Supervisor>(*jobs, *logs, default_command_builder(RecordKind::Job, cfg.rsync_binary, cfg.rclone_binary),
                                               make_process_controller(), SupervisorOptions::from_config(cfg, RecordKind::Job));
        op_sup = std::make_unique<Supervisor>(*ops, *logs, default_command_builder(RecordKind::Operation, cfg.rsync_binary, cfg.rclone_binary),
                                              make_process_controller(), SupervisorOptions::from_config(cfg, RecordKind::Operation));
    }
    Supervisor& for_id(const std::string& id) {
        return id.rfind(std::string(id_prefix(RecordKind::Operation)) + "_", 0) == 0 ? *op_sup : *job_sup;
    }
    void reconcile() {
        int j = job_sup->reconcile_zombies(), o = op_sup->reconcile_zombies();
        if (j || o) std::cout << "Cleaned up " << j << " zombie jobs and " << o << " zombie operations\n";
    }
};

static json parse_opt_value(const std::string& v) {
    if (v=="true"||v=="on"||v=="yes") return true;
    if (v=="false"||v=="off"||v=="no") return false;
    return v;
}

static bool take_value(const std::vector<std::string>& args, size_t& i, std::string& out) {
    if (i+1 >= args.size()) { std::cerr << args[i] << " requires a value\n"; return false; }
    out = args[++i];
    return true;
}

static std::string progress_text(const Progress& p) {
    std::string s;
    if (p.percent) s += std::to_string(*p.percent) + "%";
    if (p.transferred_display) s += (s.empty()?"":" ") + *p.transferred_display;
    if (p.speed) s += (s.empty()?"":" ") + *p.speed;
    if (p.eta) s += (s.empty()?"":" ETA ") + *p.eta;
    if (p.status && *p.status=="scanning" && s.empty()) s = "scanning...";
    return s;
}

static void print_record_line(const Record& r) {
    std::cout << r.id << "  " << to_string(r.status);
    if (r.progress && r.progress->percent) std::cout << " " << *r.progress->percent << "%";
    std::cout << "  " << r.name << "  " << r.source << " -> " << r.destination;
    if (r.retry_count) std::cout << "  (retries " << r.retry_count << "/" << r.max_retries << ")";
    std::cout << '\n';
}

// Blocks until the record is idle. SIGINT stops it once.
static bool wait_for_record(Supervisor& sup, const std::string& id) {
    bool stop_sent = false;
    while (!sup.wait_idle(id, std::chrono::milliseconds(200))) {
        if (g_interrupted && !stop_sent) {
            std::cout << "\nStopping " << id << "...\n";
            sup.stop(id);
            stop_sent = true;
        }
    }
    auto rec = sup.store().get(id);
    if (!rec) { std::cout << id << ": deleted\n"; return false; }
    std::cout << '\n' << id << ": " << to_string(rec->status);
    if (rec->error_message) std::cout << " (" << *rec->error_message << ")";
    std::cout << '\n';
    return rec->status == Status::Completed;
}

static ProgressCallback console_progress() {
    auto last = std::make_shared<std::string>();
    return [last](const std::string&, const Progress& p){
        std::string t = progress_text(p);
        if (t.empty() || t == *last) return;
        *last = t;
        std::cout << "\r" << t << "        " << std::flush;
    };
}

static int cmd_create(Engine& eng, RecordKind kind, const std::vector<std::string>& args) {
    Record draft;
    draft.kind = kind;
    draft.options = kind==RecordKind::Job ? default_rsync_args() : default_rclone_args();
    bool check = kind==RecordKind::Job, preview = false;
    for (size_t i=1;i<args.size();++i) {
        const std::string& a = args[i];
        std::string v;
        if (a=="--name") { if(!take_value(args,i,draft.name)) return 2; }
        else if (a=="--source") { if(!take_value(args,i,draft.source)) return 2; }
        else if (a=="--dest") { if(!take_value(args,i,draft.destination)) return 2; }
        else if (a=="--type" && kind==RecordKind::Operation) { if(!take_value(args,i,draft.operation_type)) return 2; }
        else if (a=="--max-retries") { if(!take_value(args,i,v)) return 2; draft.max_retries = std::stoi(v); }
        else if (a=="--exclude") { if(!take_value(args,i,v)) return 2; for (auto &p : split_patterns(v)) draft.excludes.push_back(p); }
        else if (a=="--opt") {
            if(!take_value(args,i,v)) return 2;
            auto eq = v.find('=');
            if (eq==std::string::npos) { std::cerr << "--opt expects key=value\n"; return 2; }
            draft.options[v.substr(0,eq)] = parse_opt_value(v.substr(eq+1));
        }
        else if (a=="--no-check") check = false;
        else if (a=="--check") check = true;
        else if (a=="--preview" && kind==RecordKind::Operation) preview = true;
        else { std::cerr << "unknown option " << a << '\n'; return 2; }
    }
    require_valid(draft, check);
    auto warnings = kind==RecordKind::Job ? rsync_option_warnings(draft.options) : rclone_option_warnings(draft.options);
    for (auto &w : warnings) std::cerr << "warning: " << w << '\n';

    RecordStore& store = kind==RecordKind::Job ? *eng.jobs : *eng.ops;
    std::string id = store.create(draft);
    std::cout << id << '\n';
    if (preview) {
        auto res = eng.op_sup->preview(id);
        std::cout << (res.success ? "Preview complete - awaiting approval" : res.error) << '\n';
        if (!res.stats.empty()) std::cout << res.stats << '\n';
        return res.success ? 0 : 1;
    }
    return 0;
}

static int cmd_logs(Engine& eng, const std::string& id, size_t tail) {
    std::ifstream in(eng.for_id(id).log_file(id));
    if (!in) { std::cerr << "no log for " << id << '\n'; return 1; }
    std::deque<std::string> lines; std::string line;
    while (std::getline(in, line)) { lines.push_back(line); if (tail && lines.size() > tail) lines.pop_front(); }
    for (auto &l : lines) std::cout << l << '\n';
    return 0;
}

static int cmd_remotes(Engine& eng, const std::vector<std::string>& args) {
    const std::string sub = args.size() > 1 ? args[1] : "list";
    RcloneInfo rclone({eng.cfg.rclone_binary});
    if (sub=="list") {
        for (auto &r : eng.remotes->list())
            std::cout << r.value("name", std::string()) << "  " << r.value("type", std::string("?")) << '\n';
        auto system = rclone.list_remotes();
        if (!system.empty()) {
            std::cout << "configured in rclone:";
            for (auto &n : system) std::cout << ' ' << n;
            std::cout << '\n';
        }
        return 0;
    }
    if (sub=="types") {
        for (auto &t : remote_types()) std::cout << t << '\n';
        return 0;
    }
    if (sub=="add") {
        json remote = json::object();
        for (size_t i=2;i<args.size();++i) {
            const std::string& a = args[i];
            std::string v;
            if (a=="--name") { if(!take_value(args,i,v)) return 2; remote["name"] = v; }
            else if (a=="--type") { if(!take_value(args,i,v)) return 2; remote["type"] = v; }
            else if (a=="--opt") {
                if(!take_value(args,i,v)) return 2;
                auto eq = v.find('=');
                if (eq==std::string::npos) { std::cerr << "--opt expects key=value\n"; return 2; }
                remote["config"][v.substr(0,eq)] = parse_opt_value(v.substr(eq+1));
            }
            else { std::cerr << "unknown option " << a << '\n'; return 2; }
        }
        std::cout << "Added remote " << eng.remotes->add(remote) << '\n';
        return 0;
    }
    if (args.size() < 3) { usage(); return 2; }
    const std::string& name = args[2];
    if (sub=="update") {
        json patch = json::object();
        for (size_t i=3;i<args.size();++i) {
            std::string v;
            if (args[i]!="--opt") { std::cerr << "unknown option " << args[i] << '\n'; return 2; }
            if(!take_value(args,i,v)) return 2;
            auto eq = v.find('=');
            if (eq==std::string::npos) { std::cerr << "--opt expects key=value\n"; return 2; }
            patch["config"][v.substr(0,eq)] = parse_opt_value(v.substr(eq+1));
        }
        if (!eng.remotes->update(name, patch)) { std::cerr << "remote " << name << " not found\n"; return 1; }
        std::cout << "Updated remote " << name << '\n';
        return 0;
    }
    if (sub=="delete") {
        if (!eng.remotes->remove(name)) { std::cerr << "remote " << name << " not found\n"; return 1; }
        std::cout << "Deleted remote " << name << '\n';
        return 0;
    }
    if (sub=="test") {
        auto res = rclone.test_remote(name);
        for (auto &l : res.output) std::cout << l << '\n';
        std::cout << res.message << '\n';
        return res.success ? 0 : 1;
    }
    usage();
    return 2;
}

static int cmd_rclone_status(Engine& eng) {
    RcloneInfo rclone({eng.cfg.rclone_binary});
    auto version = rclone.version();
    if (!version) { std::cout << "rclone not installed (" << eng.cfg.rclone_binary << ")\n"; return 1; }
    std::cout << *version << '\n';
    return 0;
}

static int dispatch(Engine& eng, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    auto need_id = [&]()->bool { if (args.size() < 2) { usage(); return false; } return true; };

    if (cmd=="list") {
        bool jobs = args.size()<2 || args[1]=="jobs", ops = args.size()<2 || args[1]=="ops";
        if (jobs) for (auto &r : eng.jobs->list()) print_record_line(r);
        if (ops) for (auto &r : eng.ops->list()) print_record_line(r);
        return 0;
    }
    if (cmd=="create-job") return cmd_create(eng, RecordKind::Job, args);
    if (cmd=="create-op") return cmd_create(eng, RecordKind::Operation, args);
    if (cmd=="reconcile") { eng.reconcile(); return 0; }
    if (cmd=="remotes") return cmd_remotes(eng, args);
    if (cmd=="rclone-status") return cmd_rclone_status(eng);
    if (cmd=="restart-failed") {
        bool jobs = args.size()<2 || args[1]=="jobs", ops = args.size()<2 || args[1]=="ops";
        eng.reconcile();
        std::vector<std::pair<Supervisor*, std::string>> started;
        for (auto sup : {jobs ? eng.job_sup.get() : nullptr, ops ? eng.op_sup.get() : nullptr}) {
            if (!sup) continue;
            auto failed = sup->store().list_by_status(Status::Failed);
            int n = sup->restart_failed();
            std::cout << "Restarted " << n << (sup->kind()==RecordKind::Job ? " failed jobs\n" : " failed operations\n");
            for (auto &r : failed) if (sup->is_running(r.id)) started.emplace_back(sup, r.id);
        }
        int rc = 0;
        for (auto &s : started) if (!wait_for_record(*s.first, s.second)) rc = 1;
        return rc;
    }

    if (!need_id()) return 2;
    const std::string& id = args[1];
    Supervisor& sup = eng.for_id(id);
    if (cmd=="show") {
        auto rec = sup.store().get(id);
        if (!rec) { std::cerr << id << " not found\n"; return 1; }
        std::cout << json(*rec).dump(2) << '\n';
        return 0;
    }
    if (cmd=="logs") {
        size_t tail = 0;
        if (args.size()>3 && args[2]=="--tail") tail = static_cast<size_t>(std::stoul(args[3]));
        return cmd_logs(eng, id, tail);
    }
    if (cmd=="delete") {
        if (!sup.remove(id)) { std::cerr << id << " not found\n"; return 1; }
        std::cout << "Deleted " << id << '\n';
        return 0;
    }
    if (cmd=="preview") {
        auto res = sup.preview(id);
        for (auto &l : res.output) std::cout << l << '\n';
        std::cout << (res.success ? "Preview complete - awaiting approval" : res.error) << '\n';
        return res.success ? 0 : 1;
    }
    if (cmd=="run" || cmd=="restart" || cmd=="approve") {
        eng.reconcile();
        bool ok = cmd=="run" ? sup.start(id, console_progress())
                : cmd=="restart" ? sup.restart(id) : sup.approve(id);
        if (!ok) { std::cerr << "cannot " << cmd << " " << id << '\n'; return 1; }
        return wait_for_record(sup, id) ? 0 : 1;
    }
    usage();
    return 2;
}

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("transferd"));
    std::signal(SIGINT, sigint_handler);
#ifndef _WIN32
    std::signal(SIGTERM, sigint_handler);
#endif
    std::vector<std::string> args;
    std::string rc_path;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (a=="--config" && i+1<argc) rc_path = argv[++i];
        else if (a=="-h" || a=="--help") { usage(); return 0; }
        else args.push_back(a);
    }
    if (args.empty()) { usage(); return 2; }
    try {
        EngineConfig cfg = load_config(rc_path);
        apply_log_level(cfg.log_level);
        Engine eng(cfg);
        return dispatch(eng, args);
    } catch (const ValidationError& e) {
        for (auto &m : e.errors()) std::cerr << "error: " << m << '\n';
        return 1;
    } catch (const StorageError& e) {
        std::cerr << "storage error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }
}
