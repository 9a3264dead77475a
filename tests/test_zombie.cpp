#include <gtest/gtest.h>
#include <transferd/exec/supervisor.hpp>
#include "test_support.hpp"
#include <thread>

using namespace transferd;
using namespace std::chrono_literals;
using transferd_test::TempDir;
using nlohmann::json;

static std::vector<std::string> sh_command(const Record& r) {
    return {"/bin/sh", "-c", r.options.value("script", std::string("exit 0"))};
}

static Record make_draft(const std::string& name, const std::string& script = "exit 0") {
    Record r;
    r.name = name;
    r.source = "/src";
    r.destination = "/dst";
    r.options = json{{"script", script}};
    return r;
}

TEST(ZombieReconciler, OrphanedJobStatesBecomeFailed) {
    TempDir dir;
    RecordStore store(job_store_options(dir / "jobs.json"));
    JobLogBook logs(dir / "logs");
    auto running = store.create(make_draft("running"));
    auto paused = store.create(make_draft("paused"));
    auto pending = store.create(make_draft("pending"));
    auto done = store.create(make_draft("done"));
    auto fresh = store.create(make_draft("fresh"));
    store.update(running, json{{"status", "running"}});
    store.update(paused, json{{"status", "paused"}});
    store.update(pending, json{{"status", "pending"}});
    store.update(done, json{{"status", "completed"}});

    Supervisor sup(store, logs, sh_command);
    EXPECT_EQ(sup.reconcile_zombies(), 3);

    for (const auto& id : {running, paused, pending}) {
        auto r = store.get(id);
        EXPECT_EQ(r->status, Status::Failed);
        EXPECT_TRUE(r->failed_at.has_value());
        EXPECT_NE(r->error_message.value_or("").find("no process is tracked (zombie state cleaned up)"),
                  std::string::npos);
    }
    EXPECT_NE(store.get(running)->error_message.value_or("").find("was running"), std::string::npos);
    EXPECT_EQ(store.get(done)->status, Status::Completed);
    EXPECT_EQ(store.get(fresh)->status, Status::Created);
    EXPECT_NE(transferd_test::read_file(sup.log_file(running)).find("zombie state cleaned up"), std::string::npos);

    // idempotent
    EXPECT_EQ(sup.reconcile_zombies(), 0);
}

TEST(ZombieReconciler, LiveJobIsLeftAlone) {
    TempDir dir;
    RecordStore store(job_store_options(dir / "jobs.json"));
    JobLogBook logs(dir / "logs");
    SupervisorOptions opts;
    opts.stop_grace = 2000ms;
    opts.kill_wait = 1000ms;
    Supervisor sup(store, logs, sh_command, make_process_controller(), opts);

    auto id = store.create(make_draft("live", "exec sleep 30"));
    ASSERT_TRUE(sup.start(id));
    ASSERT_TRUE(transferd_test::wait_until([&]{ return store.get(id)->status == Status::Running; }));
    EXPECT_EQ(sup.reconcile_zombies(), 0);
    EXPECT_EQ(store.get(id)->status, Status::Running);
    EXPECT_TRUE(sup.stop(id));
}

TEST(ZombieReconciler, FreshOperationsHaveGracePeriod) {
    TempDir dir;
    RecordStore store(operation_store_options(dir / "rclone_operations.json"));
    JobLogBook logs(dir / "logs");
    Record draft = make_draft("awaiting");
    draft.operation_type = "copy";
    auto id = store.create(draft);
    store.update(id, json{{"status", "pending_approval"}});

    Supervisor sup(store, logs, sh_command);
    EXPECT_EQ(sup.reconcile_zombies(), 0);
    EXPECT_EQ(store.get(id)->status, Status::PendingApproval);
}

TEST(ZombieReconciler, StaleOperationsAreCleaned) {
    TempDir dir;
    RecordStore store(operation_store_options(dir / "rclone_operations.json"));
    JobLogBook logs(dir / "logs");
    Record draft = make_draft("scanning");
    draft.operation_type = "sync";
    auto id = store.create(draft);
    store.update(id, json{{"status", "scanning"}});
    std::this_thread::sleep_for(20ms);

    SupervisorOptions opts;
    opts.zombie_grace = std::chrono::seconds(0);
    Supervisor sup(store, logs, sh_command, make_process_controller(), opts);
    EXPECT_EQ(sup.reconcile_zombies(), 1);
    EXPECT_EQ(store.get(id)->status, Status::Failed);
}
