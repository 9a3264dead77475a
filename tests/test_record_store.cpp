#include <gtest/gtest.h>
#include <transferd/storage/errors.hpp>
#include <transferd/storage/file_util.hpp>
#include <transferd/storage/record_store.hpp>
#include "test_support.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace transferd;
using transferd_test::TempDir;
using nlohmann::json;
namespace fs = std::filesystem;

static Record draft(const std::string& name, int max_retries = -1) {
    Record r;
    r.name = name;
    r.source = "/data/src";
    r.destination = "/data/dst";
    r.max_retries = max_retries;
    return r;
}

TEST(RecordStore, CreateAssignsIdentityAndDefaults) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    auto id = jobs.create(draft("nightly"));
    EXPECT_EQ(id.rfind("job_", 0), 0u);
    auto r = jobs.get(id);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, Status::Created);
    EXPECT_EQ(r->retry_count, 0);
    EXPECT_EQ(r->max_retries, 5);
    EXPECT_FALSE(r->created_at.empty());
    EXPECT_EQ(r->created_at, r->updated_at);

    RecordStore ops(operation_store_options(dir / "rclone_operations.json"));
    Record op = draft("mirror");
    op.operation_type = "sync";
    auto op_id = ops.create(op);
    EXPECT_EQ(op_id.rfind("rclone_", 0), 0u);
    EXPECT_EQ(ops.get(op_id)->max_retries, 3);
    EXPECT_EQ(ops.get(op_id)->kind, RecordKind::Operation);
}

TEST(RecordStore, ExplicitMaxRetriesKept) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    EXPECT_EQ(jobs.get(jobs.create(draft("a", 0)))->max_retries, 0);
    EXPECT_EQ(jobs.get(jobs.create(draft("b", 7)))->max_retries, 7);
}

TEST(RecordStore, PersistsAcrossInstances) {
    TempDir dir;
    std::string id;
    {
        RecordStore jobs(job_store_options(dir / "jobs.json"));
        id = jobs.create(draft("persisted"));
        jobs.update(id, json{{"status", "failed"}, {"error_message", "boom"}});
    }
    RecordStore again(job_store_options(dir / "jobs.json"));
    auto r = again.get(id);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->name, "persisted");
    EXPECT_EQ(r->status, Status::Failed);
    EXPECT_EQ(r->error_message.value_or(""), "boom");

    json doc = json::parse(transferd_test::read_file(dir / "jobs.json"));
    ASSERT_TRUE(doc["jobs"].is_array());
    EXPECT_EQ(doc["jobs"].size(), 1u);
}

TEST(RecordStore, UpdateMergesNestedProgress) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    auto id = jobs.create(draft("merge"));
    jobs.update(id, json{{"progress", {{"percent", 10}, {"speed", "1MB/s"}}}});
    jobs.update(id, json{{"progress", {{"percent", 55}}}});
    auto r = jobs.get(id);
    ASSERT_TRUE(r->progress.has_value());
    EXPECT_EQ(r->progress->percent.value_or(-1), 55);
    EXPECT_EQ(r->progress->speed.value_or(""), "1MB/s");

    // null removes a field
    jobs.update(id, json{{"progress", {{"speed", nullptr}}}});
    EXPECT_FALSE(jobs.get(id)->progress->speed.has_value());
}

TEST(RecordStore, UpdateCannotChangeIdentity) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    auto id = jobs.create(draft("fixed"));
    auto created = jobs.get(id)->created_at;
    jobs.update(id, json{{"id", "job_other"}, {"created_at", "2000-01-01T00:00:00"}, {"name", "renamed"}});
    auto r = jobs.get(id);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->name, "renamed");
    EXPECT_EQ(r->created_at, created);
    EXPECT_FALSE(jobs.get("job_other").has_value());
}

TEST(RecordStore, UpdateUnknownIdIsNoop) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    jobs.create(draft("only"));
    EXPECT_NO_THROW(jobs.update("job_missing", json{{"status", "failed"}}));
    EXPECT_EQ(jobs.list().size(), 1u);
}

TEST(RecordStore, InvalidPatchLeavesRecordUntouched) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    auto id = jobs.create(draft("typed"));
    EXPECT_THROW(jobs.update(id, json{{"status", "bogus"}}), StorageValidationError);
    EXPECT_THROW(jobs.update(id, json{{"retry_count", "three"}}), StorageValidationError);
    EXPECT_THROW(jobs.update(id, json::array()), StorageValidationError);
    EXPECT_EQ(jobs.get(id)->status, Status::Created);
    EXPECT_EQ(jobs.get(id)->retry_count, 0);
}

TEST(RecordStore, ListByStatusAndRemove) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    auto a = jobs.create(draft("a"));
    auto b = jobs.create(draft("b"));
    jobs.update(b, json{{"status", "failed"}});
    auto failed = jobs.list_by_status(Status::Failed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].id, b);

    EXPECT_TRUE(jobs.remove(a));
    EXPECT_FALSE(jobs.remove(a));
    EXPECT_EQ(jobs.list().size(), 1u);
}

TEST(RecordStore, IncrementRetryCount) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    auto id = jobs.create(draft("retry"));
    EXPECT_EQ(jobs.increment_retry_count(id).value_or(-1), 1);
    EXPECT_EQ(jobs.increment_retry_count(id).value_or(-1), 2);
    EXPECT_FALSE(jobs.increment_retry_count("job_missing").has_value());
}

TEST(RecordStore, ConcurrentCreatesAreAllKept) {
    TempDir dir;
    RecordStore jobs(job_store_options(dir / "jobs.json"));
    std::vector<std::thread> threads;
    std::vector<std::string> ids(50);
    for (int i = 0; i < 50; ++i)
        threads.emplace_back([&, i]{ ids[i] = jobs.create(draft("job" + std::to_string(i))); });
    for (auto &t : threads) t.join();

    std::set<std::string> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), 50u);
    EXPECT_EQ(jobs.list().size(), 50u);

    RecordStore reloaded(job_store_options(dir / "jobs.json"));
    EXPECT_EQ(reloaded.list().size(), 50u);
}

TEST(RecordStore, StaleTempFileIsDiscarded) {
    TempDir dir;
    fs::path path = dir / "jobs.json";
    std::string id;
    {
        RecordStore jobs(job_store_options(path));
        id = jobs.create(draft("committed"));
    }
    transferd_test::write_file(temp_path_for(path), "{\"jobs\": [half written");
    RecordStore jobs(job_store_options(path));
    EXPECT_FALSE(fs::exists(temp_path_for(path)));
    ASSERT_EQ(jobs.list().size(), 1u);
    EXPECT_EQ(jobs.list()[0].id, id);
}

TEST(RecordStore, CorruptPrimaryRecoversFromBackup) {
    TempDir dir;
    fs::path path = dir / "jobs.json";
    std::string first;
    {
        RecordStore jobs(job_store_options(path));
        first = jobs.create(draft("first"));
        jobs.create(draft("second")); // backs up the one-record document first
    }
    ASSERT_FALSE(list_backups(path).empty());
    transferd_test::write_file(path, "not json at all");

    RecordStore jobs(job_store_options(path));
    auto all = jobs.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, first);
}

TEST(RecordStore, CorruptPrimaryWithoutBackupFails) {
    TempDir dir;
    fs::path path = dir / "jobs.json";
    transferd_test::write_file(path, "{{{{");
    EXPECT_THROW({ RecordStore jobs(job_store_options(path)); }, StorageCorruptionError);
}

TEST(RecordStore, WritesKeepBoundedBackups) {
    TempDir dir;
    fs::path path = dir / "jobs.json";
    RecordStore jobs(job_store_options(path, 2));
    auto id = jobs.create(draft("b"));
    for (int i = 0; i < 6; ++i) {
        jobs.update(id, json{{"retry_count", i}});
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    EXPECT_LE(list_backups(path).size(), 2u);
}

TEST(RecordStore, LegacyDocumentGetsStoreDefaults) {
    TempDir dir;
    json legacy_job = {{"id", "job_old"}, {"name", "nightly"}, {"source", "/a"}, {"destination", "/b"},
                       {"status", "failed"}, {"retry_count", 0}, {"excludes", "*.tmp"},
                       {"rsync_args", {{"archive", true}, {"delete", true}}}};
    transferd_test::write_file(dir / "jobs.json", json{{"jobs", json::array({legacy_job})}}.dump());
    json legacy_op = {{"id", "rclone_old"}, {"name", "mirror"}, {"source", "/a"}, {"destination", "remote:b"},
                      {"operation_type", "sync"}, {"status", "completed"},
                      {"rclone_args", {{"delete", true}}}};
    transferd_test::write_file(dir / "ops.json", json{{"operations", json::array({legacy_op})}}.dump());

    RecordStore jobs(job_store_options(dir / "jobs.json"));
    auto job = jobs.get("job_old");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->max_retries, 5);
    EXPECT_EQ(job->options["delete"], true);
    EXPECT_EQ(job->excludes, (std::vector<std::string>{"*.tmp"}));

    StoreOptions op_opts = operation_store_options(dir / "ops.json");
    op_opts.default_max_retries = 7;
    RecordStore ops(op_opts);
    auto op = ops.get("rclone_old");
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(op->max_retries, 7);
    EXPECT_EQ(op->options["delete"], true);
}

TEST(RecordStore, WrongCollectionShapeRecoversFromBackup) {
    TempDir dir;
    fs::path path = dir / "jobs.json";
    std::string first;
    {
        RecordStore jobs(job_store_options(path));
        first = jobs.create(draft("first"));
        jobs.create(draft("second"));
    }
    transferd_test::write_file(path, "{\"jobs\": {\"job_a\": 1}}");

    RecordStore jobs(job_store_options(path));
    auto all = jobs.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, first);
    fs::path aside = path;
    aside += ".corrupted";
    EXPECT_TRUE(fs::exists(aside));
}

TEST(RecordStore, InvalidRecordRecoversFromBackup) {
    TempDir dir;
    fs::path path = dir / "jobs.json";
    std::string first;
    {
        RecordStore jobs(job_store_options(path));
        first = jobs.create(draft("first"));
        jobs.create(draft("second"));
    }
    transferd_test::write_file(path, "{\"jobs\": [{\"id\": \"job_x\", \"status\": \"exploded\"}]}");

    RecordStore jobs(job_store_options(path));
    ASSERT_EQ(jobs.list().size(), 1u);
    EXPECT_EQ(jobs.list()[0].id, first);
}

TEST(RecordStore, WrongShapeWithoutBackupFails) {
    TempDir dir;
    fs::path path = dir / "jobs.json";
    transferd_test::write_file(path, "{\"jobs\": 7}");
    EXPECT_THROW({ RecordStore jobs(job_store_options(path)); }, StorageCorruptionError);
    transferd_test::write_file(path, "{\"operations\": []}");
    EXPECT_THROW({ RecordStore jobs(job_store_options(path)); }, StorageCorruptionError);
}
