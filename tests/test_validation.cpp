#include <gtest/gtest.h>
#include <transferd/command/validation.hpp>
#include "test_support.hpp"

using namespace transferd;
using transferd_test::TempDir;
namespace fs = std::filesystem;

static Record job_draft(const std::string& src, const std::string& dst) {
    Record r;
    r.kind = RecordKind::Job;
    r.name = "backup";
    r.source = src;
    r.destination = dst;
    return r;
}

static Record op_draft(const std::string& type, const std::string& src, const std::string& dst) {
    Record r;
    r.kind = RecordKind::Operation;
    r.name = "op";
    r.operation_type = type;
    r.source = src;
    r.destination = dst;
    return r;
}

static bool mentions(const ValidationResult& res, const std::string& text) {
    for (auto &e : res.errors) if (e.find(text) != std::string::npos) return true;
    return false;
}

TEST(Validation, SanitizeRejectsSystemDirectories) {
    EXPECT_THROW(sanitize_path("/"), ValidationError);
    EXPECT_THROW(sanitize_path("/etc"), ValidationError);
    EXPECT_THROW(sanitize_path("/etc/"), ValidationError);
    EXPECT_THROW(sanitize_path("/etc/ssh"), ValidationError);
    EXPECT_THROW(sanitize_path("/usr/local/share"), ValidationError);
    EXPECT_EQ(sanitize_path("/usrdata/x"), "/usrdata/x");
    EXPECT_EQ(sanitize_path("/home/u/backup/"), "/home/u/backup");
}

TEST(Validation, SanitizeRejectsTraversalAndNulls) {
    EXPECT_THROW(sanitize_path("../outside"), ValidationError);
    EXPECT_THROW(sanitize_path(std::string("/home/u\0/x", 10)), ValidationError);
    EXPECT_THROW(sanitize_path(""), ValidationError);
    // resolved lexically, nothing escapes
    EXPECT_EQ(sanitize_path("/home/u/a/../b"), "/home/u/b");
}

TEST(Validation, RemotePaths) {
    EXPECT_TRUE(is_remote_path("gdrive:backups"));
    EXPECT_TRUE(is_remote_path("s3:bucket/dir"));
    EXPECT_FALSE(is_remote_path("/local/path"));
    EXPECT_FALSE(is_remote_path("/odd/name:with-colon"));
    EXPECT_FALSE(is_remote_path("C:\\Users\\x"));
    EXPECT_FALSE(is_remote_path(":nothing"));
}

TEST(Validation, JobRequiredFields) {
    Record r;
    r.kind = RecordKind::Job;
    auto res = validate_job(r, false);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.errors.size(), 3u);
    EXPECT_TRUE(mentions(res, "Job name is required"));

    r = job_draft("/a", "/b");
    r.name = std::string(201, 'n');
    res = validate_job(r, false);
    EXPECT_TRUE(mentions(res, "too long"));

    r = job_draft("/a", "/b");
    r.max_retries = 101;
    EXPECT_FALSE(validate_job(r, false).ok);
    r.max_retries = -1;
    EXPECT_TRUE(validate_job(r, false).ok);
    r.max_retries = 0;
    EXPECT_TRUE(validate_job(r, false).ok);
}

TEST(Validation, JobPathChecks) {
    TempDir dir;
    fs::create_directories(dir / "src");
    fs::create_directories(dir / "dst");

    EXPECT_TRUE(validate_job(job_draft((dir / "src").string(), (dir / "dst").string())).ok);
    // destination may not exist yet if its parent does
    EXPECT_TRUE(validate_job(job_draft((dir / "src").string(), (dir / "new").string())).ok);

    auto res = validate_job(job_draft((dir / "missing").string(), (dir / "dst").string()));
    EXPECT_TRUE(mentions(res, "does not exist"));

    res = validate_job(job_draft((dir / "src").string(), (dir / "nope" / "deeper").string()));
    EXPECT_TRUE(mentions(res, "Parent directory does not exist"));

    res = validate_job(job_draft((dir / "src").string(), (dir / "src").string()));
    EXPECT_TRUE(mentions(res, "cannot be the same"));

    res = validate_job(job_draft((dir / "src").string(), (dir / "src" / "inner").string()));
    EXPECT_TRUE(mentions(res, "inside source"));

    res = validate_job(job_draft((dir / "src").string(), "/etc/backup"));
    EXPECT_TRUE(mentions(res, "system directory"));
}

TEST(Validation, OperationTypeMustBeKnown) {
    auto res = validate_operation(op_draft("frobnicate", "/a", "r:b"));
    EXPECT_FALSE(res.ok);
    EXPECT_TRUE(mentions(res, "Invalid operation type: frobnicate. Allowed: check, copy, copyto"));
    EXPECT_TRUE(validate_operation(op_draft("sync", "/a", "r:b")).ok);
    EXPECT_TRUE(mentions(validate_operation(op_draft("", "/a", "r:b")), "Operation type is required"));
}

TEST(Validation, OperationChecksLocalPathsOnly) {
    TempDir dir;
    EXPECT_TRUE(validate_operation(op_draft("copy", "remote:src", "other:dst"), true).ok);
    EXPECT_TRUE(validate_operation(op_draft("copy", dir.path.string(), "other:dst"), true).ok);
    auto res = validate_operation(op_draft("copy", (dir / "missing").string(), "other:dst"), true);
    EXPECT_TRUE(mentions(res, "does not exist"));
    res = validate_operation(op_draft("copy", "remote:src", "/proc/x"), true);
    EXPECT_TRUE(mentions(res, "system directory"));
}

TEST(Validation, RequireValidThrowsWithEveryMessage) {
    Record r;
    r.kind = RecordKind::Operation;
    try {
        require_valid(r, false);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.errors().size(), 3u);
        EXPECT_NE(std::string(e.what()).find("; "), std::string::npos);
    }
    EXPECT_NO_THROW(require_valid(job_draft("/a", "/b"), false));
}
