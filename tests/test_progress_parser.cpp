#include <gtest/gtest.h>
#include <transferd/exec/progress_parser.hpp>

using namespace transferd;

TEST(RsyncProgress, ProgressLine) {
    auto p = parse_rsync_progress("     1,234,567  45%    1.23MB/s    0:00:12");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->percent.value_or(-1), 45);
    EXPECT_EQ(p->speed.value_or(""), "1.23MB/s");
    EXPECT_EQ(p->eta.value_or(""), "0:00:12");
    EXPECT_EQ(p->transferred_display.value_or(""), "1,234,567");
    EXPECT_EQ(p->status.value_or(""), "running");
}

TEST(RsyncProgress, CheckCounterWithProgress) {
    auto p = parse_rsync_progress("  2,048 100%  10.00kB/s    0:00:00 (xfr#3, to-chk=7/10)");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->percent.value_or(-1), 100);
    EXPECT_EQ(p->files_transferred.value_or(-1), 3);
    EXPECT_EQ(p->total_files.value_or(-1), 10);
}

TEST(RsyncProgress, CheckCounterAlone) {
    auto p = parse_rsync_progress("(xfr#12, ir-chk=1030/1040)");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->files_transferred.value_or(-1), 12);
    EXPECT_EQ(p->total_files.value_or(-1), 1040);
    EXPECT_EQ(p->percent.value_or(-1), 0);
}

TEST(RsyncProgress, SummaryLines) {
    auto sent = parse_rsync_progress("sent 1,024 bytes  received 35 bytes  2,118.00 bytes/sec");
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->bytes_transferred.value_or(-1), 1024);

    auto total = parse_rsync_progress("total size is 2,048  speedup is 1.93");
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(total->total_bytes.value_or(-1), 2048);
}

TEST(RsyncProgress, ScanningAndNoise) {
    auto scan = parse_rsync_progress("1,234 files...");
    ASSERT_TRUE(scan.has_value());
    EXPECT_EQ(scan->status.value_or(""), "scanning");

    EXPECT_FALSE(parse_rsync_progress("sending incremental file list").has_value());
    EXPECT_FALSE(parse_rsync_progress("photos/2024/img_0001.jpg").has_value());
    EXPECT_FALSE(parse_rsync_progress("").has_value());
}

TEST(RcloneProgress, ByteCounterLine) {
    auto p = parse_rclone_progress("Transferred:   \t   10.5 MiB / 100.0 MiB, 10%, 1.2 MiB/s, ETA 1m30s");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->transferred_display.value_or(""), "10.5 MiB / 100.0 MiB");
    EXPECT_EQ(p->percent.value_or(-1), 10);
    EXPECT_EQ(p->speed.value_or(""), "1.2 MiB/s");
    EXPECT_EQ(p->eta.value_or(""), "1m30s");
    EXPECT_EQ(p->status.value_or(""), "running");
}

TEST(RcloneProgress, FileCounterLine) {
    auto p = parse_rclone_progress("Transferred:            3 / 10, 30%");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->files_transferred.value_or(-1), 3);
    EXPECT_EQ(p->total_files.value_or(-1), 10);
    EXPECT_EQ(p->percent.value_or(-1), 30);
    EXPECT_FALSE(p->transferred_display.has_value());
}

TEST(RcloneProgress, CheckingAndNoise) {
    auto p = parse_rclone_progress("Checking:");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->status.value_or(""), "scanning");
    EXPECT_FALSE(parse_rclone_progress("2025/03/01 12:00:00 INFO  : a.txt: Copied (new)").has_value());
}

TEST(Progress, DispatchByKindAndPatch) {
    EXPECT_TRUE(parse_progress(RecordKind::Job, "total size is 5").has_value());
    EXPECT_FALSE(parse_progress(RecordKind::Operation, "total size is 5").has_value());

    Progress p;
    p.percent = 12;
    auto patch = progress_patch(p);
    EXPECT_EQ(patch["percent"], 12);
    EXPECT_FALSE(patch.contains("speed"));
}

TEST(RcloneProgress, LongDigitRunBeforePercentIsIgnored) {
    std::optional<Progress> p;
    EXPECT_NO_THROW(p = parse_rclone_progress("INFO  : Transferred: report, 99999999999%.txt: Copied (new)"));
    EXPECT_FALSE(p.has_value());

    EXPECT_NO_THROW(p = parse_rclone_progress("Transferred:   1 MiB / 2 MiB, 1000%, 1 MiB/s, ETA 1s"));
    ASSERT_TRUE(p.has_value());
    EXPECT_FALSE(p->percent.has_value());
}

TEST(RsyncProgress, OversizedCheckCounters) {
    std::optional<Progress> p;
    EXPECT_NO_THROW(p = parse_rsync_progress("(xfr#1, to-chk=1/999999999999999999)"));
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(p->percent.has_value());
    EXPECT_GE(*p->percent, 0);
    EXPECT_LE(*p->percent, 100);

    EXPECT_NO_THROW(p = parse_rsync_progress("(xfr#1, to-chk=5/99999999999999999999999)"));
    ASSERT_TRUE(p.has_value());
    EXPECT_FALSE(p->total_files.has_value());
    EXPECT_FALSE(p->percent.has_value());

    p = parse_rsync_progress("(xfr#2, to-chk=50/10)");
    ASSERT_TRUE(p.has_value());
    EXPECT_FALSE(p->percent.has_value());
}
