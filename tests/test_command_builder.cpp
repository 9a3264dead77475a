#include <gtest/gtest.h>
#include <transferd/command/command_builder.hpp>
#include <algorithm>

using namespace transferd;
using nlohmann::json;
using Argv = std::vector<std::string>;

static bool has(const Argv& v, const std::string& s) { return std::find(v.begin(), v.end(), s) != v.end(); }

TEST(RsyncBuilder, DefaultFlagsInOrder) {
    auto cmd = build_rsync_command("/src/", "/dst", default_rsync_args(), {"*.tmp", ".cache"});
    Argv expected{"rsync", "-a", "-v", "-h", "-P", "--stats",
                  "--exclude", "*.tmp", "--exclude", ".cache", "/src/", "/dst"};
    EXPECT_EQ(cmd, expected);
}

TEST(RsyncBuilder, ValuedOptionsAndPlaceholders) {
    json args = {{"archive", true}, {"delete", true}, {"bwlimit", " 500 "}, {"partial_dir", ".partial"}};
    auto cmd = build_rsync_command("", "  ", args, {}, "/usr/local/bin/rsync");
    Argv expected{"/usr/local/bin/rsync", "-a", "--delete", "--bwlimit=500", "--partial-dir=.partial",
                  "[SOURCE]", "[DESTINATION]"};
    EXPECT_EQ(cmd, expected);
}

TEST(RsyncBuilder, FalsyOptionsAreSkipped) {
    json args = {{"archive", false}, {"verbose", 0}, {"compress", ""}, {"checksum", nullptr}, {"bwlimit", ""}};
    auto cmd = build_rsync_command("/a", "/b", args, {""});
    EXPECT_EQ(cmd, (Argv{"rsync", "/a", "/b"}));
}

TEST(RsyncBuilder, Warnings) {
    EXPECT_TRUE(rsync_option_warnings(default_rsync_args()).empty());
    json args = {{"delete", true}};
    EXPECT_EQ(rsync_option_warnings(args).size(), 1u);
    args["dry_run"] = true;
    EXPECT_TRUE(rsync_option_warnings(args).empty());
    json rm = {{"remove_source_files", true}};
    EXPECT_EQ(rsync_option_warnings(rm).size(), 2u);
    rm["checksum"] = true;
    EXPECT_EQ(rsync_option_warnings(rm).size(), 1u);
}

TEST(RcloneBuilder, DefaultCopy) {
    auto cmd = build_rclone_command("copy", "/data", "remote:bucket", default_rclone_args(), {});
    Argv expected{"rclone", "copy", "-v", "--progress",
                  "--transfers", "4", "--checkers", "8",
                  "--retries", "3", "--low-level-retries", "10",
                  "--stats", "1m", "/data", "remote:bucket"};
    EXPECT_EQ(cmd, expected);
}

TEST(RcloneBuilder, SyncSpecificFlags) {
    json args = {{"delete", true}, {"create_empty_src_dirs", true}, {"checksum", true}};
    auto cmd = build_rclone_command("sync", "/a", "b:c", args, {"*.log"});
    Argv expected{"rclone", "sync", "--delete-during", "--create-empty-src-dirs", "--checksum",
                  "--exclude", "*.log", "/a", "b:c"};
    EXPECT_EQ(cmd, expected);

    // delete only means something for sync
    auto copy = build_rclone_command("copy", "/a", "b:c", args, {});
    EXPECT_FALSE(has(copy, "--delete-during"));
    EXPECT_TRUE(has(copy, "--checksum"));
    auto check = build_rclone_command("check", "/a", "b:c", args, {});
    EXPECT_FALSE(has(check, "--checksum"));
}

TEST(RcloneBuilder, IncludesAndFilters) {
    json args = {{"includes", "*.jpg  *.png"}, {"max_age", "24h"}, {"stats", true}};
    auto cmd = build_rclone_command("move", "/a", "b:c", args, {});
    Argv expected{"rclone", "move", "--stats", "1m", "--max-age", "24h",
                  "--include", "*.jpg", "--include", "*.png", "/a", "b:c"};
    EXPECT_EQ(cmd, expected);
}

TEST(CommandBuilder, OptionHelpers) {
    json args = {{"t", true}, {"f", false}, {"s", "x"}, {"blank", "  "}, {"n", 4}, {"z", 0}};
    EXPECT_TRUE(option_enabled(args, "t"));
    EXPECT_FALSE(option_enabled(args, "f"));
    EXPECT_TRUE(option_enabled(args, "s"));
    EXPECT_FALSE(option_enabled(args, "blank"));
    EXPECT_TRUE(option_enabled(args, "n"));
    EXPECT_FALSE(option_enabled(args, "z"));
    EXPECT_FALSE(option_enabled(args, "missing"));
    EXPECT_FALSE(option_enabled(json::array(), "t"));

    EXPECT_EQ(option_value(args, "n").value_or(""), "4");
    EXPECT_EQ(option_value(args, "s").value_or(""), "x");
    EXPECT_FALSE(option_value(args, "t").has_value());
    EXPECT_FALSE(option_value(args, "blank").has_value());
}

TEST(CommandBuilder, JoinQuotesArgumentsWithSpaces) {
    EXPECT_EQ(join_command({"rsync", "-a", "/my files/", "/dst"}), "rsync -a \"/my files/\" /dst");
    EXPECT_EQ(join_command({"x", ""}), "x \"\"");
}

TEST(CommandBuilder, DefaultBuilderPerKind) {
    Record job;
    job.kind = RecordKind::Job;
    job.source = "/a";
    job.destination = "/b";
    job.options = json{{"archive", true}};
    EXPECT_EQ(default_command_builder(RecordKind::Job)(job), (Argv{"rsync", "-a", "/a", "/b"}));

    Record op;
    op.kind = RecordKind::Operation;
    op.source = "/a";
    op.destination = "r:b";
    auto argv = default_command_builder(RecordKind::Operation, "rsync", "/opt/rclone")(op);
    EXPECT_EQ(argv, (Argv{"/opt/rclone", "copy", "/a", "r:b"}));
    op.operation_type = "sync";
    EXPECT_EQ(default_command_builder(RecordKind::Operation)(op)[1], "sync");
}

TEST(CommandBuilder, DryRunIsForced) {
    Record op;
    op.operation_type = "move";
    op.source = "/a";
    op.destination = "r:b";
    op.options = json{{"dry_run", false}};
    Record dry = with_dry_run(op);
    EXPECT_FALSE(option_enabled(op.options, "dry_run"));
    EXPECT_TRUE(has(default_command_builder(RecordKind::Operation)(dry), "--dry-run"));
}

TEST(CommandBuilder, OperationList) {
    const auto& ops = rclone_operations();
    EXPECT_TRUE(has(ops, "copy"));
    EXPECT_TRUE(has(ops, "sync"));
    EXPECT_TRUE(has(ops, "moveto"));
    EXPECT_FALSE(has(ops, "purge"));
}
