#include <gtest/gtest.h>
#include <transferd/exec/process.hpp>
#include <csignal>
#include <system_error>

using namespace transferd;
using namespace std::chrono_literals;

TEST(PosixProcess, CapturesMergedOutputAndExitCode) {
    auto ctl = make_process_controller();
    auto p = ctl->spawn({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
    std::vector<std::string> lines;
    while (auto l = p->read_line()) lines.push_back(*l);
    EXPECT_EQ(lines, (std::vector<std::string>{"out", "err"}));
    auto es = p->wait();
    ASSERT_TRUE(es.code.has_value());
    EXPECT_EQ(*es.code, 3);
    EXPECT_FALSE(es.signal.has_value());
    EXPECT_FALSE(p->running());
}

TEST(PosixProcess, CarriageReturnEndsLine) {
    auto ctl = make_process_controller();
    auto p = ctl->spawn({"/bin/sh", "-c", "printf '10%%\\r20%%\\r\\n\\ndone'"});
    std::vector<std::string> lines;
    while (auto l = p->read_line()) lines.push_back(*l);
    EXPECT_EQ(lines, (std::vector<std::string>{"10%", "20%", "done"}));
    EXPECT_EQ(p->wait().code.value_or(-1), 0);
}

TEST(PosixProcess, StdinIsNullDevice) {
    auto ctl = make_process_controller();
    auto p = ctl->spawn({"/bin/sh", "-c", "if read x; then echo got; else echo eof; fi"});
    auto l = p->read_line();
    ASSERT_TRUE(l.has_value());
    EXPECT_EQ(*l, "eof");
    p->wait();
}

TEST(PosixProcess, MissingBinaryThrows) {
    auto ctl = make_process_controller();
    EXPECT_THROW(ctl->spawn({"/nonexistent/transferd-test-binary"}), std::system_error);
    EXPECT_THROW(ctl->spawn({}), std::system_error);
}

TEST(PosixProcess, InterruptStopsGroup) {
    auto ctl = make_process_controller();
    auto p = ctl->spawn({"sleep", "30"});
    EXPECT_TRUE(p->running());
    EXPECT_FALSE(p->wait_for(50ms));
    EXPECT_EQ(ctl->interrupt(*p), SignalResult::Ok);
    ASSERT_TRUE(p->wait_for(5s));
    auto es = p->exit_status();
    ASSERT_TRUE(es.has_value());
    EXPECT_EQ(es->signal.value_or(0), SIGINT);
    EXPECT_EQ(ctl->interrupt(*p), SignalResult::NotRunning);
}

TEST(PosixProcess, SuspendResumeKeepsProcess) {
    auto ctl = make_process_controller();
    ASSERT_TRUE(ctl->supports_pause());
    auto p = ctl->spawn({"sleep", "30"});
    long pid = p->pid();
    EXPECT_EQ(ctl->suspend(*p), SignalResult::Ok);
    EXPECT_TRUE(p->running());
    EXPECT_EQ(ctl->resume(*p), SignalResult::Ok);
    EXPECT_TRUE(p->running());
    EXPECT_EQ(p->pid(), pid);
    EXPECT_EQ(ctl->kill(*p), SignalResult::Ok);
    auto es = p->wait();
    EXPECT_EQ(es.signal.value_or(0), SIGKILL);
}

TEST(PosixProcess, SignalResultNames) {
    EXPECT_STREQ(to_string(SignalResult::Ok), "ok");
    EXPECT_STREQ(to_string(SignalResult::NotRunning), "not running");
}
