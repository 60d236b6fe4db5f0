/*
 * Runner tests - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <ai-cmdgate/exec/runner.hpp>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace cmdgate;
using namespace std::chrono_literals;

// Alive means present in /proc and not a zombie.
static bool process_alive(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in) return false;
    std::string stat; std::getline(in, stat);
    auto rp = stat.rfind(')');
    if (rp == std::string::npos || rp + 2 >= stat.size()) return false;
    char state = stat[rp + 2];
    return state != 'Z' && state != 'X';
}

static pid_t first_pid(const std::string& out) {
    std::istringstream iss(out); long pid = 0; iss >> pid;
    return static_cast<pid_t>(pid);
}

TEST(PosixRunner, CapturesStdout) {
    PosixRunner r;
    auto out = r.run("echo hello", 5s, ExecMode::Shell);
    ASSERT_TRUE(std::holds_alternative<Exited>(out.status));
    EXPECT_EQ(std::get<Exited>(out.status).code, 0);
    EXPECT_EQ(out.stdout_data, "hello\n");
    EXPECT_TRUE(out.stderr_data.empty());
}

TEST(PosixRunner, StderrSeparate) {
    PosixRunner r;
    auto out = r.run("echo err 1>&2; echo out", 5s, ExecMode::Shell);
    EXPECT_EQ(out.stdout_data, "out\n");
    EXPECT_EQ(out.stderr_data, "err\n");
}

TEST(PosixRunner, NonZeroExitReported) {
    PosixRunner r;
    auto out = r.run("exit 3", 5s, ExecMode::Shell);
    ASSERT_TRUE(std::holds_alternative<Exited>(out.status));
    EXPECT_EQ(std::get<Exited>(out.status).code, 3);
}

TEST(PosixRunner, KilledBySignalMapsTo128PlusSignal) {
    PosixRunner r;
    auto out = r.run("kill -TERM $$", 5s, ExecMode::Shell);
    ASSERT_TRUE(std::holds_alternative<Exited>(out.status));
    EXPECT_EQ(std::get<Exited>(out.status).code, 128 + 15);
}

TEST(PosixRunner, StdinIsDevNull) {
    PosixRunner r;
    auto out = r.run("cat", 5s, ExecMode::Shell);
    ASSERT_TRUE(std::holds_alternative<Exited>(out.status));
    EXPECT_EQ(std::get<Exited>(out.status).code, 0);
    EXPECT_TRUE(out.stdout_data.empty());
}

TEST(PosixRunnerTimeout, TimedOutAndGroupKilled) {
    PosixRunner r;
    auto started = std::chrono::steady_clock::now();
    auto out = r.run("sleep 30 & echo $!; wait", 1s, ExecMode::Shell);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(std::holds_alternative<TimedOut>(out.status));
    EXPECT_LT(elapsed, 5s);
    EXPECT_GE(out.duration, 900ms);
    pid_t bg = first_pid(out.stdout_data);
    ASSERT_GT(bg, 0);
    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(process_alive(bg));
}

TEST(PosixRunnerTimeout, LeftoverBackgroundKilledAfterExit) {
    PosixRunner r;
    auto out = r.run("sleep 30 >/dev/null 2>&1 & echo $!", 5s, ExecMode::Shell);
    ASSERT_TRUE(std::holds_alternative<Exited>(out.status));
    pid_t bg = first_pid(out.stdout_data);
    ASSERT_GT(bg, 0);
    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(process_alive(bg));
}

TEST(PosixRunnerSpawn, NonPositiveTimeoutIsFailed) {
    PosixRunner r;
    auto out = r.run("echo hi", 0s, ExecMode::Shell);
    ASSERT_TRUE(std::holds_alternative<Failed>(out.status));
    EXPECT_TRUE(out.stdout_data.empty());
}

TEST(PosixRunnerSpawn, MissingShellIsFailed) {
    RunnerOptions opts; opts.shell = "/nonexistent/bin/sh";
    PosixRunner r(opts);
    auto out = r.run("echo hi", 5s, ExecMode::Shell);
    ASSERT_TRUE(std::holds_alternative<Failed>(out.status));
    EXPECT_NE(std::get<Failed>(out.status).reason.find("exec"), std::string::npos);
}

TEST(PosixRunnerArgv, RunsWithoutShell) {
    PosixRunner r;
    auto out = r.run("echo 'a  b' c $HOME", 5s, ExecMode::Argv);
    ASSERT_TRUE(std::holds_alternative<Exited>(out.status));
    // no shell: quotes are honoured by the lexer, $HOME is passed literally
    EXPECT_EQ(out.stdout_data, "a  b c $HOME\n");
}

TEST(PosixRunnerArgv, OperatorsAndMissingProgramFail) {
    PosixRunner r;
    auto piped = r.run("echo a | cat", 5s, ExecMode::Argv);
    EXPECT_TRUE(std::holds_alternative<Failed>(piped.status));
    auto missing = r.run("definitely-not-a-program-xyz", 5s, ExecMode::Argv);
    EXPECT_TRUE(std::holds_alternative<Failed>(missing.status));
}

TEST(SplitArgv, Words) {
    std::string err;
    auto argv = split_argv("ls -la \"my dir\"", &err);
    ASSERT_TRUE(argv.has_value());
    std::vector<std::string> expected = {"ls", "-la", "my dir"};
    EXPECT_EQ(*argv, expected);
    EXPECT_FALSE(split_argv("cat a > b", &err).has_value());
    EXPECT_NE(err.find(">"), std::string::npos);
    EXPECT_FALSE(split_argv("echo 'x", &err).has_value());
    EXPECT_EQ(err, "unbalanced quotes");
    EXPECT_FALSE(split_argv("ls\nwhoami", &err).has_value());
    EXPECT_EQ(err, "argv mode runs a single line");
    auto trailing = split_argv("ls -la\n", &err);
    ASSERT_TRUE(trailing.has_value());
    EXPECT_EQ(trailing->size(), 2u);
}
