#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <memory>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/errors/transpile_errors.hpp"
#include "core/logging/logger.hpp"
#include "tools/process_runner.hpp"
#include "test_support.hpp"

namespace {

using transpiler::core::errors::ErrorCategory;
using transpiler::core::errors::get_error;
using transpiler::core::errors::get_value;
using transpiler::core::errors::is_error;
using transpiler::protocol::RawOutcome;
using transpiler::testing::TempDir;
using transpiler::testing::read_file;
using transpiler::testing::write_script;
using transpiler::tools::ProcessSpec;
using transpiler::tools::run_process;

ProcessSpec shell_spec(const std::filesystem::path& script,
                       const std::filesystem::path& cwd) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", script.string()};
    spec.working_directory = cwd;
    spec.timeout_ms = 5000;
    spec.grace_ms = 200;
    return spec;
}

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    TempDir dir("runner");
    const auto script = write_script(dir.root() / "tool.sh",
                                     "echo out\n"
                                     "echo err >&2\n"
                                     "exit 3\n");

    auto result = run_process(shell_spec(script, dir.root()));
    ASSERT_FALSE(is_error(result));
    const RawOutcome& raw = get_value(result);

    EXPECT_EQ(raw.stdout_text, "out\n");
    EXPECT_EQ(raw.stderr_text, "err\n");
    EXPECT_EQ(raw.exit_code, 3);
    EXPECT_FALSE(raw.timed_out);
    EXPECT_FALSE(raw.cancelled);
    EXPECT_FALSE(raw.stdout_truncated);
    EXPECT_GE(raw.duration_ms, 0.0);
}

TEST(ProcessRunnerTest, RunsInWorkingDirectoryWithEmptyStdin) {
    TempDir dir("runner");
    const auto workdir = dir.root() / "work";
    std::filesystem::create_directories(workdir);
    const auto script = write_script(dir.root() / "tool.sh",
                                     "pwd\n"
                                     "cat\n");

    auto result = run_process(shell_spec(script, workdir));
    ASSERT_FALSE(is_error(result));
    const RawOutcome& raw = get_value(result);

    EXPECT_EQ(raw.exit_code, 0);
    EXPECT_EQ(raw.stdout_text, std::filesystem::canonical(workdir).string() + "\n");
}

TEST(ProcessRunnerTest, TimeoutEscalatesToKillWhenTermIsIgnored) {
    TempDir dir("runner");
    const auto pid_file = dir.root() / "pid";
    const auto script = write_script(dir.root() / "stubborn.sh",
                                     "trap '' TERM\n"
                                     "echo $$ > \"" + pid_file.string() + "\"\n"
                                     "while :; do sleep 0.05; done\n");

    auto spec = shell_spec(script, dir.root());
    spec.timeout_ms = 300;
    spec.grace_ms = 200;

    const auto started = std::chrono::steady_clock::now();
    auto result = run_process(spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(is_error(result));
    const RawOutcome& raw = get_value(result);

    EXPECT_TRUE(raw.timed_out);
    EXPECT_FALSE(raw.cancelled);
    EXPECT_EQ(raw.exit_code, 128 + SIGKILL);
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    const std::string pid_text = read_file(pid_file);
    ASSERT_FALSE(pid_text.empty());
    const pid_t pid = static_cast<pid_t>(std::stol(pid_text));
    errno = 0;
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST(ProcessRunnerTest, CancelTokenStopsRunningProcess) {
    TempDir dir("runner");
    const auto script = write_script(dir.root() / "slow.sh", "sleep 30\n");

    auto spec = shell_spec(script, dir.root());
    spec.timeout_ms = 20000;
    spec.cancel_token = std::make_shared<std::atomic_bool>(false);

    std::thread canceller([token = spec.cancel_token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token->store(true);
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = run_process(spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_FALSE(get_value(result).timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, AlreadyCancelledTokenNeverSpawns) {
    ProcessSpec spec;
    spec.argv = {"/nonexistent/transpiler"};
    spec.cancel_token = std::make_shared<std::atomic_bool>(true);

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_EQ(get_value(result).exit_code, -1);
    EXPECT_TRUE(get_value(result).stderr_text.empty());
}

TEST(ProcessRunnerTest, CapsCapturedStderr) {
    TempDir dir("runner");
    const auto script = write_script(dir.root() / "noisy.sh",
                                     "head -c 100000 /dev/zero >&2\n"
                                     "exit 1\n");

    auto spec = shell_spec(script, dir.root());
    spec.max_stderr_bytes = 1024;

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    const RawOutcome& raw = get_value(result);

    EXPECT_EQ(raw.exit_code, 1);
    EXPECT_EQ(raw.stderr_text.size(), 1024u);
    EXPECT_TRUE(raw.stderr_truncated);
    EXPECT_FALSE(raw.stdout_truncated);
}

TEST(ProcessRunnerTest, MissingExecutableExitsWith127) {
    TempDir dir("runner");
    ProcessSpec spec;
    spec.argv = {"/nonexistent/transpiler", "--cpp", "input.py"};
    spec.working_directory = dir.root();

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
    EXPECT_EQ(get_value(result).stderr_text, "exec failed\n");
}

TEST(ProcessRunnerTest, StrayDescendantDoesNotHangTheRun) {
    TempDir dir("runner");
    const auto script = write_script(dir.root() / "forker.sh",
                                     "sleep 30 &\n"
                                     "echo done\n");

    auto spec = shell_spec(script, dir.root());
    spec.grace_ms = 200;

    const auto started = std::chrono::steady_clock::now();
    auto result = run_process(spec);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(get_value(result).stdout_text, "done\n");
    EXPECT_FALSE(get_value(result).timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, LogLinesCarryTheLabel) {
    using transpiler::core::logging::LogLevel;
    using transpiler::core::logging::Logger;

    TempDir dir("runner");
    const auto script = write_script(dir.root() / "tool.sh", "echo hi\n");
    auto spec = shell_spec(script, dir.root());
    spec.log_label = "inv-label-test";

    std::ostringstream captured;
    Logger::get().set_sink(captured);
    Logger::get().set_min_level(LogLevel::DEBUG);
    auto result = run_process(spec);
    Logger::get().set_sink(std::cerr);
    Logger::get().set_min_level(LogLevel::INFO);

    ASSERT_FALSE(is_error(result));
    EXPECT_NE(captured.str().find("[inv-label-test] ProcessRunner: pid "), std::string::npos);
}

TEST(ProcessRunnerTest, RejectsEmptyCommandLine) {
    ProcessSpec spec;

    auto result = run_process(spec);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "empty_argv");
}

}  // namespace
