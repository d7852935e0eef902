/**
 * @file test_process.cpp
 * @brief Child process runner: exit codes, combined output, timeout, truncation, PATH lookup.
 */

#include <gtest/gtest.h>

#include <chrono>

#include "skufall/os/process.hpp"

using skufall::os::ProcessSpec;
using skufall::os::find_in_path;
using skufall::os::run_process;
using namespace std::chrono_literals;

static ProcessSpec sh(const std::string& script) {
  ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.args = {"-c", script};
  return spec;
}

/**
 * @test ExitCode_AndCombinedOutput
 * @brief stdout and stderr both land in output; the exit status is passed through.
 */
TEST(Process, ExitCode_AndCombinedOutput) {
  auto r = run_process(sh("echo out; echo err 1>&2; exit 3"));
  EXPECT_TRUE(r.spawned());
  EXPECT_FALSE(r.io_failed());
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_NE(r.output.find("out\n"), std::string::npos);
  EXPECT_NE(r.output.find("err\n"), std::string::npos);
  EXPECT_FALSE(r.timed_out);
  EXPECT_FALSE(r.truncated);
}

TEST(Process, Success_ResolvedThroughPath) {
  ProcessSpec spec;
  spec.command = "sh";
  spec.args = {"-c", "printf hello"};
  auto r = run_process(spec);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.output, "hello");
}

TEST(Process, ExecFailure_Is127) {
  ProcessSpec spec;
  spec.command = "/nonexistent/skufall-binary";
  auto r = run_process(spec);
  EXPECT_EQ(r.exit_code, 127);
  EXPECT_TRUE(r.spawned());
  EXPECT_NE(r.output.find("failed to execute '/nonexistent/skufall-binary'"), std::string::npos);
}

TEST(Process, EmptyCommand_NotSpawned) {
  auto r = run_process(ProcessSpec{});
  EXPECT_FALSE(r.spawned());
  EXPECT_FALSE(r.io_failed());
  EXPECT_EQ(r.error_message, "empty command");
}

/**
 * @test Timeout_KillsProcessGroup
 * @brief A child outliving its deadline is terminated and reported as 124.
 */
TEST(Process, Timeout_KillsProcessGroup) {
  auto spec = sh("echo started; sleep 30");
  spec.timeout = 500ms;
  const auto t0 = std::chrono::steady_clock::now();
  auto r = run_process(spec);
  const auto spent = std::chrono::steady_clock::now() - t0;

  EXPECT_TRUE(r.timed_out);
  EXPECT_EQ(r.exit_code, 124);
  EXPECT_NE(r.output.find("started"), std::string::npos);
  EXPECT_LT(spent, 10s);
}

TEST(Process, NoTimeout_WhenChildIsFast) {
  auto spec = sh("exit 0");
  spec.timeout = 5s;
  auto r = run_process(spec);
  EXPECT_FALSE(r.timed_out);
  EXPECT_EQ(r.exit_code, 0);
}

TEST(Process, Output_IsCapped) {
  auto spec = sh("head -c 10000 /dev/zero");
  spec.max_output_bytes = 100;
  auto r = run_process(spec);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_TRUE(r.truncated);
  EXPECT_EQ(r.output.size(), 100u + std::string("\n(output truncated)").size());
}

TEST(Process, KilledBySignal_Is128PlusSignal) {
  auto r = run_process(sh("kill -9 $$"));
  EXPECT_EQ(r.exit_code, 137);
}

TEST(Process, FindInPath) {
  auto sh_path = find_in_path("sh");
  ASSERT_TRUE(sh_path.has_value());
  EXPECT_EQ(sh_path->back(), 'h');

  EXPECT_EQ(find_in_path("/bin/sh"), std::optional<std::string>{"/bin/sh"});
  EXPECT_FALSE(find_in_path("skufall-definitely-not-installed").has_value());
  EXPECT_FALSE(find_in_path("/nonexistent/az").has_value());
  EXPECT_FALSE(find_in_path("").has_value());
}
