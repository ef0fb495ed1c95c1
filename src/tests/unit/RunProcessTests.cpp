// File: tests/unit/RunProcessTests.cpp
// Purpose: Exercise the fork/exec process runner against /bin/sh.
// Key invariants: Start failures are SpawnErrors naming the program; non-zero
//                 exits are ExecutionErrors carrying the exit code.
// Ownership/Lifetime: Tests own their scratch directories.
// Links: common/RunProcess.hpp

#include <gtest/gtest.h>

#include "common/RunProcess.hpp"
#include "tests/common/TempDir.hpp"

#include <filesystem>
#include <string>

using namespace screeps;
using namespace screeps::common;

TEST(RunProcess, ZeroExitIsSuccess)
{
    PosixProcessRunner runner;
    auto result = runner.run({"/bin/sh", {"-c", "exit 0"}, ""});
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_TRUE(result.value().success);
    EXPECT_EQ(result.value().exit_code, 0);
    EXPECT_TRUE(execute(runner, {"/bin/sh", {"-c", "true"}, ""}).hasValue());
}

TEST(RunProcess, NonZeroExitIsExecutionError)
{
    PosixProcessRunner runner;
    auto result = runner.run({"/bin/sh", {"-c", "exit 3"}, ""});
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().success);
    EXPECT_EQ(result.value().exit_code, 3);

    auto executed = execute(runner, {"/bin/sh", {"-c", "exit 3"}, ""});
    ASSERT_FALSE(executed.hasValue());
    EXPECT_EQ(executed.error().code, support::DiagCode::Execution);
    EXPECT_EQ(executed.error().exitCode, 3);
    EXPECT_NE(executed.error().message.find("exit code: 3"), std::string::npos);
    EXPECT_NE(executed.error().message.find("/bin/sh -c exit 3"), std::string::npos);
}

TEST(RunProcess, KilledBySignalIsFailure)
{
    PosixProcessRunner runner;
    auto result = runner.run({"/bin/sh", {"-c", "kill -9 $$"}, ""});
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().success);
    EXPECT_EQ(result.value().exit_code, 128 + 9);

    auto executed = execute(runner, {"/bin/sh", {"-c", "kill -9 $$"}, ""});
    ASSERT_FALSE(executed.hasValue());
    EXPECT_EQ(executed.error().code, support::DiagCode::Execution);
    EXPECT_EQ(executed.error().exitCode, 128 + 9);
}

TEST(RunProcess, MissingProgramIsSpawnError)
{
    PosixProcessRunner runner;
    const std::string program = "screeps-build-no-such-program-xyz";
    auto result = runner.run({program, {"--version"}, ""});
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, support::DiagCode::Spawn);
    EXPECT_NE(result.error().message.find(program), std::string::npos);

    auto executed = execute(runner, {program, {}, ""});
    ASSERT_FALSE(executed.hasValue());
    EXPECT_EQ(executed.error().code, support::DiagCode::Spawn);
}

TEST(RunProcess, EmptyProgramIsSpawnError)
{
    PosixProcessRunner runner;
    auto result = runner.run({"", {}, ""});
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, support::DiagCode::Spawn);
}

TEST(RunProcess, RunsInWorkingDirectory)
{
    test::TempDir tmp;
    PosixProcessRunner runner;
    auto result = runner.run({"/bin/sh", {"-c", "echo here > marker.txt"}, tmp.path().string()});
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_TRUE(result.value().success);
    EXPECT_EQ(test::readFile(tmp.path() / "marker.txt"), "here\n");
}

TEST(RunProcess, MissingWorkingDirectoryIsSpawnError)
{
    test::TempDir tmp;
    PosixProcessRunner runner;
    const auto dir = (tmp.path() / "absent").string();
    auto result = runner.run({"/bin/sh", {"-c", "true"}, dir});
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, support::DiagCode::Spawn);
    EXPECT_NE(result.error().message.find(dir), std::string::npos);
}

TEST(RunProcess, DescribeCommandJoinsArguments)
{
    EXPECT_EQ(describeCommand({"cargo", {"web", "build", "--release"}, "/p"}),
              "cargo web build --release");
    EXPECT_EQ(describeCommand({"cargo", {}, ""}), "cargo");
}
