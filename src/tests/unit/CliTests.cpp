// File: tests/unit/CliTests.cpp
// Purpose: Validate screeps-build argument parsing and exit statuses.
// Key invariants: Usage errors exit with 2, pipeline failures with 1 and
//                 successful runs with 0.
// Ownership/Lifetime: Tests own argv storage and scratch project roots.
// Links: tools/screeps-build/cli.hpp

#include <gtest/gtest.h>

#include "tests/common/FakeProcessRunner.hpp"
#include "tests/common/TempDir.hpp"
#include "tools/screeps-build/cli.hpp"

#include <initializer_list>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace screeps;
using namespace screeps::tools;

namespace
{
/// Mutable argv storage with the program name at index 0.
class Argv
{
  public:
    Argv(std::initializer_list<std::string> args) : storage_{"screeps-build"}
    {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto &s : storage_)
            pointers_.push_back(s.data());
        pointers_.push_back(nullptr);
    }

    int argc() const
    {
        return static_cast<int>(storage_.size());
    }

    char **argv()
    {
        return pointers_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> pointers_;
};

struct RunOutput
{
    int status;
    std::string out;
    std::string err;
};

RunOutput runCli(test::FakeProcessRunner &runner, std::initializer_list<std::string> args)
{
    Argv argv(args);
    std::ostringstream out;
    std::ostringstream err;
    const int status = runScreepsBuild(argv.argc(), argv.argv(), runner, out, err);
    return {status, out.str(), err.str()};
}
} // namespace

TEST(CliParse, AcceptsCommandsAndOptions)
{
    Argv argv({"-v", "--root", "/work/bot", "check"});
    auto opts = parseCommandLine(argv.argc(), argv.argv());
    ASSERT_TRUE(opts.hasValue()) << opts.error().message;
    EXPECT_EQ(opts.value().mode, build::Mode::Check);
    EXPECT_EQ(opts.value().root, "/work/bot");
    EXPECT_TRUE(opts.value().verbose);

    Argv other({"build", "--root=/srv"});
    auto parsed = parseCommandLine(other.argc(), other.argv());
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(parsed.value().mode, build::Mode::Build);
    EXPECT_EQ(parsed.value().root, "/srv");
    EXPECT_FALSE(parsed.value().verbose);
}

TEST(CliParse, RejectsMalformedCommandLines)
{
    const std::vector<std::pair<std::vector<std::string>, std::string>> cases = {
        {{}, "no command given"},
        {{"deploy"}, "unknown command 'deploy'"},
        {{"build", "check"}, "unexpected argument: check"},
        {{"--frobnicate", "build"}, "unknown option: --frobnicate"},
        {{"build", "-C"}, "-C requires a directory"},
        {{"build", "--root="}, "--root requires a directory"},
    };
    for (const auto &[args, expected] : cases)
    {
        std::vector<std::string> storage{"screeps-build"};
        storage.insert(storage.end(), args.begin(), args.end());
        std::vector<char *> ptrs;
        for (auto &s : storage)
            ptrs.push_back(s.data());
        ptrs.push_back(nullptr);

        auto opts = parseCommandLine(static_cast<int>(storage.size()), ptrs.data());
        ASSERT_FALSE(opts.hasValue()) << expected;
        EXPECT_EQ(opts.error().code, support::DiagCode::Usage);
        EXPECT_NE(opts.error().message.find(expected), std::string::npos)
            << opts.error().message;
    }
}

TEST(CliRun, UsageErrorExitsWithTwo)
{
    test::FakeProcessRunner runner;
    auto result = runCli(runner, {"publish"});
    EXPECT_EQ(result.status, kExitUsage);
    EXPECT_NE(result.err.find("error: unknown command 'publish'"), std::string::npos);
    EXPECT_NE(result.err.find("Usage: screeps-build"), std::string::npos);
    EXPECT_TRUE(runner.calls.empty());
}

TEST(CliRun, HelpAndVersionGoToStdout)
{
    test::FakeProcessRunner runner;
    auto help = runCli(runner, {"--help"});
    EXPECT_EQ(help.status, 0);
    EXPECT_NE(help.out.find("Usage: screeps-build"), std::string::npos);
    EXPECT_TRUE(help.err.empty());

    auto version = runCli(runner, {"--version"});
    EXPECT_EQ(version.status, 0);
    EXPECT_EQ(version.out.rfind("screeps-build v", 0), 0u);
    EXPECT_TRUE(runner.calls.empty());
}

TEST(CliRun, CheckRunsInGivenRoot)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "screeps.project", "cargo /usr/local/bin/cargo\n");
    test::FakeProcessRunner runner;
    auto result = runCli(runner, {"-C", tmp.path().string(), "check"});
    EXPECT_EQ(result.status, 0) << result.err;
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls.front().program, "/usr/local/bin/cargo");
    EXPECT_EQ(runner.calls.front().workingDir, tmp.path().string());
    EXPECT_TRUE(result.err.empty());
}

TEST(CliRun, VerboseCheckPrintsNotes)
{
    test::TempDir tmp;
    test::FakeProcessRunner runner;
    auto result = runCli(runner, {"--verbose", "--root", tmp.path().string(), "check"});
    EXPECT_EQ(result.status, 0);
    EXPECT_NE(result.err.find("note: running check"), std::string::npos);
}

TEST(CliRun, PipelineFailureExitsWithOne)
{
    test::TempDir tmp;
    test::FakeProcessRunner runner;
    runner.exitCode = 101;
    auto result = runCli(runner, {"-C", tmp.path().string(), "build"});
    EXPECT_EQ(result.status, 1);
    EXPECT_NE(result.err.find("error: "), std::string::npos);
    EXPECT_NE(result.err.find("exit code: 101"), std::string::npos);
}

TEST(CliRun, BadManifestExitsWithOne)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "screeps.project", "release sometimes\n");
    test::FakeProcessRunner runner;
    auto result = runCli(runner, {"-C", tmp.path().string(), "build"});
    EXPECT_EQ(result.status, 1);
    EXPECT_NE(result.err.find("invalid value 'sometimes'"), std::string::npos);
    EXPECT_TRUE(runner.calls.empty());
}
