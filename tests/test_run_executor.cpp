#include <gtest/gtest.h>
#include "../include/RunExecutor.hpp"
#include "test_util.hpp"

using namespace packager;
namespace fs = std::filesystem;
using testutil::read_file;

namespace
{
    RunTask command(const std::string &cmd, std::vector<std::string> args = {})
    {
        RunTask t;
        t.command = cmd;
        t.args = std::move(args);
        return t;
    }
} // namespace

TEST(RunExecutor, ZeroExitIsSuccess)
{
    testutil::ScratchDir dir;
    EXPECT_TRUE(RunExecutor::execute(command("true"), ResolvedContext{dir.path}).ok());
}

TEST(RunExecutor, NonZeroExitIsProcessError)
{
    testutil::ScratchDir dir;
    const auto r = RunExecutor::execute(command("exit 1"), ResolvedContext{dir.path}, 1);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.task_index, 1u);
    EXPECT_EQ(r.failure->kind, ErrorKind::ProcessError);
    EXPECT_EQ(r.failure->exit_code, 1);

    const auto r7 = RunExecutor::execute(command("exit 7"), ResolvedContext{dir.path});
    ASSERT_FALSE(r7.ok());
    EXPECT_EQ(r7.failure->exit_code, 7);
}

TEST(RunExecutor, RunsInBaseDirectory)
{
    testutil::ScratchDir dir;
    ASSERT_TRUE(RunExecutor::execute(command("pwd -P > where.txt"), ResolvedContext{dir.path}).ok());
    const std::string got = read_file(dir / "where.txt");
    EXPECT_EQ(fs::path(got.substr(0, got.find('\n'))), fs::canonical(dir.path));
}

TEST(RunExecutor, ArgsArePassedUnsplit)
{
    testutil::ScratchDir dir;
    const auto r = RunExecutor::execute(
        command("printf '%s|%s|%s|%s' \"$0\" \"$1\" \"$2\" \"$#\" > args.txt", {"first arg", "$HOME; rm -rf x"}),
        ResolvedContext{dir.path});
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(read_file(dir / "args.txt"), "sh|first arg|$HOME; rm -rf x|2");
}

TEST(RunExecutor, EveryArgReachesPositionalParameters)
{
    testutil::ScratchDir dir;
    ASSERT_TRUE(RunExecutor::execute(command("printf '[%s]' \"$@\" > out.txt", {"one", "two"}),
                                     ResolvedContext{dir.path}).ok());
    EXPECT_EQ(read_file(dir / "out.txt"), "[one][two]");
}

TEST(RunExecutor, WindowsArgumentQuoting)
{
    EXPECT_EQ(quote_windows_arg("plain"), "plain");
    EXPECT_EQ(quote_windows_arg(""), "\"\"");
    EXPECT_EQ(quote_windows_arg("x y"), "\"x y\"");
    EXPECT_EQ(quote_windows_arg("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(quote_windows_arg("C:\\dir with space\\"), "\"C:\\dir with space\\\\\"");
    EXPECT_EQ(quote_windows_arg("C:\\no_space\\"), "C:\\no_space\\");
}

TEST(RunExecutor, ShellFeaturesAreAvailable)
{
    testutil::ScratchDir dir;
    ASSERT_TRUE(RunExecutor::execute(command("echo one && echo two | tr a-z A-Z > out.txt"),
                                     ResolvedContext{dir.path}).ok());
    EXPECT_EQ(read_file(dir / "out.txt"), "TWO\n");
}

TEST(RunExecutor, KilledBySignalMapsTo128PlusSignal)
{
    testutil::ScratchDir dir;
    const ExitStatus st = spawn_platform_command("kill -9 $$", {}, dir.path);
    EXPECT_TRUE(st.spawned);
    EXPECT_EQ(st.code, 128 + 9);
    EXPECT_FALSE(st.success());
}

TEST(RunExecutor, MissingWorkingDirectoryIsNotSpawned)
{
    testutil::ScratchDir dir;
    const ExitStatus st = spawn_platform_command("true", {}, dir / "does-not-exist");
    EXPECT_FALSE(st.spawned);
    EXPECT_FALSE(st.error.empty());

    const auto r = RunExecutor::execute(command("true"), ResolvedContext{dir / "does-not-exist"});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure->kind, ErrorKind::ProcessError);
    EXPECT_EQ(r.failure->exit_code, -1);
}

TEST(RunExecutor, UnknownCommandFailsThroughShell)
{
    testutil::ScratchDir dir;
    const auto r = RunExecutor::execute(command("definitely-not-a-command-xyz"), ResolvedContext{dir.path});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure->kind, ErrorKind::ProcessError);
    EXPECT_EQ(r.failure->exit_code, 127);
}
