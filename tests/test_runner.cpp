#include <gtest/gtest.h>
#include <sstream>
#include "../include/Runner.hpp"
#include "test_util.hpp"

using namespace packager;
namespace fs = std::filesystem;
using testutil::read_file;
using testutil::write_file;

namespace
{
    RunOptions options_for(const fs::path &script)
    {
        RunOptions o;
        o.config_path = script.string();
        return o;
    }
} // namespace

TEST(Runner, PackagesAndReportsSuccess)
{
    testutil::ScratchDir dir;
    write_file(dir / "app/a.txt", "a\n");
    write_file(dir / "app/b.log", "b\n");
    write_file(dir / "app/sub/c.txt", "c\n");
    write_file(dir / "app/VERSION", "version=1.0.0\n");
    write_file(dir / "app/.gitignore", "*.log\n");
    write_file(dir / "package.pkg",
               "@copy source=\"app\" destination=\"dist\"\n"
               "@replace target=\"dist/VERSION\" pattern=\"version=\\\\d+\\\\.\\\\d+\\\\.\\\\d+\" replacement=\"version=2.0.0\"\n"
               "@run command=\"ls dist > listing.txt\"\n");

    std::ostringstream log;
    EXPECT_EQ(Runner::run(options_for(dir / "package.pkg"), log), EXIT_OK);
    EXPECT_EQ(testutil::list_tree(dir / "dist"), (std::set<std::string>{"VERSION", "a.txt", "sub/c.txt"}));
    EXPECT_EQ(read_file(dir / "dist/VERSION"), "version=2.0.0\n");
    EXPECT_TRUE(fs::exists(dir / "listing.txt"));
    EXPECT_NE(log.str().find("All tasks completed successfully"), std::string::npos);
}

TEST(Runner, FailingTaskStopsRun)
{
    testutil::ScratchDir dir;
    write_file(dir / "package.pkg",
               "@run command=\"true\"\n"
               "@run command=\"exit 1\"\n"
               "@run command=\"touch marker\"\n");

    std::ostringstream log;
    EXPECT_EQ(Runner::run(options_for(dir / "package.pkg"), log), EXIT_TASK_FAILED);
    EXPECT_FALSE(fs::exists(dir / "marker"));
    const std::string out = log.str();
    // progress and failure lines count tasks from 1
    EXPECT_NE(out.find("[2/3] run exit 1"), std::string::npos);
    EXPECT_NE(out.find("Task #2"), std::string::npos);
    EXPECT_EQ(out.find("[3/3]"), std::string::npos);
    EXPECT_NE(out.find("package.pkg:2"), std::string::npos);
    EXPECT_NE(out.find("ProcessError"), std::string::npos);
    EXPECT_NE(out.find("1 task(s) not run"), std::string::npos);
}

TEST(Runner, IoFailureHasOwnExitCode)
{
    testutil::ScratchDir dir;
    write_file(dir / "app/a.txt", "a\n");
    fs::create_directories(dir / "dist/a.txt");
    write_file(dir / "package.pkg", "@copy source=\"app\" destination=\"dist\"\n");

    std::ostringstream log;
    EXPECT_EQ(Runner::run(options_for(dir / "package.pkg"), log), EXIT_IO);
    EXPECT_NE(log.str().find("IoError"), std::string::npos);
}

TEST(Runner, ConfigurationErrorsRunNothing)
{
    testutil::ScratchDir dir;
    write_file(dir / "package.pkg",
               "@run command=\"touch marker\"\n"
               "@copy source=\"a\"\n");

    std::ostringstream log;
    EXPECT_EQ(Runner::run(options_for(dir / "package.pkg"), log), EXIT_CONFIG);
    EXPECT_FALSE(fs::exists(dir / "marker"));
    EXPECT_NE(log.str().find("package.pkg:2"), std::string::npos);
}

TEST(Runner, MissingScriptIsConfigurationError)
{
    testutil::ScratchDir dir;
    std::ostringstream log;
    EXPECT_EQ(Runner::run(options_for(dir / "absent.pkg"), log), EXIT_CONFIG);
}

TEST(Runner, MissingWorkdirIsConfigurationError)
{
    testutil::ScratchDir dir;
    write_file(dir / "package.pkg", "@run command=\"true\"\n");
    auto options = options_for(dir / "package.pkg");
    options.workdir = (dir / "nowhere").string();

    std::ostringstream log;
    EXPECT_EQ(Runner::run(options, log), EXIT_CONFIG);
}

TEST(Runner, WorkdirIsBaseForRelativePaths)
{
    testutil::ScratchDir dir;
    write_file(dir / "scripts/package.pkg", "@run command=\"touch here\"\n");
    fs::create_directories(dir / "work");
    auto options = options_for(dir / "scripts/package.pkg");
    options.workdir = (dir / "work").string();

    std::ostringstream log;
    EXPECT_EQ(Runner::run(options, log), EXIT_OK);
    EXPECT_TRUE(fs::exists(dir / "work/here"));
    EXPECT_FALSE(fs::exists(dir / "scripts/here"));
}

TEST(Runner, DryRunOnlyPrintsPlan)
{
    testutil::ScratchDir dir;
    write_file(dir / "package.pkg",
               "@copy source=\"app\" destination=\"dist\"\n"
               "@run command=\"touch marker\"\n");
    auto options = options_for(dir / "package.pkg");
    options.dry_run = true;

    std::ostringstream log;
    EXPECT_EQ(Runner::run(options, log), EXIT_OK);
    EXPECT_FALSE(fs::exists(dir / "marker"));
    EXPECT_FALSE(fs::exists(dir / "dist"));
    const std::string out = log.str();
    EXPECT_NE(out.find("2 task(s)"), std::string::npos);
    EXPECT_NE(out.find("copy app -> dist"), std::string::npos);
    EXPECT_NE(out.find("run touch marker"), std::string::npos);
}

TEST(Runner, ExitCodeForReport)
{
    RunReport report;
    report.state = RunState::Completed;
    EXPECT_EQ(Runner::exit_code_for(report), EXIT_OK);
    report.state = RunState::Aborted;
    report.failure = Failure{ErrorKind::PatternError, "x", 0};
    EXPECT_EQ(Runner::exit_code_for(report), EXIT_TASK_FAILED);
    report.failure = Failure{ErrorKind::IoError, "x", 0};
    EXPECT_EQ(Runner::exit_code_for(report), EXIT_IO);
}
