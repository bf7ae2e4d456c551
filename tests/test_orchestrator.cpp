#include <gtest/gtest.h>
#include "../include/Orchestrator.hpp"
#include "test_util.hpp"

using namespace packager;
namespace fs = std::filesystem;
using testutil::write_file;

namespace
{
    Task run_task(const std::string &cmd)
    {
        RunTask t;
        t.command = cmd;
        return t;
    }
} // namespace

TEST(Orchestrator, StopsAtFirstFailure)
{
    testutil::ScratchDir dir;
    TaskOrchestrator o({run_task("true"), run_task("exit 1"), run_task("touch marker")}, ResolvedContext{dir.path});
    EXPECT_EQ(o.state(), RunState::NotStarted);

    const RunReport &report = o.run();
    EXPECT_EQ(report.state, RunState::Aborted);
    ASSERT_TRUE(report.failed_index.has_value());
    EXPECT_EQ(*report.failed_index, 1u);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->kind, ErrorKind::ProcessError);
    EXPECT_EQ(report.failure->exit_code, 1);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_TRUE(report.results[0].ok());
    EXPECT_FALSE(report.results[1].ok());
    EXPECT_FALSE(fs::exists(dir / "marker"));
    EXPECT_FALSE(o.current().has_value());
}

TEST(Orchestrator, RunsAllTasksInOrder)
{
    testutil::ScratchDir dir;
    write_file(dir / "src/VERSION", "0.1\n");

    CopyTask copy;
    copy.source = "src";
    copy.destination = "dist";
    ReplaceTask replace;
    replace.target = "dist/VERSION";
    replace.pattern = "0\\.1";
    replace.replacement = "0.2";

    TaskOrchestrator o({copy, replace, run_task("cat dist/VERSION > seen.txt")}, ResolvedContext{dir.path});
    const RunReport &report = o.run();
    EXPECT_EQ(report.state, RunState::Completed);
    EXPECT_FALSE(report.failed_index.has_value());
    EXPECT_FALSE(report.failure.has_value());
    ASSERT_EQ(report.results.size(), 3u);
    for (std::size_t i = 0; i < report.results.size(); ++i) EXPECT_EQ(report.results[i].task_index, i);
    EXPECT_EQ(testutil::read_file(dir / "seen.txt"), "0.2\n");
    EXPECT_EQ(testutil::read_file(dir / "src/VERSION"), "0.1\n");
}

TEST(Orchestrator, EmptyListCompletes)
{
    testutil::ScratchDir dir;
    TaskOrchestrator o({}, ResolvedContext{dir.path});
    EXPECT_EQ(o.run().state, RunState::Completed);
}

TEST(Orchestrator, HooksSeeEveryAttemptedTask)
{
    testutil::ScratchDir dir;
    TaskOrchestrator o({run_task("true"), run_task("false"), run_task("true")}, ResolvedContext{dir.path});

    std::vector<std::size_t> before;
    std::vector<bool> after;
    std::vector<std::size_t> seen_current;
    TaskHooks hooks;
    hooks.before_task = [&](const std::size_t i, const Task &) {
        before.push_back(i);
        EXPECT_EQ(o.state(), RunState::Running);
        if (o.current()) seen_current.push_back(*o.current());
    };
    hooks.after_task = [&](const ExecutionResult &r, const Task &) { after.push_back(r.ok()); };

    o.run(hooks);
    EXPECT_EQ(before, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(after, (std::vector<bool>{true, false}));
    EXPECT_EQ(seen_current, (std::vector<std::size_t>{0, 1}));
}

TEST(Orchestrator, RunTwiceThrows)
{
    testutil::ScratchDir dir;
    TaskOrchestrator o({run_task("true")}, ResolvedContext{dir.path});
    o.run();
    EXPECT_THROW(o.run(), std::logic_error);
}

TEST(Orchestrator, DispatchSelectsExecutor)
{
    testutil::ScratchDir dir;
    CopyTask copy;
    copy.source = "missing";
    copy.destination = "out";
    const auto r = TaskOrchestrator::dispatch(copy, ResolvedContext{dir.path}, 5);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.task_index, 5u);
    EXPECT_EQ(r.failure->kind, ErrorKind::SourceNotFoundError);
}

TEST(Orchestrator, DescribeTasks)
{
    RunTask run;
    run.command = "make";
    run.args = {"all"};
    EXPECT_EQ(describe(run), "run make 'all'");
    EXPECT_STREQ(kind_name(run), "run");
    EXPECT_STREQ(to_string(RunState::Aborted), "Aborted");
    EXPECT_STREQ(to_string(ErrorKind::PatternError), "PatternError");
}
