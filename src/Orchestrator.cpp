#include "../include/Orchestrator.hpp"
#include "../include/CopyExecutor.hpp"
#include "../include/ReplaceExecutor.hpp"
#include "../include/RunExecutor.hpp"
#include <stdexcept>
#include <type_traits>
#include <utility>

using namespace packager;

const char *packager::to_string(const RunState state) {
    switch (state) {
        case RunState::NotStarted: return "NotStarted";
        case RunState::Running: return "Running";
        case RunState::Completed: return "Completed";
        case RunState::Aborted: return "Aborted";
    }
    return "Unknown";
}

TaskOrchestrator::TaskOrchestrator(std::vector<Task> p_tasks, ResolvedContext p_context)
    : tasks(std::move(p_tasks))
    , context(std::move(p_context)) {
}

ExecutionResult TaskOrchestrator::dispatch(const Task &task, const ResolvedContext &context, const std::size_t index) {
    return std::visit([&](const auto &t) -> ExecutionResult {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, CopyTask>) return CopyExecutor::execute(t, context, index);
        else if constexpr (std::is_same_v<T, ReplaceTask>) return ReplaceExecutor::execute(t, context, index);
        else if constexpr (std::is_same_v<T, RunTask>) return RunExecutor::execute(t, context, index);
        else static_assert(!sizeof(T), "unhandled task kind");
    }, task);
}

const RunReport &TaskOrchestrator::run(const TaskHooks &hooks) {
    if (report.state != RunState::NotStarted) {
        throw std::logic_error("TaskOrchestrator::run called twice");
    }
    report.state = RunState::Running;
    report.results.reserve(tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        current_index = i;
        if (hooks.before_task) hooks.before_task(i, tasks[i]);
        ExecutionResult result = dispatch(tasks[i], context, i);
        report.results.push_back(result);
        if (hooks.after_task) hooks.after_task(result, tasks[i]);
        if (!result.ok()) {
            report.state = RunState::Aborted;
            report.failed_index = i;
            report.failure = result.failure;
            current_index.reset();
            return report;
        }
    }
    current_index.reset();
    report.state = RunState::Completed;
    return report;
}
