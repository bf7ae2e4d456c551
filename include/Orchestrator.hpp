#pragma once
#include "PathResolver.hpp"
#include "Task.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace packager {
    enum class RunState {
        NotStarted,
        Running,
        Completed,
        Aborted,
    };

    [[nodiscard]] const char *to_string(RunState state);

    struct RunReport {
        RunState state = RunState::NotStarted;
        std::vector<ExecutionResult> results; // one per attempted task, in order
        std::optional<std::size_t> failed_index; // set when Aborted
        std::optional<Failure> failure; // first failure, set when Aborted
    };

    // Optional observation points, used for console output.
    struct TaskHooks {
        std::function<void(std::size_t, const Task &)> before_task;
        std::function<void(const ExecutionResult &, const Task &)> after_task;
    };

    /**
     * @brief Runs an ordered task list once, strictly in declaration order.
     *
     * State machine: NotStarted -> Running(i) -> Completed | Aborted.
     * Fail-fast: the first Failure stops the run and later tasks are never
     * attempted. Nothing is retried and nothing already done is rolled back.
     */
    class TaskOrchestrator {
    public:
        TaskOrchestrator(std::vector<Task> tasks, ResolvedContext context);

        // Runs every task; may only be called once per orchestrator.
        const RunReport &run(const TaskHooks &hooks = {});

        [[nodiscard]] RunState state() const { return report.state; }

        // Index of the task being executed while Running.
        [[nodiscard]] std::optional<std::size_t> current() const { return current_index; }

        [[nodiscard]] const RunReport &get_report() const { return report; }

        [[nodiscard]] const std::vector<Task> &get_tasks() const { return tasks; }

        [[nodiscard]] const ResolvedContext &get_context() const { return context; }

        // Exhaustive dispatch of one task to its executor.
        [[nodiscard]] static ExecutionResult dispatch(const Task &task, const ResolvedContext &context,
                                                      std::size_t index);

    private:
        const std::vector<Task> tasks;
        const ResolvedContext context;
        RunReport report;
        std::optional<std::size_t> current_index;
    };
} // namespace packager
