#include "../include/Runner.hpp"
#include "../include/Config.hpp"
#include "../include/Console.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

using namespace packager;
using namespace std;

int Runner::exit_code_for(const RunReport &report) {
    switch (report.state) {
        case RunState::Completed: return EXIT_OK;
        case RunState::Aborted:
            if (report.failure && report.failure->kind == ErrorKind::IoError) return EXIT_IO;
            return EXIT_TASK_FAILED;
        case RunState::NotStarted:
        case RunState::Running: break;
    }
    return EXIT_TASK_FAILED;
}

int Runner::run(const RunOptions &options) {
    return run(options, cout);
}

int Runner::run(const RunOptions &options, ostream &log) {
    ConfigParser parser;
    ResolvedContext context;
    try {
        parser.parse_file(options.config_path);
        parser.finalize();
        context = ResolvedContext::from(options.config_path, options.workdir);
        error_code ec;
        if (!filesystem::is_directory(context.base_dir, ec)) {
            throw TaskError(ErrorKind::ConfigurationError,
                            context.base_dir.string() + ": " + _("working directory does not exist"));
        }
    } catch (const TaskError &e) {
        Console::status(log, e.what(), "!!", true);
        return EXIT_CONFIG;
    } catch (const filesystem::filesystem_error &e) {
        Console::status(log, e.what(), "!!", true);
        return EXIT_CONFIG;
    }

    const auto &tasks = parser.get_tasks();
    if (options.dry_run) {
        Console::info(log, string(_("Base directory: ")) + context.base_dir.string());
        parser.print_plan(log);
        return EXIT_OK;
    }

    Console::status(log, string(_("Starting packager: ")) + std::to_string(tasks.size()) + " task(s)", "ok");

    TaskOrchestrator orchestrator(tasks, context);
    TaskHooks hooks;
    hooks.before_task = [&](const size_t i, const Task &task) {
        Console::info(log, "[" + std::to_string(i + 1) + "/" + std::to_string(tasks.size()) + "] " + describe(task));
    };
    hooks.after_task = [&](const ExecutionResult &result, const Task &task) {
        if (result.ok()) Console::status(log, kind_name(task), "ok");
        else Console::status(log, kind_name(task), "!!", true);
    };
    const RunReport &report = orchestrator.run(hooks);

    if (report.state == RunState::Completed) {
        Console::status(log, _("All tasks completed successfully"), "ok");
        return EXIT_OK;
    }

    const size_t idx = report.failed_index.value_or(0);
    string msg = string(_("Task")) + " #" + std::to_string(idx + 1) + " (" + parser.get_origins().at(idx) + ") " + _("failed");
    if (report.failure) msg += ": " + string(to_string(report.failure->kind)) + ": " + report.failure->detail;
    Console::status(log, msg, "!!", true);
    Console::status(log, std::to_string(tasks.size() - idx - 1) + " " + _("task(s) not run"), "!!", true);
    return exit_code_for(report);
}
