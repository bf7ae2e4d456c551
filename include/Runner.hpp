#pragma once

#include "Orchestrator.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace packager {
    // Process exit codes.
    enum ExitCode : int {
        EXIT_OK = 0,
        EXIT_USAGE = 1,
        EXIT_CONFIG = 2,
        EXIT_TASK_FAILED = 3,
        EXIT_IO = 4,
    };

    struct RunOptions {
        std::string config_path;
        std::optional<std::string> workdir; // overrides the script's directory as base
        bool dry_run = false;
    };

    // Reads a task script and executes its tasks in order.
    // Notes:
    // - Parse errors are reported before anything runs (EXIT_CONFIG).
    // - The first failing task stops the run; its kind picks the exit code.
    // - Progress goes to log as status lines.
    class Runner {
    public:
        static int run(const RunOptions &options, std::ostream &log);

        // Convenience overload writing to std::cout
        static int run(const RunOptions &options);

        [[nodiscard]] static int exit_code_for(const RunReport &report);
    };
} // namespace packager
