#pragma once
#include "PathResolver.hpp"
#include "Task.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace packager {
    struct ExitStatus {
        bool spawned = false; // false: the interpreter could not be started
        int code = -1; // exit code, 128 + N when killed by signal N
        std::string error; // why spawning failed

        [[nodiscard]] bool success() const { return spawned && code == 0; }
    };

    /**
     * @brief Run command through the platform interpreter and wait for it.
     *
     * POSIX: /bin/sh -c command sh args...   Windows: cmd /C command args...
     * args are passed as separate argv entries, never spliced into command;
     * with sh they are $1..$n. Standard streams are inherited. There is no
     * timeout.
     */
    ExitStatus spawn_platform_command(const std::string &command, const std::vector<std::string> &args,
                                      const std::filesystem::path &cwd);

    // One argument as the MS C runtime splits it back: quoted when it holds blanks or quotes, empty as "".
    [[nodiscard]] std::string quote_windows_arg(const std::string &arg);

    class RunExecutor {
    public:
        [[nodiscard]] static ExecutionResult execute(const RunTask &task, const ResolvedContext &context,
                                                     std::size_t index = 0);

        static void run(const RunTask &task, const ResolvedContext &context);
    };
} // namespace packager
