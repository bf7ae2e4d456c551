#include "../include/RunExecutor.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace packager {
    namespace fs = std::filesystem;

    std::string quote_windows_arg(const std::string &arg) {
        if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) return arg;
        std::string out = "\"";
        std::size_t backslashes = 0;
        for (const char c: arg) {
            if (c == '\\') {
                ++backslashes;
                continue;
            }
            // backslashes only escape when a quote follows them
            if (c == '"') out.append(backslashes * 2 + 1, '\\');
            else out.append(backslashes, '\\');
            backslashes = 0;
            out.push_back(c);
        }
        out.append(backslashes * 2, '\\');
        out.push_back('"');
        return out;
    }

#ifdef _WIN32
    ExitStatus spawn_platform_command(const std::string &command, const std::vector<std::string> &args,
                                      const fs::path &cwd) {
        ExitStatus st;
        std::error_code ec;
        const fs::path previous = fs::current_path(ec);
        if (ec) {
            st.error = ec.message();
            return st;
        }
        fs::current_path(cwd, ec);
        if (ec) {
            st.error = cwd.string() + ": " + ec.message();
            return st;
        }
        std::vector<std::string> quoted;
        quoted.reserve(args.size());
        for (const auto &a: args) quoted.push_back(quote_windows_arg(a));
        std::vector<const char *> argv{"cmd", "/C", command.c_str()};
        for (const auto &a: quoted) argv.push_back(a.c_str());
        argv.push_back(nullptr);
        std::cout.flush();
        const intptr_t rc = _spawnvp(_P_WAIT, "cmd", argv.data());
        const int saved = errno;
        fs::current_path(previous, ec);
        if (rc == -1) {
            st.error = std::strerror(saved);
            return st;
        }
        st.spawned = true;
        st.code = static_cast<int>(rc);
        return st;
    }
#else
    ExitStatus spawn_platform_command(const std::string &command, const std::vector<std::string> &args,
                                      const fs::path &cwd) {
        ExitStatus st;
        std::error_code ec;
        if (!fs::is_directory(cwd, ec)) {
            st.error = cwd.string() + ": " + _("working directory does not exist");
            return st;
        }

        // argv is built before fork: the child only calls async-signal-safe functions
        std::vector<char *> argv;
        argv.reserve(args.size() + 5);
        argv.push_back(const_cast<char *>("sh"));
        argv.push_back(const_cast<char *>("-c"));
        argv.push_back(const_cast<char *>(command.c_str()));
        argv.push_back(const_cast<char *>("sh")); // $0, so args start at $1
        for (const auto &a: args) argv.push_back(const_cast<char *>(a.c_str()));
        argv.push_back(nullptr);
        const std::string dir = cwd.string();

        std::cout.flush();
        std::cerr.flush();
        std::fflush(nullptr);

        const pid_t pid = fork();
        if (pid < 0) {
            st.error = std::string("fork: ") + std::strerror(errno);
            return st;
        }
        if (pid == 0) {
            if (chdir(dir.c_str()) != 0) _exit(127);
            execv("/bin/sh", argv.data());
            _exit(127);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno == EINTR) continue;
            st.error = std::string("waitpid: ") + std::strerror(errno);
            return st;
        }
        st.spawned = true;
        if (WIFEXITED(status)) st.code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status)) st.code = 128 + WTERMSIG(status);
        return st;
    }
#endif

    void RunExecutor::run(const RunTask &task, const ResolvedContext &context) {
        const ExitStatus st = spawn_platform_command(task.command, task.args, context.base_dir);
        if (!st.spawned) {
            throw TaskError(ErrorKind::ProcessError, task.command + ": " + st.error, -1);
        }
        if (st.code != 0) {
            throw TaskError(ErrorKind::ProcessError,
                            task.command + ": " + _("exited with status") + " " + std::to_string(st.code), st.code);
        }
    }

    ExecutionResult RunExecutor::execute(const RunTask &task, const ResolvedContext &context, const std::size_t index) {
        return guarded(index, [&] { run(task, context); });
    }
} // namespace packager
