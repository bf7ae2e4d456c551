#pragma once
#include <libintl.h>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#ifndef PACKAGER_GETTEXT_DEFINED
#define _(String) gettext(String)
#define PACKAGER_GETTEXT_DEFINED
#endif

namespace packager {
    // Mirror a filtered directory tree into a destination.
    struct CopyTask {
        std::string source;
        std::string destination;
        std::string ignore_file = ".gitignore"; // relative to the source root
        bool use_ignore = true;
    };

    // Regex substitution over one file (or a glob of files).
    struct ReplaceTask {
        std::string target;
        std::string pattern;
        std::string replacement;
    };

    // External command through the platform interpreter.
    struct RunTask {
        std::string command;
        std::vector<std::string> args;
    };

    using Task = std::variant<CopyTask, ReplaceTask, RunTask>;

    enum class ErrorKind {
        InvalidPathError,
        SourceNotFoundError,
        TargetNotFoundError,
        EncodingError,
        PatternError,
        IoError,
        ProcessError,
        ConfigurationError,
    };

    [[nodiscard]] const char *to_string(ErrorKind kind);

    /**
     * @brief Exception raised inside executors and the task-script parser.
     *
     * Executors never let it escape: it is caught at the task boundary and
     * turned into a Failure. The Runner catches the parser's ConfigurationError.
     */
    class TaskError : public std::runtime_error {
    public:
        TaskError(ErrorKind kind, const std::string &detail, int exit_code = 0);

        [[nodiscard]] ErrorKind kind() const { return error_kind; }
        [[nodiscard]] const std::string &detail() const { return error_detail; }
        [[nodiscard]] int exit_code() const { return code; }

    private:
        ErrorKind error_kind;
        std::string error_detail;
        int code;
    };

    struct Failure {
        ErrorKind kind = ErrorKind::IoError;
        std::string detail; // offending path, command or message
        int exit_code = 0; // only meaningful for ProcessError
    };

    struct ExecutionResult {
        std::size_t task_index = 0;
        std::optional<Failure> failure; // empty = Success

        [[nodiscard]] bool ok() const { return !failure.has_value(); }

        static ExecutionResult success(std::size_t index);

        static ExecutionResult failed(std::size_t index, const TaskError &e);
    };

    // Runs body and converts whatever it throws into a Failure for task index.
    [[nodiscard]] ExecutionResult guarded(std::size_t index, const std::function<void()> &body);

    // Short human-readable summary, e.g. "copy app -> dist/app".
    [[nodiscard]] std::string describe(const Task &task);

    [[nodiscard]] const char *kind_name(const Task &task);
} // namespace packager
