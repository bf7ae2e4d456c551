#include "../include/Task.hpp"
#include <filesystem>
#include <new>
#include <sstream>
#include <string>
#include <type_traits>

namespace packager {
    const char *to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidPathError: return "InvalidPathError";
            case ErrorKind::SourceNotFoundError: return "SourceNotFoundError";
            case ErrorKind::TargetNotFoundError: return "TargetNotFoundError";
            case ErrorKind::EncodingError: return "EncodingError";
            case ErrorKind::PatternError: return "PatternError";
            case ErrorKind::IoError: return "IoError";
            case ErrorKind::ProcessError: return "ProcessError";
            case ErrorKind::ConfigurationError: return "ConfigurationError";
        }
        return "UnknownError";
    }

    TaskError::TaskError(const ErrorKind kind, const std::string &detail, const int exit_code)
        : std::runtime_error(std::string(to_string(kind)) + ": " + detail)
        , error_kind(kind)
        , error_detail(detail)
        , code(exit_code) {
    }

    ExecutionResult ExecutionResult::success(const std::size_t index) {
        ExecutionResult r;
        r.task_index = index;
        return r;
    }

    ExecutionResult ExecutionResult::failed(const std::size_t index, const TaskError &e) {
        ExecutionResult r;
        r.task_index = index;
        r.failure = Failure{e.kind(), e.detail(), e.exit_code()};
        return r;
    }

    ExecutionResult guarded(const std::size_t index, const std::function<void()> &body) {
        try {
            body();
            return ExecutionResult::success(index);
        } catch (const TaskError &e) {
            return ExecutionResult::failed(index, e);
        } catch (const std::filesystem::filesystem_error &e) {
            const std::string where = e.path1().empty() ? std::string(e.what()) : e.path1().string() + ": " + e.code().message();
            return ExecutionResult::failed(index, TaskError(ErrorKind::IoError, where));
        } catch (const std::bad_alloc &) {
            return ExecutionResult::failed(index, TaskError(ErrorKind::IoError, _("out of memory")));
        } catch (const std::exception &e) {
            return ExecutionResult::failed(index, TaskError(ErrorKind::IoError, e.what()));
        }
    }

    const char *kind_name(const Task &task) {
        return std::visit([](const auto &t) -> const char * {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, CopyTask>) return "copy";
            else if constexpr (std::is_same_v<T, ReplaceTask>) return "replace";
            else return "run";
        }, task);
    }

    std::string describe(const Task &task) {
        std::ostringstream os;
        std::visit([&os](const auto &t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, CopyTask>) {
                os << "copy " << t.source << " -> " << t.destination;
                if (!t.use_ignore) os << " (no ignore file)";
                else if (t.ignore_file != ".gitignore") os << " (ignore=" << t.ignore_file << ")";
            } else if constexpr (std::is_same_v<T, ReplaceTask>) {
                os << "replace /" << t.pattern << "/ -> \"" << t.replacement << "\" in " << t.target;
            } else {
                os << "run " << t.command;
                for (const auto &a: t.args) os << " '" << a << "'";
            }
        }, task);
        return os.str();
    }
} // namespace packager
