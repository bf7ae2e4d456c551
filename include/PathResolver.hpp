#pragma once
#include "Task.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace packager {
    /**
     * @brief The single base directory of a run.
     *
     * Either the explicit working directory (made absolute against the
     * process's current directory) or the directory holding the task script.
     * Built once by the Runner and shared read-only by every task.
     */
    struct ResolvedContext {
        std::filesystem::path base_dir;

        static ResolvedContext from(const std::string &config_path, const std::optional<std::string> &workdir);
    };

    class PathResolver {
    public:
        // Absolute paths are returned unchanged; relative ones are joined to the
        // base directory. Empty input throws InvalidPathError. ".." is allowed.
        static std::filesystem::path resolve(const std::string &declared, const ResolvedContext &context);
    };
} // namespace packager
