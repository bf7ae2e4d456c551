#pragma once
#include "IgnoreMatcher.hpp"
#include "PathResolver.hpp"
#include "Task.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace packager {
    struct CopyEntry {
        std::filesystem::path relative; // relative to the source root
        bool symlink = false;
    };

    /**
     * @brief Mirrors the included part of a source tree into a destination.
     *
     * The whole listing is computed before the first write, in lexicographic
     * order of the relative paths, so a destination nested inside the source
     * is never walked into. Files are overwritten; permission bits follow the
     * source. The ignore file itself is not copied.
     */
    class CopyExecutor {
    public:
        [[nodiscard]] static ExecutionResult execute(const CopyTask &task, const ResolvedContext &context,
                                                     std::size_t index = 0);

        // Throwing variant used by execute().
        static void run(const CopyTask &task, const ResolvedContext &context);

        /**
         * @brief List what a copy of root would write.
         * @param skip_file Path under root never listed (the ignore file); may be empty.
         * @param skip_dir Relative directory pruned from the walk (a nested destination); may be empty.
         */
        [[nodiscard]] static std::vector<CopyEntry> plan(const std::filesystem::path &root, const IgnoreRuleSet &rules,
                                                         const std::filesystem::path &skip_file,
                                                         const std::string &skip_dir);

    private:
        static void walk(const std::filesystem::path &root, const std::filesystem::path &dir,
                         const IgnoreRuleSet &rules, const std::string &skip_file,
                         const std::string &skip_dir, std::vector<CopyEntry> &out);

        static void copy_file(const std::filesystem::path &from, const std::filesystem::path &to);

        static void copy_link(const std::filesystem::path &from, const std::filesystem::path &to);
    };
} // namespace packager
