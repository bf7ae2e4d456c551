#pragma once
#include "PathResolver.hpp"
#include "Task.hpp"
#include <re2/re2.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace packager {
    /**
     * @brief Regex substitution over a file, all-or-nothing.
     *
     * Patterns use RE2 syntax and match in time linear in the input, so a
     * long single-line file cannot exhaust the stack. Every non-overlapping
     * match is replaced in one left-to-right pass.
     * Zero matches is a success and the file is not touched at all. The new
     * content goes to a temporary file next to the target which is then renamed
     * over it, so a failure leaves the original bytes in place.
     */
    class ReplaceExecutor {
    public:
        [[nodiscard]] static ExecutionResult execute(const ReplaceTask &task, const ResolvedContext &context,
                                                     std::size_t index = 0);

        static void run(const ReplaceTask &task, const ResolvedContext &context);

        // Compiles pattern or throws PatternError.
        [[nodiscard]] static std::unique_ptr<RE2> compile(const std::string &pattern);

        /**
         * @brief Replace every match of re in text.
         * @param replacement Template: $0 or $& (whole match), $1..$99, ${N}, $$ for a literal '$'.
         * @param count Receives the number of matches when not null.
         */
        [[nodiscard]] static std::string replace_all(const std::string &text, const RE2 &re,
                                                     const std::string &replacement, std::size_t *count = nullptr);

        // groups[0] is the whole match; a group that did not take part has a null data().
        [[nodiscard]] static std::string expand_template(const std::vector<re2::StringPiece> &groups,
                                                         const std::string &replacement);

        [[nodiscard]] static bool valid_utf8(const std::string &bytes);

        // One file, or every regular file matched by a glob in the path. Sorted.
        [[nodiscard]] static std::vector<std::filesystem::path> expand_targets(const std::filesystem::path &target);

        static void write_atomically(const std::filesystem::path &target, const std::string &content);

    private:
        static std::string read_text(const std::filesystem::path &file);
    };
} // namespace packager
