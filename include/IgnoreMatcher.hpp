#pragma once
#include "Task.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace packager {
    /// One compiled line of an ignore file.
    struct IgnoreRule {
        /// The pattern as written, without the '!' and trailing '/' markers.
        std::string source;
        /// Pattern split on '/'. Unanchored patterns start with a "**" segment.
        std::vector<std::string> segments;
        bool negated = false;
        bool directory_only = false;
        bool anchored = false;
    };

    /**
     * @brief Ordered rules of a single ignore file.
     *
     * Built at the start of a copy and dropped at its end; never shared between
     * tasks. An empty set includes everything.
     */
    struct IgnoreRuleSet {
        std::vector<IgnoreRule> rules;

        [[nodiscard]] bool empty() const { return rules.empty(); }
    };

    /**
     * @brief gitignore-subset matcher.
     *
     * Supported syntax: '#' comments, '!' negation, trailing '/' for
     * directories only, leading '/' to anchor at the root, and the globs
     * '*', '?', '[...]' and '**'. The last matching rule wins and a path with no
     * matching rule is included. Every ancestor directory is tested before the
     * leaf, so an excluded directory excludes its whole subtree.
     */
    class IgnoreMatcher {
    public:
        static IgnoreRuleSet compile(const std::string &contents);

        /**
         * @brief Read and compile an ignore file.
         * @return An empty rule set when the file does not exist.
         * @throws TaskError IoError when the file exists but cannot be read.
         */
        static IgnoreRuleSet load(const std::filesystem::path &file);

        /**
         * @brief Decide whether a path survives the rule set.
         * @param relative_path Path relative to the tree root, '/' separated.
         * @param is_directory Whether the leaf itself is a directory.
         */
        [[nodiscard]] static bool included(const IgnoreRuleSet &rules, const std::string &relative_path,
                                           bool is_directory);

        // Whole-path glob match ('/' separated), '**' spanning segments.
        [[nodiscard]] static bool glob_match(const std::string &pattern, const std::string &path);

        // Single-segment match: '*' and '?' never cross '/'.
        [[nodiscard]] static bool segment_match(const std::string &pattern, const std::string &text);

        [[nodiscard]] static bool has_glob_chars(const std::string &s);

    private:
        static std::vector<std::string> split_segments(const std::string &path);

        static bool match_segments(const std::vector<std::string> &pattern, std::size_t pi,
                                   const std::vector<std::string> &path, std::size_t si, std::size_t path_end);

        static bool excluded(const IgnoreRuleSet &rules, const std::vector<std::string> &path, std::size_t len,
                             bool is_directory);

        static bool match_class(const std::string &pattern, std::size_t &pi, char c);
    };
} // namespace packager
