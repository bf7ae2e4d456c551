#pragma once
#include "Task.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace packager {
    // Value of one key=... attribute on a directive.
    struct Attribute {
        std::string value;
        std::vector<std::string> list;
        bool is_list = false;
        bool quoted = false;
    };

    /**
     * @brief Reads a task script into an ordered task list.
     *
     * One directive per line:
     *   @let NAME="value" [NAME2=value]  variables, expanded as ${NAME} afterwards
     *   @include "other.pkg"             relative to the including file
     *   @copy source="..." destination="..." [ignore="..."] [use_ignore=false]
     *   @replace target="..." pattern="..." replacement="..."
     *   @run command="..." [args=["...", "..."]]
     *
     * '#' and '//' start a comment outside double quotes. Every error is a
     * TaskError of kind ConfigurationError carrying "file:line".
     */
    class ConfigParser {
    public:
        void parse_file(const std::string &path);

        void parse_line(const std::string &line);

        // Checks the parsed script is runnable (at least one task).
        void finalize() const;

        [[nodiscard]] const std::vector<Task> &get_tasks() const { return tasks; }

        // "file:line" of each task, same order as get_tasks().
        [[nodiscard]] const std::vector<std::string> &get_origins() const { return origins; }

        // Dry-run listing of the parsed tasks.
        void print_plan(std::ostream &os = std::cout) const;

        // Replaces ${NAME} for every defined NAME; anything else is kept as written.
        [[nodiscard]] std::string expand_vars(const std::string &in) const;

        [[nodiscard]] const std::unordered_map<std::string, std::string> &get_vars() const { return vars; }

        // Splits `key="v" k2=[...] k3=bare` into attributes; values are not expanded.
        [[nodiscard]] std::map<std::string, Attribute> parse_attributes(const std::string &rest) const;

    private:
        using Handler = void (ConfigParser::*)(const std::string &);

        // One script being read; the innermost is back().
        struct Frame {
            std::filesystem::path file;
            int line = 0;
        };

        static const std::map<std::string, Handler> &handlers();

        static std::string strip(const std::string &s);

        static std::string without_comment(const std::string &line);

        static bool valid_name(const std::string &name);

        [[noreturn]] void fail(const std::string &msg) const;

        [[nodiscard]] std::string origin() const;

        void push_task(Task task);

        // Attribute helpers for task directives
        std::string take_string(std::map<std::string, Attribute> &attrs, const std::string &key, bool required,
                                const std::string &fallback = std::string()) const;

        bool take_bool(std::map<std::string, Attribute> &attrs, const std::string &key, bool fallback) const;

        std::vector<std::string> take_list(std::map<std::string, Attribute> &attrs, const std::string &key) const;

        void reject_leftovers(const std::map<std::string, Attribute> &attrs, const std::string &directive) const;

        void on_let(const std::string &rest);

        void on_include(const std::string &rest);

        void on_copy(const std::string &rest);

        void on_replace(const std::string &rest);

        void on_run(const std::string &rest);

        std::vector<Task> tasks;
        std::vector<std::string> origins;
        std::unordered_map<std::string, std::string> vars;
        std::vector<Frame> frames;
        static constexpr std::size_t max_include_depth = 32;
    };
} // namespace packager
