#include "../include/Config.hpp"
#include <cctype>
#include <fstream>
#include <system_error>

using namespace packager;
namespace fs = std::filesystem;

namespace {
    const char *const blanks = " \t\r\n\f\v";

    bool is_blank(const char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
} // namespace

// ------------ Lexing ------------
std::string ConfigParser::strip(const std::string &s) {
    const std::size_t first = s.find_first_not_of(blanks);
    if (first == std::string::npos) return {};
    return s.substr(first, s.find_last_not_of(blanks) - first + 1);
}

// '#' and '//' open a comment unless they sit inside a double-quoted value.
std::string ConfigParser::without_comment(const std::string &line) {
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (quoted) {
            if (line[i] == '\\') ++i;
            else if (line[i] == '"') quoted = false;
        } else if (line[i] == '"') {
            quoted = true;
        } else if (line[i] == '#' || line.compare(i, 2, "//") == 0) {
            return line.substr(0, i);
        }
    }
    return line;
}

bool ConfigParser::valid_name(const std::string &name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) return false;
    for (const char c: name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::string ConfigParser::origin() const {
    if (frames.empty()) return "<input>";
    return frames.back().file.string() + ":" + std::to_string(frames.back().line);
}

void ConfigParser::fail(const std::string &msg) const {
    throw TaskError(ErrorKind::ConfigurationError, origin() + ": " + msg);
}

std::string ConfigParser::expand_vars(const std::string &in) const {
    std::string out;
    out.reserve(in.size());
    std::size_t i = 0;
    while (i < in.size()) {
        if (in.compare(i, 2, "${") == 0) {
            if (const std::size_t close = in.find('}', i + 2); close != std::string::npos) {
                if (const auto it = vars.find(in.substr(i + 2, close - i - 2)); it != vars.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(in[i++]);
    }
    return out;
}

std::map<std::string, Attribute> ConfigParser::parse_attributes(const std::string &rest) const {
    std::map<std::string, Attribute> out;
    const std::size_t n = rest.size();
    std::size_t i = 0;
    auto skip_ws = [&] {
        while (i < n && is_blank(rest[i])) ++i;
    };
    // i points at the opening quote; only \" and \\ are escapes
    auto read_quoted = [&]() -> std::string {
        ++i;
        std::string v;
        while (i < n && rest[i] != '"') {
            if (rest[i] == '\\' && i + 1 < n && (rest[i + 1] == '"' || rest[i + 1] == '\\')) {
                v.push_back(rest[i + 1]);
                i += 2;
                continue;
            }
            v.push_back(rest[i++]);
        }
        if (i >= n) fail(_("Unterminated string"));
        ++i;
        return v;
    };

    while (true) {
        skip_ws();
        if (i >= n) break;
        const std::size_t k = i;
        while (i < n && (std::isalnum(static_cast<unsigned char>(rest[i])) || rest[i] == '_')) ++i;
        if (k == i) fail(std::string(_("Expected attribute name near: ")) + rest.substr(k));
        const std::string key = rest.substr(k, i - k);
        skip_ws();
        if (i >= n || rest[i] != '=') fail("Expected '=' after " + key);
        ++i;
        skip_ws();

        Attribute a;
        if (i < n && rest[i] == '"') {
            a.value = read_quoted();
            a.quoted = true;
        } else if (i < n && rest[i] == '[') {
            a.is_list = true;
            ++i;
            skip_ws();
            if (i < n && rest[i] == ']') {
                ++i;
            } else {
                for (;;) {
                    skip_ws();
                    if (i >= n || rest[i] != '"') fail("List items of " + key + " must be quoted strings");
                    a.list.push_back(read_quoted());
                    skip_ws();
                    if (i < n && rest[i] == ',') {
                        ++i;
                        continue;
                    }
                    if (i < n && rest[i] == ']') {
                        ++i;
                        break;
                    }
                    fail("Missing closing ']' for " + key);
                }
            }
        } else {
            const std::size_t v = i;
            while (i < n && !is_blank(rest[i])) ++i;
            a.value = rest.substr(v, i - v);
            if (a.value.empty()) fail("Missing value for " + key);
        }
        if (i < n && !is_blank(rest[i])) {
            fail("Unexpected text after " + key + ": " + rest.substr(i));
        }
        if (!out.emplace(key, std::move(a)).second) fail("Duplicate attribute: " + key);
    }
    return out;
}

// ------------ Reading ------------
const std::map<std::string, ConfigParser::Handler> &ConfigParser::handlers() {
    static const std::map<std::string, Handler> table{
        {"@let", &ConfigParser::on_let},
        {"@include", &ConfigParser::on_include},
        {"@copy", &ConfigParser::on_copy},
        {"@replace", &ConfigParser::on_replace},
        {"@run", &ConfigParser::on_run},
    };
    return table;
}

void ConfigParser::parse_file(const std::string &path) {
    if (path.empty()) fail(_("Empty script path"));
    const fs::path file = fs::absolute(path).lexically_normal();
    if (frames.size() >= max_include_depth) fail(_("Include depth exceeded"));
    for (const auto &frame: frames) {
        if (frame.file == file) fail(std::string(_("Circular include detected: ")) + file.string());
    }

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) fail(std::string(_("Failed to open file: ")) + file.string());
    std::ifstream in(file);
    if (!in.is_open()) fail(std::string(_("Failed to open file: ")) + file.string());

    frames.push_back({file, 0});
    struct FramePop {
        std::vector<Frame> &stack;
        ~FramePop() { stack.pop_back(); }
    } pop{frames};

    std::string line;
    while (std::getline(in, line)) {
        ++frames.back().line;
        parse_line(line);
    }
    if (in.bad()) fail(std::string(_("Failed to read file: ")) + file.string());
}

void ConfigParser::parse_line(const std::string &line) {
    const std::string s = strip(without_comment(line));
    if (s.empty()) return;
    if (s.front() != '@') fail(std::string(_("Expected a directive, got: ")) + s);

    const std::size_t cut = s.find_first_of(blanks);
    const std::string name = s.substr(0, cut);
    const std::string rest = cut == std::string::npos ? std::string() : strip(s.substr(cut));

    const auto &table = handlers();
    const auto it = table.find(name);
    if (it == table.end()) fail(std::string(_("Unknown directive: ")) + name);
    (this->*(it->second))(rest);
}

void ConfigParser::on_let(const std::string &rest) {
    auto attrs = parse_attributes(rest);
    if (attrs.size() != 1) fail(_("@let defines exactly one NAME=value"));
    auto &[name, attr] = *attrs.begin();
    if (!valid_name(name)) fail("@let invalid name: " + name);
    if (attr.is_list) fail("@let " + name + " expects a single value");
    vars[name] = expand_vars(attr.value);
}

void ConfigParser::on_include(const std::string &rest) {
    std::string target = rest;
    if (target.size() >= 2 && target.front() == '"' && target.back() == '"') {
        target = target.substr(1, target.size() - 2);
    }
    target = expand_vars(target);
    if (target.empty()) fail(_("@include expects a path"));

    // relative to the including script, or to the process when there is none
    const fs::path base = frames.empty() ? fs::current_path() : frames.back().file.parent_path();
    parse_file((base / target).string());
}

// ------------ Tasks ------------
std::string ConfigParser::take_string(std::map<std::string, Attribute> &attrs, const std::string &key,
                                      const bool required, const std::string &fallback) const {
    const auto it = attrs.find(key);
    if (it == attrs.end()) {
        if (required) fail("Missing " + key + "=\"...\"");
        return fallback;
    }
    if (it->second.is_list) fail(key + " expects a string, not a list");
    std::string v = expand_vars(it->second.value);
    attrs.erase(it);
    return v;
}

bool ConfigParser::take_bool(std::map<std::string, Attribute> &attrs, const std::string &key,
                             const bool fallback) const {
    const auto it = attrs.find(key);
    if (it == attrs.end()) return fallback;
    if (it->second.is_list) fail(key + " expects true or false");
    std::string v;
    for (const char c: expand_vars(it->second.value)) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    attrs.erase(it);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    fail(key + " expects true or false, got: " + v);
}

std::vector<std::string> ConfigParser::take_list(std::map<std::string, Attribute> &attrs,
                                                 const std::string &key) const {
    const auto it = attrs.find(key);
    if (it == attrs.end()) return {};
    if (!it->second.is_list) fail(key + " expects a list, e.g. " + key + "=[\"a\", \"b\"]");
    std::vector<std::string> out;
    out.reserve(it->second.list.size());
    for (const auto &item: it->second.list) out.push_back(expand_vars(item));
    attrs.erase(it);
    return out;
}

void ConfigParser::reject_leftovers(const std::map<std::string, Attribute> &attrs, const std::string &directive) const {
    if (!attrs.empty()) fail("Unknown attribute '" + attrs.begin()->first + "' for " + directive);
}

void ConfigParser::push_task(Task task) {
    tasks.push_back(std::move(task));
    origins.push_back(origin());
}

void ConfigParser::on_copy(const std::string &rest) {
    auto attrs = parse_attributes(rest);
    CopyTask t;
    t.source = take_string(attrs, "source", true);
    t.destination = take_string(attrs, "destination", true);
    t.ignore_file = take_string(attrs, "ignore", false, t.ignore_file);
    t.use_ignore = take_bool(attrs, "use_ignore", true);
    reject_leftovers(attrs, "@copy");
    if (t.source.empty() || t.destination.empty()) fail("@copy paths must not be empty");
    push_task(std::move(t));
}

void ConfigParser::on_replace(const std::string &rest) {
    auto attrs = parse_attributes(rest);
    ReplaceTask t;
    t.target = take_string(attrs, "target", true);
    t.pattern = take_string(attrs, "pattern", true);
    t.replacement = take_string(attrs, "replacement", true);
    reject_leftovers(attrs, "@replace");
    if (t.target.empty()) fail("@replace target must not be empty");
    push_task(std::move(t));
}

void ConfigParser::on_run(const std::string &rest) {
    auto attrs = parse_attributes(rest);
    RunTask t;
    t.command = take_string(attrs, "command", true);
    t.args = take_list(attrs, "args");
    reject_leftovers(attrs, "@run");
    if (strip(t.command).empty()) fail("@run command must not be empty");
    push_task(std::move(t));
}

void ConfigParser::finalize() const {
    if (tasks.empty()) fail(_("No task declared"));
}

void ConfigParser::print_plan(std::ostream &os) const {
    os << "[packager] Plan: " << tasks.size() << " task(s)\n";
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        os << "  #" << i + 1 << " " << describe(tasks[i]);
        if (i < origins.size()) os << "  (" << origins[i] << ")";
        os << "\n";
    }
    os << std::flush;
}
