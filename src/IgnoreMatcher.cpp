#include "../include/IgnoreMatcher.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

using namespace packager;
namespace fs = std::filesystem;

// ------------ Helpers ------------
std::vector<std::string> IgnoreMatcher::split_segments(const std::string &path) {
    std::vector<std::string> out;
    std::string cur;
    for (const char c: path) {
        if (c == '/') {
            if (!cur.empty() && cur != ".") out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur != ".") out.push_back(cur);
    return out;
}

bool IgnoreMatcher::has_glob_chars(const std::string &s) {
    return s.find_first_of("*?[") != std::string::npos;
}

// pi points at '['. On success pi is moved past the closing ']'.
// A class with no closing bracket is a literal '['.
bool IgnoreMatcher::match_class(const std::string &pattern, std::size_t &pi, const char c) {
    std::size_t j = pi + 1;
    bool negate = false;
    if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
        negate = true;
        ++j;
    }
    // a ']' right after the opener is a member, not the terminator
    const std::size_t close = pattern.find(']', j < pattern.size() && pattern[j] == ']' ? j + 1 : j);
    if (close == std::string::npos) {
        if (c != '[') return false;
        pi += 1;
        return true;
    }
    bool matched = false;
    for (std::size_t k = j; k < close; ++k) {
        if (k + 2 < close && pattern[k + 1] == '-') {
            if (c >= pattern[k] && c <= pattern[k + 2]) matched = true;
            k += 2;
        } else if (pattern[k] == c) {
            matched = true;
        }
    }
    if (matched == negate) return false;
    pi = close + 1;
    return true;
}

bool IgnoreMatcher::segment_match(const std::string &pattern, const std::string &text) {
    std::size_t p = 0, t = 0;
    std::size_t star_p = std::string::npos, star_t = 0;
    while (t < text.size()) {
        if (p < pattern.size()) {
            const char pc = pattern[p];
            if (pc == '*') {
                star_p = ++p;
                star_t = t;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++t;
                continue;
            }
            if (pc == '[') {
                if (std::size_t q = p; match_class(pattern, q, text[t])) {
                    p = q;
                    ++t;
                    continue;
                }
            } else if (pc == '\\' && p + 1 < pattern.size()) {
                if (pattern[p + 1] == text[t]) {
                    p += 2;
                    ++t;
                    continue;
                }
            } else if (pc == text[t]) {
                ++p;
                ++t;
                continue;
            }
        }
        // mismatch: let the last '*' swallow one more character
        if (star_p != std::string::npos) {
            p = star_p;
            t = ++star_t;
            continue;
        }
        return false;
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool IgnoreMatcher::match_segments(const std::vector<std::string> &pattern, const std::size_t pi,
                                   const std::vector<std::string> &path, const std::size_t si,
                                   const std::size_t path_end) {
    if (pi == pattern.size()) return si == path_end;
    if (pattern[pi] == "**") {
        // "dir/**" matches what is inside dir, not dir itself
        if (pi + 1 == pattern.size()) return si < path_end;
        for (std::size_t k = si; k <= path_end; ++k) {
            if (match_segments(pattern, pi + 1, path, k, path_end)) return true;
        }
        return false;
    }
    if (si == path_end) return false;
    return segment_match(pattern[pi], path[si]) && match_segments(pattern, pi + 1, path, si + 1, path_end);
}

static void collapse_double_stars(std::vector<std::string> &segments) {
    std::vector<std::string> out;
    out.reserve(segments.size());
    for (auto &s: segments) {
        if (s == "**" && !out.empty() && out.back() == "**") continue;
        out.push_back(std::move(s));
    }
    segments.swap(out);
}

// ------------ Core ------------
IgnoreRuleSet IgnoreMatcher::compile(const std::string &contents) {
    IgnoreRuleSet set;
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        // trailing blanks are insignificant unless escaped
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) {
            if (line.back() == ' ' && line.size() >= 2 && line[line.size() - 2] == '\\') {
                line.erase(line.size() - 2, 1);
                break;
            }
            line.pop_back();
        }
        if (line.empty() || line.front() == '#') continue;

        IgnoreRule rule;
        if (line.front() == '!') {
            rule.negated = true;
            line.erase(0, 1);
        } else if (line.size() >= 2 && line[0] == '\\' && (line[1] == '!' || line[1] == '#')) {
            line.erase(0, 1);
        }
        if (!line.empty() && line.back() == '/') {
            rule.directory_only = true;
            while (!line.empty() && line.back() == '/') line.pop_back();
        }
        if (!line.empty() && line.front() == '/') {
            rule.anchored = true;
            while (!line.empty() && line.front() == '/') line.erase(0, 1);
        }
        if (line.empty()) continue;

        rule.source = line;
        rule.segments = split_segments(line);
        if (rule.segments.empty()) continue;
        if (!rule.anchored) rule.segments.insert(rule.segments.begin(), "**");
        collapse_double_stars(rule.segments);
        set.rules.push_back(std::move(rule));
    }
    return set;
}

IgnoreRuleSet IgnoreMatcher::load(const fs::path &file) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw TaskError(ErrorKind::IoError, file.string() + ": " + ec.message());
        }
        return {};
    }
    if (!fs::is_regular_file(file, ec)) {
        throw TaskError(ErrorKind::IoError, file.string() + ": " + _("ignore file is not a regular file"));
    }
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw TaskError(ErrorKind::IoError, file.string() + ": " + _("cannot open ignore file"));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw TaskError(ErrorKind::IoError, file.string() + ": " + _("cannot read ignore file"));
    }
    return compile(buf.str());
}

bool IgnoreMatcher::excluded(const IgnoreRuleSet &rules, const std::vector<std::string> &path,
                             const std::size_t len, const bool is_directory) {
    bool out = false;
    for (const auto &rule: rules.rules) {
        if (rule.directory_only && !is_directory) continue;
        if (match_segments(rule.segments, 0, path, 0, len)) out = !rule.negated;
    }
    return out;
}

bool IgnoreMatcher::included(const IgnoreRuleSet &rules, const std::string &relative_path,
                             const bool is_directory) {
    if (rules.empty()) return true;
    const auto segs = split_segments(relative_path);
    if (segs.empty()) return true;
    for (std::size_t len = 1; len < segs.size(); ++len) {
        if (excluded(rules, segs, len, true)) return false;
    }
    return !excluded(rules, segs, segs.size(), is_directory);
}

bool IgnoreMatcher::glob_match(const std::string &pattern, const std::string &path) {
    auto pat = split_segments(pattern);
    collapse_double_stars(pat);
    const auto segs = split_segments(path);
    return match_segments(pat, 0, segs, 0, segs.size());
}
