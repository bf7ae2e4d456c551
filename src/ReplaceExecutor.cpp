#include "../include/ReplaceExecutor.hpp"
#include "../include/IgnoreMatcher.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

using namespace packager;
namespace fs = std::filesystem;

namespace {
    // Removes the temporary file unless it was renamed into place.
    struct TempFileGuard {
        fs::path path;
        bool armed = true;

        explicit TempFileGuard(fs::path p) : path(std::move(p)) {
        }

        ~TempFileGuard() {
            if (!armed) return;
            std::error_code ec;
            fs::remove(path, ec);
        }
    };

    std::atomic<unsigned> temp_counter{0};

    fs::path make_temp_path(const fs::path &target) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path name = target.filename();
        name += ".tmp." + std::to_string(stamp) + "." + std::to_string(temp_counter++);
        return target.parent_path() / name;
    }
} // namespace

bool ReplaceExecutor::valid_utf8(const std::string &bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t len;
        unsigned cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string ReplaceExecutor::expand_template(const std::vector<re2::StringPiece> &groups,
                                             const std::string &replacement) {
    std::string out;
    out.reserve(replacement.size());
    const auto group = [&](const std::size_t g) {
        if (g < groups.size() && groups[g].data() != nullptr) out.append(groups[g].data(), groups[g].size());
    };
    for (std::size_t i = 0; i < replacement.size(); ++i) {
        const char c = replacement[i];
        if (c != '$' || i + 1 >= replacement.size()) {
            out.push_back(c);
            continue;
        }
        const char next = replacement[i + 1];
        if (next == '$') {
            out.push_back('$');
            ++i;
        } else if (next == '&') {
            group(0);
            ++i;
        } else if (std::isdigit(static_cast<unsigned char>(next))) {
            std::size_t g = static_cast<std::size_t>(next - '0');
            std::size_t used = 1;
            // two digits only when they name an existing group
            if (i + 2 < replacement.size() && std::isdigit(static_cast<unsigned char>(replacement[i + 2]))) {
                if (const std::size_t two = g * 10 + static_cast<std::size_t>(replacement[i + 2] - '0'); two < groups.size()) {
                    g = two;
                    used = 2;
                }
            }
            group(g);
            i += used;
        } else if (next == '{') {
            const std::size_t close = replacement.find('}', i + 2);
            const std::string inner = close == std::string::npos ? std::string() : replacement.substr(i + 2, close - i - 2);
            if (inner.empty() || !std::all_of(inner.begin(), inner.end(), [](const char d) {
                return std::isdigit(static_cast<unsigned char>(d));
            }) || inner.size() > 2) {
                out.push_back(c);
                continue;
            }
            group(static_cast<std::size_t>(std::stoi(inner)));
            i = close;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::unique_ptr<RE2> ReplaceExecutor::compile(const std::string &pattern) {
    RE2::Options options;
    options.set_log_errors(false);
    auto re = std::make_unique<RE2>(pattern, options);
    if (!re->ok()) throw TaskError(ErrorKind::PatternError, pattern + ": " + re->error());
    return re;
}

std::string ReplaceExecutor::replace_all(const std::string &text, const RE2 &re,
                                         const std::string &replacement, std::size_t *count) {
    std::string out;
    out.reserve(text.size());
    std::vector<re2::StringPiece> groups(static_cast<std::size_t>(re.NumberOfCapturingGroups()) + 1);
    const re2::StringPiece input(text);
    std::size_t n = 0;
    std::size_t copied = 0; // text before this offset is already in out
    std::size_t pos = 0;
    std::optional<std::size_t> previous_end;

    // width of the UTF-8 sequence starting at i, so an empty match never splits a character
    const auto step = [&](const std::size_t i) -> std::size_t {
        std::size_t k = i + 1;
        while (k < text.size() && (static_cast<unsigned char>(text[k]) & 0xC0) == 0x80) ++k;
        return k - i;
    };

    while (pos <= text.size()) {
        if (!re.Match(input, pos, text.size(), RE2::UNANCHORED, groups.data(), static_cast<int>(groups.size()))) break;
        const auto start = static_cast<std::size_t>(groups[0].data() - text.data());
        const std::size_t end = start + groups[0].size();

        // an empty match right where the previous one ended is not a new match
        if (start == end && previous_end && *previous_end == start) {
            if (start >= text.size()) break;
            pos = start + step(start);
            continue;
        }

        out.append(text, copied, start - copied);
        out += expand_template(groups, replacement);
        copied = end;
        previous_end = end;
        ++n;
        if (start == end) {
            if (end >= text.size()) break;
            pos = end + step(end);
        } else {
            pos = end;
        }
    }
    out.append(text, copied, std::string::npos);
    if (count) *count = n;
    return out;
}

std::vector<fs::path> ReplaceExecutor::expand_targets(const fs::path &target) {
    std::error_code ec;
    if (!IgnoreMatcher::has_glob_chars(target.generic_string())) {
        if (!fs::is_regular_file(target, ec)) throw TaskError(ErrorKind::TargetNotFoundError, target.string());
        return {target};
    }

    // split into the literal directory prefix and the glob part
    fs::path base;
    fs::path pattern;
    bool globbing = false;
    for (const auto &part: target) {
        if (!globbing && !IgnoreMatcher::has_glob_chars(part.string())) base /= part;
        else {
            globbing = true;
            pattern /= part;
        }
    }
    if (base.empty()) base = ".";
    if (!fs::is_directory(base, ec)) throw TaskError(ErrorKind::TargetNotFoundError, target.string());

    const std::string pat = pattern.generic_string();
    const bool deep = pat.find("**") != std::string::npos;
    const auto depth_limit = static_cast<int>(std::count(pat.begin(), pat.end(), '/'));

    std::vector<fs::path> out;
    for (fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (!deep && it.depth() >= depth_limit) it.disable_recursion_pending();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        if (IgnoreMatcher::glob_match(pat, it->path().lexically_relative(base).generic_string())) {
            out.push_back(it->path());
        }
    }
    if (ec) throw TaskError(ErrorKind::IoError, base.string() + ": " + ec.message());
    if (out.empty()) throw TaskError(ErrorKind::TargetNotFoundError, target.string());
    std::sort(out.begin(), out.end());
    return out;
}

std::string ReplaceExecutor::read_text(const fs::path &file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) throw TaskError(ErrorKind::IoError, file.string() + ": " + _("cannot open file"));
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) throw TaskError(ErrorKind::IoError, file.string() + ": " + _("cannot read file"));
    return buf.str();
}

void ReplaceExecutor::write_atomically(const fs::path &target, const std::string &content) {
    std::error_code ec;
    const fs::path real = fs::is_symlink(target, ec) ? fs::canonical(target, ec) : target;
    if (ec) throw TaskError(ErrorKind::IoError, target.string() + ": " + ec.message());

    TempFileGuard guard(make_temp_path(real));
    {
        std::ofstream out(guard.path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw TaskError(ErrorKind::IoError, guard.path.string() + ": " + _("cannot create temporary file"));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (out.fail()) throw TaskError(ErrorKind::IoError, guard.path.string() + ": " + _("write failed"));
    }

    const auto perms = fs::status(real, ec).permissions();
    if (ec) throw TaskError(ErrorKind::IoError, real.string() + ": " + ec.message());
    fs::permissions(guard.path, perms, fs::perm_options::replace, ec);
    if (ec) throw TaskError(ErrorKind::IoError, guard.path.string() + ": " + ec.message());

    fs::rename(guard.path, real, ec);
    if (ec) throw TaskError(ErrorKind::IoError, real.string() + ": " + ec.message());
    guard.armed = false;
}

void ReplaceExecutor::run(const ReplaceTask &task, const ResolvedContext &context) {
    const fs::path target = PathResolver::resolve(task.target, context);
    const auto files = expand_targets(target);

    std::vector<std::string> texts;
    texts.reserve(files.size());
    for (const auto &f: files) {
        texts.push_back(read_text(f));
        if (!valid_utf8(texts.back())) {
            throw TaskError(ErrorKind::EncodingError, f.string() + ": " + _("not valid UTF-8"));
        }
    }

    const auto re = compile(task.pattern);

    // transform everything before the first write
    std::vector<std::pair<std::size_t, std::string> > pending;
    for (std::size_t i = 0; i < files.size(); ++i) {
        std::size_t count = 0;
        std::string out = replace_all(texts[i], *re, task.replacement, &count);
        if (count == 0 || out == texts[i]) continue;
        pending.emplace_back(i, std::move(out));
    }
    for (const auto &[i, content]: pending) write_atomically(files[i], content);
}

ExecutionResult ReplaceExecutor::execute(const ReplaceTask &task, const ResolvedContext &context,
                                         const std::size_t index) {
    return guarded(index, [&] { run(task, context); });
}
