#include "../include/CopyExecutor.hpp"
#include <algorithm>
#include <system_error>

using namespace packager;
namespace fs = std::filesystem;

static TaskError io_error(const fs::path &p, const std::error_code &ec) {
    return TaskError(ErrorKind::IoError, p.string() + ": " + ec.message());
}

static void ensure_parent(const fs::path &to) {
    std::error_code ec;
    if (const auto parent = to.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) throw io_error(parent, ec);
    }
}

// "a/../dist/" and "dist" name the same directory; walked paths are compared
// against the ignore file, so both must be spelled the same way
static fs::path normal_dir(const fs::path &p) {
    const fs::path n = p.lexically_normal();
    return !n.has_filename() && n.has_relative_path() ? n.parent_path() : n;
}

void CopyExecutor::walk(const fs::path &root, const fs::path &dir, const IgnoreRuleSet &rules,
                        const std::string &skip_file, const std::string &skip_dir, std::vector<CopyEntry> &out) {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) entries.push_back(*it);
    if (ec) throw io_error(dir, ec);

    for (const auto &entry: entries) {
        const fs::path rel = entry.path().lexically_relative(root);
        const std::string rel_s = rel.generic_string();
        const auto st = entry.symlink_status(ec);
        if (ec) throw io_error(entry.path(), ec);

        if (fs::is_symlink(st)) {
            if (IgnoreMatcher::included(rules, rel_s, false)) out.push_back({rel, true});
        } else if (fs::is_directory(st)) {
            if (!skip_dir.empty() && rel_s == skip_dir) continue;
            if (!IgnoreMatcher::included(rules, rel_s, true)) continue;
            walk(root, entry.path(), rules, skip_file, skip_dir, out);
        } else if (fs::is_regular_file(st)) {
            if (!skip_file.empty() && rel_s == skip_file) continue;
            if (IgnoreMatcher::included(rules, rel_s, false)) out.push_back({rel, false});
        }
        // sockets, fifos and devices are not part of a package
    }
}

std::vector<CopyEntry> CopyExecutor::plan(const fs::path &root, const IgnoreRuleSet &rules,
                                          const fs::path &skip_file, const std::string &skip_dir) {
    std::vector<CopyEntry> out;
    // compared by relative spelling so "x/../src" and "src" agree
    const std::string skip_rel =
        skip_file.empty() ? std::string() : skip_file.lexically_normal().lexically_relative(root.lexically_normal()).generic_string();
    walk(root, root, rules, skip_rel, skip_dir, out);
    std::sort(out.begin(), out.end(), [](const CopyEntry &a, const CopyEntry &b) {
        return a.relative.generic_string() < b.relative.generic_string();
    });
    return out;
}

void CopyExecutor::copy_file(const fs::path &from, const fs::path &to) {
    std::error_code ec;
    ensure_parent(to);

    const auto dst = fs::symlink_status(to, ec);
    if (fs::is_directory(dst)) {
        throw TaskError(ErrorKind::IoError, to.string() + ": " + _("destination is a directory"));
    }
    if (fs::is_symlink(dst)) {
        fs::remove(to, ec);
        if (ec) throw io_error(to, ec);
    } else if (fs::exists(dst)) {
        // a read-only file from a previous run must still be replaceable
        fs::permissions(to, fs::perms::owner_write, fs::perm_options::add, ec);
        if (ec) throw io_error(to, ec);
    }

    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) throw io_error(from, ec);

    const auto perms = fs::status(from, ec).permissions();
    if (ec) throw io_error(from, ec);
    fs::permissions(to, perms, fs::perm_options::replace, ec);
    if (ec) throw io_error(to, ec);
}

void CopyExecutor::copy_link(const fs::path &from, const fs::path &to) {
    std::error_code ec;
    ensure_parent(to);
    if (fs::exists(fs::symlink_status(to, ec))) {
        if (fs::is_directory(fs::symlink_status(to, ec))) {
            throw TaskError(ErrorKind::IoError, to.string() + ": " + _("destination is a directory"));
        }
        fs::remove(to, ec);
        if (ec) throw io_error(to, ec);
    }
    fs::copy_symlink(from, to, ec);
    if (ec) throw io_error(from, ec);
}

void CopyExecutor::run(const CopyTask &task, const ResolvedContext &context) {
    const fs::path source = normal_dir(PathResolver::resolve(task.source, context));
    const fs::path destination = normal_dir(PathResolver::resolve(task.destination, context));

    std::error_code ec;
    const auto st = fs::status(source, ec);
    if (!fs::exists(st)) {
        throw TaskError(ErrorKind::SourceNotFoundError, source.string());
    }

    if (fs::is_regular_file(st)) {
        const bool into_dir = fs::is_directory(destination, ec);
        copy_file(source, into_dir ? destination / source.filename() : destination);
        return;
    }
    if (!fs::is_directory(st)) {
        throw TaskError(ErrorKind::IoError, source.string() + ": " + _("neither a file nor a directory"));
    }

    IgnoreRuleSet rules;
    fs::path ignore_path;
    if (task.use_ignore && !task.ignore_file.empty()) {
        ignore_path = normal_dir(source / task.ignore_file);
        rules = IgnoreMatcher::load(ignore_path);
    }

    // prune the destination when it sits inside the source tree
    std::string skip_dir;
    {
        const fs::path src_abs = fs::weakly_canonical(source, ec);
        if (ec) throw io_error(source, ec);
        const fs::path dst_abs = fs::weakly_canonical(destination, ec);
        if (ec) throw io_error(destination, ec);
        if (src_abs == dst_abs) {
            throw TaskError(ErrorKind::InvalidPathError, destination.string() + ": " + _("destination is the source"));
        }
        const fs::path rel = dst_abs.lexically_relative(src_abs);
        if (!rel.empty() && *rel.begin() != "..") skip_dir = rel.generic_string();
    }

    const auto entries = plan(source, rules, ignore_path, skip_dir);

    fs::create_directories(destination, ec);
    if (ec) throw io_error(destination, ec);

    for (const auto &[relative, symlink]: entries) {
        if (symlink) copy_link(source / relative, destination / relative);
        else copy_file(source / relative, destination / relative);
    }
}

ExecutionResult CopyExecutor::execute(const CopyTask &task, const ResolvedContext &context, const std::size_t index) {
    return guarded(index, [&] { run(task, context); });
}
