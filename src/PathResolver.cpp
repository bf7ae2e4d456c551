#include "../include/PathResolver.hpp"
#include <system_error>

using namespace packager;
namespace fs = std::filesystem;

ResolvedContext ResolvedContext::from(const std::string &config_path, const std::optional<std::string> &workdir) {
    ResolvedContext ctx;
    std::error_code ec;
    if (workdir.has_value()) {
        if (workdir->empty()) throw TaskError(ErrorKind::InvalidPathError, _("empty working directory"));
        ctx.base_dir = fs::absolute(*workdir, ec);
    } else {
        if (config_path.empty()) throw TaskError(ErrorKind::InvalidPathError, _("empty configuration path"));
        ctx.base_dir = fs::absolute(config_path, ec).parent_path();
    }
    if (ec) throw TaskError(ErrorKind::InvalidPathError, ec.message());
    ctx.base_dir = ctx.base_dir.lexically_normal();
    // "dir/" normalises to "dir/" with an empty filename; drop it so joins stay clean
    if (!ctx.base_dir.has_filename() && ctx.base_dir.has_parent_path() && ctx.base_dir != ctx.base_dir.root_path()) {
        ctx.base_dir = ctx.base_dir.parent_path();
    }
    return ctx;
}

fs::path PathResolver::resolve(const std::string &declared, const ResolvedContext &context) {
    if (declared.empty()) {
        throw TaskError(ErrorKind::InvalidPathError, _("empty path"));
    }
    if (declared.find('\0') != std::string::npos) {
        throw TaskError(ErrorKind::InvalidPathError, _("path contains a NUL byte"));
    }
    const fs::path p(declared);
    if (p.is_absolute()) return p;
    return (context.base_dir / p).lexically_normal();
}
