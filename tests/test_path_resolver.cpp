#include <gtest/gtest.h>
#include "../include/PathResolver.hpp"
#include "test_util.hpp"

using namespace packager;
namespace fs = std::filesystem;

TEST(PathResolver, AbsolutePathIsReturnedUnchanged)
{
    ResolvedContext ctx{"/base/dir"};
    EXPECT_EQ(PathResolver::resolve("/opt/pkg/file.txt", ctx), fs::path("/opt/pkg/file.txt"));
}

TEST(PathResolver, RelativePathIsJoinedToBase)
{
    ResolvedContext ctx{"/base/dir"};
    EXPECT_EQ(PathResolver::resolve("src/a.txt", ctx), fs::path("/base/dir/src/a.txt"));
}

TEST(PathResolver, ParentTraversalIsAllowed)
{
    ResolvedContext ctx{"/base/dir"};
    EXPECT_EQ(PathResolver::resolve("../sibling/x", ctx), fs::path("/base/sibling/x"));
    EXPECT_EQ(PathResolver::resolve("../../../../up", ctx), fs::path("/up"));
}

TEST(PathResolver, EmptyPathThrowsInvalidPath)
{
    ResolvedContext ctx{"/base"};
    try {
        (void) PathResolver::resolve("", ctx);
        FAIL() << "expected InvalidPathError";
    } catch (const TaskError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPathError);
    }
    EXPECT_THROW((void) PathResolver::resolve(std::string("a\0b", 3), ctx), TaskError);
}

TEST(ResolvedContext, DefaultsToConfigDirectory)
{
    const auto ctx = ResolvedContext::from("/srv/project/package.pkg", std::nullopt);
    EXPECT_EQ(ctx.base_dir, fs::path("/srv/project"));
}

TEST(ResolvedContext, WorkdirOverridesConfigDirectory)
{
    const auto ctx = ResolvedContext::from("/srv/project/package.pkg", std::string("/tmp/elsewhere/"));
    EXPECT_EQ(ctx.base_dir, fs::path("/tmp/elsewhere"));
}

TEST(ResolvedContext, RelativeConfigIsMadeAbsolute)
{
    const auto ctx = ResolvedContext::from("conf/package.pkg", std::nullopt);
    EXPECT_TRUE(ctx.base_dir.is_absolute());
    EXPECT_EQ(ctx.base_dir, (fs::current_path() / "conf").lexically_normal());
}

TEST(ResolvedContext, EmptyWorkdirThrows)
{
    EXPECT_THROW(ResolvedContext::from("/a/b.pkg", std::string()), TaskError);
}
