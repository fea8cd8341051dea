#include <gtest/gtest.h>

#include "nav/path_resolver.hpp"

namespace arcnav {

namespace {

std::string ResolveOk(std::string_view base, std::string_view input) {
    std::string out;
    auto res = PathResolver::Resolve(base, input, out);
    EXPECT_TRUE(res.is_ok()) << res.msg;
    return out;
}

} // namespace

TEST(PathResolverTest, RelativeJoinsOntoBase) {
    EXPECT_EQ(ResolveOk("payload/", "a.csv"), "payload/a.csv");
    EXPECT_EQ(ResolveOk("payload/", "sub/"), "payload/sub/");
    EXPECT_EQ(ResolveOk("", "docs"), "docs");
}

TEST(PathResolverTest, AbsoluteIgnoresBase) {
    EXPECT_EQ(ResolveOk("payload/", "/docs/readme.txt"), "docs/readme.txt");
    EXPECT_EQ(ResolveOk("payload/", "/"), "");
}

TEST(PathResolverTest, EmptyInputIsBase) {
    EXPECT_EQ(ResolveOk("payload/sub/", ""), "payload/sub");
    EXPECT_EQ(ResolveOk("", ""), "");
}

TEST(PathResolverTest, DotDotClimbsWithinRoot) {
    EXPECT_EQ(ResolveOk("payload/sub/", ".."), "payload");
    EXPECT_EQ(ResolveOk("payload/sub/", "../../"), "");
    EXPECT_EQ(ResolveOk("payload/", "./x/../y.txt"), "payload/y.txt");
}

TEST(PathResolverTest, DotDotInsideRelativePathFromRoot) {
    EXPECT_EQ(ResolveOk("", "a/../b"), "b");
}

TEST(PathResolverTest, BackslashesAreSeparators) {
    EXPECT_EQ(ResolveOk("", "payload\\sub\\f.txt"), "payload/sub/f.txt");
}

TEST(PathResolverTest, EscapingRootFails) {
    std::string out;
    auto res = PathResolver::Resolve("payload/", "../../etc", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::ValidationError);
    EXPECT_NE(res.msg.find("escapes the archive root"), std::string::npos);

    EXPECT_FALSE(PathResolver::Resolve("", "..", out).is_ok());
}

TEST(PathResolverTest, Render) {
    EXPECT_EQ(PathResolver::Render(""), "/");
    EXPECT_EQ(PathResolver::Render("docs/"), "/docs/");
}

} // namespace arcnav
