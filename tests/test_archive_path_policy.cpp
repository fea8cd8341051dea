#include <gtest/gtest.h>

#include "archive/archive_path_policy.hpp"

namespace arcnav {

TEST(ArchivePathPolicyTest, AcceptsOrdinaryMembers) {
    EXPECT_TRUE(ArchivePathPolicy::IsSafeMember("a.csv"));
    EXPECT_TRUE(ArchivePathPolicy::IsSafeMember("payload/sub/b.txt"));
    EXPECT_TRUE(ArchivePathPolicy::IsSafeMember("./dir//file.txt"));
    EXPECT_TRUE(ArchivePathPolicy::IsSafeMember("a/../b.txt"));
    EXPECT_TRUE(ArchivePathPolicy::IsSafeMember("..foo/bar"));
}

TEST(ArchivePathPolicyTest, RejectsEscapingMembers) {
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("../evil.txt"));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("a/../../evil.txt"));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("..\\evil.txt"));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember(".."));
}

TEST(ArchivePathPolicyTest, RejectsAbsoluteAndDriveMembers) {
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("/etc/passwd"));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("\\windows\\system32"));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("C:/boot.ini"));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("c:evil"));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember(""));
    EXPECT_FALSE(ArchivePathPolicy::IsSafeMember("./"));
}

TEST(ArchivePathPolicyTest, TargetPathStaysBelowRoot) {
    std::string out;
    auto res = ArchivePathPolicy::TargetPath("/tmp/out", "./dir//file.txt", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "/tmp/out/dir/file.txt");
}

TEST(ArchivePathPolicyTest, TargetPathRejectsUnsafeMember) {
    std::string out;
    auto res = ArchivePathPolicy::TargetPath("/tmp/out", "../escape.txt", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::UnsafeMember);
    EXPECT_NE(res.msg.find("Unsafe archive member"), std::string::npos);
}

} // namespace arcnav
