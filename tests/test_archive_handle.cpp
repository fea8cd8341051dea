#include <gtest/gtest.h>

#include "archive/archive_handle.hpp"
#include "testing.hpp"

#include <string>

namespace arcnav {

class ArchiveHandleTest : public ::testing::Test {
  protected:
    void SetUp() override {
        zip_ = tmp_.Path() + "/sample.zip";
        testutil::BuildZip(zip_, {
            {"dir/", "", false, true},
            {"dir/stored.txt", "stored payload", true},
            {"dir/deflated.txt", std::string(4096, 'z'), false},
            {"top.bin", "", true},
        });
    }

    testutil::TemporaryDirectory tmp_;
    std::string zip_;
};

TEST_F(ArchiveHandleTest, IndexesRegularFilesOnly) {
    ArchiveHandle h;
    auto res = ArchiveHandle::Open(zip_, h);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_TRUE(h.IsOpen());
    EXPECT_EQ(h.Path(), zip_);
    ASSERT_EQ(h.Members().size(), 3u);
    EXPECT_EQ(h.Find("dir/"), nullptr);
    ASSERT_NE(h.Find("top.bin"), nullptr);
    EXPECT_EQ(h.Find("top.bin")->size, 0u);
}

TEST_F(ArchiveHandleTest, RecordsSizeAndCompression) {
    ArchiveHandle h;
    ASSERT_TRUE(ArchiveHandle::Open(zip_, h).is_ok());

    const MemberInfo* stored = h.Find("dir/stored.txt");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->size, 14u);
    EXPECT_EQ(stored->compression, "STORED");
    ASSERT_TRUE(stored->compressed_size.has_value());
    EXPECT_EQ(*stored->compressed_size, 14u);
    EXPECT_EQ(stored->mtime, 1700000000);

    const MemberInfo* deflated = h.Find("dir/deflated.txt");
    ASSERT_NE(deflated, nullptr);
    EXPECT_EQ(deflated->size, 4096u);
    EXPECT_EQ(deflated->compression, "DEFLATED");
    EXPECT_FALSE(deflated->compressed_size.has_value());
}

TEST_F(ArchiveHandleTest, ReadMemberReturnsContent) {
    ArchiveHandle h;
    ASSERT_TRUE(ArchiveHandle::Open(zip_, h).is_ok());

    std::string data;
    auto res = h.ReadMember("dir/deflated.txt", data);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(data, std::string(4096, 'z'));

    ASSERT_TRUE(h.ReadMember("top.bin", data).is_ok());
    EXPECT_TRUE(data.empty());
}

TEST_F(ArchiveHandleTest, ReadersAreIndependent) {
    ArchiveHandle h;
    ASSERT_TRUE(ArchiveHandle::Open(zip_, h).is_ok());

    MemberReader a;
    MemberReader b;
    ASSERT_TRUE(h.OpenMember("dir/stored.txt", a).is_ok());
    ASSERT_TRUE(h.OpenMember("dir/deflated.txt", b).is_ok());

    EXPECT_EQ(testutil::ReadAll(b), std::string(4096, 'z'));
    EXPECT_EQ(testutil::ReadAll(a), "stored payload");
}

TEST_F(ArchiveHandleTest, MissingMemberIsNotFound) {
    ArchiveHandle h;
    ASSERT_TRUE(ArchiveHandle::Open(zip_, h).is_ok());

    std::string data;
    auto res = h.ReadMember("nope.txt", data);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::NotFound);
}

TEST(ArchiveHandleOpenTest, MissingFileIsNotFound) {
    testutil::TemporaryDirectory tmp;
    ArchiveHandle h;
    auto res = ArchiveHandle::Open(tmp.Path() + "/absent.zip", h);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::NotFound);
    EXPECT_FALSE(h.IsOpen());
}

TEST(ArchiveHandleOpenTest, GarbageIsArchiveError) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/garbage.zip";
    testutil::WriteFile(path, "this is not an archive at all, just some text\n");

    ArchiveHandle h;
    auto res = ArchiveHandle::Open(path, h);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::ArchiveError);
    EXPECT_FALSE(h.IsOpen());
}

TEST(ArchiveHandleOpenTest, CloseDropsIndex) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/one.zip";
    testutil::BuildZip(path, {{"a.txt", "a", false}});

    ArchiveHandle h;
    ASSERT_TRUE(ArchiveHandle::Open(path, h).is_ok());
    h.Close();
    EXPECT_FALSE(h.IsOpen());
    EXPECT_TRUE(h.Members().empty());

    std::string data;
    EXPECT_FALSE(h.ReadMember("a.txt", data).is_ok());
}

} // namespace arcnav
