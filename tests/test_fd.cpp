#include <gtest/gtest.h>

#include "io/fd.hpp"
#include "testing.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        arcnav::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, MoveTransfersOwnership) {
    arcnav::Fd a;
    auto res = arcnav::Fd::Open("/dev/null", O_RDONLY, 0, a);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    const int raw = a.Get();

    arcnav::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), raw);
}

TEST(FdTests, OpenMissingFileIsNotFound) {
    testutil::TemporaryDirectory tmp;
    arcnav::Fd fd;
    auto res = arcnav::Fd::Open(tmp.Path() + "/missing", O_RDONLY, 0, fd);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, arcnav::ErrorCode::NotFound);
    EXPECT_EQ(res.sys_errno, ENOENT);
    EXPECT_FALSE(fd.Valid());
}

} // namespace
