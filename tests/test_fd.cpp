#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        curator::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    curator::Fd a(fd);
    curator::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    ASSERT_TRUE(b.Valid());
    EXPECT_EQ(b.Get(), fd);

    auto res = b.Close();
    EXPECT_TRUE(res.is_ok()) << res.msg;
    EXPECT_FALSE(b.Valid());

    // Closing twice is a no-op.
    EXPECT_TRUE(b.Close().is_ok());
}

TEST(FdTests, ReleaseDetachesDescriptor) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    int released = -1;
    {
        curator::Fd holder(fd);
        released = holder.Release();
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(released, fd);
    EXPECT_EQ(::close(released), 0);
}

} // namespace
