#include "wayfarer/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

namespace wayfarer {

namespace {
bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }
}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ClosesOnDestruction) {
  int raw = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  ASSERT_GE(raw, 0);
  {
    BaseFd fd(raw);
    EXPECT_TRUE(fd);
    EXPECT_TRUE(IsOpen(raw));
  }
  EXPECT_FALSE(IsOpen(raw));
}

TEST(BaseFd, MoveTransfersOwnership) {
  BaseFd first(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  const int raw = first.fd();
  BaseFd second(std::move(first));
  EXPECT_EQ(second.fd(), raw);
  BaseFd third;
  third = std::move(second);
  EXPECT_EQ(third.fd(), raw);
  EXPECT_TRUE(IsOpen(raw));
}

TEST(BaseFd, ReleaseAndCloseIdempotent) {
  BaseFd fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  const int raw = fd.release();
  EXPECT_FALSE(fd);
  EXPECT_TRUE(IsOpen(raw));
  BaseFd adopt(raw);
  adopt.close();
  adopt.close();
  EXPECT_FALSE(adopt);
  EXPECT_FALSE(IsOpen(raw));
}

}  // namespace wayfarer
