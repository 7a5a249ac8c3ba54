#include "wayfarer/file.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "wayfarer/temp-file.hpp"

namespace wayfarer {

using test::ScopedTempDir;
using test::ScopedTempFile;

TEST(File, OpenMissingFile) {
  ScopedTempDir dir;
  File file(dir.dirPath() / "missing.txt");
  EXPECT_FALSE(file);
  std::array<std::byte, 4> buf;
  EXPECT_EQ(file.readAt(buf, 0), File::kError);
}

TEST(File, SizeAndLastModified) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "hello.txt", "hello world");
  File file(tmp.filePath());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 11U);
  const auto expected = std::chrono::file_clock::to_sys(std::filesystem::last_write_time(tmp.filePath()));
  EXPECT_EQ(std::chrono::floor<std::chrono::seconds>(file.lastModified()),
            std::chrono::floor<std::chrono::seconds>(expected));
}

TEST(File, ReadAtOffsets) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "data.bin", "0123456789");
  File file(tmp.filePath());
  ASSERT_TRUE(file);

  std::array<std::byte, 4> buf;
  ASSERT_EQ(file.readAt(buf, 3), 4U);
  EXPECT_EQ(std::string_view(reinterpret_cast<const char *>(buf.data()), 4), "3456");

  // short read at the end, then EOF
  ASSERT_EQ(file.readAt(buf, 8), 2U);
  EXPECT_EQ(std::string_view(reinterpret_cast<const char *>(buf.data()), 2), "89");
  EXPECT_EQ(file.readAt(buf, 10), 0U);
}

}  // namespace wayfarer
