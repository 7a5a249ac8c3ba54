#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <span>

#include "wayfarer/base-fd.hpp"
#include "wayfarer/timestring.hpp"

namespace wayfarer {

// Read-only file opened for streaming. Size and modification time are captured at opening.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. On failure, the error is logged and operator bool() returns false.
  explicit File(const std::filesystem::path& path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the file size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Last modification time, at the time of opening.
  [[nodiscard]] SysTimePoint lastModified() const noexcept { return _lastModified; }

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Uses pread() so it does not modify the file's current offset, and can be shared by concurrent readers.
  // Returns the number of bytes read (0 on EOF). Returns kError on error.
  [[nodiscard]] std::size_t readAt(std::span<std::byte> dst, std::size_t offset) const;

 private:
  BaseFd _fd;
  std::size_t _fileSize{kError};
  SysTimePoint _lastModified{};
};

}  // namespace wayfarer
