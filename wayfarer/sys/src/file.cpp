#include "wayfarer/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <span>

#include "wayfarer/log.hpp"
#include "wayfarer/timestring.hpp"

namespace wayfarer {

File::File(const std::filesystem::path& path) : _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    log::error("Unable to open file '{}' (errno {}: {})", path.string(), errno, std::strerror(errno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    log::error("Unable to stat file '{}' (errno {}: {})", path.string(), errno, std::strerror(errno));
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
  _lastModified = SysTimePoint{std::chrono::duration_cast<SysDuration>(std::chrono::seconds{st.st_mtim.tv_sec} +
                                                                       std::chrono::nanoseconds{st.st_mtim.tv_nsec})};
}

std::size_t File::readAt(std::span<std::byte> dst, std::size_t offset) const {
  if (!_fd) {
    return kError;
  }
  for (;;) {
    const ssize_t ret = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (ret >= 0) {
      return static_cast<std::size_t>(ret);
    }
    if (errno == EINTR) {
      continue;
    }
    log::error("pread failed on fd # {} at offset {} (errno {}: {})", _fd.fd(), offset, errno, std::strerror(errno));
    return kError;
  }
}

}  // namespace wayfarer
