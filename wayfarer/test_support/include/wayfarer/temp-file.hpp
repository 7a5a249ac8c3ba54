#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace wayfarer::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  // Create a uniquely-named temporary directory with optional prefix.
  explicit ScopedTempDir(std::string_view prefix = "wayfarer-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: a named file inside a ScopedTempDir, removed on destruction.
// The directory is not removed by this ScopedTempFile; the ScopedTempDir owns the directory lifecycle.
class ScopedTempFile {
 public:
  // 'name' may contain sub directories, which are created if needed.
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  // Full path to the file
  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }
  // Filename only
  [[nodiscard]] std::string filename() const { return _path.filename().string(); }
  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

}  // namespace wayfarer::test
