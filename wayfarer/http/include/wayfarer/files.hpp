#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "wayfarer/route-result.hpp"

// Static file serving, scoped under a root directory.
// Handlers of this module decline (no-match) when the target is missing or outside of the root,
// so they can be followed by a fallback such as NotFound.

namespace wayfarer::files {

// Path of 'name' relative to 'rootDir', after stripping its leading slashes and resolving dot segments and
// symbolic links. std::nullopt when the resolved path escapes the canonical root.
[[nodiscard]] std::optional<std::filesystem::path> LocalFile(std::string_view name,
                                                             const std::filesystem::path& rootDir);

// Same as LocalFile, arguments in (root, name) order.
[[nodiscard]] std::optional<std::filesystem::path> ResolvePath(const std::filesystem::path& rootDir,
                                                               std::string_view name);

// Serves the regular file at 'path'. No-match if it is not a regular file.
//  - Content-Type from the MIME map of the runtime config, its default content type otherwise (omitted if empty)
//  - Last-Modified, and 304 Not Modified when If-Modified-Since is not older than the file
//  - the content is streamed by chunks of RuntimeConfig::fileChunkSize during the deferred write
//  - when allowCompression is set and the MIME type is compressible, files of at least CompressionConfig::minBytes
//    are compressed with the encoding negotiated from Accept-Encoding, and sent chunked
[[nodiscard]] Handler SendFile(std::filesystem::path path, bool allowCompression);

// Serves 'name' relative to the home directory of the runtime config.
[[nodiscard]] Handler File(std::string_view name);

[[nodiscard]] Handler BrowseFile(std::filesystem::path rootDir, std::string_view name);

[[nodiscard]] Handler BrowseFileHome(std::string_view name);

// Serves the file designated by the request path, relative to 'rootDir'.
// A directory containing the configured index file serves that file.
[[nodiscard]] Handler Browse(std::filesystem::path rootDir);

[[nodiscard]] Handler BrowseHome();

// HTML listing of the directory designated by the request path, relative to 'rootDir'.
// No-match when the target is not a directory, or when it contains the configured index file.
[[nodiscard]] Handler Dir(std::filesystem::path rootDir);

[[nodiscard]] Handler DirHome();

}  // namespace wayfarer::files
