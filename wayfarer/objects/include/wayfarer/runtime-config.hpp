#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/log.hpp"
#include "wayfarer/mime-types.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

namespace wayfarer {

// Settings shared by all the requests served by one application.
// Built and validated once at startup, then shared read-only (through std::shared_ptr<const RuntimeConfig>).
struct RuntimeConfig {
  // Throws std::invalid_argument on inconsistent settings.
  void validate() const;

  RuntimeConfig& withHomeDirectory(std::filesystem::path homeDirectory);

  RuntimeConfig& withDefaultIndex(std::string_view indexFile);

  RuntimeConfig& withDefaultContentType(std::string_view contentType);

  RuntimeConfig& withDirectoryListingCss(std::string_view css);

  RuntimeConfig& withShowHiddenFiles(bool on = true);

  RuntimeConfig& withMaxEntriesToList(std::size_t maxEntries);

  RuntimeConfig& withCompression(bool on = true);

  RuntimeConfig& withCompressionConfig(CompressionConfig config);

  // Registers (or overrides) the MIME type of given extension. Extension is case-insensitive, leading dot optional.
  RuntimeConfig& withMimeType(std::string_view extension, MimeDescriptor mimeType);

  RuntimeConfig& withAuthRealm(std::string_view realm);

  RuntimeConfig& withExposeErrorDetails(bool on = true);

  RuntimeConfig& withFileChunkSize(std::size_t chunkSize);

  RuntimeConfig& withLogLevel(log::level::level_enum level);

  // MIME descriptor of given file path, from the configured overrides first then the built-in table.
  [[nodiscard]] std::optional<MimeDescriptor> mimeTypeOf(std::string_view path) const;

  // Root of the files served by the *Home file handlers. Default: current working directory at construction.
  std::filesystem::path homeDirectory{std::filesystem::current_path()};

  // Name of the file served when the target path resolves to a directory.
  std::string defaultIndex{"index.html"};

  // Content-Type of files with an unknown extension. Empty means no Content-Type header.
  std::string defaultContentType;

  // Optional CSS stylesheet inlined in directory listings.
  std::string directoryListingCss;

  // Whether hidden files (dotfiles) are listed in directory listings.
  bool showHiddenFiles{false};

  // Guard against pathological directories.
  std::size_t maxEntriesToList{10000};

  // Whether File / Browse handlers may compress according to Accept-Encoding.
  bool compressionEnabled{true};

  CompressionConfig compression;

  // Extension (without dot, case-insensitive) -> MIME type overrides.
  std::map<std::string, MimeDescriptor, CaseInsensitiveLessFunc> mimeTypeOverrides;

  // Realm advertised in WWW-Authenticate challenges.
  std::string authRealm{"protected"};

  // When true, the message of an exception escaping a handler is sent in the 500 response body.
  bool exposeErrorDetails{false};

  // Size of the reads when streaming a file to the sink.
  std::size_t fileChunkSize{64UL * 1024UL};

  // Headers added to every response that does not set them.
  std::vector<std::pair<std::string, std::string>> globalHeaders{{"Server", "wayfarer"}};

  log::level::level_enum logLevel{log::level::info};
};

// Sets the global log level from the configuration.
void ApplyLogLevel(const RuntimeConfig& config);

}  // namespace wayfarer
