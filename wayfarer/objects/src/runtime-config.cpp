#include "wayfarer/runtime-config.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/log.hpp"
#include "wayfarer/mime-types.hpp"

namespace wayfarer {

void RuntimeConfig::validate() const {
  if (homeDirectory.empty()) {
    throw std::invalid_argument("RuntimeConfig.homeDirectory cannot be empty");
  }
  if (defaultIndex.empty() || defaultIndex.contains('/') || defaultIndex.contains('\\')) {
    throw std::invalid_argument("RuntimeConfig.defaultIndex must be a plain file name");
  }
  if (fileChunkSize == 0) {
    throw std::invalid_argument("RuntimeConfig.fileChunkSize cannot be 0");
  }
  if (authRealm.contains('"')) {
    throw std::invalid_argument("RuntimeConfig.authRealm cannot contain double quotes");
  }
  for (const auto& [name, value] : globalHeaders) {
    if (name.empty() || name.find_first_of(":\r\n") != std::string::npos || value.find_first_of("\r\n") != std::string::npos) {
      throw std::invalid_argument("Invalid global header '" + name + "'");
    }
  }
  compression.validate();
}

RuntimeConfig& RuntimeConfig::withHomeDirectory(std::filesystem::path homeDirectory) {
  this->homeDirectory = std::move(homeDirectory);
  return *this;
}

RuntimeConfig& RuntimeConfig::withDefaultIndex(std::string_view indexFile) {
  this->defaultIndex = indexFile;
  return *this;
}

RuntimeConfig& RuntimeConfig::withDefaultContentType(std::string_view contentType) {
  this->defaultContentType = contentType;
  return *this;
}

RuntimeConfig& RuntimeConfig::withDirectoryListingCss(std::string_view css) {
  this->directoryListingCss = css;
  return *this;
}

RuntimeConfig& RuntimeConfig::withShowHiddenFiles(bool on) {
  this->showHiddenFiles = on;
  return *this;
}

RuntimeConfig& RuntimeConfig::withMaxEntriesToList(std::size_t maxEntries) {
  this->maxEntriesToList = maxEntries;
  return *this;
}

RuntimeConfig& RuntimeConfig::withCompression(bool on) {
  this->compressionEnabled = on;
  return *this;
}

RuntimeConfig& RuntimeConfig::withCompressionConfig(CompressionConfig config) {
  this->compression = std::move(config);
  return *this;
}

RuntimeConfig& RuntimeConfig::withMimeType(std::string_view extension, MimeDescriptor mimeType) {
  if (extension.starts_with('.')) {
    extension.remove_prefix(1);
  }
  if (extension.empty() || mimeType.name.empty()) {
    throw std::invalid_argument("MIME type override needs a non empty extension and type");
  }
  mimeTypeOverrides.insert_or_assign(std::string(extension), std::move(mimeType));
  return *this;
}

RuntimeConfig& RuntimeConfig::withAuthRealm(std::string_view realm) {
  this->authRealm = realm;
  return *this;
}

RuntimeConfig& RuntimeConfig::withExposeErrorDetails(bool on) {
  this->exposeErrorDetails = on;
  return *this;
}

RuntimeConfig& RuntimeConfig::withFileChunkSize(std::size_t chunkSize) {
  this->fileChunkSize = chunkSize;
  return *this;
}

RuntimeConfig& RuntimeConfig::withLogLevel(log::level::level_enum level) {
  this->logLevel = level;
  return *this;
}

std::optional<MimeDescriptor> RuntimeConfig::mimeTypeOf(std::string_view path) const {
  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || path.find('/', dotPos) != std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view extension = path.substr(dotPos + 1);
  if (auto it = mimeTypeOverrides.find(extension); it != mimeTypeOverrides.end()) {
    return it->second;
  }
  return DefaultMimeTypesMap(extension);
}

void ApplyLogLevel(const RuntimeConfig& config) { log::set_level(config.logLevel); }

}  // namespace wayfarer
