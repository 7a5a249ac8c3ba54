#include "wayfarer/mime-types.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "wayfarer/mime-mappings.hpp"

namespace wayfarer {

std::optional<MimeDescriptor> MkMimeType(std::string_view name, bool compressible) {
  if (name.empty()) {
    return std::nullopt;
  }
  return MimeDescriptor{std::string(name), compressible};
}

std::optional<MimeDescriptor> DefaultMimeTypesMap(std::string_view extension) {
  const MIMETypeIdx idx = FindMIMETypeIdxByExtension(extension);
  if (idx == kUnknownMIMEMappingIdx) {
    return std::nullopt;
  }
  return MimeDescriptor{std::string(kMIMEMappings[idx].mimeType), kMIMEMappings[idx].compressible};
}

}  // namespace wayfarer
