#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace wayfarer {

struct MimeDescriptor {
  std::string name;
  // Whether the payload is worth compressing.
  bool compressible{false};

  bool operator==(const MimeDescriptor &) const = default;
};

// Builds a descriptor; returns std::nullopt for an empty name.
[[nodiscard]] std::optional<MimeDescriptor> MkMimeType(std::string_view name, bool compressible);

// Built-in extension table lookup. Extension is case-insensitive, with or without its leading dot.
[[nodiscard]] std::optional<MimeDescriptor> DefaultMimeTypesMap(std::string_view extension);

}  // namespace wayfarer
