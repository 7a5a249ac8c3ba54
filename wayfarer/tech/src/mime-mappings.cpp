#include "wayfarer/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string_view>

#include "wayfarer/ascii.hpp"

namespace wayfarer {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

static_assert(std::size(kMIMEMappings) < std::numeric_limits<MIMETypeIdx>::max(),
              "kMIMEMappings size exceeds MIMETypeIdx capacity");

MIMETypeIdx FindMIMETypeIdxByExtension(std::string_view extension) {
  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, [](const auto &lhs, const auto &rhs) {
        return lhs.extension.size() < rhs.extension.size();
      })->extension.size();

  if (extension.starts_with('.')) {
    extension.remove_prefix(1);
  }
  if (extension.empty() || extension.size() > kMaximumKnownExtensionSize) {
    return kUnknownMIMEMappingIdx;
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt = std::transform(extension.begin(), extension.end(), extBuf, [](char ch) { return tolower(ch); });

  const std::string_view ext(extBuf, endIt);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return static_cast<MIMETypeIdx>(std::distance(std::begin(kMIMEMappings), it));
  }
  return kUnknownMIMEMappingIdx;
}

MIMETypeIdx DetermineMIMETypeIdx(std::string_view path) {
  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || path.find('/', dotPos) != std::string_view::npos) {
    return kUnknownMIMEMappingIdx;
  }
  return FindMIMETypeIdxByExtension(path.substr(dotPos + 1U));
}

std::string_view DetermineMIMETypeStr(std::string_view path) {
  const MIMETypeIdx idx = DetermineMIMETypeIdx(path);
  if (idx != kUnknownMIMEMappingIdx) {
    return kMIMEMappings[idx].mimeType;
  }
  return {};
}

}  // namespace wayfarer
