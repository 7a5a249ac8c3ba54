#include "wayfarer/compression-config.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "wayfarer/encoding.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

#ifdef WAYFARER_ENABLE_ZLIB
#include <zlib.h>
#endif
#ifdef WAYFARER_ENABLE_BROTLI
#include <brotli/encode.h>
#endif
#ifdef WAYFARER_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace wayfarer {

namespace {

[[maybe_unused]] void CheckLevel(const std::optional<int> &level, int minLevel, int maxLevel, std::string_view what) {
  if (level && (*level < minLevel || *level > maxLevel)) {
    throw std::invalid_argument("Invalid " + std::string(what) + " " + std::to_string(*level) + ", expected [" +
                                std::to_string(minLevel) + ", " + std::to_string(maxLevel) + "]");
  }
}

}  // namespace

void CompressionConfig::validate() const {
  if (chunkSize == 0) {
    throw std::invalid_argument("Invalid encoder chunk size");
  }
  auto it = std::ranges::find_if_not(preferredFormats, [](Encoding enc) { return IsEncodingEnabled(enc); });
  if (it != preferredFormats.end()) {
    throw std::invalid_argument("Unsupported encoding " + std::string(GetEncodingStr(*it)) + " in preferredFormats");
  }
#ifdef WAYFARER_ENABLE_ZLIB
  CheckLevel(gzipLevel, Z_NO_COMPRESSION, Z_BEST_COMPRESSION, "gzip level");
#endif
#ifdef WAYFARER_ENABLE_BROTLI
  CheckLevel(brotliQuality, BROTLI_MIN_QUALITY, BROTLI_MAX_QUALITY, "brotli quality");
#endif
#ifdef WAYFARER_ENABLE_ZSTD
  CheckLevel(zstdLevel, ZSTD_minCLevel(), ZSTD_maxCLevel(), "zstd level");
#endif
}

bool CompressionConfig::isEligible(std::string_view contentType, std::size_t fileSize) const noexcept {
  if (fileSize < minBytes) {
    return false;
  }
  if (contentTypeAllowList.empty()) {
    return true;
  }
  return std::ranges::any_of(contentTypeAllowList, [contentType](const std::string &prefix) {
    return StartsWithCaseInsensitive(contentType, prefix);
  });
}

}  // namespace wayfarer
