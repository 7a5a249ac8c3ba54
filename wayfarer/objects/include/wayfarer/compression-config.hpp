#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wayfarer/encoding.hpp"

namespace wayfarer {

// How served files get compressed.
// Formats whose library is not compiled in are never negotiated, and listing one in preferredFormats
// is a configuration error.
struct CompressionConfig {
  // Throws std::invalid_argument for a level outside of the range of its library.
  void validate() const;

  // Whether a file of this content type and size is worth compressing.
  // The MIME descriptor of the file must also be compressible, which is checked by the caller.
  [[nodiscard]] bool isEligible(std::string_view contentType, std::size_t fileSize) const noexcept;

  // Negotiation order, the first format accepted by the client wins. Empty means the order of Encoding.
  std::vector<Encoding> preferredFormats;

  // Smaller files are sent as they are.
  std::size_t minBytes{1024UL};

  // Content type prefixes (case-insensitive) eligible for compression. Empty allows any compressible type.
  std::vector<std::string> contentTypeAllowList;

  // Adds Vary: Accept-Encoding to compressed responses.
  bool addVaryHeader{true};

  // Compression levels, library defaults when unset.
  std::optional<int> gzipLevel;  // also used for deflate
  std::optional<int> brotliQuality;
  std::optional<int> zstdLevel;

  // Growth step of the encoder output buffers.
  std::size_t chunkSize{64UL * 1024UL};
};

}  // namespace wayfarer
