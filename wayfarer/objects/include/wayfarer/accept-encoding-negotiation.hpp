#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "wayfarer/compression-config.hpp"
#include "wayfarer/encoding.hpp"

namespace wayfarer {

class EncodingSelector {
 public:
  EncodingSelector();

  explicit EncodingSelector(const CompressionConfig &compressionConfig);

  struct NegotiatedResult {
    Encoding encoding{Encoding::none};

    // True when the client explicitly disallowed identity (identity;q=0) and no other acceptable
    // encoding was present. Callers may translate this into 406 Not Acceptable.
    bool reject{false};
  };

  // Parse an Accept-Encoding header per RFC 9110 section 12.5.3 and select the
  // best encoding among the supported ones.
  //  - Split on commas; each token may have optional parameters separated by ';'
  //  - q parameter in [0, 1], default 1. Invalid q is treated as 0.
  //  - Case-insensitive exact token matching; encodings with q=0 are ignored.
  //  - Highest q wins; ties go to the server preference order.
  //  - Wildcard '*' applies its q to any supported encoding not explicitly listed.
  [[nodiscard]] NegotiatedResult negotiateAcceptEncoding(std::string_view acceptEncoding) const;

 private:
  // Server preference order, only enabled encodings, without none.
  std::vector<Encoding> _preferenceOrdered;
  // Position in _preferenceOrdered, -1 when not advertised.
  std::array<int8_t, kNbContentEncodings> _serverPrefIndex;
};

}  // namespace wayfarer
