#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "wayfarer/features.hpp"
#include "wayfarer/http-constants.hpp"

namespace wayfarer {

// Ordered from preferred to least preferred, used as a default if no config preference is set.
enum class Encoding : std::uint8_t {
  zstd,
  br,
  gzip,
  deflate,
  none,  // should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

namespace detail {

inline constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {
    http::zstd, http::br, http::gzip, http::deflate, http::identity,
};

inline constexpr bool kEncodingEnabled[kNbContentEncodings] = {
    zstdEnabled(), brotliEnabled(), zlibEnabled(), zlibEnabled(), true,
};

}  // namespace detail

// Get string representation of encoding for use in HTTP headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return detail::kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Check if encoding is enabled in this build.
constexpr bool IsEncodingEnabled(Encoding enc) {
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return false;
  }
  return detail::kEncodingEnabled[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

}  // namespace wayfarer
