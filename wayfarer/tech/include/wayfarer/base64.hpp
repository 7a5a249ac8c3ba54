#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace wayfarer {

constexpr std::size_t B64EncodedLen(std::size_t binDataLen) { return ((binDataLen + 2U) / 3U) * 4U; }

// Standard alphabet (RFC 4648 §4) with '=' padding.
[[nodiscard]] std::string B64Encode(std::string_view binData);

// Decodes standard base64. Whitespace and padding characters are skipped.
// Returns std::nullopt if an illegal character is found or if the input ends on an incomplete sextet.
[[nodiscard]] std::optional<std::string> B64Decode(std::string_view ascData);

}  // namespace wayfarer
