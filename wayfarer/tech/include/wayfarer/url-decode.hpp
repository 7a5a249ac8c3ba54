#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wayfarer::url {

// Strict percent-decoding. '+' is translated into plusAs (use ' ' only for query / form components, never for
// paths). Returns std::nullopt on a truncated escape or a non hexadecimal digit.
[[nodiscard]] std::optional<std::string> Decode(std::string_view encoded, char plusAs = '+');

// Best effort percent-decoding: malformed escapes are kept verbatim.
[[nodiscard]] std::string DecodeLenient(std::string_view encoded, char plusAs = '+');

// Parses an application/x-www-form-urlencoded sequence of pairs (query string or form body).
//  - pairs are separated by '&', key and value by the first '='
//  - a missing '=' gives an empty value, empty pairs are skipped
//  - key and value are decoded independently with '+' as space
//  - duplicates are preserved in order
[[nodiscard]] std::vector<std::pair<std::string, std::string>> ParseFormEncoded(std::string_view encoded);

}  // namespace wayfarer::url
