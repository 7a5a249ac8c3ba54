#include "wayfarer/url-decode.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wayfarer::url {

namespace {

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int FromHexDigit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

// Returns false on the first malformed escape when strict, otherwise keeps it verbatim.
bool DecodeInto(std::string_view encoded, char plusAs, bool strict, std::string &out) {
  out.reserve(out.size() + encoded.size());
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch == '+') {
      out.push_back(plusAs);
      continue;
    }
    if (ch != '%') {
      out.push_back(ch);
      continue;
    }
    if (pos + 2 >= encoded.size()) {
      if (strict) {
        return false;
      }
      out.push_back('%');
      continue;
    }
    const int hi = FromHexDigit(encoded[pos + 1]);
    const int lo = FromHexDigit(encoded[pos + 2]);
    if (hi < 0 || lo < 0) {
      if (strict) {
        return false;
      }
      out.push_back('%');
      continue;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    pos += 2;
  }
  return true;
}

}  // namespace

std::optional<std::string> Decode(std::string_view encoded, char plusAs) {
  std::string ret;
  if (!DecodeInto(encoded, plusAs, true, ret)) {
    return std::nullopt;
  }
  return ret;
}

std::string DecodeLenient(std::string_view encoded, char plusAs) {
  std::string ret;
  DecodeInto(encoded, plusAs, false, ret);
  return ret;
}

std::vector<std::pair<std::string, std::string>> ParseFormEncoded(std::string_view encoded) {
  std::vector<std::pair<std::string, std::string>> params;
  while (!encoded.empty()) {
    const auto ampPos = encoded.find('&');
    const std::string_view pair = encoded.substr(0, ampPos);
    encoded.remove_prefix(ampPos == std::string_view::npos ? encoded.size() : ampPos + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eqPos = pair.find('=');
    if (eqPos == std::string_view::npos) {
      params.emplace_back(DecodeLenient(pair, ' '), std::string());
    } else {
      params.emplace_back(DecodeLenient(pair.substr(0, eqPos), ' '), DecodeLenient(pair.substr(eqPos + 1), ' '));
    }
  }
  return params;
}

}  // namespace wayfarer::url
