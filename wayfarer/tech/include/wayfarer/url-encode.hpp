#pragma once

#include <string>
#include <string_view>

namespace wayfarer::url {

// RFC 3986 §2.3 unreserved characters.
constexpr bool IsUnreserved(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' ||
         ch == '_' || ch == '.' || ch == '~';
}

template <class IsNotEncodedFunc>
constexpr auto EncodedSize(std::string_view data, IsNotEncodedFunc isNotEncodedFunc) {
  std::string_view::size_type nbChars = 0;
  for (char ch : data) {
    nbChars += isNotEncodedFunc(ch) ? 1UL : 3UL;
  }
  return nbChars;
}

/// Appends the URL encoded form of 'data' to 'out'.
/// All input characters 'ch' for which isNotEncodedFunc(ch) is false are converted in upper case hexadecimal
/// (%NN where NN is a two-digit hexadecimal number).
template <class IsNotEncodedFunc>
void AppendEncoded(std::string_view data, IsNotEncodedFunc isNotEncodedFunc, std::string& out) {
  static constexpr std::string_view kHexDigits = "0123456789ABCDEF";
  out.reserve(out.size() + EncodedSize(data, isNotEncodedFunc));
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      out.push_back(ch);
    } else {
      const auto uch = static_cast<unsigned char>(ch);
      out.push_back('%');
      out.push_back(kHexDigits[uch >> 4U]);
      out.push_back(kHexDigits[uch & 0x0FU]);
    }
  }
}

}  // namespace wayfarer::url
