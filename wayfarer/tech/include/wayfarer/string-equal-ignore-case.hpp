#pragma once

#include <cstddef>
#include <string_view>

#include "wayfarer/ascii.hpp"

namespace wayfarer {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool CaseInsensitiveLess(std::string_view lhs, std::string_view rhs) {
  const auto minSize = lhs.size() < rhs.size() ? lhs.size() : rhs.size();
  for (std::size_t pos = 0; pos < minSize; ++pos) {
    const char lc = tolower(lhs[pos]);
    const char rc = tolower(rhs[pos]);
    if (lc != rc) {
      return lc < rc;
    }
  }
  return lhs.size() < rhs.size();
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Transparent comparator, usable as key comparison of ordered associative containers of header names.
struct CaseInsensitiveLessFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveLess(lhs, rhs);
  }
};

}  // namespace wayfarer
