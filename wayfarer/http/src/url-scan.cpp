#include "wayfarer/url-scan.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "wayfarer/ascii.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

namespace wayfarer::detail {

namespace {

constexpr std::string_view kConversions = "dufbcs";

bool LiteralEqual(std::string_view lhs, std::string_view rhs, bool caseInsensitive) {
  return caseInsensitive ? CaseInsensitiveEqual(lhs, rhs) : lhs == rhs;
}

// Position of the first occurrence of 'literal' in 'str' at or after 'from', or npos.
std::size_t FindLiteral(std::string_view str, std::string_view literal, std::size_t from, bool caseInsensitive) {
  if (!caseInsensitive) {
    return str.find(literal, from);
  }
  for (std::size_t pos = from; pos + literal.size() <= str.size(); ++pos) {
    if (CaseInsensitiveEqual(str.substr(pos, literal.size()), literal)) {
      return pos;
    }
  }
  return std::string_view::npos;
}

std::size_t DigitsLen(std::string_view str) {
  std::size_t len = 0;
  while (len < str.size() && isdigit(str[len])) {
    ++len;
  }
  return len;
}

std::size_t SignedDigitsLen(std::string_view str) {
  const std::size_t signLen = !str.empty() && (str.front() == '-' || str.front() == '+') ? 1U : 0U;
  const std::size_t digitsLen = DigitsLen(str.substr(signLen));
  return digitsLen == 0 ? 0 : signLen + digitsLen;
}

std::size_t FloatLen(std::string_view str) {
  const std::size_t signLen = str.starts_with('+') ? 1U : 0U;
  if (signLen == 1U && str.substr(1).starts_with('-')) {
    return 0;
  }
  const std::string_view number = str.substr(signLen);
  const std::string_view magnitude = number.starts_with('-') ? number.substr(1) : number;
  // from_chars also accepts inf and nan, which are not numbers in a path
  if (magnitude.empty() || (!isdigit(magnitude.front()) && magnitude.front() != '.')) {
    return 0;
  }
  const char* first = str.data() + signLen;
  double value;
  const auto result = std::from_chars(first, str.data() + str.size(), value);
  if (result.ptr == first) {
    return 0;
  }
  return static_cast<std::size_t>(result.ptr - str.data());
}

std::size_t BoolLen(std::string_view str) {
  if (str.size() >= 4 && CaseInsensitiveEqual(str.substr(0, 4), "true")) {
    return 4;
  }
  if (str.size() >= 5 && CaseInsensitiveEqual(str.substr(0, 5), "false")) {
    return 5;
  }
  return 0;
}

}  // namespace

std::vector<ScanSegment> ParseScanFormat(std::string_view format) {
  std::vector<ScanSegment> segments;
  std::string literal;
  const auto flushLiteral = [&segments, &literal]() {
    if (!literal.empty()) {
      segments.push_back(ScanSegment{0, std::move(literal)});
      literal.clear();
    }
  };

  for (std::size_t pos = 0; pos < format.size(); ++pos) {
    if (format[pos] != '%') {
      literal.push_back(format[pos]);
      continue;
    }
    if (++pos == format.size()) {
      throw std::invalid_argument("Scan format '" + std::string(format) + "' ends with a lone '%'");
    }
    const char spec = format[pos];
    if (spec == '%') {
      literal.push_back('%');
      continue;
    }
    if (kConversions.find(spec) == std::string_view::npos) {
      throw std::invalid_argument("Unknown conversion '%" + std::string(1, spec) + "' in scan format '" +
                                  std::string(format) + "'");
    }
    flushLiteral();
    if (!segments.empty() && segments.back().spec == 's') {
      throw std::invalid_argument("Conversion '%s' must be followed by a literal in scan format '" +
                                  std::string(format) + "'");
    }
    segments.push_back(ScanSegment{spec, {}});
  }
  flushLiteral();
  return segments;
}

void CheckScanSpecs(std::span<const ScanSegment> segments, std::span<const char> expectedSpecs,
                    std::string_view format) {
  std::size_t specIdx = 0;
  for (const ScanSegment& segment : segments) {
    if (segment.spec == 0) {
      continue;
    }
    if (specIdx == expectedSpecs.size()) {
      throw std::invalid_argument("Scan format '" + std::string(format) + "' has more conversions than captures");
    }
    if (segment.spec != expectedSpecs[specIdx]) {
      throw std::invalid_argument("Conversion #" + std::to_string(specIdx + 1) + " of scan format '" +
                                  std::string(format) + "' is '%" + std::string(1, segment.spec) + "', expected '%" +
                                  std::string(1, expectedSpecs[specIdx]) + "'");
    }
    ++specIdx;
  }
  if (specIdx != expectedSpecs.size()) {
    throw std::invalid_argument("Scan format '" + std::string(format) + "' has fewer conversions than captures");
  }
}

std::optional<std::vector<std::string_view>> ScanPath(std::span<const ScanSegment> segments, std::string_view path,
                                                      bool caseInsensitive) {
  std::vector<std::string_view> captures;
  for (std::size_t segIdx = 0; segIdx < segments.size(); ++segIdx) {
    const ScanSegment& segment = segments[segIdx];
    if (segment.spec == 0) {
      if (path.size() < segment.literal.size() ||
          !LiteralEqual(path.substr(0, segment.literal.size()), segment.literal, caseInsensitive)) {
        return std::nullopt;
      }
      path.remove_prefix(segment.literal.size());
      continue;
    }

    std::size_t len = 0;
    switch (segment.spec) {
      case 'd':
        len = SignedDigitsLen(path);
        break;
      case 'u':
        len = DigitsLen(path);
        break;
      case 'f':
        len = FloatLen(path);
        break;
      case 'b':
        len = BoolLen(path);
        break;
      case 'c':
        len = path.empty() ? 0U : 1U;
        break;
      default: {
        // 's', followed by a literal or ending the format
        if (segIdx + 1 == segments.size()) {
          len = path.size();
        } else {
          const std::size_t literalPos = FindLiteral(path, segments[segIdx + 1].literal, 1, caseInsensitive);
          len = literalPos == std::string_view::npos ? 0U : literalPos;
        }
        break;
      }
    }
    if (len == 0) {
      return std::nullopt;
    }
    captures.push_back(path.substr(0, len));
    path.remove_prefix(len);
  }
  if (!path.empty()) {
    return std::nullopt;
  }
  return captures;
}

}  // namespace wayfarer::detail
