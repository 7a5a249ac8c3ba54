#pragma once

#include <array>
#include <charconv>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "wayfarer/http-context.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

// Typed path scanning.
//
// Format conversions:
//   %d  signed integer, optional sign      -> signed integral type
//   %u  unsigned integer                   -> unsigned integral type
//   %f  floating point number              -> floating point type
//   %b  'true' or 'false' (any case)       -> bool
//   %c  exactly one character              -> char
//   %s  at least one character, up to the next literal of the format (or the end of the path) -> std::string
//   %%  a literal '%'
// A %s must be followed by a literal or end the format.

namespace wayfarer {

namespace detail {

struct ScanSegment {
  // Conversion character, or 0 for a literal segment.
  char spec{};
  std::string literal;
};

// Throws std::invalid_argument for a malformed format.
[[nodiscard]] std::vector<ScanSegment> ParseScanFormat(std::string_view format);

// Throws std::invalid_argument if the conversions of the format do not match, in number and kind, the expected ones.
void CheckScanSpecs(std::span<const ScanSegment> segments, std::span<const char> expectedSpecs,
                    std::string_view format);

// Raw text of each conversion, or std::nullopt if the path does not follow the format.
[[nodiscard]] std::optional<std::vector<std::string_view>> ScanPath(std::span<const ScanSegment> segments,
                                                                  std::string_view path, bool caseInsensitive);

template <class T>
inline constexpr bool kAlwaysFalse = false;

template <class T>
constexpr char ScanSpecOf() {
  if constexpr (std::is_same_v<T, bool>) {
    return 'b';
  } else if constexpr (std::is_same_v<T, char>) {
    return 'c';
  } else if constexpr (std::is_same_v<T, std::string>) {
    return 's';
  } else if constexpr (std::is_floating_point_v<T>) {
    return 'f';
  } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
    return 'd';
  } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
    return 'u';
  } else {
    static_assert(kAlwaysFalse<T>, "unsupported UrlScan capture type");
  }
}

template <class T>
std::optional<T> ConvertCapture(std::string_view raw) {
  if constexpr (std::is_same_v<T, std::string>) {
    return std::string(raw);
  } else if constexpr (std::is_same_v<T, char>) {
    return raw.front();
  } else if constexpr (std::is_same_v<T, bool>) {
    return CaseInsensitiveEqual(raw, "true");
  } else {
    if (raw.starts_with('+')) {
      raw.remove_prefix(1);
    }
    T value{};
    const auto [ptr, errc] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (errc != std::errc{} || ptr != raw.data() + raw.size()) {
      return std::nullopt;
    }
    return value;
  }
}

template <class... Ts, std::size_t... Is>
std::optional<std::tuple<Ts...>> ConvertCaptures(std::span<const std::string_view> raw, std::index_sequence<Is...>) {
  std::tuple<std::optional<Ts>...> converted{ConvertCapture<Ts>(raw[Is])...};
  if (!(std::get<Is>(converted).has_value() && ...)) {
    return std::nullopt;
  }
  return std::tuple<Ts...>(std::move(*std::get<Is>(converted))...);
}

template <class... Ts, class F>
Handler MakeUrlScan(std::string_view format, F makeHandler, bool caseInsensitive) {
  std::vector<ScanSegment> segments = ParseScanFormat(format);
  static constexpr std::array<char, sizeof...(Ts)> kExpectedSpecs{ScanSpecOf<Ts>()...};
  CheckScanSpecs(segments, kExpectedSpecs, format);

  return [segments = std::move(segments), makeHandler = std::move(makeHandler),
          caseInsensitive](const HttpContext& ctx) -> RouteResult<HttpContext> {
    const auto raw = ScanPath(segments, ctx.request.path(), caseInsensitive);
    if (!raw) {
      return kNoMatch;
    }
    auto captures = ConvertCaptures<Ts...>(*raw, std::index_sequence_for<Ts...>{});
    if (!captures) {
      return kNoMatch;
    }
    const Handler handler = std::apply(makeHandler, std::move(*captures));
    return handler(ctx);
  };
}

}  // namespace detail

// Scans the request path with 'format'. On success, makeHandler(captures...) builds the handler, which is run
// immediately on the context. A path not following the format gives no-match.
// Throws std::invalid_argument when the format is malformed or does not match Ts.
// Example:
//   UrlScan<int>("/items/%d", [](int id) { return Ok("item " + std::to_string(id)); })
template <class... Ts, class F>
[[nodiscard]] Handler UrlScan(std::string_view format, F makeHandler) {
  return detail::MakeUrlScan<Ts...>(format, std::move(makeHandler), false);
}

// Like UrlScan, literal parts of the format being compared case-insensitively.
template <class... Ts, class F>
[[nodiscard]] Handler UrlScanCi(std::string_view format, F makeHandler) {
  return detail::MakeUrlScan<Ts...>(format, std::move(makeHandler), true);
}

}  // namespace wayfarer
