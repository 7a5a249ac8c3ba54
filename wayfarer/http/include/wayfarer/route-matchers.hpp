#pragma once

#include <string_view>

#include "wayfarer/http-context.hpp"
#include "wayfarer/http-method.hpp"
#include "wayfarer/route-result.hpp"

// Matchers: handlers returning their input context unchanged when the request satisfies a predicate,
// no-match otherwise.

namespace wayfarer {

[[nodiscard]] Handler Method(http::Method method);

inline const Handler GET = Method(http::Method::GET);
inline const Handler POST = Method(http::Method::POST);
inline const Handler PUT = Method(http::Method::PUT);
inline const Handler DELETE = Method(http::Method::DELETE);
inline const Handler HEAD = Method(http::Method::HEAD);
inline const Handler CONNECT = Method(http::Method::CONNECT);
inline const Handler PATCH = Method(http::Method::PATCH);
inline const Handler TRACE = Method(http::Method::TRACE);
inline const Handler OPTIONS = Method(http::Method::OPTIONS);

// Exact path equality.
[[nodiscard]] Handler Url(std::string_view path);

// Case-insensitive path equality.
[[nodiscard]] Handler UrlCi(std::string_view path);

[[nodiscard]] Handler UrlStartsWith(std::string_view prefix);

// Matches when the ECMAScript regular expression matches somewhere in the path.
// Anchor the pattern with ^ and $ to match the whole path.
// Throws std::invalid_argument for an invalid pattern.
[[nodiscard]] Handler UrlRegex(std::string_view pattern);

// Matches requests received over an encrypted transport.
inline const Handler IsSecure = [](const HttpContext& ctx) -> RouteResult<HttpContext> {
  if (ctx.request.isSecure()) {
    return ctx;
  }
  return kNoMatch;
};

// Host header equality, without port, case-insensitive.
[[nodiscard]] Handler Host(std::string_view hostName);

[[nodiscard]] Handler HasQueryParam(std::string_view key);

}  // namespace wayfarer
