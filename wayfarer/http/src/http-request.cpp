#include "wayfarer/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wayfarer/ascii.hpp"
#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-cookie.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"
#include "wayfarer/url-decode.hpp"

namespace wayfarer {

namespace {

std::string_view TrimOws(std::string_view value) {
  while (!value.empty() && isblank(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && isblank(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

// Media type of a Content-Type value, without its parameters.
std::string_view MediaType(std::string_view contentType) {
  return TrimOws(contentType.substr(0, contentType.find(';')));
}

}  // namespace

std::optional<std::string_view> HttpRequest::headerValue(std::string_view key) const noexcept {
  for (auto it = _headers.rbegin(); it != _headers.rend(); ++it) {
    if (CaseInsensitiveEqual(it->first, key)) {
      return std::string_view(it->second);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::queryParam(std::string_view key) const noexcept {
  for (const auto& [paramKey, paramValue] : _queryParams) {
    if (paramKey == key) {
      return std::string_view(paramValue);
    }
  }
  return std::nullopt;
}

std::vector<HttpRequest::Param> HttpRequest::formParams() const {
  const auto contentType = headerValue(http::ContentType);
  if (!contentType || !CaseInsensitiveEqual(MediaType(*contentType), http::ContentTypeFormUrlEncoded)) {
    return {};
  }
  return url::ParseFormEncoded(_body);
}

std::optional<std::string> HttpRequest::formParam(std::string_view key) const {
  for (auto& [paramKey, paramValue] : formParams()) {
    if (paramKey == key) {
      return std::move(paramValue);
    }
  }
  return std::nullopt;
}

std::string_view HttpRequest::host() const noexcept {
  std::string_view hostValue = headerValueOrEmpty(http::Host);
  if (hostValue.starts_with('[')) {
    // IPv6 literal, port after the closing bracket
    const auto closingPos = hostValue.find(']');
    return closingPos == std::string_view::npos ? hostValue : hostValue.substr(0, closingPos + 1);
  }
  return hostValue.substr(0, hostValue.find(':'));
}

std::optional<std::string> HttpRequest::cookie(std::string_view name) const {
  std::optional<std::string> ret;
  for (const auto& [key, value] : _headers) {
    if (!CaseInsensitiveEqual(key, http::Cookie)) {
      continue;
    }
    for (auto& [cookieName, cookieValue] : ParseCookieHeader(value)) {
      if (cookieName == name && !ret) {
        ret = std::move(cookieValue);
      }
    }
  }
  return ret;
}

HttpRequest& HttpRequest::withTarget(std::string_view target) {
  const auto queryPos = target.find('?');
  const std::string_view rawPath = target.substr(0, queryPos);
  _path = url::DecodeLenient(rawPath);
  if (_path.empty()) {
    _path.push_back('/');
  }
  if (queryPos == std::string_view::npos) {
    _rawQuery.clear();
    _queryParams.clear();
  } else {
    _rawQuery.assign(target.substr(queryPos + 1));
    _queryParams = url::ParseFormEncoded(_rawQuery);
  }
  return *this;
}

HttpRequest& HttpRequest::withHeader(std::string_view key, std::string_view value) {
  _headers.emplace_back(std::string(key), std::string(TrimOws(value)));
  return *this;
}

}  // namespace wayfarer
