#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-method.hpp"

namespace wayfarer {

// Inbound request, as handed over by the transport.
// The transport builds it with the fluent setters below; handlers only read it.
class HttpRequest {
 public:
  using HeaderField = std::pair<std::string, std::string>;
  using Param = std::pair<std::string, std::string>;

  HttpRequest() = default;

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The URL decoded path (the target without the query params string).
  // Example:
  //  GET /path               -> '/path'
  //  GET /path?key=val       -> '/path'
  //  GET /path%2Caaa?key=val -> '/path,aaa'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw (still encoded) query string, without the '?'.
  [[nodiscard]] std::string_view rawQuery() const noexcept { return _rawQuery; }

  // Protocol version token, "HTTP/1.1" by default.
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Header fields in reception order, duplicates preserved.
  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  // Case-insensitive lookup. When a header is present several times, the last value wins.
  //   * std::nullopt  => header not present in the request.
  //   * engaged empty => header present with an empty value.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  // Like headerValue() but returns an empty string_view when the header is absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  // URL decoded query params, order and duplicates preserved.
  [[nodiscard]] const std::vector<Param>& queryParams() const noexcept { return _queryParams; }

  // First value of given query param.
  [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view key) const noexcept;

  // Params decoded from an application/x-www-form-urlencoded body. Empty for other content types.
  [[nodiscard]] std::vector<Param> formParams() const;

  [[nodiscard]] std::optional<std::string> formParam(std::string_view key) const;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Host header value without its port, or empty if absent.
  [[nodiscard]] std::string_view host() const noexcept;

  // Whether the request was received over an encrypted transport.
  [[nodiscard]] bool isSecure() const noexcept { return _secure; }

  [[nodiscard]] std::string_view remoteAddress() const noexcept { return _remoteAddress; }

  // Value of given cookie from the Cookie header(s).
  [[nodiscard]] std::optional<std::string> cookie(std::string_view name) const;

  HttpRequest& withMethod(http::Method method) {
    _method = method;
    return *this;
  }

  // Splits the request target into path and query. The path is percent-decoded ('+' kept as is),
  // query params are decoded with form semantics.
  HttpRequest& withTarget(std::string_view target);

  HttpRequest& withVersion(std::string_view version) {
    _version.assign(version);
    return *this;
  }

  // Appends a header field. Surrounding whitespace of the value is trimmed.
  HttpRequest& withHeader(std::string_view key, std::string_view value);

  HttpRequest& withBody(std::string body) {
    _body = std::move(body);
    return *this;
  }

  HttpRequest& withSecure(bool secure = true) {
    _secure = secure;
    return *this;
  }

  HttpRequest& withRemoteAddress(std::string_view remoteAddress) {
    _remoteAddress.assign(remoteAddress);
    return *this;
  }

 private:
  http::Method _method{http::Method::GET};
  bool _secure{false};
  std::string _path{"/"};
  std::string _rawQuery;
  std::string _version{http::HTTP11Sv};
  std::vector<HeaderField> _headers;
  std::vector<Param> _queryParams;
  std::string _body;
  std::string _remoteAddress;
};

}  // namespace wayfarer
