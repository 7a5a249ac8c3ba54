#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wayfarer/timestring.hpp"

namespace wayfarer {

class HttpCookie {
 public:
  enum class SameSite : std::int8_t { Unset, Strict, Lax, None };

  HttpCookie() noexcept = default;

  // Throws std::invalid_argument if name is not a valid token or value contains forbidden characters.
  HttpCookie(std::string_view name, std::string_view value);

  // Cookie of given name, with empty value, expired at the epoch. Browsers delete it on reception.
  static HttpCookie Expired(std::string_view name);

  [[nodiscard]] std::string_view name() const noexcept { return _name; }
  [[nodiscard]] std::string_view value() const noexcept { return _value; }
  [[nodiscard]] std::string_view path() const noexcept { return _path; }
  [[nodiscard]] std::string_view domain() const noexcept { return _domain; }
  [[nodiscard]] std::optional<SysTimePoint> expires() const noexcept { return _expires; }
  [[nodiscard]] bool secure() const noexcept { return _secure; }
  [[nodiscard]] bool httpOnly() const noexcept { return _httpOnly; }
  [[nodiscard]] SameSite sameSite() const noexcept { return _sameSite; }

  HttpCookie &withPath(std::string_view path);
  HttpCookie &withDomain(std::string_view domain);

  HttpCookie &withExpires(SysTimePoint expires) {
    _expires = expires;
    return *this;
  }

  HttpCookie &withSecure(bool secure = true) {
    _secure = secure;
    return *this;
  }

  HttpCookie &withHttpOnly(bool httpOnly = true) {
    _httpOnly = httpOnly;
    return *this;
  }

  HttpCookie &withSameSite(SameSite sameSite) {
    _sameSite = sameSite;
    return *this;
  }

  // Value of a Set-Cookie header field for this cookie (RFC 6265 §4.1).
  [[nodiscard]] std::string toSetCookieValue() const;

  bool operator==(const HttpCookie &) const = default;

 private:
  std::string _name;
  std::string _value;
  std::string _path;
  std::string _domain;
  std::optional<SysTimePoint> _expires;
  bool _secure{false};
  bool _httpOnly{false};
  SameSite _sameSite{SameSite::Unset};
};

// Parses the value of a Cookie request header ("a=1; b=2") into name / value pairs, in order.
// Malformed pairs (without '=' or with an empty name) are skipped.
[[nodiscard]] std::vector<std::pair<std::string, std::string>> ParseCookieHeader(std::string_view cookieHeader);

}  // namespace wayfarer
