#include "wayfarer/http-cookie.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wayfarer/timestring.hpp"

namespace wayfarer {

namespace {

// RFC 7230 token characters.
constexpr bool IsTokenChar(char ch) {
  if (ch >= 'a' && ch <= 'z') {
    return true;
  }
  if (ch >= 'A' && ch <= 'Z') {
    return true;
  }
  if (ch >= '0' && ch <= '9') {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").contains(ch);
}

// RFC 6265 cookie-octet: no control, whitespace, DQUOTE, comma, semicolon nor backslash.
constexpr bool IsCookieOctet(char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  return uch > 0x20 && uch < 0x7F && ch != '"' && ch != ',' && ch != ';' && ch != '\\';
}

constexpr bool IsAttributeValueValid(std::string_view value) {
  return std::ranges::none_of(value, [](char ch) {
    const auto uch = static_cast<unsigned char>(ch);
    return uch < 0x20 || uch == 0x7F || ch == ';';
  });
}

constexpr std::string_view Trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace

HttpCookie::HttpCookie(std::string_view name, std::string_view value) : _name(name), _value(value) {
  if (name.empty() || !std::ranges::all_of(name, IsTokenChar)) {
    throw std::invalid_argument("Invalid cookie name '" + _name + "'");
  }
  if (!std::ranges::all_of(value, IsCookieOctet)) {
    throw std::invalid_argument("Invalid value for cookie '" + _name + "'");
  }
}

HttpCookie HttpCookie::Expired(std::string_view name) {
  HttpCookie cookie(name, std::string_view());
  cookie._expires = SysTimePoint{};
  return cookie;
}

HttpCookie &HttpCookie::withPath(std::string_view path) {
  if (!IsAttributeValueValid(path)) {
    throw std::invalid_argument("Invalid cookie path");
  }
  _path = path;
  return *this;
}

HttpCookie &HttpCookie::withDomain(std::string_view domain) {
  if (!IsAttributeValueValid(domain)) {
    throw std::invalid_argument("Invalid cookie domain");
  }
  _domain = domain;
  return *this;
}

std::string HttpCookie::toSetCookieValue() const {
  std::string ret;
  ret.reserve(_name.size() + _value.size() + 64U);
  ret.append(_name);
  ret.push_back('=');
  ret.append(_value);
  if (_expires) {
    ret.append("; Expires=");
    ret.append(TimeToStringRFC7231(*_expires));
  }
  if (!_domain.empty()) {
    ret.append("; Domain=");
    ret.append(_domain);
  }
  if (!_path.empty()) {
    ret.append("; Path=");
    ret.append(_path);
  }
  if (_secure) {
    ret.append("; Secure");
  }
  if (_httpOnly) {
    ret.append("; HttpOnly");
  }
  switch (_sameSite) {
    case SameSite::Strict:
      ret.append("; SameSite=Strict");
      break;
    case SameSite::Lax:
      ret.append("; SameSite=Lax");
      break;
    case SameSite::None:
      ret.append("; SameSite=None");
      break;
    default:
      break;
  }
  return ret;
}

std::vector<std::pair<std::string, std::string>> ParseCookieHeader(std::string_view cookieHeader) {
  std::vector<std::pair<std::string, std::string>> cookies;
  while (!cookieHeader.empty()) {
    const auto semiPos = cookieHeader.find(';');
    const std::string_view pair = Trim(cookieHeader.substr(0, semiPos));
    cookieHeader.remove_prefix(semiPos == std::string_view::npos ? cookieHeader.size() : semiPos + 1);

    const auto eqPos = pair.find('=');
    if (eqPos == std::string_view::npos) {
      continue;
    }
    const std::string_view name = Trim(pair.substr(0, eqPos));
    std::string_view value = Trim(pair.substr(eqPos + 1));
    if (name.empty()) {
      continue;
    }
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }
    cookies.emplace_back(name, value);
  }
  return cookies;
}

}  // namespace wayfarer
