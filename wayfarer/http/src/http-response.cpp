#include "wayfarer/http-response.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/http-cookie.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

namespace wayfarer {

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  for (auto it = _headers.rbegin(); it != _headers.rend(); ++it) {
    if (CaseInsensitiveEqual(it->first, key)) {
      return std::string_view(it->second);
    }
  }
  return std::nullopt;
}

HttpResponse& HttpResponse::header(std::string_view key, std::string_view value) {
  auto it = std::ranges::find_if(_headers, [key](const HeaderField& field) {
    return CaseInsensitiveEqual(field.first, key);
  });
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(key), std::string(value));
    return *this;
  }
  // keep the position of the first occurrence, drop the others
  it->second.assign(value);
  auto tail = std::remove_if(std::next(it), _headers.end(),
                             [key](const HeaderField& field) { return CaseInsensitiveEqual(field.first, key); });
  _headers.erase(tail, _headers.end());
  return *this;
}

HttpResponse& HttpResponse::addHeader(std::string_view key, std::string_view value) {
  _headers.emplace_back(std::string(key), std::string(value));
  return *this;
}

HttpResponse& HttpResponse::removeHeader(std::string_view key) {
  std::erase_if(_headers, [key](const HeaderField& field) { return CaseInsensitiveEqual(field.first, key); });
  return *this;
}

HttpResponse& HttpResponse::cookie(HttpCookie cookie) {
  auto it = std::ranges::find_if(_cookies, [&cookie](const HttpCookie& existing) {
    return existing.name() == cookie.name();
  });
  if (it == _cookies.end()) {
    _cookies.push_back(std::move(cookie));
  } else {
    *it = std::move(cookie);
  }
  return *this;
}

}  // namespace wayfarer
