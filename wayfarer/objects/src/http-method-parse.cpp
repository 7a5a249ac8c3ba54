#include <optional>
#include <string_view>

#include "wayfarer/ascii.hpp"
#include "wayfarer/http-method.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

namespace wayfarer::http {

namespace {

std::optional<Method> IfEqual(std::string_view str, std::string_view expected, Method method) {
  return CaseInsensitiveEqual(str, expected) ? std::optional<Method>(method) : std::nullopt;
}

}  // namespace

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:  // GET, PUT
      switch (toupper(str[0])) {
        case 'G':
          return IfEqual(str, "GET", Method::GET);
        case 'P':
          return IfEqual(str, "PUT", Method::PUT);
        default:
          return std::nullopt;
      }
    case 4:  // HEAD, POST
      switch (toupper(str[0])) {
        case 'H':
          return IfEqual(str, "HEAD", Method::HEAD);
        case 'P':
          return IfEqual(str, "POST", Method::POST);
        default:
          return std::nullopt;
      }
    case 5:  // TRACE, PATCH
      switch (toupper(str[0])) {
        case 'T':
          return IfEqual(str, "TRACE", Method::TRACE);
        case 'P':
          return IfEqual(str, "PATCH", Method::PATCH);
        default:
          return std::nullopt;
      }
    case 6:
      return IfEqual(str, "DELETE", Method::DELETE);
    case 7:  // CONNECT, OPTIONS
      switch (toupper(str[0])) {
        case 'C':
          return IfEqual(str, "CONNECT", Method::CONNECT);
        case 'O':
          return IfEqual(str, "OPTIONS", Method::OPTIONS);
        default:
          return std::nullopt;
      }
    default:
      return std::nullopt;
  }
}

}  // namespace wayfarer::http
