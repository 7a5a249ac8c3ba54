#include "wayfarer/writers.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/http-cookie.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/route-result.hpp"

namespace wayfarer {

Handler RespondWith(http::Status status, BodyProducer producer) {
  return [status, producer = std::move(producer)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    HttpContext out = ctx;
    out.response.status(status).removeHeader(http::ContentLength);
    if (http::IsBodyForbidden(status)) {
      out.response.clearBody();
    } else {
      out.response.body(producer);
    }
    return out;
  };
}

Handler RespondWithBytes(http::Status status, std::span<const std::byte> bytes) {
  std::string content(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  return [status, content = std::move(content)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    HttpContext out = ctx;
    out.response.status(status);
    if (http::IsBodyForbidden(status)) {
      out.response.clearBody().removeHeader(http::ContentLength);
    } else {
      out.response.header(http::ContentLength, std::to_string(content.size())).body(content);
    }
    return out;
  };
}

Handler SetStatus(http::Status status) {
  return [status](const HttpContext& ctx) -> RouteResult<HttpContext> {
    HttpContext out = ctx;
    out.response.status(status);
    return out;
  };
}

Handler SetHeader(std::string_view key, std::string_view value) {
  return [key = std::string(key), value = std::string(value)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    HttpContext out = ctx;
    out.response.header(key, value);
    return out;
  };
}

Handler AddHeader(std::string_view key, std::string_view value) {
  return [key = std::string(key), value = std::string(value)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    HttpContext out = ctx;
    out.response.addHeader(key, value);
    return out;
  };
}

Handler SetCookie(HttpCookie cookie) {
  return [cookie = std::move(cookie)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    HttpContext out = ctx;
    out.response.cookie(cookie);
    return out;
  };
}

Handler UnsetCookie(std::string_view name) { return SetCookie(HttpCookie::Expired(name)); }

Handler SetMimeType(std::string_view mimeType) { return SetHeader(http::ContentType, mimeType); }

Handler SetUserData(std::string_view key, std::string_view value) {
  return [key = std::string(key), value = std::string(value)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    HttpContext out = ctx;
    out.userState.insert_or_assign(key, value);
    return out;
  };
}

}  // namespace wayfarer
