#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "wayfarer/http-status.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/writers.hpp"

// Named shorthands of Respond / RespondWithBytes, grouped by status class.
// Text forms take UTF-8 text, ...Bytes forms take raw bytes.

namespace wayfarer {

// 2xx

[[nodiscard]] inline Handler Ok(std::string_view text) { return Respond(http::Status::OK, text); }
[[nodiscard]] inline Handler OkBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::OK, bytes);
}

[[nodiscard]] inline Handler Created(std::string_view text) { return Respond(http::Status::Created, text); }
[[nodiscard]] inline Handler CreatedBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::Created, bytes);
}

[[nodiscard]] inline Handler Accepted(std::string_view text) { return Respond(http::Status::Accepted, text); }
[[nodiscard]] inline Handler AcceptedBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::Accepted, bytes);
}

[[nodiscard]] inline Handler NoContent() { return RespondWithBytes(http::Status::NoContent, {}); }

// 3xx

// 301 with a Location header and an empty body.
[[nodiscard]] Handler MovedPermanently(std::string_view location);

// 302 with a Location header and an empty body.
[[nodiscard]] Handler Found(std::string_view location);

// 302 with a Location header and a small HTML body linking to 'url'.
[[nodiscard]] Handler Redirect(std::string_view url);

[[nodiscard]] inline Handler NotModified() { return RespondWithBytes(http::Status::NotModified, {}); }

// 4xx

[[nodiscard]] inline Handler BadRequest(std::string_view text) { return Respond(http::Status::BadRequest, text); }
[[nodiscard]] inline Handler BadRequestBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::BadRequest, bytes);
}

[[nodiscard]] inline Handler Unauthorized(std::string_view text) { return Respond(http::Status::Unauthorized, text); }
[[nodiscard]] inline Handler UnauthorizedBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::Unauthorized, bytes);
}

// 401 with 'WWW-Authenticate: Basic realm="<realm>"', realm taken from the runtime config.
[[nodiscard]] Handler Challenge();

[[nodiscard]] inline Handler Forbidden(std::string_view text) { return Respond(http::Status::Forbidden, text); }
[[nodiscard]] inline Handler ForbiddenBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::Forbidden, bytes);
}

[[nodiscard]] inline Handler NotFound(std::string_view text) { return Respond(http::Status::NotFound, text); }
[[nodiscard]] inline Handler NotFoundBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::NotFound, bytes);
}

[[nodiscard]] inline Handler MethodNotAllowed(std::string_view text) {
  return Respond(http::Status::MethodNotAllowed, text);
}
[[nodiscard]] inline Handler MethodNotAllowedBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::MethodNotAllowed, bytes);
}

[[nodiscard]] inline Handler NotAcceptable(std::string_view text) { return Respond(http::Status::NotAcceptable, text); }
[[nodiscard]] inline Handler NotAcceptableBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::NotAcceptable, bytes);
}

[[nodiscard]] inline Handler RequestTimeout(std::string_view text) {
  return Respond(http::Status::RequestTimeout, text);
}
[[nodiscard]] inline Handler RequestTimeoutBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::RequestTimeout, bytes);
}

[[nodiscard]] inline Handler Conflict(std::string_view text) { return Respond(http::Status::Conflict, text); }
[[nodiscard]] inline Handler ConflictBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::Conflict, bytes);
}

[[nodiscard]] inline Handler Gone(std::string_view text) { return Respond(http::Status::Gone, text); }
[[nodiscard]] inline Handler GoneBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::Gone, bytes);
}

[[nodiscard]] inline Handler UnsupportedMediaType(std::string_view text) {
  return Respond(http::Status::UnsupportedMediaType, text);
}
[[nodiscard]] inline Handler UnsupportedMediaTypeBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::UnsupportedMediaType, bytes);
}

[[nodiscard]] inline Handler UnprocessableEntity(std::string_view text) {
  return Respond(http::Status::UnprocessableEntity, text);
}
[[nodiscard]] inline Handler UnprocessableEntityBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::UnprocessableEntity, bytes);
}

[[nodiscard]] inline Handler PreconditionRequired(std::string_view text) {
  return Respond(http::Status::PreconditionRequired, text);
}
[[nodiscard]] inline Handler PreconditionRequiredBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::PreconditionRequired, bytes);
}

[[nodiscard]] inline Handler TooManyRequests(std::string_view text) {
  return Respond(http::Status::TooManyRequests, text);
}
[[nodiscard]] inline Handler TooManyRequestsBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::TooManyRequests, bytes);
}

// 5xx

[[nodiscard]] inline Handler InternalError(std::string_view text) {
  return Respond(http::Status::InternalServerError, text);
}
[[nodiscard]] inline Handler InternalErrorBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::InternalServerError, bytes);
}

[[nodiscard]] inline Handler NotImplemented(std::string_view text) {
  return Respond(http::Status::NotImplemented, text);
}
[[nodiscard]] inline Handler NotImplementedBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::NotImplemented, bytes);
}

[[nodiscard]] inline Handler BadGateway(std::string_view text) { return Respond(http::Status::BadGateway, text); }
[[nodiscard]] inline Handler BadGatewayBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::BadGateway, bytes);
}

[[nodiscard]] inline Handler ServiceUnavailable(std::string_view text) {
  return Respond(http::Status::ServiceUnavailable, text);
}
[[nodiscard]] inline Handler ServiceUnavailableBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::ServiceUnavailable, bytes);
}

[[nodiscard]] inline Handler GatewayTimeout(std::string_view text) {
  return Respond(http::Status::GatewayTimeout, text);
}
[[nodiscard]] inline Handler GatewayTimeoutBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::GatewayTimeout, bytes);
}

[[nodiscard]] inline Handler InvalidHttpVersion(std::string_view text) {
  return Respond(http::Status::HTTPVersionNotSupported, text);
}
[[nodiscard]] inline Handler InvalidHttpVersionBytes(std::span<const std::byte> bytes) {
  return RespondWithBytes(http::Status::HTTPVersionNotSupported, bytes);
}

}  // namespace wayfarer
