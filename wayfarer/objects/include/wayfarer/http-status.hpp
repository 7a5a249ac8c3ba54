#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace wayfarer::http {

// Closed set of statuses this library knows how to emit.
enum class Status : int16_t {
  Continue = 100,
  SwitchingProtocols = 101,

  OK = 200,
  Created = 201,
  Accepted = 202,
  NonAuthoritativeInformation = 203,
  NoContent = 204,
  ResetContent = 205,
  PartialContent = 206,

  MultipleChoices = 300,
  MovedPermanently = 301,
  Found = 302,
  SeeOther = 303,
  NotModified = 304,
  UseProxy = 305,
  TemporaryRedirect = 307,

  BadRequest = 400,
  Unauthorized = 401,
  PaymentRequired = 402,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  NotAcceptable = 406,
  ProxyAuthenticationRequired = 407,
  RequestTimeout = 408,
  Conflict = 409,
  Gone = 410,
  LengthRequired = 411,
  PreconditionFailed = 412,
  PayloadTooLarge = 413,
  URITooLong = 414,
  UnsupportedMediaType = 415,
  RangeNotSatisfiable = 416,
  ExpectationFailed = 417,
  UnprocessableEntity = 422,
  PreconditionRequired = 428,
  TooManyRequests = 429,

  InternalServerError = 500,
  NotImplemented = 501,
  BadGateway = 502,
  ServiceUnavailable = 503,
  GatewayTimeout = 504,
  HTTPVersionNotSupported = 505,
};

struct StatusEntry {
  Status status;
  std::string_view reason;
  std::string_view message;
};

// Sorted by numeric code.
inline constexpr StatusEntry kAllStatuses[] = {
    {Status::Continue, "Continue", "Request received, please continue"},
    {Status::SwitchingProtocols, "Switching Protocols", "Switching to new protocol; obey Upgrade header"},

    {Status::OK, "OK", "Request fulfilled, document follows"},
    {Status::Created, "Created", "Document created, URL follows"},
    {Status::Accepted, "Accepted", "Request accepted, processing continues off-line"},
    {Status::NonAuthoritativeInformation, "Non-Authoritative Information", "Request fulfilled from cache"},
    {Status::NoContent, "No Content", "Request fulfilled, nothing follows"},
    {Status::ResetContent, "Reset Content", "Clear input form for further input"},
    {Status::PartialContent, "Partial Content", "Partial content follows"},

    {Status::MultipleChoices, "Multiple Choices", "Object has several resources -- see URI list"},
    {Status::MovedPermanently, "Moved Permanently", "Object moved permanently -- see URI list"},
    {Status::Found, "Found", "Object moved temporarily -- see URI list"},
    {Status::SeeOther, "See Other", "Object moved -- see Method and URL list"},
    {Status::NotModified, "Not Modified", "Document has not changed since given time"},
    {Status::UseProxy, "Use Proxy", "You must use proxy specified in Location to access this resource"},
    {Status::TemporaryRedirect, "Temporary Redirect", "Object moved temporarily -- see URI list"},

    {Status::BadRequest, "Bad Request", "Bad request syntax or unsupported method"},
    {Status::Unauthorized, "Unauthorized", "No permission -- see authorization schemes"},
    {Status::PaymentRequired, "Payment Required", "No payment -- see charging schemes"},
    {Status::Forbidden, "Forbidden", "Request forbidden -- authorization will not help"},
    {Status::NotFound, "Not Found", "Nothing matches the given URI"},
    {Status::MethodNotAllowed, "Method Not Allowed", "Specified method is invalid for this resource"},
    {Status::NotAcceptable, "Not Acceptable", "URI not available in preferred format"},
    {Status::ProxyAuthenticationRequired, "Proxy Authentication Required",
     "You must authenticate with this proxy before proceeding"},
    {Status::RequestTimeout, "Request Timeout", "Request timed out; try again later"},
    {Status::Conflict, "Conflict", "Request conflict"},
    {Status::Gone, "Gone", "URI no longer exists and has been permanently removed"},
    {Status::LengthRequired, "Length Required", "Client must specify Content-Length"},
    {Status::PreconditionFailed, "Precondition Failed", "Precondition in headers is false"},
    {Status::PayloadTooLarge, "Payload Too Large", "Entity is too large"},
    {Status::URITooLong, "URI Too Long", "URI is too long"},
    {Status::UnsupportedMediaType, "Unsupported Media Type", "Entity body in unsupported format"},
    {Status::RangeNotSatisfiable, "Range Not Satisfiable", "Cannot satisfy request range"},
    {Status::ExpectationFailed, "Expectation Failed", "Expect condition could not be satisfied"},
    {Status::UnprocessableEntity, "Unprocessable Entity",
     "The server understands the content type but was unable to process the contained instructions"},
    {Status::PreconditionRequired, "Precondition Required",
     "The origin server requires the request to be conditional"},
    {Status::TooManyRequests, "Too Many Requests",
     "The user has sent too many requests in a given amount of time (\"rate limiting\")"},

    {Status::InternalServerError, "Internal Server Error", "Server got itself in trouble"},
    {Status::NotImplemented, "Not Implemented", "Server does not support this operation"},
    {Status::BadGateway, "Bad Gateway", "Invalid responses from another server/proxy"},
    {Status::ServiceUnavailable, "Service Unavailable", "The server cannot process the request due to a high load"},
    {Status::GatewayTimeout, "Gateway Timeout", "The gateway server did not receive a timely response"},
    {Status::HTTPVersionNotSupported, "HTTP Version Not Supported", "Cannot fulfill request"},
};

constexpr int StatusCode(Status status) noexcept { return static_cast<int>(status); }

// Returns the registry entry of a status. Total over the enumeration.
const StatusEntry &StatusEntryOf(Status status) noexcept;

inline std::string_view ReasonPhrase(Status status) noexcept { return StatusEntryOf(status).reason; }

// Human readable explanation, suitable for a default response body.
inline std::string_view StatusMessage(Status status) noexcept { return StatusEntryOf(status).message; }

// Returns std::nullopt for integers that are not part of the registry.
[[nodiscard]] std::optional<Status> TryParseStatus(int code) noexcept;

// Informational statuses, 204 and 304 never carry a body (RFC 9110 §6.4.1).
constexpr bool IsBodyForbidden(Status status) noexcept {
  const int code = StatusCode(status);
  return code < 200 || status == Status::NoContent || status == Status::NotModified;
}

constexpr bool IsClientError(Status status) noexcept { return StatusCode(status) / 100 == 4; }

constexpr bool IsServerError(Status status) noexcept { return StatusCode(status) / 100 == 5; }

}  // namespace wayfarer::http
