#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "wayfarer/http-cookie.hpp"
#include "wayfarer/http-response.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/route-result.hpp"

// Handlers writing into the response of the context. They always match.

namespace wayfarer {

inline std::span<const std::byte> AsBytes(std::string_view text) noexcept {
  return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

// Sets the status and installs the producer as content, to be run during the deferred write.
// Unless the producer later gets a Content-Length header, the body is sent with chunked transfer encoding.
[[nodiscard]] Handler RespondWith(http::Status status, BodyProducer producer);

// Sets the status, the bytes as content and their Content-Length.
// Statuses forbidding a body (1xx, 204, 304) drop both.
[[nodiscard]] Handler RespondWithBytes(http::Status status, std::span<const std::byte> bytes);

// UTF-8 text form of RespondWithBytes.
[[nodiscard]] inline Handler Respond(http::Status status, std::string_view text) {
  return RespondWithBytes(status, AsBytes(text));
}

[[nodiscard]] Handler SetStatus(http::Status status);

// Sets a response header, replacing previous values of the same key.
[[nodiscard]] Handler SetHeader(std::string_view key, std::string_view value);

// Appends a response header, keeping previous values of the same key.
[[nodiscard]] Handler AddHeader(std::string_view key, std::string_view value);

// Adds a Set-Cookie to the response. A cookie of the same name set earlier is replaced.
[[nodiscard]] Handler SetCookie(HttpCookie cookie);

// Asks the client to drop given cookie by sending it already expired.
[[nodiscard]] Handler UnsetCookie(std::string_view name);

// Sets the Content-Type header.
[[nodiscard]] Handler SetMimeType(std::string_view mimeType);

[[nodiscard]] Handler SetUserData(std::string_view key, std::string_view value);

}  // namespace wayfarer
