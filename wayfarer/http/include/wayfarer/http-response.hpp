#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "wayfarer/http-cookie.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/response-sink.hpp"
#include "wayfarer/task.hpp"

namespace wayfarer {

struct HttpContext;

// Writes a response body to the sink, later, during the deferred write.
// Producers not announcing a Content-Length are framed with chunked transfer encoding.
using BodyProducer = std::function<WriteTask(const HttpContext&, ResponseSink&)>;

// Response under construction. Handlers never mutate the response of their input context, they return
// a modified copy.
class HttpResponse {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  HttpResponse() = default;

  [[nodiscard]] http::Status status() const noexcept { return _status; }

  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  // Case-insensitive lookup of the last value of given header.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] const std::vector<HttpCookie>& cookies() const noexcept { return _cookies; }

  [[nodiscard]] bool hasBody() const noexcept { return !std::holds_alternative<std::monostate>(_content); }

  // Non-null when the content is a byte string.
  [[nodiscard]] const std::string* bytes() const noexcept { return std::get_if<std::string>(&_content); }

  // Non-null when the content is a producer.
  [[nodiscard]] const BodyProducer* producer() const noexcept { return std::get_if<BodyProducer>(&_content); }

  HttpResponse& status(http::Status status) {
    _status = status;
    return *this;
  }

  // Sets a header, replacing all previous values of the same key (case-insensitive).
  HttpResponse& header(std::string_view key, std::string_view value);

  // Appends a header, keeping previous values of the same key.
  HttpResponse& addHeader(std::string_view key, std::string_view value);

  // Removes all values of given header key (case-insensitive).
  HttpResponse& removeHeader(std::string_view key);

  // Adds a cookie, replacing a previously set cookie of the same name.
  HttpResponse& cookie(HttpCookie cookie);

  HttpResponse& body(std::string bytes) {
    _content = std::move(bytes);
    return *this;
  }

  HttpResponse& body(BodyProducer producer) {
    _content = std::move(producer);
    return *this;
  }

  HttpResponse& clearBody() noexcept {
    _content = std::monostate{};
    return *this;
  }

 private:
  http::Status _status{http::Status::NotFound};
  std::vector<HeaderField> _headers;
  std::vector<HttpCookie> _cookies;
  std::variant<std::monostate, std::string, BodyProducer> _content;
};

}  // namespace wayfarer
