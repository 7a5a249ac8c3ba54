#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wayfarer/http-context.hpp"
#include "wayfarer/http-method.hpp"
#include "wayfarer/runtime-config.hpp"

namespace wayfarer::test {

struct RequestOptions {
  http::Method method{http::Method::GET};
  std::string target{"/"};
  std::vector<std::pair<std::string, std::string>> headers;  // additional headers
  std::string body;
  bool secure{false};
  std::string remoteAddress{"127.0.0.1"};
};

// Context of a request built from the options, as a transport would do.
[[nodiscard]] HttpContext MakeContext(const RequestOptions& options,
                                      std::shared_ptr<const RuntimeConfig> runtime = {});

[[nodiscard]] inline HttpContext MakeContext(std::string_view target,
                                             std::shared_ptr<const RuntimeConfig> runtime = {}) {
  RequestOptions options;
  options.target = target;
  return MakeContext(options, std::move(runtime));
}

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  int statusCode{0};
  bool chunked{false};
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;  // in order, duplicates kept
  std::string body;                                          // de-chunked if Transfer-Encoding: chunked

  // Last value of given header, case-insensitive.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view key) const;

  [[nodiscard]] std::size_t headerCount(std::string_view key) const;
};

// Parses a serialized response. Throws std::invalid_argument on malformed framing.
[[nodiscard]] ParsedResponse ParseResponse(std::string_view raw);

// Runs the deferred write of the context to a StringSink and returns its serialized response.
[[nodiscard]] std::string WriteToString(const HttpContext& ctx);

}  // namespace wayfarer::test
