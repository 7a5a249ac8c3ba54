#include "wayfarer/test-util.hpp"

#include <charconv>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "wayfarer/http-context.hpp"
#include "wayfarer/http-request.hpp"
#include "wayfarer/response-writer.hpp"
#include "wayfarer/runtime-config.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"
#include "wayfarer/string-sink.hpp"

namespace wayfarer::test {

namespace {

constexpr std::string_view kCRLF = "\r\n";

std::string_view NextLine(std::string_view& raw) {
  const auto pos = raw.find(kCRLF);
  if (pos == std::string_view::npos) {
    throw std::invalid_argument("Missing CRLF in response");
  }
  std::string_view line = raw.substr(0, pos);
  raw.remove_prefix(pos + kCRLF.size());
  return line;
}

std::string Dechunk(std::string_view raw) {
  std::string body;
  for (;;) {
    const std::string_view sizeLine = NextLine(raw);
    std::size_t chunkSize = 0;
    const auto [ptr, errc] = std::from_chars(sizeLine.data(), sizeLine.data() + sizeLine.size(), chunkSize, 16);
    if (errc != std::errc{} || ptr != sizeLine.data() + sizeLine.size()) {
      throw std::invalid_argument("Invalid chunk size line");
    }
    if (chunkSize == 0) {
      if (raw != kCRLF) {
        throw std::invalid_argument("Invalid last chunk");
      }
      return body;
    }
    if (raw.size() < chunkSize + kCRLF.size() || raw.substr(chunkSize, kCRLF.size()) != kCRLF) {
      throw std::invalid_argument("Truncated chunk");
    }
    body.append(raw.substr(0, chunkSize));
    raw.remove_prefix(chunkSize + kCRLF.size());
  }
}

}  // namespace

HttpContext MakeContext(const RequestOptions& options, std::shared_ptr<const RuntimeConfig> runtime) {
  HttpRequest request;
  request.withMethod(options.method)
      .withTarget(options.target)
      .withSecure(options.secure)
      .withRemoteAddress(options.remoteAddress)
      .withHeader("Host", "localhost");
  for (const auto& [key, value] : options.headers) {
    request.withHeader(key, value);
  }
  request.withBody(options.body);
  return HttpContext(std::move(request), std::move(runtime));
}

std::optional<std::string_view> ParsedResponse::header(std::string_view key) const {
  std::optional<std::string_view> ret;
  for (const auto& [headerKey, value] : headers) {
    if (CaseInsensitiveEqual(headerKey, key)) {
      ret = value;
    }
  }
  return ret;
}

std::size_t ParsedResponse::headerCount(std::string_view key) const {
  std::size_t count = 0;
  for (const auto& [headerKey, value] : headers) {
    if (CaseInsensitiveEqual(headerKey, key)) {
      ++count;
    }
  }
  return count;
}

ParsedResponse ParseResponse(std::string_view raw) {
  ParsedResponse parsed;

  std::string_view statusLine = NextLine(raw);
  if (!statusLine.starts_with("HTTP/1.1 ") || statusLine.size() < 12) {
    throw std::invalid_argument("Invalid status line");
  }
  statusLine.remove_prefix(9);
  const auto [ptr, errc] = std::from_chars(statusLine.data(), statusLine.data() + 3, parsed.statusCode);
  if (errc != std::errc{} || ptr != statusLine.data() + 3) {
    throw std::invalid_argument("Invalid status code");
  }
  parsed.reason = statusLine.substr(statusLine.size() > 4 ? 4 : 3);

  for (std::string_view line = NextLine(raw); !line.empty(); line = NextLine(raw)) {
    const auto sepPos = line.find(": ");
    if (sepPos == std::string_view::npos) {
      throw std::invalid_argument("Invalid header line");
    }
    parsed.headers.emplace_back(std::string(line.substr(0, sepPos)), std::string(line.substr(sepPos + 2)));
  }

  const auto transferEncoding = parsed.header("Transfer-Encoding");
  parsed.chunked = transferEncoding && CaseInsensitiveEqual(*transferEncoding, "chunked");
  if (parsed.chunked && !raw.empty()) {
    parsed.body = Dechunk(raw);
  } else {
    parsed.body = raw;
  }
  return parsed;
}

std::string WriteToString(const HttpContext& ctx) {
  StringSink sink;
  WriteResponse(ctx, sink).runSynchronously();
  return sink.data();
}

}  // namespace wayfarer::test
