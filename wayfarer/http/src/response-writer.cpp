#include "wayfarer/response-writer.hpp"

#include <array>
#include <charconv>
#include <string>
#include <string_view>

#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/http-method.hpp"
#include "wayfarer/http-response.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/log.hpp"
#include "wayfarer/response-sink.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"
#include "wayfarer/task.hpp"

namespace wayfarer {

namespace {

constexpr std::string_view kLastChunk = "0\r\n\r\n";

// Frames each write as one chunk of the chunked transfer coding (RFC 9112 §7.1).
class ChunkedSink final : public ResponseSink {
 public:
  explicit ChunkedSink(ResponseSink& sink) noexcept : _sink(sink) {}

  WriteTask write(std::string_view data) override {
    // an empty chunk would terminate the body
    if (data.empty()) {
      co_return;
    }
    std::array<char, 2 * sizeof(std::size_t)> hexSize;
    const auto result = std::to_chars(hexSize.data(), hexSize.data() + hexSize.size(), data.size(), 16);
    _frame.assign(hexSize.data(), result.ptr);
    _frame.append(http::CRLF);
    _frame.append(data);
    _frame.append(http::CRLF);
    co_await _sink.write(_frame);
  }

  WriteTask finish() { co_await _sink.write(kLastChunk); }

 private:
  ResponseSink& _sink;
  std::string _frame;
};

void AppendHeader(std::string& out, std::string_view key, std::string_view value) {
  out.append(key);
  out.append(http::HeaderSep);
  out.append(value);
  out.append(http::CRLF);
}

}  // namespace

WriteTask WriteResponse(HttpContext ctx, ResponseSink& sink) {
  const HttpResponse& response = ctx.response;
  const http::Status status = response.status();
  const bool bodyForbidden = http::IsBodyForbidden(status);
  const std::string* bytes = bodyForbidden ? nullptr : response.bytes();
  const BodyProducer* producer = bodyForbidden ? nullptr : response.producer();
  const bool producerWithLength = producer != nullptr && response.headerValue(http::ContentLength).has_value();
  const bool chunked = producer != nullptr && !producerWithLength;

  std::string head;
  head.append(http::HTTP11Sv);
  head.push_back(' ');
  head.append(std::to_string(http::StatusCode(status)));
  head.push_back(' ');
  head.append(http::ReasonPhrase(status));
  head.append(http::CRLF);

  for (const auto& [key, value] : response.headers()) {
    // framing headers are owned by this function
    if (CaseInsensitiveEqual(key, http::TransferEncoding) ||
        (CaseInsensitiveEqual(key, http::ContentLength) && !producerWithLength)) {
      continue;
    }
    AppendHeader(head, key, value);
  }
  for (const auto& [key, value] : ctx.config().globalHeaders) {
    if (!response.headerValue(key)) {
      AppendHeader(head, key, value);
    }
  }
  if (chunked) {
    AppendHeader(head, http::TransferEncoding, http::chunked);
  } else if (!bodyForbidden && !producerWithLength) {
    AppendHeader(head, http::ContentLength, std::to_string(bytes == nullptr ? 0 : bytes->size()));
  }
  for (const HttpCookie& cookie : response.cookies()) {
    AppendHeader(head, http::SetCookie, cookie.toSetCookieValue());
  }
  head.append(http::CRLF);

  log::debug("Writing response {} for {} {}", http::StatusCode(status), http::MethodToStr(ctx.request.method()),
             ctx.request.path());

  co_await sink.write(head);

  if (ctx.request.method() == http::Method::HEAD) {
    co_return;
  }
  if (bytes != nullptr && !bytes->empty()) {
    co_await sink.write(*bytes);
  } else if (chunked) {
    ChunkedSink chunkedSink(sink);
    co_await (*producer)(ctx, chunkedSink);
    co_await chunkedSink.finish();
  } else if (producer != nullptr) {
    co_await (*producer)(ctx, sink);
  }
}

}  // namespace wayfarer
