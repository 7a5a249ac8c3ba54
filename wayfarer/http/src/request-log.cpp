#include "wayfarer/request-log.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/http-method.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/log.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/timestring.hpp"

namespace wayfarer {

namespace {

void AppendOrDash(std::string& out, std::string_view value) {
  if (value.empty()) {
    out.push_back('-');
  } else {
    out.append(value);
  }
}

}  // namespace

std::string LogFormat(const HttpContext& ctx) {
  const HttpRequest& request = ctx.request;
  const HttpResponse& response = ctx.response;

  std::string line;
  AppendOrDash(line, request.remoteAddress());
  line.append(" - ");
  AppendOrDash(line, ctx.userData(kUserNameKey).value_or(std::string_view{}));
  line.append(" [");
  line.append(TimeToStringCommonLog(SysClock::now()));
  line.append("] \"");
  line.append(http::MethodToStr(request.method()));
  line.push_back(' ');
  line.append(request.path());
  if (!request.rawQuery().empty()) {
    line.push_back('?');
    line.append(request.rawQuery());
  }
  line.push_back(' ');
  line.append(request.version());
  line.append("\" ");
  line.append(std::to_string(http::StatusCode(response.status())));
  line.push_back(' ');
  if (const std::string* bytes = response.bytes(); bytes != nullptr) {
    line.append(std::to_string(bytes->size()));
  } else if (auto contentLength = response.headerValue(http::ContentLength); contentLength && response.hasBody()) {
    line.append(*contentLength);
  } else if (response.hasBody()) {
    line.push_back('-');
  } else {
    line.push_back('0');
  }
  return line;
}

LogSink SpdlogSink() {
  return [](std::string_view line) { log::info("{}", line); };
}

Handler Log(LogSink sink, LogFormatter formatter) {
  return [sink = std::move(sink), formatter = std::move(formatter)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    sink(formatter(ctx));
    return ctx;
  };
}

}  // namespace wayfarer
