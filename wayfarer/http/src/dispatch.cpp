#include "wayfarer/dispatch.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/combinators.hpp"
#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/http-method.hpp"
#include "wayfarer/http-response.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/log.hpp"
#include "wayfarer/response-sink.hpp"
#include "wayfarer/response-writer.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/task.hpp"
#include "wayfarer/writers.hpp"

namespace wayfarer {

RouteResult<HttpContext> Dispatch(const Handler& app, const HttpContext& ctx) {
  try {
    RouteResult<HttpContext> outcome = app(ctx);
    if (!outcome) {
      log::debug("No handler for {} {}", http::MethodToStr(ctx.request.method()), ctx.request.path());
    }
    return outcome;
  } catch (const std::exception& ex) {
    log::error("Exception in handler of {} {}: {}", http::MethodToStr(ctx.request.method()), ctx.request.path(),
               ex.what());
    HttpContext out = ctx;
    out.response = HttpResponse{};
    const std::string_view body = ctx.config().exposeErrorDetails
                                      ? std::string_view(ex.what())
                                      : http::StatusMessage(http::Status::InternalServerError);
    return (SetMimeType(http::ContentTypeTextPlain) >> Respond(http::Status::InternalServerError, body))(out);
  }
}

RouteResult<WriteTask> Serve(const Handler& app, const HttpContext& ctx, ResponseSink& sink) {
  RouteResult<HttpContext> outcome = Dispatch(app, ctx);
  if (!outcome) {
    return kNoMatch;
  }
  return WriteResponse(std::move(outcome).value(), sink);
}

WriteTask RespondToInvalidRequestLine(const HttpContext& ctx, ResponseSink& sink) {
  HttpContext out = ctx;
  out.response = HttpResponse{};
  out.response.header(http::Connection, http::close);
  out.response.status(http::Status::HTTPVersionNotSupported);
  const std::string_view message = http::StatusMessage(http::Status::HTTPVersionNotSupported);
  out.response.header(http::ContentType, http::ContentTypeTextPlain).body(std::string(message));
  return WriteResponse(std::move(out), sink);
}

}  // namespace wayfarer
