#pragma once

#include "wayfarer/http-context.hpp"
#include "wayfarer/response-sink.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/task.hpp"

// Entry points of the transport.

namespace wayfarer {

// Runs one routing pass of 'app' on the context.
// An exception escaping a handler is logged and turned into 500 Internal Server Error, with the exception message
// as body only if RuntimeConfig::exposeErrorDetails is set.
[[nodiscard]] RouteResult<HttpContext> Dispatch(const Handler& app, const HttpContext& ctx);

// Dispatch, then the deferred write of the resulting response to the sink. No-match when no handler applies:
// the transport chooses how to answer it.
[[nodiscard]] RouteResult<WriteTask> Serve(const Handler& app, const HttpContext& ctx, ResponseSink& sink);

// Answer to a request whose request line cannot be parsed: 505 HTTP Version Not Supported, 'Connection: close'.
[[nodiscard]] WriteTask RespondToInvalidRequestLine(const HttpContext& ctx, ResponseSink& sink);

}  // namespace wayfarer
