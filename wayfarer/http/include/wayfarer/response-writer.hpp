#pragma once

#include "wayfarer/http-context.hpp"
#include "wayfarer/response-sink.hpp"
#include "wayfarer/task.hpp"

namespace wayfarer {

// Serializes the response of the context to the sink: status line, headers, then body.
//  - bytes content is sent with its Content-Length
//  - a producer is sent as is when a Content-Length header was set, chunked otherwise
//  - no content gives 'Content-Length: 0'
//  - global headers of the runtime config are added unless the response sets them
//  - each cookie gives one Set-Cookie header
//  - for HEAD requests and statuses forbidding a body, only the head is sent
// The context is taken by value: it is kept alive by the coroutine frame until the write completes.
[[nodiscard]] WriteTask WriteResponse(HttpContext ctx, ResponseSink& sink);

}  // namespace wayfarer
