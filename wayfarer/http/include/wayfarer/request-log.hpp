#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "wayfarer/http-context.hpp"
#include "wayfarer/route-result.hpp"

namespace wayfarer {

// Receives one formatted log line per request reaching a Log handler.
using LogSink = std::function<void(std::string_view)>;

using LogFormatter = std::function<std::string(const HttpContext&)>;

// NCSA Common Log Format line of the context:
//   remote-address - user [10/Oct/2000:13:55:36 +0000] "GET /path?query HTTP/1.1" status bytes
// 'user' is the authenticated user name if any, and 'bytes' is '-' when the body size is not known in advance.
[[nodiscard]] std::string LogFormat(const HttpContext& ctx);

// Forwards lines to the library logger, at info level.
[[nodiscard]] LogSink SpdlogSink();

// Never filters: formats the context, forwards the line to the sink and passes the context unchanged.
[[nodiscard]] Handler Log(LogSink sink, LogFormatter formatter = LogFormat);

}  // namespace wayfarer
