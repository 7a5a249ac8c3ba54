#include "wayfarer/response-builders.hpp"

#include <string>
#include <string_view>

#include "wayfarer/combinators.hpp"
#include "wayfarer/html-escape.hpp"
#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/writers.hpp"

namespace wayfarer {

Handler MovedPermanently(std::string_view location) {
  return SetHeader(http::Location, location) >> RespondWithBytes(http::Status::MovedPermanently, {});
}

Handler Found(std::string_view location) {
  return SetHeader(http::Location, location) >> RespondWithBytes(http::Status::Found, {});
}

Handler Redirect(std::string_view url) {
  std::string body("<html>\n  <body>\n    <a href=\"");
  AppendHtmlEscaped(url, body);
  body.append("\">Content Moved</a>\n  </body>\n</html>");
  return SetHeader(http::Location, url) >> SetMimeType(http::ContentTypeTextHtml) >>
         Respond(http::Status::Found, body);
}

Handler Challenge() {
  return [](const HttpContext& ctx) -> RouteResult<HttpContext> {
    std::string challenge("Basic realm=\"");
    challenge.append(ctx.config().authRealm);
    challenge.push_back('"');
    return (SetHeader(http::WWWAuthenticate, challenge) >>
            Respond(http::Status::Unauthorized, http::StatusMessage(http::Status::Unauthorized)))(ctx);
  };
}

}  // namespace wayfarer
