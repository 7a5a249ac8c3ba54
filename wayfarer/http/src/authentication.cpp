#include "wayfarer/authentication.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/ascii.hpp"
#include "wayfarer/base64.hpp"
#include "wayfarer/http-constants.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/log.hpp"
#include "wayfarer/response-builders.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

namespace wayfarer {

namespace {

constexpr std::string_view kBasicScheme = "Basic";

// Authenticated copy of the context, or std::nullopt when a challenge is due.
std::optional<HttpContext> Authenticate(const HttpContext& ctx, const CredentialsPredicate& predicate) {
  const auto authorization = ctx.request.headerValue(http::Authorization);
  if (!authorization) {
    return std::nullopt;
  }
  const std::optional<BasicCredentials> credentials = ParseAuthToken(*authorization);
  if (!credentials || !CaseInsensitiveEqual(credentials->scheme, kBasicScheme)) {
    log::debug("Malformed or non Basic Authorization header for {}", ctx.request.path());
    return std::nullopt;
  }
  if (!predicate(*credentials)) {
    log::debug("Credentials of user '{}' rejected for {}", credentials->user, ctx.request.path());
    return std::nullopt;
  }
  HttpContext out = ctx;
  out.userState.insert_or_assign(std::string(kUserNameKey), credentials->user);
  return out;
}

}  // namespace

std::optional<BasicCredentials> ParseAuthToken(std::string_view token) {
  while (!token.empty() && isspace(token.front())) {
    token.remove_prefix(1);
  }
  const auto spacePos = token.find(' ');
  if (spacePos == 0 || spacePos == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view scheme = token.substr(0, spacePos);
  std::string_view payload = token.substr(spacePos + 1);
  while (!payload.empty() && isspace(payload.back())) {
    payload.remove_suffix(1);
  }
  if (payload.empty()) {
    return std::nullopt;
  }

  const std::optional<std::string> decoded = B64Decode(payload);
  if (!decoded) {
    return std::nullopt;
  }
  const auto colonPos = decoded->find(':');
  if (colonPos == std::string::npos) {
    return std::nullopt;
  }
  return BasicCredentials{std::string(scheme), decoded->substr(0, colonPos), decoded->substr(colonPos + 1)};
}

Handler AuthenticateBasic(CredentialsPredicate predicate) {
  return [predicate = std::move(predicate)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    std::optional<HttpContext> authenticated = Authenticate(ctx, predicate);
    if (!authenticated) {
      return Challenge()(ctx);
    }
    return std::move(*authenticated);
  };
}

Handler AuthenticateBasic(CredentialsPredicate predicate, Handler protectedPart) {
  return [predicate = std::move(predicate),
          protectedPart = std::move(protectedPart)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    const std::optional<HttpContext> authenticated = Authenticate(ctx, predicate);
    if (!authenticated) {
      return Challenge()(ctx);
    }
    return protectedPart(*authenticated);
  };
}

}  // namespace wayfarer
