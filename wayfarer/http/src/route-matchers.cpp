#include "wayfarer/route-matchers.hpp"

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "wayfarer/http-context.hpp"
#include "wayfarer/http-method.hpp"
#include "wayfarer/route-result.hpp"
#include "wayfarer/string-equal-ignore-case.hpp"

namespace wayfarer {

namespace {

template <class Pred>
Handler Filter(Pred pred) {
  return [pred = std::move(pred)](const HttpContext& ctx) -> RouteResult<HttpContext> {
    if (pred(ctx.request)) {
      return ctx;
    }
    return kNoMatch;
  };
}

}  // namespace

Handler Method(http::Method method) {
  return Filter([method](const HttpRequest& request) { return request.method() == method; });
}

Handler Url(std::string_view path) {
  return Filter([path = std::string(path)](const HttpRequest& request) { return request.path() == path; });
}

Handler UrlCi(std::string_view path) {
  return Filter(
      [path = std::string(path)](const HttpRequest& request) { return CaseInsensitiveEqual(request.path(), path); });
}

Handler UrlStartsWith(std::string_view prefix) {
  return Filter(
      [prefix = std::string(prefix)](const HttpRequest& request) { return request.path().starts_with(prefix); });
}

Handler UrlRegex(std::string_view pattern) {
  std::shared_ptr<const std::regex> regex;
  try {
    regex = std::make_shared<const std::regex>(pattern.begin(), pattern.end(), std::regex::ECMAScript);
  } catch (const std::regex_error& ex) {
    throw std::invalid_argument("Invalid URL regex '" + std::string(pattern) + "': " + ex.what());
  }
  return Filter([regex = std::move(regex)](const HttpRequest& request) {
    const std::string_view path = request.path();
    return std::regex_search(path.begin(), path.end(), *regex);
  });
}

Handler Host(std::string_view hostName) {
  return Filter([hostName = std::string(hostName)](const HttpRequest& request) {
    return CaseInsensitiveEqual(request.host(), hostName);
  });
}

Handler HasQueryParam(std::string_view key) {
  return Filter([key = std::string(key)](const HttpRequest& request) { return request.queryParam(key).has_value(); });
}

}  // namespace wayfarer
