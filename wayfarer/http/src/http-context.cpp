#include "wayfarer/http-context.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "wayfarer/http-request.hpp"
#include "wayfarer/runtime-config.hpp"

namespace wayfarer {

namespace {

std::shared_ptr<const RuntimeConfig> DefaultRuntimeConfig() {
  static const auto kDefault = std::make_shared<const RuntimeConfig>();
  return kDefault;
}

}  // namespace

HttpContext::HttpContext() : runtime(DefaultRuntimeConfig()) {}

HttpContext::HttpContext(HttpRequest req, std::shared_ptr<const RuntimeConfig> runtimeConfig)
    : request(std::move(req)), runtime(runtimeConfig ? std::move(runtimeConfig) : DefaultRuntimeConfig()) {}

std::optional<std::string_view> HttpContext::userData(std::string_view key) const {
  auto it = userState.find(key);
  if (it == userState.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

}  // namespace wayfarer
