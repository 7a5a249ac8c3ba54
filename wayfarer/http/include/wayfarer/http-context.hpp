#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wayfarer/http-request.hpp"
#include "wayfarer/http-response.hpp"
#include "wayfarer/runtime-config.hpp"

namespace wayfarer {

// Everything a handler sees about one request: the request itself, the response built so far,
// the shared runtime configuration and free-form user state.
// Value type: handlers narrow it by returning modified copies.
struct HttpContext {
  HttpContext();

  // A null runtime is replaced by a default RuntimeConfig.
  explicit HttpContext(HttpRequest req, std::shared_ptr<const RuntimeConfig> runtimeConfig = {});

  [[nodiscard]] const RuntimeConfig& config() const noexcept { return *runtime; }

  [[nodiscard]] std::optional<std::string_view> userData(std::string_view key) const;

  HttpRequest request;
  HttpResponse response;
  std::shared_ptr<const RuntimeConfig> runtime;
  std::map<std::string, std::string, std::less<>> userState;
};

// User state key under which AuthenticateBasic stores the authenticated user name.
inline constexpr std::string_view kUserNameKey = "userName";

}  // namespace wayfarer
