#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "wayfarer/route-result.hpp"

namespace wayfarer {

struct BasicCredentials {
  std::string scheme;
  std::string user;
  std::string password;

  bool operator==(const BasicCredentials&) const = default;
};

// Parses an Authorization header value "<scheme> base64(user:password)".
// The password may contain ':', the user name cannot.
// Returns std::nullopt on a missing scheme or payload, an invalid base64 payload or a missing ':'.
[[nodiscard]] std::optional<BasicCredentials> ParseAuthToken(std::string_view token);

using CredentialsPredicate = std::function<bool(const BasicCredentials&)>;

// Passes the context through, with the user name stored in user state under kUserNameKey, when the request
// carries Basic credentials accepted by the predicate. Otherwise answers with a Challenge.
// A challenge is a matched outcome: to guard other handlers, use the overload taking the protected part.
[[nodiscard]] Handler AuthenticateBasic(CredentialsPredicate predicate);

// Runs protectedPart on the authenticated context, answers with a Challenge without running it otherwise.
[[nodiscard]] Handler AuthenticateBasic(CredentialsPredicate predicate, Handler protectedPart);

}  // namespace wayfarer
