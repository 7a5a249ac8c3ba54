#pragma once

#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace wayfarer {

// Routing signal: the handler does not apply to its input.
struct NoMatch {
  bool operator==(const NoMatch&) const = default;
};

inline constexpr NoMatch kNoMatch{};

// Outcome of a handler: either no-match, or matched with a value.
// No-match is not an error, it tells the caller to try the next candidate.
template <class T>
class RouteResult {
 public:
  using value_type = T;

  RouteResult(NoMatch) noexcept {}

  template <class U = T>
    requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::remove_cvref_t<U>, RouteResult> &&
             !std::is_same_v<std::remove_cvref_t<U>, NoMatch>)
  RouteResult(U&& value) : _state(std::in_place_index<1>, std::forward<U>(value)) {}

  [[nodiscard]] bool matched() const noexcept { return _state.index() == 1; }

  explicit operator bool() const noexcept { return matched(); }

  // Throws std::logic_error on a no-match.
  [[nodiscard]] T& value() & { return *checked(std::get_if<1>(&_state)); }
  [[nodiscard]] const T& value() const& { return *checked(std::get_if<1>(&_state)); }
  [[nodiscard]] T&& value() && { return std::move(*checked(std::get_if<1>(&_state))); }

  T& operator*() & noexcept { return *std::get_if<1>(&_state); }
  const T& operator*() const& noexcept { return *std::get_if<1>(&_state); }
  T&& operator*() && noexcept { return std::move(*std::get_if<1>(&_state)); }

  T* operator->() noexcept { return std::get_if<1>(&_state); }
  const T* operator->() const noexcept { return std::get_if<1>(&_state); }

  bool operator==(const RouteResult&) const = default;

 private:
  template <class Ptr>
  static Ptr checked(Ptr ptr) {
    if (ptr == nullptr) {
      throw std::logic_error("Access to the value of a no-match route result");
    }
    return ptr;
  }

  std::variant<NoMatch, T> _state;
};

struct HttpContext;

// A route: given a request context, either declines (no-match) or returns the context carrying
// the response built so far.
using Handler = std::function<RouteResult<HttpContext>(const HttpContext&)>;

}  // namespace wayfarer
