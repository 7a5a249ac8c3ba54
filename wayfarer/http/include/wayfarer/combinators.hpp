#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "wayfarer/http-context.hpp"
#include "wayfarer/http-request.hpp"
#include "wayfarer/route-result.hpp"

// Algebra of match / no-match returning functions.
// A handler is any callable taking a value and returning a RouteResult. Handlers are composed
// sequentially (>>, Compose) or as alternatives (|, OrElse, Choose).

namespace wayfarer {

namespace detail {

template <class F, class Input>
using RouteValueT = typename std::invoke_result_t<const F&, const Input&>::value_type;

}  // namespace detail

// Succeed(x) -> matched(x). Usable as the identity handler.
struct SucceedFn {
  template <class T>
  RouteResult<std::remove_cvref_t<T>> operator()(T&& value) const {
    return RouteResult<std::remove_cvref_t<T>>(std::forward<T>(value));
  }
};

inline constexpr SucceedFn Succeed{};

inline constexpr NoMatch Fail{};

// Never(x) -> no-match, whatever x.
struct NeverFn {
  template <class T>
  RouteResult<std::remove_cvref_t<T>> operator()(const T& /*value*/) const noexcept {
    return kNoMatch;
  }
};

inline constexpr NeverFn Never{};

template <class F, class T>
auto Bind(F&& fn, RouteResult<T> outcome) -> std::invoke_result_t<F&, T&&> {
  if (!outcome) {
    return kNoMatch;
  }
  return std::invoke(fn, std::move(outcome).value());
}

// Handler built by makeHandler() each time an input reaches it.
template <class F>
auto Delay(F makeHandler) {
  return [makeHandler = std::move(makeHandler)](const auto& input) { return std::invoke(makeHandler)(input); };
}

// Runs 'first', then 'second' on its matched value. 'second' is not evaluated after a no-match.
template <class First, class Second>
auto Compose(First first, Second second) {
  return [first = std::move(first), second = std::move(second)]<class Input>(const Input& input)
             -> std::invoke_result_t<const Second&, detail::RouteValueT<First, Input>&> {
    auto outcome = std::invoke(first, input);
    if (!outcome) {
      return kNoMatch;
    }
    return std::invoke(second, *outcome);
  };
}

inline Handler operator>>(Handler first, Handler second) { return Compose(std::move(first), std::move(second)); }

// Evaluates the candidates in order and returns the first matched outcome.
inline RouteResult<HttpContext> Choose(const std::vector<Handler>& candidates, const HttpContext& input) {
  for (const Handler& candidate : candidates) {
    auto outcome = candidate(input);
    if (outcome) {
      return outcome;
    }
  }
  return kNoMatch;
}

inline Handler Choose(std::vector<Handler> candidates) {
  return [candidates = std::move(candidates)](const HttpContext& input) { return Choose(candidates, input); };
}

inline Handler OrElse(Handler first, Handler second) { return Choose({std::move(first), std::move(second)}); }

inline Handler operator|(Handler first, Handler second) { return OrElse(std::move(first), std::move(second)); }

// x -> fn(x, x), or fn(x)(x) for curried callables.
template <class F>
auto ApplyToSelf(F fn) {
  return [fn = std::move(fn)]<class Input>(const Input& input) {
    if constexpr (std::is_invocable_v<const F&, const Input&, const Input&>) {
      return std::invoke(fn, input, input);
    } else {
      return std::invoke(std::invoke(fn, input), input);
    }
  };
}

// Builds the handler from the context it is about to run on.
inline Handler Context(std::function<Handler(const HttpContext&)> makeHandler) {
  return ApplyToSelf(std::move(makeHandler));
}

// Builds the handler from the request of the context it is about to run on.
inline Handler Request(std::function<Handler(const HttpRequest&)> makeHandler) {
  return [makeHandler = std::move(makeHandler)](const HttpContext& ctx) { return makeHandler(ctx.request)(ctx); };
}

// Constant(x) -> callable ignoring its arguments and returning x.
struct ConstantFn {
  template <class T>
  auto operator()(T value) const {
    return [value = std::move(value)](auto&&...) { return value; };
  }
};

inline constexpr ConstantFn Constant{};

// fn(*item) when item is engaged, 'otherwise' if not.
template <class T, class F, class G>
auto Cond(const std::optional<T>& item, F&& fn, G&& otherwise) -> std::invoke_result_t<F&, const T&> {
  if (item) {
    return std::invoke(fn, *item);
  }
  return std::forward<G>(otherwise);
}

}  // namespace wayfarer
