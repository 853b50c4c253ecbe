#ifndef KEEL_CORE_ROUNDING_HPP
#define KEEL_CORE_ROUNDING_HPP

#include <concepts>
#include <string>
#include <utility>

#include "keel/core/enums.hpp"
#include "keel/core/exceptions.hpp"

namespace keel {

template <typename R>
concept RoundingPolicy = requires {
  { R::mode } -> std::convertible_to<RoundingMode>;
};

namespace rounding {

// Round toward zero (truncation).
struct TowardZero {
  static constexpr RoundingMode mode = RoundingMode::ToZero;
};

// Round to nearest, ties to even. IEEE 754 default.
struct ToNearestTiesToEven {
  static constexpr RoundingMode mode = RoundingMode::ToNearest;
};

// Round to nearest, ties away from zero (C-style).
struct ToNearestTiesAway {
  static constexpr RoundingMode mode = RoundingMode::ToNearestTiesAway;
};

// Round to nearest, ties toward positive infinity (Java-style).
struct ToNearestTiesUp {
  static constexpr RoundingMode mode = RoundingMode::ToNearestTiesUp;
};

// Round toward positive infinity (ceiling).
struct TowardPositive {
  static constexpr RoundingMode mode = RoundingMode::Up;
};

// Round toward negative infinity (floor).
struct TowardNegative {
  static constexpr RoundingMode mode = RoundingMode::Down;
};

using Default = ToNearestTiesToEven;

static_assert(RoundingPolicy<TowardZero>);
static_assert(RoundingPolicy<ToNearestTiesToEven>);
static_assert(RoundingPolicy<ToNearestTiesAway>);
static_assert(RoundingPolicy<ToNearestTiesUp>);
static_assert(RoundingPolicy<TowardPositive>);
static_assert(RoundingPolicy<TowardNegative>);

} // namespace rounding

// Call Fn with the policy tag matching a run-time RoundingMode.
template <typename Fn> decltype(auto) visitRounding(RoundingMode M, Fn &&F) {
  switch (M) {
  case RoundingMode::ToNearest:
    return std::forward<Fn>(F)(rounding::ToNearestTiesToEven{});
  case RoundingMode::ToNearestTiesAway:
    return std::forward<Fn>(F)(rounding::ToNearestTiesAway{});
  case RoundingMode::ToNearestTiesUp:
    return std::forward<Fn>(F)(rounding::ToNearestTiesUp{});
  case RoundingMode::Up:
    return std::forward<Fn>(F)(rounding::TowardPositive{});
  case RoundingMode::Down:
    return std::forward<Fn>(F)(rounding::TowardNegative{});
  case RoundingMode::ToZero:
    return std::forward<Fn>(F)(rounding::TowardZero{});
  }
  throw ArgumentError("unknown rounding mode " +
                      std::to_string(static_cast<int>(M)));
}

} // namespace keel

#endif // KEEL_CORE_ROUNDING_HPP
