#ifndef KEEL_OPS_APPROX_HPP
#define KEEL_OPS_APPROX_HPP

// Approximate equality.
//
// isApprox(x, y) holds when x == y, or when both are finite and
//
//   norm(x - y) <= max(Atol, Rtol * max(norm(x), norm(y)))
//
// or when Nans is set and both are NaN. With the defaults (Atol = 0,
// Rtol = sqrt(eps) of the less precise float type) about half of the
// significant digits must agree; comparing against zero therefore needs
// an explicit Atol.

#include <algorithm>
#include <cmath>
#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

#include "keel/core/classify.hpp"
#include "keel/core/float.hpp"

namespace keel {

struct ApproxOptions {
  double Atol = 0;
  std::optional<double> Rtol; // unset: rtolDefault of the operand types
  bool Nans = false;          // NaN compares equal to NaN
};

// Magnitude of a real value. Signed integers map to their unsigned
// counterpart so the most negative value has a magnitude.
struct AbsNorm {
  template <BuiltinInteger I>
  constexpr std::make_unsigned_t<I> operator()(I X) const noexcept {
    using U = std::make_unsigned_t<I>;
    auto Bits = static_cast<U>(X);
    if constexpr (std::is_signed_v<I>)
      return X < 0 ? static_cast<U>(U(0) - Bits) : Bits;
    else
      return Bits;
  }

  Float16 operator()(Float16 X) const noexcept { return keel::abs(X); }
  float operator()(float X) const noexcept { return std::fabs(X); }
  double operator()(double X) const noexcept { return std::fabs(X); }
};

// ===================================================================
// Default relative tolerance
// ===================================================================

// sqrt(eps(T)) for float types, 0 for integers.
template <typename T> double rtolDefault() noexcept {
  if constexpr (IEEEFloat<T>)
    return std::sqrt(static_cast<double>(eps<T>()));
  else
    return 0.0;
}

// The looser of the two types' defaults, or 0 once an absolute
// tolerance is given.
template <typename T, typename U> double rtolDefault(double Atol) noexcept {
  if (Atol > 0)
    return 0.0;
  return std::max(rtolDefault<T>(), rtolDefault<U>());
}

namespace detail {

template <typename C> constexpr bool finiteValue(C X) noexcept {
  if constexpr (IEEEFloat<C>)
    return isFinite(X);
  else
    return true;
}

template <typename C> constexpr bool nanValue(C X) noexcept {
  if constexpr (IEEEFloat<C>)
    return isNan(X);
  else
    return false;
}

// X - Y in C. Integers give the distance |X - Y| in the unsigned
// type, which holds it for every pair of values.
template <typename C> auto difference(C X, C Y) noexcept {
  if constexpr (BuiltinInteger<C>) {
    using U = std::make_unsigned_t<C>;
    return X >= Y ? static_cast<U>(static_cast<U>(X) - static_cast<U>(Y))
                  : static_cast<U>(static_cast<U>(Y) - static_cast<U>(X));
  } else {
    return X - Y;
  }
}

} // namespace detail

// ===================================================================
// Comparison
// ===================================================================

template <typename T, typename U, typename Norm = AbsNorm>
  requires(IEEEFloat<T> || BuiltinInteger<T>) &&
          (IEEEFloat<U> || BuiltinInteger<U>)
bool isApprox(T X, U Y, const ApproxOptions &Opts = {}, Norm N = {}) {
  using C = std::common_type_t<T, U>;
  auto CX = static_cast<C>(X);
  auto CY = static_cast<C>(Y);

  if (CX == CY)
    return true;

  if (detail::finiteValue(CX) && detail::finiteValue(CY)) {
    double Rtol = Opts.Rtol ? *Opts.Rtol : rtolDefault<T, U>(Opts.Atol);
    auto Diff = static_cast<double>(N(detail::difference(CX, CY)));
    auto Scale = std::max(static_cast<double>(N(CX)),
                          static_cast<double>(N(CY)));
    return Diff <= std::max(Opts.Atol, Rtol * Scale);
  }

  return Opts.Nans && detail::nanValue(CX) && detail::nanValue(CY);
}

template <typename T, typename U, typename Norm = AbsNorm>
bool notApprox(T X, U Y, const ApproxOptions &Opts = {}, Norm N = {}) {
  return !isApprox(X, Y, Opts, std::move(N));
}

// isApprox with the right-hand side and configuration bound.
template <typename T, typename Norm = AbsNorm> class ApproxTo {
public:
  explicit ApproxTo(T Target, ApproxOptions Opts = {}, Norm N = {})
      : Target(Target), Opts(std::move(Opts)), N(std::move(N)) {}

  template <typename U> bool operator()(U X) const {
    return isApprox(X, Target, Opts, N);
  }

  T target() const noexcept { return Target; }
  const ApproxOptions &options() const noexcept { return Opts; }

private:
  T Target;
  ApproxOptions Opts;
  Norm N;
};

template <typename T, typename Norm = AbsNorm>
ApproxTo<T, Norm> approxTo(T Y, const ApproxOptions &Opts = {}, Norm N = {}) {
  return ApproxTo<T, Norm>(Y, Opts, std::move(N));
}

} // namespace keel

#endif // KEEL_OPS_APPROX_HPP
