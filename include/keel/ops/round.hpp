#ifndef KEEL_OPS_ROUND_HPP
#define KEEL_OPS_ROUND_HPP

// Rounding engine.
//
//   round(x)                          nearest integer, ties to even
//   round(x, rounding::TowardZero{})  integer under a policy tag
//   round(x, RoundingMode::Up)        integer under a run-time mode
//   round(x, Rnd, {.Digits = 2})      two digits after the point, base 10
//   round(x, Rnd, {.SigDigits = 3, .Base = 2})
//   trunc / floor / ceil              round with ToZero / Down / Up
//   roundTo<I>(x, Rnd), truncTo<I>(x) round then convert to integer I
//
// Digit rounding scales by Base^Digits, rounds to an integer and scales
// back, so a decimal request on a binary value is only as exact as that
// scaling: round(1.15, {.Digits = 1}) is 1.2 even though the stored
// value is below 1.15.

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

#include "keel/core/classify.hpp"
#include "keel/core/exceptions.hpp"
#include "keel/core/float.hpp"
#include "keel/core/rounding.hpp"

namespace keel {

struct RoundOptions {
  std::optional<int> Digits;    // after the point; negative rounds to a step
  std::optional<int> SigDigits; // significant digits
  std::optional<int> Base;      // defaults to 10; ignored without a count
};

namespace detail {

// ===================================================================
// Integral rounding kernels, one per policy
// ===================================================================

template <std::floating_point T>
T roundIntegral(T X, rounding::ToNearestTiesToEven) noexcept {
  // Independent of the dynamic rounding mode: resolve exact halves by
  // rounding X/2, which is exact for every non-integer X.
  T R = std::round(X);
  if (std::fabs(X - std::trunc(X)) == T(0.5))
    R = T(2) * std::round(X / T(2));
  return R;
}

template <std::floating_point T>
T roundIntegral(T X, rounding::ToNearestTiesAway) noexcept {
  T Y = std::trunc(X);
  return X == Y ? Y : std::trunc(T(2) * X - Y);
}

template <std::floating_point T>
T roundIntegral(T X, rounding::ToNearestTiesUp) noexcept {
  // Add a quarter twice, nudged by half an ulp of 0.5 either way, so a
  // tie lands exactly on the next integer and nothing else does.
  constexpr T HalfUlp = std::numeric_limits<T>::epsilon() / T(2);
  T Y = std::floor((X + (T(0.25) - HalfUlp)) + (T(0.25) + HalfUlp));
  return std::copysign(Y, X);
}

template <std::floating_point T>
T roundIntegral(T X, rounding::TowardPositive) noexcept {
  return std::ceil(X);
}

template <std::floating_point T>
T roundIntegral(T X, rounding::TowardNegative) noexcept {
  return std::floor(X);
}

template <std::floating_point T>
T roundIntegral(T X, rounding::TowardZero) noexcept {
  return std::trunc(X);
}

// ===================================================================
// Digit rounding
// ===================================================================

// Round X to a multiple of 1/InvStep.
template <std::floating_point T, RoundingPolicy Rnd>
T roundInvStep(T X, T InvStep, Rnd R) noexcept {
  T Y = roundIntegral(X * InvStep, R) / InvStep;
  return isFinite(Y) ? Y : X;
}

// Round X to a multiple of 1/InvStepSqrt^2 without forming InvStepSqrt^2.
template <std::floating_point T, RoundingPolicy Rnd>
T roundInvStepSqrt(T X, T InvStepSqrt, Rnd R) noexcept {
  T Y = roundIntegral((X * InvStepSqrt) * InvStepSqrt, R) / InvStepSqrt /
        InvStepSqrt;
  return isFinite(Y) ? Y : X;
}

// Round X to a multiple of Step. When the step itself is out of range
// the answer is zero or an infinity, chosen by direction.
template <std::floating_point T, RoundingPolicy Rnd>
T roundStep(T X, T Step, Rnd R) noexcept {
  T Y = roundIntegral(X / Step, R) * Step;
  if (isFinite(Y))
    return Y;
  if (X > 0)
    return Rnd::mode == RoundingMode::Up ? std::numeric_limits<T>::infinity()
                                         : T(0);
  if (X < 0)
    return Rnd::mode == RoundingMode::Down
               ? -std::numeric_limits<T>::infinity()
               : -T(0);
  return X;
}

template <std::floating_point T, RoundingPolicy Rnd>
T roundDigits(T X, Rnd R, int Digits, int Base) noexcept {
  T B = static_cast<T>(Base);
  if (Digits >= 0) {
    T InvStep = std::pow(B, static_cast<T>(Digits));
    if (isFinite(InvStep))
      return roundInvStep(X, InvStep, R);
    T InvStepSqrt = std::pow(B, static_cast<T>(Digits) / T(2));
    return roundInvStepSqrt(X, InvStepSqrt, R);
  }
  T Step = std::pow(B, static_cast<T>(-static_cast<int64_t>(Digits)));
  return roundStep(X, Step, R);
}

inline void checkBase(int Base) {
  if (Base < 2)
    throw ArgumentError("base must be at least 2, got " +
                        std::to_string(Base));
}

// Digit counts beyond int are out of reach of every format anyway.
inline int clampDigits(int64_t Digits) noexcept {
  if (Digits > std::numeric_limits<int>::max())
    return std::numeric_limits<int>::max();
  if (Digits < std::numeric_limits<int>::min())
    return std::numeric_limits<int>::min();
  return static_cast<int>(Digits);
}

// Position of the leading non-zero digit of X in the given base; 0 for 0.
// Base is at least 2.
template <std::floating_point T> int hiDigit(T X, int Base) noexcept {
  if (isZero(X))
    return 0;
  if (Base == 10)
    return 1 + static_cast<int>(std::floor(std::log10(std::fabs(X))));
  if (Base == 2)
    return 1 + exponent(X);
  return 1 + static_cast<int>(std::floor(std::log(std::fabs(X)) /
                                         std::log(static_cast<T>(Base))));
}

template <BuiltinInteger I> int hiDigit(I X, int Base) noexcept {
  int Count = 0;
  // Divide toward zero so the most negative value needs no negation.
  while (X != 0) {
    X = static_cast<I>(X / static_cast<I>(Base));
    ++Count;
  }
  return Count;
}

template <std::floating_point T, RoundingPolicy Rnd>
T roundSigDigits(T X, Rnd R, int SigDigits, int Base) noexcept {
  return roundDigits(
      X, R, clampDigits(int64_t{SigDigits} - hiDigit(X, Base)), Base);
}

template <BuiltinInteger I> std::string integerTypeName() {
  return std::string(std::is_signed_v<I> ? "int" : "uint") +
         std::to_string(sizeof(I) * 8) + "_t";
}

constexpr double pow2(int N) noexcept {
  double P = 1.0;
  for (int I = 0; I < N; ++I)
    P *= 2.0;
  return P;
}

} // namespace detail

// ===================================================================
// Integral rounding
// ===================================================================

template <IEEEFloat T, RoundingPolicy Rnd = rounding::Default>
T round(T X, Rnd R = Rnd{}) noexcept {
  if constexpr (std::same_as<T, Float16>)
    // Every binary16 integer fits in float and back without rounding.
    return Float16(detail::roundIntegral(static_cast<float>(X), R));
  else
    return detail::roundIntegral(X, R);
}

template <BuiltinInteger I, RoundingPolicy Rnd = rounding::Default>
constexpr I round(I X, Rnd = Rnd{}) noexcept {
  return X;
}

// ===================================================================
// Digit / significant-digit rounding
// ===================================================================

template <IEEEFloat T, RoundingPolicy Rnd>
T round(T X, Rnd R, const RoundOptions &Opts) {
  if (!Opts.Digits && !Opts.SigDigits)
    return round(X, R);
  if (Opts.Digits && Opts.SigDigits)
    throw ArgumentError(
        "`round` cannot use both `Digits` and `SigDigits` arguments.");
  int Base = Opts.Base.value_or(10);
  detail::checkBase(Base);
  if (!isFinite(X))
    return X;

  if constexpr (std::same_as<T, Float16>) {
    return Float16(round(static_cast<float>(X), R, Opts));
  } else {
    if (Opts.Digits)
      return detail::roundDigits(X, R, *Opts.Digits, Base);
    return detail::roundSigDigits(X, R, *Opts.SigDigits, Base);
  }
}

// Integers round to digits as double, except that significant digits
// are counted on the integer itself. The result is always a double, so
// with neither count given this is static_cast<double>(X), which rounds
// 64-bit values beyond 2^53; round(X, R) keeps the integer type.
template <BuiltinInteger I, RoundingPolicy Rnd>
double round(I X, Rnd R, const RoundOptions &Opts) {
  if (!Opts.Digits && !Opts.SigDigits)
    return static_cast<double>(X);
  if (Opts.Digits && Opts.SigDigits)
    throw ArgumentError(
        "`round` cannot use both `Digits` and `SigDigits` arguments.");
  int Base = Opts.Base.value_or(10);
  detail::checkBase(Base);
  auto F = static_cast<double>(X);
  if (Opts.Digits)
    return detail::roundDigits(F, R, *Opts.Digits, Base);
  int64_t Digits = int64_t{*Opts.SigDigits} - detail::hiDigit(X, Base);
  return detail::roundDigits(F, R, detail::clampDigits(Digits), Base);
}

template <IEEEFloat T> T round(T X, const RoundOptions &Opts) {
  return round(X, rounding::Default{}, Opts);
}

template <IEEEFloat T>
T round(T X, RoundingMode M, const RoundOptions &Opts = {}) {
  return visitRounding(M, [&](auto R) -> T { return round(X, R, Opts); });
}

template <IEEEFloat T> T trunc(T X, const RoundOptions &Opts = {}) {
  return round(X, rounding::TowardZero{}, Opts);
}

template <IEEEFloat T> T floor(T X, const RoundOptions &Opts = {}) {
  return round(X, rounding::TowardNegative{}, Opts);
}

template <IEEEFloat T> T ceil(T X, const RoundOptions &Opts = {}) {
  return round(X, rounding::TowardPositive{}, Opts);
}

// ===================================================================
// Rounding to an integer type
// ===================================================================

// Truncate X into I, or throw InexactError if the truncated value is NaN
// or outside I's range.
template <BuiltinInteger I, IEEEFloat T> I truncTo(T X) {
  constexpr int Digits = std::numeric_limits<I>::digits;
  // 2^Digits is one past the largest value; the smallest is -2^Digits
  // for signed types and 0 otherwise. All are exact in double.
  constexpr double Upper = detail::pow2(Digits);
  constexpr double Lower = std::is_signed_v<I> ? -Upper : 0.0;

  double D = std::trunc(static_cast<double>(X));
  if (!(D >= Lower && D < Upper))
    throw InexactError("trunc", detail::integerTypeName<I>(),
                       static_cast<double>(X));
  return static_cast<I>(D);
}

template <BuiltinInteger I, IEEEFloat T,
          RoundingPolicy Rnd = rounding::Default>
I roundTo(T X, Rnd R = Rnd{}) {
  if constexpr (Rnd::mode != RoundingMode::ToZero)
    X = round(X, R);
  return truncTo<I>(X);
}

template <BuiltinInteger I, IEEEFloat T> I roundTo(T X, RoundingMode M) {
  return visitRounding(M, [&](auto R) -> I { return roundTo<I>(X, R); });
}

} // namespace keel

#endif // KEEL_OPS_ROUND_HPP
