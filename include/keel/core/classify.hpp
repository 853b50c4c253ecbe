#ifndef KEEL_CORE_CLASSIFY_HPP
#define KEEL_CORE_CLASSIFY_HPP

// Bit-level primitives shared by the rounding, approximate-equality and
// FMA code: classification, sign manipulation, neighbours, exponent
// access and spacing. Everything here works on the storage word through
// FloatTraits, so the three widths share one implementation.

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <limits>

#include "keel/core/float.hpp"

namespace keel {

template <IEEEFloat T> constexpr bool isNan(T X) noexcept {
  using L = typename FloatTraits<T>::layout;
  auto Bits = toBits(X);
  return (Bits & L::exp_mask) == L::exp_mask && (Bits & L::mant_mask) != 0;
}

template <IEEEFloat T> constexpr bool isInf(T X) noexcept {
  using L = typename FloatTraits<T>::layout;
  auto Bits = toBits(X);
  return (Bits & L::exp_mask) == L::exp_mask && (Bits & L::mant_mask) == 0;
}

template <IEEEFloat T> constexpr bool isFinite(T X) noexcept {
  using L = typename FloatTraits<T>::layout;
  return (toBits(X) & L::exp_mask) != L::exp_mask;
}

template <IEEEFloat T> constexpr bool isSubnormal(T X) noexcept {
  using L = typename FloatTraits<T>::layout;
  auto Bits = toBits(X);
  return (Bits & L::exp_mask) == 0 && (Bits & L::mant_mask) != 0;
}

template <IEEEFloat T> constexpr bool isZero(T X) noexcept {
  using L = typename FloatTraits<T>::layout;
  return (toBits(X) & ~L::sign_mask) == 0;
}

template <IEEEFloat T> constexpr bool signBit(T X) noexcept {
  using L = typename FloatTraits<T>::layout;
  return (toBits(X) & L::sign_mask) != 0;
}

template <IEEEFloat T> constexpr T copySign(T X, T Y) noexcept {
  using L = typename FloatTraits<T>::layout;
  using BitsType = typename FloatTraits<T>::storage_type;
  return fromBits<T>(static_cast<BitsType>((toBits(X) & ~L::sign_mask) |
                                           (toBits(Y) & L::sign_mask)));
}

// Flip the sign of X when Y is negative (including -0 and negative NaN).
template <IEEEFloat T> constexpr T flipSign(T X, T Y) noexcept {
  using L = typename FloatTraits<T>::layout;
  using BitsType = typename FloatTraits<T>::storage_type;
  return fromBits<T>(
      static_cast<BitsType>(toBits(X) ^ (toBits(Y) & L::sign_mask)));
}

// Step N representable values away from X (N > 0 toward +Inf, N < 0
// toward -Inf). Saturates at infinity, crosses zero through the
// subnormals, leaves NaN alone.
template <IEEEFloat T> constexpr T nextFloat(T X, int64_t N) noexcept {
  using L = typename FloatTraits<T>::layout;
  using BitsType = typename FloatTraits<T>::storage_type;
  constexpr BitsType InfBits = L::exp_mask;

  if (isNan(X))
    return X;

  auto Bits = toBits(X);
  bool Negative = (Bits & L::sign_mask) != 0;
  BitsType Mag = static_cast<BitsType>(Bits & ~L::sign_mask);
  bool StepDown = N < 0;
  uint64_t Dist = StepDown ? uint64_t(0) - static_cast<uint64_t>(N)
                           : static_cast<uint64_t>(N);

  if (Dist > InfBits) {
    Negative = StepDown;
    Mag = InfBits;
  } else {
    auto Du = static_cast<BitsType>(Dist);
    if (Negative != StepDown) {
      // Moving toward zero, possibly past it.
      if (Du > Mag) {
        Mag = std::min<BitsType>(InfBits, static_cast<BitsType>(Du - Mag));
        Negative = !Negative;
      } else {
        Mag = static_cast<BitsType>(Mag - Du);
      }
    } else {
      Mag = (InfBits - Mag < Du) ? InfBits : static_cast<BitsType>(Mag + Du);
    }
  }

  if (Negative)
    Mag |= L::sign_mask;
  return fromBits<T>(Mag);
}

template <IEEEFloat T> constexpr T nextFloat(T X) noexcept {
  return nextFloat(X, 1);
}

template <IEEEFloat T> constexpr T prevFloat(T X) noexcept {
  return nextFloat(X, -1);
}

// floor(log2(|X|)) for finite non-zero X, subnormals included.
// Returns INT_MIN for zero and INT_MAX for Inf/NaN.
template <IEEEFloat T> constexpr int exponent(T X) noexcept {
  using L = typename FloatTraits<T>::layout;
  using BitsType = typename FloatTraits<T>::storage_type;

  if (isZero(X))
    return INT_MIN;
  if (!isFinite(X))
    return INT_MAX;

  auto Bits = toBits(X);
  int Biased = static_cast<int>((Bits & L::exp_mask) >> L::exp_offset);
  if (Biased != 0)
    return Biased - L::exponent_bias;

  BitsType Mant = static_cast<BitsType>(Bits & L::mant_mask);
  int Lead = L::mant_bits - 1;
  while ((Mant >> Lead) == 0)
    --Lead;
  return L::min_exponent - (L::mant_bits - Lead);
}

// X * 2^N with a single correct rounding.
inline float ldexp(float X, int N) noexcept { return std::ldexp(X, N); }
inline double ldexp(double X, int N) noexcept { return std::ldexp(X, N); }
inline Float16 ldexp(Float16 X, int N) noexcept {
  // Exact in float over the whole binary16 range; one rounding on return.
  return Float16(std::ldexp(static_cast<float>(X), N));
}

// Machine epsilon: the gap between 1 and the next larger value.
template <IEEEFloat T> constexpr T eps() noexcept {
  return std::numeric_limits<T>::epsilon();
}

// Spacing at X: the distance to the next value of larger magnitude.
template <IEEEFloat T> T eps(T X) noexcept {
  if (!isFinite(X))
    return std::numeric_limits<T>::quiet_NaN();
  T Abs = copySign(X, T(0.0f));
  if (Abs >= std::numeric_limits<T>::min())
    return ldexp(eps<T>(), exponent(X));
  return std::numeric_limits<T>::denorm_min();
}

// Largest consecutive integer exactly representable in T.
template <IEEEFloat T> constexpr T maxIntFloat() noexcept {
  using L = typename FloatTraits<T>::layout;
  using BitsType = typename FloatTraits<T>::storage_type;
  // 2^precision: biased exponent (bias + precision), zero mantissa.
  return fromBits<T>(static_cast<BitsType>(
      static_cast<BitsType>(L::exponent_bias + L::precision) << L::exp_offset));
}

// Largest consecutive integer representable in T that does not exceed
// the largest value of I.
template <IEEEFloat T, BuiltinInteger I> T maxIntFloat() noexcept {
  T Limit = T(std::numeric_limits<I>::max());
  T Max = maxIntFloat<T>();
  return Limit < Max ? Limit : Max;
}

template <IEEEFloat T> bool isInteger(T X) noexcept {
  if (!isFinite(X))
    return false;
  if constexpr (std::same_as<T, Float16>)
    return isInteger(static_cast<float>(X));
  else
    return X - std::trunc(X) == 0;
}

} // namespace keel

#endif // KEEL_CORE_CLASSIFY_HPP
