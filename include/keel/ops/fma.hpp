#ifndef KEEL_OPS_FMA_HPP
#define KEEL_OPS_FMA_HPP

// Fused multiply-add: a*b + c with a single rounding.
//
// fma<Plat>(a, b, c) uses std::fma when Plat reports hardware support for
// the width and the software path otherwise; fmaEmulated(a, b, c) is the
// software path on its own. Both round to nearest, ties to even, and the
// software path matches hardware bit for bit, subnormals included.
//
// binary32: the product is exact in binary64, so only the final double
//   rounding of the binary64 sum needs attention.
// binary64: error-free transformations (Dekker product, two-sum) with the
//   low-order terms added under round-to-odd, and a rescaled path for
//   results near or below the subnormal range.
// binary16: evaluated in binary32.

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>

#include "keel/core/classify.hpp"
#include "keel/core/float.hpp"
#include "keel/core/platform.hpp"

namespace keel {

// A binary64 value as an unevaluated sum Hi + Lo.
struct SplitFloat {
  double Hi;
  double Lo;
};

namespace detail {

// Hi keeps the top 26 significand bits (27 trailing zeros), Lo is the
// exact remainder. Both halves multiply without rounding.
inline SplitFloat splitBits(double X) noexcept {
  double Hi = fromBits<double>(toBits(X) & 0xffff'ffff'f800'0000ull);
  return {Hi, X - Hi};
}

// A*B as Hi + Lo with Hi = fl(A*B). Exact unless the product overflows or
// the low part underflows.
inline SplitFloat twoMul(double A, double B) noexcept {
  auto [AHi, ALo] = splitBits(A);
  auto [BHi, BLo] = splitBits(B);
  double ABHi = A * B;
  auto [BLoHi, BLoLo] = splitBits(BLo);
  double ABLo = ALo * BLoHi - (((ABHi - AHi * BHi) - ALo * BHi) - AHi * BLo) +
                BLoLo * ALo;
  return {ABHi, ABLo};
}

// A + B as Hi + Lo exactly.
inline SplitFloat twoSum(double A, double B) noexcept {
  double Hi = A + B;
  double Lo = std::fabs(A) >= std::fabs(B) ? B - (Hi - A) : A - (Hi - B);
  return {Hi, Lo};
}

// A rounded value and the sign (-1, 0, +1) of the exact value minus it.
struct RoundedSum {
  double Value;
  int Tail;
};

// A + B rounded to odd: an inexact sum has its last significand bit set,
// so one later rounding to nearest still sees that the sum was inexact.
inline RoundedSum addRoundToOdd(double A, double B) noexcept {
  auto [S, T] = twoSum(A, B);
  if (T == 0)
    return {S, 0};
  int Dir = T > 0 ? 1 : -1;
  if ((toBits(S) & 1) == 0)
    return {nextFloat(S, Dir), -Dir};
  return {S, Dir};
}

// ABHi + ABLo + C rounded once, for an exact product ABHi + ABLo.
// (R, E) carries ABHi + C exactly; E + ABLo is rounded to odd so that a
// tie in R + E + ABLo is broken by whatever lies below ABLo's last bit.
inline RoundedSum sumProduct(double ABHi, double ABLo, double C) noexcept {
  auto [R, E] = twoSum(ABHi, C);
  auto [V, VTail] = addRoundToOdd(E, ABLo);
  auto [Sum, D] = twoSum(R, V);
  return {Sum, D != 0 ? (D > 0 ? 1 : -1) : VTail};
}

// Scale X into [1, 2) keeping its sign. X is finite and non-zero.
inline double normalizeSignificand(double X) noexcept {
  if (isSubnormal(X))
    X *= 0x1p52;
  return fromBits<double>((toBits(X) & 0x800f'ffff'ffff'ffffull) |
                          0x3ff0'0000'0000'0000ull);
}

} // namespace detail

// ===================================================================
// Software FMA
// ===================================================================

inline float fmaEmulated(float A, float B, float C) noexcept {
  double AB = static_cast<double>(A) * static_cast<double>(B);
  double Res = AB + static_cast<double>(C);

  constexpr double MinNormal32 = std::numeric_limits<float>::min();
  if (std::fabs(Res) < MinNormal32) {
    // Subnormal binary32 results round at a coarser, varying position,
    // so fold the binary64 rounding error in as a sticky bit (round to
    // odd). Any narrower format then rounds correctly.
    double Bv = Res - AB;
    double Err = (AB - (Res - Bv)) + (static_cast<double>(C) - Bv);
    if (Err != 0 && (toBits(Res) & 1) == 0)
      Res = nextFloat(Res, Err > 0 ? 1 : -1);
    return static_cast<float>(Res);
  }

  // Low 29 bits of 0x1000_0000 put Res exactly halfway between two
  // binary32 values; anything else narrows correctly as it is.
  if ((toBits(Res) & 0x1fff'ffffull) != 0x1000'0000ull)
    return static_cast<float>(Res);

  double ResLo = std::fabs(static_cast<double>(C)) > std::fabs(AB)
                     ? AB - (Res - static_cast<double>(C))
                     : static_cast<double>(C) - (Res - AB);
  if (ResLo != 0)
    Res = signBit(ResLo) ? prevFloat(Res) : nextFloat(Res);
  return static_cast<float>(Res);
}

inline double fmaEmulated(double A, double B, double C) noexcept {
  auto [ABHi, ABLo] = detail::twoMul(A, B);

  // Products at or below 2^-969 lose low bits of ABLo to underflow.
  if (!isFinite(ABHi + C) || std::fabs(ABHi) <= 0x1p-969 || isSubnormal(A) ||
      isSubnormal(B)) {
    if (!(isFinite(A) && isFinite(B)))
      return ABHi + C;
    // A finite product cannot cancel an infinite or NaN addend, even
    // when ABHi overflowed.
    if (!isFinite(C))
      return C;
    if (isZero(A) || isZero(B))
      return ABHi + C;

    int Bias = exponent(A) + exponent(B);
    double CDenorm = ldexp(C, -Bias);
    if (isFinite(CDenorm)) {
      // Compute (A' * B' + C') * 2^Bias with A', B' in [1, 2).
      auto [Hi, Lo] = detail::twoMul(detail::normalizeSignificand(A),
                                     detail::normalizeSignificand(B));
      auto [SumHi, Tail] = detail::sumProduct(Hi, Lo, CDenorm);

      // Scaling into the subnormal range rounds a second time. Pre-round
      // SumHi so that the tie-breaking ldexp lands on the right value.
      if (isFinite(SumHi) && !isZero(SumHi) &&
          exponent(SumHi) + Bias < -1022) {
        int BitsLost = -Bias - exponent(SumHi) - 1022;
        bool LowBitSet = (toBits(SumHi) & 1) != 0;
        if ((BitsLost != 1) != LowBitSet)
          SumHi = nextFloat(SumHi, Tail);
      }
      return ldexp(SumHi, Bias);
    }

    // C dominates any finite product; an infinite product of the same
    // sign as C is the answer.
    if (isInf(ABHi) && signBit(C) == signBit(A * B))
      return ABHi;
  }

  return detail::sumProduct(ABHi, ABLo, C).Value;
}

inline Float16 fmaEmulated(Float16 A, Float16 B, Float16 C) noexcept {
  return Float16(static_cast<float>(A) * static_cast<float>(B) +
                 static_cast<float>(C));
}

// ===================================================================
// Dispatch
// ===================================================================

template <PlatformPolicy Plat = platforms::Default, IEEEFloat T>
T fma(T A, T B, T C) noexcept {
  initializeRounding();
  if constexpr (std::same_as<T, Float16>) {
    if constexpr (hasHardwareFma<T, Plat>())
      return Float16(std::fma(static_cast<float>(A), static_cast<float>(B),
                              static_cast<float>(C)));
    else
      return fmaEmulated(A, B, C);
  } else {
    if constexpr (hasHardwareFma<T, Plat>())
      return std::fma(A, B, C);
    else
      return fmaEmulated(A, B, C);
  }
}

} // namespace keel

#endif // KEEL_OPS_FMA_HPP
