#ifndef KEEL_CORE_FLOAT16_HPP
#define KEEL_CORE_FLOAT16_HPP

// Float16: IEEE 754 binary16 as a value type.
//
// Storage is the raw 16-bit pattern. Conversions from wider types are
// correctly rounded (ties to even) with gradual underflow; conversions
// to float/double are exact. Arithmetic is evaluated in float and
// narrowed once, which is exact for + - * / because float carries more
// than 2*11+2 significand bits.

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "keel/core/bits.hpp"
#include "keel/core/format.hpp"

namespace keel {

class Float16 {
public:
  using layout = fp16_layout;
  using storage_type = layout::storage_type;

  Float16() = default;

  explicit Float16(double D) noexcept : Bits(narrow(D)) {}

  template <typename T>
    requires(std::is_arithmetic_v<T> && !std::same_as<T, double>)
  explicit Float16(T V) noexcept : Bits(narrow(static_cast<double>(V))) {}

  static constexpr Float16 fromBits(storage_type Raw) noexcept {
    Float16 H;
    H.Bits = Raw;
    return H;
  }

  constexpr storage_type bits() const noexcept { return Bits; }

  explicit operator float() const noexcept { return widen(Bits); }
  explicit operator double() const noexcept {
    return static_cast<double>(widen(Bits));
  }

  friend Float16 operator+(Float16 A, Float16 B) noexcept {
    return Float16(static_cast<float>(A) + static_cast<float>(B));
  }
  friend Float16 operator-(Float16 A, Float16 B) noexcept {
    return Float16(static_cast<float>(A) - static_cast<float>(B));
  }
  friend Float16 operator*(Float16 A, Float16 B) noexcept {
    return Float16(static_cast<float>(A) * static_cast<float>(B));
  }
  friend Float16 operator/(Float16 A, Float16 B) noexcept {
    return Float16(static_cast<float>(A) / static_cast<float>(B));
  }
  friend constexpr Float16 operator-(Float16 A) noexcept {
    return fromBits(static_cast<storage_type>(A.Bits ^ layout::sign_mask));
  }

  // IEEE comparison: -0 == +0, NaN is unordered.
  friend bool operator==(Float16 A, Float16 B) noexcept {
    return static_cast<float>(A) == static_cast<float>(B);
  }
  friend std::partial_ordering operator<=>(Float16 A, Float16 B) noexcept {
    return static_cast<float>(A) <=> static_cast<float>(B);
  }

private:
  static storage_type narrow(double D) noexcept {
    uint64_t U = bitCast<uint64_t>(D);
    auto Sign = static_cast<storage_type>((U >> 48) & 0x8000);
    uint64_t Abs = U & 0x7fff'ffff'ffff'ffffULL;

    if (Abs >= 0x7ff0'0000'0000'0000ULL) {
      if (Abs == 0x7ff0'0000'0000'0000ULL)
        return Sign | 0x7c00;
      // Keep the top payload bits and force the quiet bit.
      return static_cast<storage_type>(Sign | 0x7e00 | ((Abs >> 42) & 0x3ff));
    }

    int Exp = static_cast<int>(Abs >> 52) - 1023;
    if (Exp < -25)
      return Sign; // below half the smallest subnormal, or a binary64 subnormal

    if (Exp >= 16)
      return Sign | 0x7c00;

    uint64_t Sig = (Abs & 0x000f'ffff'ffff'ffffULL) | (uint64_t{1} << 52);
    uint64_t Biased;
    int Shift;
    if (Exp >= -14) {
      Shift = 52 - 10;
      Biased = (static_cast<uint64_t>(Exp + 15) << 10) |
               ((Sig >> Shift) & 0x3ff);
    } else {
      Shift = 42 + (-14 - Exp);
      Biased = Sig >> Shift;
    }

    uint64_t Rem = Sig & ((uint64_t{1} << Shift) - 1);
    uint64_t Half = uint64_t{1} << (Shift - 1);
    // A carry out of the mantissa bumps the exponent, and out of the
    // largest finite value lands exactly on infinity.
    if (Rem > Half || (Rem == Half && (Biased & 1)))
      ++Biased;
    return static_cast<storage_type>(Sign | Biased);
  }

  static float widen(storage_type H) noexcept {
    uint32_t Sign = static_cast<uint32_t>(H & 0x8000) << 16;
    uint32_t Exp = (H >> 10) & 0x1f;
    uint32_t Mant = H & 0x3ff;

    if (Exp == 0x1f)
      return bitCast<float>(Sign | 0x7f80'0000u | (Mant << 13));

    if (Exp == 0) {
      if (Mant == 0)
        return bitCast<float>(Sign);
      // Subnormal: normalize into the float's wider exponent range.
      int Shift = 0;
      while ((Mant & 0x400) == 0) {
        Mant <<= 1;
        ++Shift;
      }
      Mant &= 0x3ff;
      uint32_t FExp = static_cast<uint32_t>(127 - 15 + 1 - Shift);
      return bitCast<float>(Sign | (FExp << 23) | (Mant << 13));
    }

    return bitCast<float>(Sign | ((Exp + 127 - 15) << 23) | (Mant << 13));
  }

  storage_type Bits;
};

static_assert(sizeof(Float16) == 2);
static_assert(std::is_trivially_copyable_v<Float16>);

inline Float16 abs(Float16 X) noexcept {
  return Float16::fromBits(
      static_cast<Float16::storage_type>(X.bits() & ~fp16_layout::sign_mask));
}

} // namespace keel

// Mixed arithmetic follows the usual promotion ladder: binary16 loses to
// any wider float and wins over any integer.
template <> struct std::common_type<keel::Float16, float> {
  using type = float;
};
template <> struct std::common_type<float, keel::Float16> {
  using type = float;
};
template <> struct std::common_type<keel::Float16, double> {
  using type = double;
};
template <> struct std::common_type<double, keel::Float16> {
  using type = double;
};
template <std::integral I> struct std::common_type<keel::Float16, I> {
  using type = keel::Float16;
};
template <std::integral I> struct std::common_type<I, keel::Float16> {
  using type = keel::Float16;
};

template <> class std::numeric_limits<keel::Float16> {
  using H = keel::Float16;

public:
  static constexpr bool is_specialized = true;
  static constexpr bool is_signed = true;
  static constexpr bool is_integer = false;
  static constexpr bool is_exact = false;
  static constexpr bool has_infinity = true;
  static constexpr bool has_quiet_NaN = true;
  static constexpr bool has_signaling_NaN = true;
  static constexpr bool is_iec559 = true;
  static constexpr bool is_bounded = true;
  static constexpr bool is_modulo = false;
  static constexpr bool traps = false;
  static constexpr bool tinyness_before = false;
  static constexpr float_denorm_style has_denorm = denorm_present;
  static constexpr bool has_denorm_loss = false;
  static constexpr float_round_style round_style = round_to_nearest;
  static constexpr int radix = 2;
  static constexpr int digits = 11;
  static constexpr int digits10 = 3;
  static constexpr int max_digits10 = 5;
  static constexpr int min_exponent = -13;
  static constexpr int max_exponent = 16;
  static constexpr int min_exponent10 = -4;
  static constexpr int max_exponent10 = 4;

  static constexpr H min() noexcept { return H::fromBits(0x0400); }
  static constexpr H lowest() noexcept { return H::fromBits(0xfbff); }
  static constexpr H max() noexcept { return H::fromBits(0x7bff); }
  static constexpr H epsilon() noexcept { return H::fromBits(0x1400); }
  static constexpr H round_error() noexcept { return H::fromBits(0x3800); }
  static constexpr H infinity() noexcept { return H::fromBits(0x7c00); }
  static constexpr H quiet_NaN() noexcept { return H::fromBits(0x7e00); }
  static constexpr H signaling_NaN() noexcept { return H::fromBits(0x7d00); }
  static constexpr H denorm_min() noexcept { return H::fromBits(0x0001); }
};

#endif // KEEL_CORE_FLOAT16_HPP
