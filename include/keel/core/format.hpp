#ifndef KEEL_CORE_FORMAT_HPP
#define KEEL_CORE_FORMAT_HPP

#include "keel/core/bits.hpp"

namespace keel {

// Bit geometry of an IEEE 754 binary interchange format: [S][E][M],
// sign in the MSB, mantissa in the low bits, implicit leading one.
template <int ExpBits, int MantBits> struct IEEELayout {
  static constexpr int sign_bits = 1;
  static constexpr int exp_bits = ExpBits;
  static constexpr int mant_bits = MantBits; // stored, excluding implicit bit
  static constexpr int total_bits = 1 + ExpBits + MantBits;

  static constexpr int mant_offset = 0;
  static constexpr int exp_offset = MantBits;
  static constexpr int sign_offset = ExpBits + MantBits;

  // Significand precision including the implicit bit.
  static constexpr int precision = MantBits + 1;

  static constexpr int exponent_bias = (1 << (ExpBits - 1)) - 1;
  static constexpr int max_exponent = exponent_bias;     // emax
  static constexpr int min_exponent = 1 - exponent_bias; // emin

  using storage_type = bits_t<total_bits>;

  static constexpr storage_type sign_mask = storage_type{1} << sign_offset;
  static constexpr storage_type exp_mask =
      static_cast<storage_type>(((storage_type{1} << ExpBits) - 1)
                                << exp_offset);
  static constexpr storage_type mant_mask =
      static_cast<storage_type>((storage_type{1} << MantBits) - 1);

  static_assert(ExpBits >= 2, "exponent needs room for reserved encodings");
  static_assert(MantBits >= 1, "mantissa field must be at least 1 bit");
};

using fp16_layout = IEEELayout<5, 10>;
using fp32_layout = IEEELayout<8, 23>;
using fp64_layout = IEEELayout<11, 52>;

} // namespace keel

#endif // KEEL_CORE_FORMAT_HPP
