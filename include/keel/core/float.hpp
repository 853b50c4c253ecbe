#ifndef KEEL_CORE_FLOAT_HPP
#define KEEL_CORE_FLOAT_HPP

#include <concepts>
#include <limits>
#include <type_traits>

#include "keel/core/bits.hpp"
#include "keel/core/float16.hpp"
#include "keel/core/format.hpp"

namespace keel {

// FloatTraits maps a value type onto its interchange format. Only the
// three widths with a concrete value type are specialized; everything in
// keel dispatches on these at compile time.
template <typename T> struct FloatTraits;

template <> struct FloatTraits<Float16> {
  using layout = fp16_layout;
  using storage_type = layout::storage_type;
  using compute_type = float; // exact for binary16 + - * /
};

template <> struct FloatTraits<float> {
  using layout = fp32_layout;
  using storage_type = layout::storage_type;
  using compute_type = double; // holds any binary32 product exactly
};

template <> struct FloatTraits<double> {
  using layout = fp64_layout;
  using storage_type = layout::storage_type;
  using compute_type = double; // nothing wider; see twoMul
};

template <typename T>
concept IEEEFloat = requires {
  typename FloatTraits<std::remove_cv_t<T>>::layout;
  typename FloatTraits<std::remove_cv_t<T>>::storage_type;
} && sizeof(T) * 8 == FloatTraits<std::remove_cv_t<T>>::layout::total_bits;

// Integer types of the host numeric tower; bool is not one of them.
template <typename T>
concept BuiltinInteger = std::integral<T> && !std::same_as<T, bool>;

template <IEEEFloat T>
constexpr typename FloatTraits<T>::storage_type toBits(T X) noexcept {
  return bitCast<typename FloatTraits<T>::storage_type>(X);
}

template <IEEEFloat T>
constexpr T fromBits(typename FloatTraits<T>::storage_type Bits) noexcept {
  return bitCast<T>(Bits);
}

// --- Convenience aliases ---

using float16 = Float16;
using float32 = float;
using float64 = double;

static_assert(IEEEFloat<float16>);
static_assert(IEEEFloat<float32>);
static_assert(IEEEFloat<float64>);
static_assert(std::numeric_limits<float>::is_iec559 &&
              std::numeric_limits<double>::is_iec559,
              "keel requires IEEE 754 binary32 and binary64");

} // namespace keel

#endif // KEEL_CORE_FLOAT_HPP
