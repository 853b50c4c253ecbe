#ifndef KEEL_CORE_PLATFORM_HPP
#define KEEL_CORE_PLATFORM_HPP

#include <cfenv>
#include <cmath>
#include <concepts>

#include "keel/core/float.hpp"

// Hardware FMA capability of the build target. <cmath> defines
// FP_FAST_FMA / FP_FAST_FMAF when fma() compiles to a single instruction;
// without them std::fma may land in a libm routine of unknown quality.
// KEEL_FORCE_EMULATED_FMA turns the native policy into the emulated one.
#if defined(KEEL_FORCE_EMULATED_FMA)
#define KEEL_HAS_HARDWARE_FMA32 0
#define KEEL_HAS_HARDWARE_FMA64 0
#else
#if defined(FP_FAST_FMAF)
#define KEEL_HAS_HARDWARE_FMA32 1
#else
#define KEEL_HAS_HARDWARE_FMA32 0
#endif
#if defined(FP_FAST_FMA)
#define KEEL_HAS_HARDWARE_FMA64 1
#else
#define KEEL_HAS_HARDWARE_FMA64 0
#endif
#endif

namespace keel {

template <typename P>
concept PlatformPolicy = requires {
  { P::has_fma16 } -> std::convertible_to<bool>;
  { P::has_fma32 } -> std::convertible_to<bool>;
  { P::has_fma64 } -> std::convertible_to<bool>;
};

namespace platforms {

// Whatever the compiler reports for the build target. binary16 FMA is
// never assumed.
struct Native {
  static constexpr bool has_fma16 = false;
  static constexpr bool has_fma32 = KEEL_HAS_HARDWARE_FMA32 != 0;
  static constexpr bool has_fma64 = KEEL_HAS_HARDWARE_FMA64 != 0;
};

// Software only: every width takes the emulated path.
struct Emulated {
  static constexpr bool has_fma16 = false;
  static constexpr bool has_fma32 = false;
  static constexpr bool has_fma64 = false;
};

using Default = Native;

static_assert(PlatformPolicy<Native>);
static_assert(PlatformPolicy<Emulated>);

} // namespace platforms

// Whether Plat trusts hardware FMA for values of type T.
template <IEEEFloat T, PlatformPolicy Plat = platforms::Default>
constexpr bool hasHardwareFma() noexcept {
  if constexpr (std::same_as<T, Float16>)
    return Plat::has_fma16;
  else if constexpr (std::same_as<T, float>)
    return Plat::has_fma32;
  else
    return Plat::has_fma64;
}

// ===================================================================
// Process-wide rounding direction
// ===================================================================
// Emulated FMA requires round-to-nearest arithmetic, and a broken libm
// fma fallback can leave the dynamic mode changed. The mode is forced
// once per process and never touched again.

inline bool initializeRounding() noexcept {
  static const bool Initialized = std::fesetround(FE_TONEAREST) == 0;
  return Initialized;
}

namespace detail {
// Runs during static initialization of any program that includes keel.
inline const bool RoundingInitializedAtLoad = initializeRounding();
} // namespace detail

} // namespace keel

#endif // KEEL_CORE_PLATFORM_HPP
