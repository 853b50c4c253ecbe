#ifndef KEEL_CORE_ENUMS_HPP
#define KEEL_CORE_ENUMS_HPP

namespace keel {

// Rounding direction selected at run time. Each value has a matching
// policy tag in keel::rounding for compile-time selection.
enum class RoundingMode {
  ToNearest,          // ties to even, IEEE 754 default
  ToNearestTiesAway,  // C round(): ties away from zero
  ToNearestTiesUp,    // Java Math.round(): ties toward +Inf
  Up,                 // toward +Inf (ceiling)
  Down,               // toward -Inf (floor)
  ToZero              // truncation
};

inline const char *roundingModeName(RoundingMode M) {
  switch (M) {
  case RoundingMode::ToNearest:         return "ToNearest";
  case RoundingMode::ToNearestTiesAway: return "ToNearestTiesAway";
  case RoundingMode::ToNearestTiesUp:   return "ToNearestTiesUp";
  case RoundingMode::Up:                return "Up";
  case RoundingMode::Down:              return "Down";
  case RoundingMode::ToZero:            return "ToZero";
  }
  return "???";
}

} // namespace keel

#endif // KEEL_CORE_ENUMS_HPP
