#ifndef KEEL_CORE_BITS_HPP
#define KEEL_CORE_BITS_HPP

// bits_t<N>: the unsigned integer that carries the bit pattern of an
// N-bit IEEE 754 value.
//
// Not an integer semantically, just a bag of bits. Only the three widths
// keel computes in (binary16, binary32, binary64) are mapped.

#include <bit>
#include <cstdint>

namespace keel {

namespace detail {

template <int N> struct BitsStorage {
  static_assert(N == 16 || N == 32 || N == 64,
                "keel stores binary16, binary32 and binary64 only");
};

template <> struct BitsStorage<16> {
  using type = uint16_t;
};

template <> struct BitsStorage<32> {
  using type = uint32_t;
};

template <> struct BitsStorage<64> {
  using type = uint64_t;
};

} // namespace detail

template <int N> using bits_t = typename detail::BitsStorage<N>::type;

// Well-defined reinterpretation between a value and its storage word.
// Both types must have the same size; std::bit_cast enforces it.
template <typename To, typename From>
constexpr To bitCast(const From &Val) noexcept {
  return std::bit_cast<To>(Val);
}

} // namespace keel

#endif // KEEL_CORE_BITS_HPP
