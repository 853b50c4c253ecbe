#ifndef KEEL_TESTS_HARNESS_TEST_HARNESS_HPP
#define KEEL_TESTS_HARNESS_TEST_HARNESS_HPP

// Generic "this against that" test harness.
//
// testAgainst(Name, HexWidth, Iter, ImplA, ImplB, Cmp)
//   runs ImplA and ImplB on every input tuple yielded by Iter,
//   compares outputs using Cmp, and prints results.
//
// Both ImplA and ImplB are opaque callables:
//   (BitsType...) -> TestOutput<BitsType>
// with the arity the iteration strategy yields (1 or 3). The harness
// knows nothing about what library backs them.
//
// This header includes only ops.hpp and the keel core. It has no
// knowledge of MPFR, SoftFloat, the native FPU, or keel's own engines.

#include <array>
#include <cstdio>
#include <random>
#include <tuple>

#include "harness/ops.hpp"
#include "keel/core/classify.hpp"
#include "keel/core/float.hpp"

namespace keel::testing {

// ===================================================================
// Hex printing for arbitrary-width bit types
// ===================================================================

template <typename BitsType>
void printHex(FILE *Out, BitsType Val, int Width) {
  for (int I = Width - 1; I >= 0; --I) {
    int Nibble = static_cast<int>((Val >> (I * 4)) & BitsType{0xF});
    std::fputc("0123456789ABCDEF"[Nibble], Out);
  }
}

template <typename T> constexpr int hexWidth() {
  return (FloatTraits<T>::layout::total_bits + 3) / 4;
}

// ===================================================================
// Failure record
// ===================================================================

template <typename BitsType> struct Failure {
  std::array<BitsType, 3> Inputs;
  int Arity;
  TestOutput<BitsType> OutputA;
  TestOutput<BitsType> OutputB;
};

struct TestResult {
  int Total = 0;
  int Passed = 0;
  int Failed = 0;
};

// ===================================================================
// testAgainst - the harness
// ===================================================================

static constexpr int MaxReportedFailures = 10;

template <typename BitsType, typename IterFn, typename ImplA, typename ImplB,
          typename Comparator>
TestResult testAgainst(const char *Name, int HexWidth, IterFn Iter, ImplA A,
                       ImplB B, Comparator Cmp) {
  TestResult R;
  Failure<BitsType> Failures[MaxReportedFailures];
  int NumReported = 0;

  Iter([&](auto... Inputs) {
    static_assert(sizeof...(Inputs) >= 1 && sizeof...(Inputs) <= 3);
    R.Total++;
    TestOutput<BitsType> OA = A(Inputs...);
    TestOutput<BitsType> OB = B(Inputs...);
    if (Cmp(OA, OB)) {
      R.Passed++;
    } else {
      R.Failed++;
      if (NumReported < MaxReportedFailures) {
        Failures[NumReported++] = {{BitsType(Inputs)...},
                                   static_cast<int>(sizeof...(Inputs)),
                                   OA,
                                   OB};
      }
    }
  });

  std::printf("%s: %d/%d passed", Name, R.Passed, R.Total);
  if (R.Failed > 0) {
    std::printf(" (%d FAILED)", R.Failed);
  }
  std::printf("\n");

  static constexpr const char *InputNames[] = {"a", "b", "c"};
  for (int I = 0; I < NumReported; ++I) {
    auto &F = Failures[I];
    std::fprintf(stderr, "  FAIL %s:", Name);
    for (int J = 0; J < F.Arity; ++J) {
      std::fprintf(stderr, " %s=0x", InputNames[J]);
      printHex(stderr, F.Inputs[J], HexWidth);
    }
    std::fprintf(stderr, "  implA=0x");
    printHex(stderr, F.OutputA.Bits, HexWidth);
    std::fprintf(stderr, " implB=0x");
    printHex(stderr, F.OutputB.Bits, HexWidth);
    std::fprintf(stderr, "\n");
  }

  return R;
}

// ===================================================================
// Iteration strategies
// ===================================================================

// Every value, or every triple, from a list of interesting values.
template <typename BitsType, int Arity> struct TargetedTuples {
  static_assert(Arity == 1 || Arity == 3);
  const BitsType *Values;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    if constexpr (Arity == 1) {
      for (int I = 0; I < Count; ++I)
        Callback(Values[I]);
    } else {
      for (int I = 0; I < Count; ++I)
        for (int J = 0; J < Count; ++J)
          for (int K = 0; K < Count; ++K)
            Callback(Values[I], Values[J], Values[K]);
    }
  }
};

// Uniform random tuples over the format's bit range.
template <typename BitsType, int TotalBits, int Arity> struct RandomTuples {
  static_assert(Arity == 1 || Arity == 3);
  uint64_t Seed;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);

    auto Gen = [&]() -> BitsType {
      BitsType Val = BitsType(Rng());
      if constexpr (TotalBits < int(sizeof(BitsType) * 8)) {
        constexpr BitsType Mask = (BitsType{1} << TotalBits) - 1;
        Val &= Mask;
      }
      return Val;
    };

    for (int I = 0; I < Count; ++I) {
      if constexpr (Arity == 1) {
        Callback(Gen());
      } else {
        BitsType A = Gen();
        BitsType B = Gen();
        BitsType C = Gen();
        Callback(A, B, C);
      }
    }
  }
};

// Every bit pattern of a format, one at a time. Only sensible for
// binary16.
template <typename BitsType, int TotalBits> struct ExhaustiveSingles {
  static_assert(TotalBits <= 16);

  template <typename Fn> void operator()(Fn &&Callback) const {
    for (uint32_t V = 0; V < (uint32_t{1} << TotalBits); ++V)
      Callback(static_cast<BitsType>(V));
  }
};

// Triples where c nearly cancels a*b. Uniform random bits almost never
// land here, yet this is where a multiply-add without a single rounding
// goes wrong: the low half of the product decides the result.
template <typename T> struct CancellingTriples {
  using BitsType = typename FloatTraits<T>::storage_type;
  uint64_t Seed;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    using L = typename FloatTraits<T>::layout;
    std::mt19937_64 Rng(Seed);
    // Keep exponents near the middle so that a*b neither overflows nor
    // underflows; the subnormal tail has its own targeted values.
    std::uniform_int_distribution<int> ExpDist(L::exponent_bias / 2,
                                               L::exponent_bias * 3 / 2);
    std::uniform_int_distribution<int> NudgeDist(-4, 4);

    auto Gen = [&]() -> T {
      BitsType Mant = static_cast<BitsType>(BitsType(Rng()) & L::mant_mask);
      BitsType Exp = static_cast<BitsType>(ExpDist(Rng)) << L::exp_offset;
      BitsType Sign = (Rng() & 1) ? L::sign_mask : BitsType{0};
      return fromBits<T>(static_cast<BitsType>(Sign | Exp | Mant));
    };

    for (int I = 0; I < Count; ++I) {
      T A = Gen();
      T B = Gen();
      T C = nextFloat(-(A * B), NudgeDist(Rng));
      Callback(toBits(A), toBits(B), toBits(C));
    }
  }
};

// Run multiple strategies in sequence.
template <typename... Strategies> struct Combined {
  std::tuple<Strategies...> Strats;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::apply([&](const auto &...S) { (S(Callback), ...); }, Strats);
  }
};

template <typename... Strategies>
Combined<Strategies...> combined(Strategies... S) {
  return {std::tuple{std::move(S)...}};
}

// ===================================================================
// Comparators
// ===================================================================

template <typename BitsType> struct BitExact {
  bool operator()(TestOutput<BitsType> A, TestOutput<BitsType> B) const {
    return A.Bits == B.Bits && A.Flags == B.Flags;
  }
};

template <typename BitsType> struct BitExactIgnoreFlags {
  bool operator()(TestOutput<BitsType> A, TestOutput<BitsType> B) const {
    return A.Bits == B.Bits;
  }
};

// NaN-aware comparison: if both outputs are NaN (regardless of payload),
// they match. Otherwise bit-exact.
template <typename T> struct NanAwareBitExact {
  using BitsType = typename FloatTraits<T>::storage_type;

  bool operator()(TestOutput<BitsType> A, TestOutput<BitsType> B) const {
    if (isNan(fromBits<T>(A.Bits)) && isNan(fromBits<T>(B.Bits)))
      return true;
    return A.Bits == B.Bits;
  }
};

// ===================================================================
// Interesting values generator
// ===================================================================

// Edge-case bit patterns derived from the format geometry.
template <typename T> constexpr auto interestingValues() {
  using Fmt = typename FloatTraits<T>::layout;
  using BitsType = typename FloatTraits<T>::storage_type;
  constexpr int E = Fmt::exp_bits;
  constexpr int M = Fmt::mant_bits;
  constexpr int Bias = Fmt::exponent_bias;
  constexpr BitsType SignBit = Fmt::sign_mask;
  constexpr BitsType ExpMax = (BitsType{1} << E) - 1;
  constexpr BitsType MantMask = Fmt::mant_mask;
  constexpr int Off = Fmt::exp_offset;

  return std::array<BitsType, 26>{{
      0,                                                    // +0
      SignBit,                                              // -0
      BitsType(ExpMax << Off),                              // +Inf
      BitsType(SignBit | (ExpMax << Off)),                  // -Inf
      BitsType((ExpMax << Off) | (BitsType{1} << (M - 1))), // QNaN
      BitsType((ExpMax << Off) | 1),                        // SNaN min
      BitsType(SignBit | (ExpMax << Off) |
               (BitsType{1} << (M - 1))),                   // -QNaN
      BitsType{1},                                          // min +subnormal
      BitsType(SignBit | BitsType{1}),                      // min -subnormal
      MantMask,                                             // max subnormal
      BitsType(BitsType{1} << M),                           // min +normal
      BitsType((BitsType{1} << M) + 1),                     // min normal + 1 ULP
      BitsType(((ExpMax - 1) << Off) | MantMask),           // max +finite
      BitsType(SignBit | ((ExpMax - 1) << Off) | MantMask), // max -finite
      BitsType(BitsType(Bias) << Off),                      // 1.0
      BitsType(SignBit | (BitsType(Bias) << Off)),          // -1.0
      BitsType((BitsType(Bias) << Off) + 1),                // 1.0 + 1 ULP
      BitsType((BitsType(Bias) << Off) - 1),                // 1.0 - 1 ULP
      BitsType(BitsType(Bias + 1) << Off),                  // 2.0
      BitsType(BitsType(Bias - 1) << Off),                  // 0.5
      BitsType(SignBit | (BitsType(Bias - 1) << Off)),      // -0.5
      BitsType((BitsType(Bias) << Off) |
               (BitsType{1} << (M - 1))),                   // 1.5
      BitsType(SignBit | (BitsType(Bias + 1) << Off) |
               (BitsType{1} << (M - 2))),                   // -2.5
      BitsType((BitsType(Bias + M - 1) << Off) | 1),        // 2^(M-1) + 0.5
      BitsType(BitsType(Bias + M + 1) << Off),              // 2^(M+1)
      BitsType(BitsType(Bias - M) << Off),                  // machine epsilon
  }};
}

} // namespace keel::testing

#endif // KEEL_TESTS_HARNESS_TEST_HARNESS_HPP
