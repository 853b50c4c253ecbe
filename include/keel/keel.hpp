#ifndef KEEL_HPP
#define KEEL_HPP

#include "keel/core/bits.hpp"
#include "keel/core/classify.hpp"
#include "keel/core/enums.hpp"
#include "keel/core/exceptions.hpp"
#include "keel/core/float.hpp"
#include "keel/core/float16.hpp"
#include "keel/core/format.hpp"
#include "keel/core/platform.hpp"
#include "keel/core/rounding.hpp"
#include "keel/ops/approx.hpp"
#include "keel/ops/fma.hpp"
#include "keel/ops/round.hpp"

#endif // KEEL_HPP
