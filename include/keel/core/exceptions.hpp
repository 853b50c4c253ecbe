#ifndef KEEL_CORE_EXCEPTIONS_HPP
#define KEEL_CORE_EXCEPTIONS_HPP

// The two conditions keel reports to its caller. Everything else
// (non-finite input, overflow while scaling, underflow) has a defined,
// correctly signed result and is not an error.

#include <cstdio>
#include <stdexcept>
#include <string>

namespace keel {

// Conflicting or invalid arguments, e.g. both Digits and SigDigits given
// to round(). Always a caller bug.
class ArgumentError : public std::invalid_argument {
public:
  explicit ArgumentError(const std::string &Msg)
      : std::invalid_argument("ArgumentError: " + Msg) {}
};

// A rounded value that the requested integer type cannot hold.
class InexactError : public std::range_error {
public:
  InexactError(const char *Func, const std::string &TypeName, double Value)
      : std::range_error(format(Func, TypeName, Value)), Func(Func),
        TypeName(TypeName), Value(Value) {}

  const char *function() const noexcept { return Func; }
  const std::string &typeName() const noexcept { return TypeName; }
  double value() const noexcept { return Value; }

private:
  static std::string format(const char *Func, const std::string &TypeName,
                            double Value) {
    char Buf[64];
    std::snprintf(Buf, sizeof(Buf), "%.17g", Value);
    return std::string("InexactError: ") + Func + "(" + TypeName + ", " +
           Buf + ")";
  }

  const char *Func;
  std::string TypeName;
  double Value;
};

} // namespace keel

#endif // KEEL_CORE_EXCEPTIONS_HPP
