#pragma once

#include <arbnum/type.hpp>

namespace arbnum::runtime
{
  static constexpr native_integer minimum_precision{ 24 };
  static constexpr native_integer default_precision{ 128 };

  /* A validated bit precision. Anything below `minimum_precision` is rejected
   * on construction, so holding one is proof the value is usable. */
  struct bit_precision
  {
    explicit bit_precision(native_integer bits);

    static bit_precision from_digits(native_integer digits);

    native_integer digits() const;

    native_bool operator==(bit_precision const &) const = default;

    native_integer bits;
  };

  bit_precision max(bit_precision l, bit_precision r);

  native_integer bits_for_digits(native_integer digits);
  native_integer digits_for_bits(native_integer bits);

  /* Keyword style precision selection. With base 10, digits win over bits;
   * with base 2, bits win and digits are read as bits. Zero means unset. When
   * base is unset it is 10, unless bits were given, in which case it is 2. */
  struct precision_request
  {
    native_integer bits{};
    native_integer digits{};
    native_integer base{};
  };

  bit_precision resolve_precision(precision_request const &request);

  /* Reads an ARBNUM_PRECISION value. Null or empty gives the default; anything
   * that is not a whole integer >= `minimum_precision` is logged and also gives
   * the default. */
  native_integer parse_precision(char const *value);

  bit_precision working_precision();
  void set_working_precision(bit_precision precision);

  /* Sets the working precision for a scope, restoring the previous one on exit. */
  struct precision_guard
  {
    explicit precision_guard(bit_precision precision);
    precision_guard(precision_guard const &) = delete;
    precision_guard &operator=(precision_guard const &) = delete;
    ~precision_guard();

    bit_precision previous;
  };

  enum class rounding_mode
  {
    nearest,
    to_zero,
    from_zero,
    down,
    up
  };

  char const *rounding_mode_str(rounding_mode mode);
}
