#pragma once

#include <complex>
#include <concepts>
#include <cstdint>

#include <mpfr.h>
#include <flint/arf.h>

#include <arbnum/type.hpp>
#include <arbnum/runtime/gc.hpp>
#include <arbnum/runtime/constant.hpp>
#include <arbnum/runtime/display_options.hpp>
#include <arbnum/runtime/precision.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  struct arb_float;
  using arb_float_ptr = native_box<arb_float>;

  /* An arbitrary-precision binary floating-point number, backed by FLINT's arf_t.
   *
   * A value is a rational m * 2^e where m is odd, or one of zero, +inf, -inf
   * and NaN. There is no negative zero, no unsigned infinity and NaN carries no
   * payload. The precision travels with the value and is used by every
   * operation that has to round. */
  struct arb_float : gc<arb_float>
  {
    arb_float();
    explicit arb_float(bit_precision precision);
    arb_float(arb_float const &o);
    arb_float(arb_float &&o) noexcept;
    ~arb_float();

    arb_float &operator=(arb_float const &o);
    arb_float &operator=(arb_float &&o) noexcept;

    template <std::integral T>
    arb_float(T const val, bit_precision const precision = working_precision())
      : arb_float{ precision }
    {
      if constexpr(std::signed_integral<T>)
      {
        set(static_cast<native_integer>(val));
      }
      else
      {
        set(static_cast<native_unsigned>(val));
      }
    }

    template <std::floating_point T>
    arb_float(T const val, bit_precision const precision = working_precision())
      : arb_float{ precision }
    {
      set(static_cast<native_real>(val));
    }

    arb_float(native_big_integer const &val, bit_precision precision = working_precision());
    arb_float(native_big_rational const &val, bit_precision precision = working_precision());
    arb_float(native_big_float const &val, bit_precision precision = working_precision());
    arb_float(std::complex<native_real> const &val,
              bit_precision precision = working_precision());
    arb_float(constant c, bit_precision precision = working_precision());
    explicit arb_float(native_persistent_string_view const &s,
                       bit_precision precision = working_precision());
    /* Rounds `o` to `precision` bits in the direction of `mode`. */
    arb_float(arb_float const &o, bit_precision precision, rounding_mode mode);

    template <typename T>
    arb_float(T const &val, precision_request const &request)
      : arb_float{ val, resolve_precision(request) }
    {
    }

    static arb_float_ptr zero(bit_precision precision = working_precision());
    static arb_float_ptr one(bit_precision precision = working_precision());
    static arb_float_ptr pos_inf(bit_precision precision = working_precision());
    static arb_float_ptr neg_inf(bit_precision precision = working_precision());
    static arb_float_ptr nan(bit_precision precision = working_precision());

    void set(native_integer val);
    void set(native_unsigned val);
    void set(native_real val);
    void swap(arb_float &o) noexcept;

    /* behavior::object_like */
    native_bool equal(arb_float const &o) const;
    native_persistent_string to_string() const;
    native_persistent_string to_string(display_options const &opts) const;
    void to_string(util::string_builder &buff) const;
    native_persistent_string to_code_string() const;
    native_hash to_hash() const;

    /* behavior::comparable */
    native_integer compare(arb_float const &o) const;

    /* behavior::number_like */
    native_integer to_integer(rounding_mode mode = rounding_mode::nearest) const;
    std::int32_t to_int32(rounding_mode mode = rounding_mode::nearest) const;
    std::int16_t to_int16(rounding_mode mode = rounding_mode::nearest) const;
    native_real to_real() const;
    native_big_float to_big_float(rounding_mode mode = rounding_mode::nearest) const;
    native_big_float
    to_big_float(bit_precision precision, rounding_mode mode = rounding_mode::nearest) const;
    /* Truncates toward zero. */
    native_big_integer to_big_integer() const;
    /* Throws inexact_error unless the value is an integer. */
    native_big_integer to_exact_integer() const;

    native_bool sign_bit() const;
    native_integer sign() const;
    native_bool is_zero() const;
    native_bool is_one() const;
    native_bool is_nan() const;
    native_bool is_inf() const;
    native_bool is_finite() const;
    native_bool is_integer() const;

    arf_t data;
    bit_precision precision;
  };

  arb_float_ptr copy(arb_float_ptr x);
  arb_float_ptr copy(arb_float_ptr x, bit_precision precision, rounding_mode mode);
  arb_float_ptr copy(arb_float_ptr x, rounding_mode mode);
  arb_float_ptr copy(arb_float_ptr x, bit_precision precision);
  void swap(arb_float_ptr x, arb_float_ptr y);

  arb_float_ptr operator-(arb_float_ptr x);

  arb_float_ptr operator+(arb_float_ptr l, arb_float_ptr r);
  arb_float_ptr operator+(arb_float_ptr l, native_integer r);
  arb_float_ptr operator+(native_integer l, arb_float_ptr r);

  arb_float_ptr operator-(arb_float_ptr l, arb_float_ptr r);
  arb_float_ptr operator-(arb_float_ptr l, native_integer r);
  arb_float_ptr operator-(native_integer l, arb_float_ptr r);

  arb_float_ptr operator*(arb_float_ptr l, arb_float_ptr r);
  arb_float_ptr operator*(arb_float_ptr l, native_integer r);
  arb_float_ptr operator*(native_integer l, arb_float_ptr r);

  arb_float_ptr operator/(arb_float_ptr l, arb_float_ptr r);
  arb_float_ptr operator/(arb_float_ptr l, native_integer r);
  arb_float_ptr operator/(native_integer l, arb_float_ptr r);

  /* Comparisons follow IEEE rules: anything involving NaN is false, except !=. */
  native_bool operator==(arb_float_ptr l, arb_float_ptr r);
  native_bool operator==(arb_float_ptr l, native_integer r);
  native_bool operator==(native_integer l, arb_float_ptr r);

  native_bool operator!=(arb_float_ptr l, arb_float_ptr r);
  native_bool operator!=(arb_float_ptr l, native_integer r);
  native_bool operator!=(native_integer l, arb_float_ptr r);

  native_bool operator<(arb_float_ptr l, arb_float_ptr r);
  native_bool operator<(arb_float_ptr l, native_integer r);
  native_bool operator<(native_integer l, arb_float_ptr r);

  native_bool operator<=(arb_float_ptr l, arb_float_ptr r);
  native_bool operator<=(arb_float_ptr l, native_integer r);
  native_bool operator<=(native_integer l, arb_float_ptr r);

  native_bool operator>(arb_float_ptr l, arb_float_ptr r);
  native_bool operator>(arb_float_ptr l, native_integer r);
  native_bool operator>(native_integer l, arb_float_ptr r);

  native_bool operator>=(arb_float_ptr l, arb_float_ptr r);
  native_bool operator>=(arb_float_ptr l, native_integer r);
  native_bool operator>=(native_integer l, arb_float_ptr r);
}

namespace std
{
  template <>
  struct hash<arbnum::runtime::obj::arb_float_ptr>
  {
    size_t operator()(arbnum::runtime::obj::arb_float_ptr const &o) const noexcept
    {
      return o ? o->to_hash() : 0;
    }
  };

  template <>
  struct hash<arbnum::runtime::obj::arb_float>
  {
    size_t operator()(arbnum::runtime::obj::arb_float const &o) const noexcept
    {
      return o.to_hash();
    }
  };
}
