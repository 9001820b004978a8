#pragma once

#include <concepts>

#include <mpfr.h>
#include <flint/arb.h>

#include <arbnum/type.hpp>
#include <arbnum/runtime/gc.hpp>
#include <arbnum/runtime/constant.hpp>
#include <arbnum/runtime/display_options.hpp>
#include <arbnum/runtime/precision.hpp>
#include <arbnum/runtime/obj/arb_float.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  struct arb_real;
  using arb_real_ptr = native_box<arb_real>;

  /* A real ball [m +/- r], backed by arb_t. The midpoint is an arf_t and the
   * radius a mag_t. Every operation returns a ball guaranteed to contain the
   * exact result for every point of the inputs. */
  struct arb_real : gc<arb_real>
  {
    arb_real();
    explicit arb_real(bit_precision precision);
    arb_real(arb_real const &o);
    arb_real(arb_real &&o) noexcept;
    ~arb_real();

    arb_real &operator=(arb_real const &o);
    arb_real &operator=(arb_real &&o) noexcept;

    template <std::integral T>
    arb_real(T const val, bit_precision const precision = working_precision())
      : arb_real{ precision }
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
    arb_real(T const val, bit_precision const precision = working_precision())
      : arb_real{ precision }
    {
      set(static_cast<native_real>(val));
    }

    arb_real(native_big_integer const &val, bit_precision precision = working_precision());
    /* The smallest ball Arb finds around the rational at this precision. */
    arb_real(native_big_rational const &val, bit_precision precision = working_precision());
    arb_real(native_big_float const &val, bit_precision precision = working_precision());
    arb_real(constant c, bit_precision precision = working_precision());
    /* Exact, at the precision of the float. */
    arb_real(arb_float const &val);
    /* Accepts plain decimals as well as balls such as "[3.14 +/- 0.01]". */
    explicit arb_real(native_persistent_string_view const &s,
                      bit_precision precision = working_precision());
    /* Rounds the midpoint of `o` to `precision` bits, widening the radius to match. */
    arb_real(arb_real const &o, bit_precision precision);

    template <typename T>
    arb_real(T const &val, precision_request const &request)
      : arb_real{ val, resolve_precision(request) }
    {
    }

    static arb_real_ptr zero(bit_precision precision = working_precision());
    static arb_real_ptr one(bit_precision precision = working_precision());
    static arb_real_ptr pos_inf(bit_precision precision = working_precision());
    static arb_real_ptr neg_inf(bit_precision precision = working_precision());
    static arb_real_ptr nan(bit_precision precision = working_precision());

    void set(native_integer val);
    void set(native_unsigned val);
    void set(native_real val);
    void swap(arb_real &o) noexcept;

    /* behavior::object_like */
    native_bool equal(arb_real const &o) const;
    native_persistent_string to_string() const;
    native_persistent_string to_string(display_options const &opts) const;
    void to_string(util::string_builder &buff) const;
    native_persistent_string to_code_string() const;
    native_hash to_hash() const;

    /* behavior::number_like, all on the midpoint */
    native_integer to_integer(rounding_mode mode = rounding_mode::nearest) const;
    native_real to_real() const;
    native_big_float to_big_float(rounding_mode mode = rounding_mode::nearest) const;

    native_bool is_exact() const;
    native_bool is_zero() const;
    native_bool is_nonzero() const;
    native_bool is_finite() const;
    native_bool is_nan() const;
    native_bool is_positive() const;
    native_bool is_negative() const;
    native_bool contains_zero() const;
    /* Relative accuracy of the ball in bits. */
    native_integer accuracy_bits() const;

    arb_t data;
    bit_precision precision;
  };

  arb_real_ptr copy(arb_real_ptr x);
  arb_real_ptr copy(arb_real_ptr x, bit_precision precision);
  void swap(arb_real_ptr x, arb_real_ptr y);

  /* Whether `x` contains every point of `y`. */
  native_bool contains(arb_real_ptr x, arb_real_ptr y);
  native_bool overlaps(arb_real_ptr x, arb_real_ptr y);
  /* Drops midpoint bits the radius makes meaningless. */
  arb_real_ptr trim(arb_real_ptr x);

  arb_real_ptr operator-(arb_real_ptr x);

  arb_real_ptr operator+(arb_real_ptr l, arb_real_ptr r);
  arb_real_ptr operator+(arb_real_ptr l, native_integer r);
  arb_real_ptr operator+(native_integer l, arb_real_ptr r);

  arb_real_ptr operator-(arb_real_ptr l, arb_real_ptr r);
  arb_real_ptr operator-(arb_real_ptr l, native_integer r);
  arb_real_ptr operator-(native_integer l, arb_real_ptr r);

  arb_real_ptr operator*(arb_real_ptr l, arb_real_ptr r);
  arb_real_ptr operator*(arb_real_ptr l, native_integer r);
  arb_real_ptr operator*(native_integer l, arb_real_ptr r);

  arb_real_ptr operator/(arb_real_ptr l, arb_real_ptr r);
  arb_real_ptr operator/(arb_real_ptr l, native_integer r);
  arb_real_ptr operator/(native_integer l, arb_real_ptr r);

  /* Comparisons hold only when they hold for every pair of points in the two
   * balls. Overlapping balls are neither < nor >=. */
  native_bool operator==(arb_real_ptr l, arb_real_ptr r);
  native_bool operator==(arb_real_ptr l, native_integer r);
  native_bool operator==(native_integer l, arb_real_ptr r);

  native_bool operator!=(arb_real_ptr l, arb_real_ptr r);
  native_bool operator!=(arb_real_ptr l, native_integer r);
  native_bool operator!=(native_integer l, arb_real_ptr r);

  native_bool operator<(arb_real_ptr l, arb_real_ptr r);
  native_bool operator<(arb_real_ptr l, native_integer r);
  native_bool operator<(native_integer l, arb_real_ptr r);

  native_bool operator<=(arb_real_ptr l, arb_real_ptr r);
  native_bool operator<=(arb_real_ptr l, native_integer r);
  native_bool operator<=(native_integer l, arb_real_ptr r);

  native_bool operator>(arb_real_ptr l, arb_real_ptr r);
  native_bool operator>(arb_real_ptr l, native_integer r);
  native_bool operator>(native_integer l, arb_real_ptr r);

  native_bool operator>=(arb_real_ptr l, arb_real_ptr r);
  native_bool operator>=(arb_real_ptr l, native_integer r);
  native_bool operator>=(native_integer l, arb_real_ptr r);
}

namespace std
{
  template <>
  struct hash<arbnum::runtime::obj::arb_real_ptr>
  {
    size_t operator()(arbnum::runtime::obj::arb_real_ptr const &o) const noexcept
    {
      return o ? o->to_hash() : 0;
    }
  };

  template <>
  struct hash<arbnum::runtime::obj::arb_real>
  {
    size_t operator()(arbnum::runtime::obj::arb_real const &o) const noexcept
    {
      return o.to_hash();
    }
  };
}
