#pragma once

#include <complex>
#include <type_traits>

#include <mpfr.h>
#include <flint/acb.h>

#include <arbnum/type.hpp>
#include <arbnum/runtime/gc.hpp>
#include <arbnum/runtime/display_options.hpp>
#include <arbnum/runtime/precision.hpp>
#include <arbnum/runtime/obj/arb_float.hpp>
#include <arbnum/runtime/obj/arb_real.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  struct arb_complex;
  using arb_complex_ptr = native_box<arb_complex>;

  /* A complex ball, backed by acb_t: a rectangle made of two real balls. */
  struct arb_complex : gc<arb_complex>
  {
    arb_complex();
    explicit arb_complex(bit_precision precision);
    arb_complex(arb_complex const &o);
    arb_complex(arb_complex &&o) noexcept;
    ~arb_complex();

    arb_complex &operator=(arb_complex const &o);
    arb_complex &operator=(arb_complex &&o) noexcept;

    template <typename T>
    requires std::is_arithmetic_v<T>
    arb_complex(T const re, bit_precision const precision = working_precision())
      : arb_complex{ arb_real{ re, precision } }
    {
    }

    template <typename R, typename I>
    requires(std::is_arithmetic_v<R> && std::is_arithmetic_v<I>)
    arb_complex(R const re, I const im, bit_precision const precision = working_precision())
      : arb_complex{ arb_real{ re, precision }, arb_real{ im, precision } }
    {
    }

    arb_complex(std::complex<native_real> const &val,
                bit_precision precision = working_precision());
    /* The imaginary part is zero. */
    arb_complex(arb_real const &re);
    arb_complex(arb_float const &re);
    /* Precision is the larger of the two parts. */
    arb_complex(arb_real const &re, arb_real const &im);
    arb_complex(arb_float const &re, arb_float const &im);

    void swap(arb_complex &o) noexcept;

    /* behavior::object_like */
    native_bool equal(arb_complex const &o) const;
    native_persistent_string to_string() const;
    native_persistent_string to_string(display_options const &opts) const;
    void to_string(util::string_builder &buff) const;
    native_persistent_string to_code_string() const;
    native_hash to_hash() const;

    std::complex<native_real> to_complex() const;

    native_bool is_real() const;
    native_bool is_exact() const;
    native_bool is_zero() const;
    native_bool is_finite() const;

    acb_t data;
    bit_precision precision;
  };

  arb_complex_ptr copy(arb_complex_ptr z);
  void swap(arb_complex_ptr x, arb_complex_ptr y);

  arb_real_ptr real(arb_complex_ptr z);
  arb_real_ptr imag(arb_complex_ptr z);

  native_bool contains(arb_complex_ptr x, arb_complex_ptr y);
  native_bool overlaps(arb_complex_ptr x, arb_complex_ptr y);

  arb_complex_ptr operator-(arb_complex_ptr z);

  arb_complex_ptr operator+(arb_complex_ptr l, arb_complex_ptr r);
  arb_complex_ptr operator+(arb_complex_ptr l, native_integer r);
  arb_complex_ptr operator+(native_integer l, arb_complex_ptr r);

  arb_complex_ptr operator-(arb_complex_ptr l, arb_complex_ptr r);
  arb_complex_ptr operator-(arb_complex_ptr l, native_integer r);
  arb_complex_ptr operator-(native_integer l, arb_complex_ptr r);

  arb_complex_ptr operator*(arb_complex_ptr l, arb_complex_ptr r);
  arb_complex_ptr operator*(arb_complex_ptr l, native_integer r);
  arb_complex_ptr operator*(native_integer l, arb_complex_ptr r);

  arb_complex_ptr operator/(arb_complex_ptr l, arb_complex_ptr r);
  arb_complex_ptr operator/(arb_complex_ptr l, native_integer r);
  arb_complex_ptr operator/(native_integer l, arb_complex_ptr r);

  /* Certainly equal / certainly different, as with arb_real. */
  native_bool operator==(arb_complex_ptr l, arb_complex_ptr r);
  native_bool operator==(arb_complex_ptr l, native_integer r);
  native_bool operator!=(arb_complex_ptr l, arb_complex_ptr r);
  native_bool operator!=(arb_complex_ptr l, native_integer r);
}

namespace std
{
  template <>
  struct hash<arbnum::runtime::obj::arb_complex_ptr>
  {
    size_t operator()(arbnum::runtime::obj::arb_complex_ptr const &o) const noexcept
    {
      return o ? o->to_hash() : 0;
    }
  };
}
