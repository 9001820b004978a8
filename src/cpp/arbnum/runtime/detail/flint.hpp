#pragma once

#include <limits>

#include <mpfr.h>
#include <flint/flint.h>
#include <flint/fmpz.h>
#include <flint/fmpq.h>
#include <flint/arf.h>
#include <flint/arb.h>

#include <arbnum/type.hpp>
#include <arbnum/runtime/constant.hpp>
#include <arbnum/runtime/precision.hpp>

/* Glue shared by the obj implementations. Nothing here is part of the public
 * interface. */
namespace arbnum::runtime::detail
{
  arf_rnd_t to_arf_rounding(rounding_mode mode);
  mpfr_rnd_t to_mpfr_rounding(rounding_mode mode);

  /* Owns an fmpz_t for the duration of a conversion. */
  struct fmpz_handle
  {
    fmpz_handle();
    explicit fmpz_handle(native_big_integer const &value);
    fmpz_handle(fmpz_handle const &) = delete;
    fmpz_handle &operator=(fmpz_handle const &) = delete;
    ~fmpz_handle();

    native_big_integer to_big_integer() const;

    fmpz_t data;
  };

  struct fmpq_handle
  {
    explicit fmpq_handle(native_big_rational const &value);
    fmpq_handle(fmpq_handle const &) = delete;
    fmpq_handle &operator=(fmpq_handle const &) = delete;
    ~fmpq_handle();

    fmpq_t data;
  };

  /* Owns a string allocated by FLINT, such as the result of arb_get_str. */
  struct flint_string
  {
    explicit flint_string(char *data);
    flint_string(flint_string const &) = delete;
    flint_string &operator=(flint_string const &) = delete;
    ~flint_string();

    native_persistent_string str() const;

    char *data;
  };

  template <typename T>
  constexpr native_bool fits_slong(T const value)
  {
    if constexpr(std::numeric_limits<T>::is_signed && sizeof(T) <= sizeof(slong))
    {
      return true;
    }
    else if constexpr(std::numeric_limits<T>::is_signed)
    {
      return value >= std::numeric_limits<slong>::min()
        && value <= std::numeric_limits<slong>::max();
    }
    else
    {
      return value <= static_cast<ulong>(std::numeric_limits<slong>::max());
    }
  }

  void set_integer(arf_t out, native_integer value);
  void set_unsigned(arf_t out, native_unsigned value);
  void set_big_integer(arf_t out, native_big_integer const &value);

  /* Renders a ball with `digits` significant digits. */
  native_persistent_string arb_str(arb_t const x, native_integer digits, ulong flags);

  /* Writes the named Arb constant into `out`. */
  void set_constant(arb_t out, constant c, native_integer prec);
}
