#pragma once

#include <flint/mag.h>

#include <arbnum/type.hpp>
#include <arbnum/runtime/gc.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  struct mag;
  using mag_ptr = native_box<mag>;

  /* An unsigned magnitude with a fixed 30-bit mantissa, backed by mag_t. Arb
   * keeps ball radii in this form; every conversion into it rounds up, so a
   * mag is always an upper bound of what it was made from. */
  struct mag : gc<mag>
  {
    mag();
    explicit mag(native_real val);
    mag(mag const &o);
    mag(mag &&o) noexcept;
    ~mag();

    mag &operator=(mag const &o);

    native_bool equal(mag const &o) const;
    native_persistent_string to_string() const;
    void to_string(util::string_builder &buff) const;
    native_hash to_hash() const;

    native_real to_real() const;
    native_bool is_zero() const;
    native_bool is_finite() const;

    mag_t data;
  };
}
