#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/container_hash/hash.hpp>

#include <arbnum/error.hpp>
#include <arbnum/runtime/obj/arb_float.hpp>
#include <arbnum/runtime/core/make_box.hpp>
#include <arbnum/runtime/detail/flint.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  arb_float::arb_float()
    : precision{ working_precision() }
  {
    arf_init(data);
  }

  arb_float::arb_float(bit_precision const precision)
    : precision{ precision }
  {
    arf_init(data);
  }

  arb_float::arb_float(arb_float const &o)
    : precision{ o.precision }
  {
    arf_init(data);
    arf_set(data, o.data);
  }

  arb_float::arb_float(arb_float &&o) noexcept
    : precision{ o.precision }
  {
    arf_init(data);
    arf_swap(data, o.data);
  }

  arb_float::~arb_float()
  {
    arf_clear(data);
  }

  arb_float &arb_float::operator=(arb_float const &o)
  {
    if(this != &o)
    {
      arf_set(data, o.data);
      precision = o.precision;
    }
    return *this;
  }

  arb_float &arb_float::operator=(arb_float &&o) noexcept
  {
    swap(o);
    return *this;
  }

  arb_float::arb_float(native_big_integer const &val, bit_precision const precision)
    : arb_float{ precision }
  {
    runtime::detail::set_big_integer(data, val);
  }

  arb_float::arb_float(native_big_rational const &val, bit_precision const precision)
    : arb_float{ precision }
  {
    runtime::detail::fmpz_handle const num{ boost::multiprecision::numerator(val) };
    runtime::detail::fmpz_handle const den{ boost::multiprecision::denominator(val) };
    arf_t d;
    arf_init(d);
    arf_set_fmpz(data, num.data);
    arf_set_fmpz(d, den.data);
    arf_div(data, data, d, precision.bits, ARF_RND_NEAR);
    arf_clear(d);
  }

  arb_float::arb_float(native_big_float const &val, bit_precision const precision)
    : arb_float{ precision }
  {
    arf_set_mpfr(data, val.backend().data());
  }

  arb_float::arb_float(std::complex<native_real> const &val, bit_precision const precision)
    : arb_float{ precision }
  {
    set(val.real());
  }

  arb_float::arb_float(constant const c, bit_precision const precision)
    : arb_float{ precision }
  {
    /* Enclose the constant with some headroom so the midpoint rounds correctly. */
    arb_t tmp;
    arb_init(tmp);
    runtime::detail::set_constant(tmp, c, precision.bits + 32);
    arf_set_round(data, arb_midref(tmp), precision.bits, ARF_RND_NEAR);
    arb_clear(tmp);
  }

  arb_float::arb_float(native_persistent_string_view const &s, bit_precision const precision)
    : arb_float{ precision }
  {
    native_persistent_string const str{ s };
    arb_t tmp;
    arb_init(tmp);
    if(arb_set_str(tmp, str.c_str(), precision.bits) != 0)
    {
      arb_clear(tmp);
      throw std::runtime_error{ util::format("Failed to construct arb_float from string '{}'",
                                             str) };
    }
    arf_set(data, arb_midref(tmp));
    arb_clear(tmp);
  }

  arb_float::arb_float(arb_float const &o, bit_precision const precision, rounding_mode const mode)
    : arb_float{ precision }
  {
    arf_set_round(data, o.data, precision.bits, runtime::detail::to_arf_rounding(mode));
  }

  arb_float_ptr arb_float::zero(bit_precision const precision)
  {
    return make_box<arb_float>(precision);
  }

  arb_float_ptr arb_float::one(bit_precision const precision)
  {
    auto ret{ make_box<arb_float>(precision) };
    arf_one(ret->data);
    return ret;
  }

  arb_float_ptr arb_float::pos_inf(bit_precision const precision)
  {
    auto ret{ make_box<arb_float>(precision) };
    arf_pos_inf(ret->data);
    return ret;
  }

  arb_float_ptr arb_float::neg_inf(bit_precision const precision)
  {
    auto ret{ make_box<arb_float>(precision) };
    arf_neg_inf(ret->data);
    return ret;
  }

  arb_float_ptr arb_float::nan(bit_precision const precision)
  {
    auto ret{ make_box<arb_float>(precision) };
    arf_nan(ret->data);
    return ret;
  }

  void arb_float::set(native_integer const val)
  {
    runtime::detail::set_integer(data, val);
  }

  void arb_float::set(native_unsigned const val)
  {
    runtime::detail::set_unsigned(data, val);
  }

  void arb_float::set(native_real const val)
  {
    arf_set_d(data, val);
  }

  void arb_float::swap(arb_float &o) noexcept
  {
    arf_swap(data, o.data);
    std::swap(precision, o.precision);
  }

  native_bool arb_float::equal(arb_float const &o) const
  {
    return arf_equal(data, o.data);
  }

  native_persistent_string arb_float::to_string() const
  {
    return to_string(display_options{});
  }

  native_persistent_string arb_float::to_string(display_options const &opts) const
  {
    util::string_builder buff;
    if(arf_is_nan(data))
    {
      buff("NaN");
    }
    else if(arf_is_pos_inf(data))
    {
      buff("Inf");
    }
    else if(arf_is_neg_inf(data))
    {
      buff("-Inf");
    }
    else
    {
      arb_t tmp;
      arb_init(tmp);
      arb_set_arf(tmp, data);
      auto const flags{ opts.midpoint ? ARB_STR_MORE | ARB_STR_NO_RADIUS : ARB_STR_NO_RADIUS };
      buff(runtime::detail::arb_str(tmp, precision.digits(), flags));
      arb_clear(tmp);
    }
    return buff.release();
  }

  void arb_float::to_string(util::string_builder &buff) const
  {
    buff(to_string());
  }

  native_persistent_string arb_float::to_code_string() const
  {
    return to_string(display_all);
  }

  native_hash arb_float::to_hash() const
  {
    /* Used for reducing the mantissa and exponent to something hashable. */
    static constexpr ulong modulus{ 4294967291ul };

    std::size_t seed{ static_cast<std::size_t>(precision.bits) };
    if(arf_is_special(data))
    {
      auto const tag{ arf_is_zero(data)  ? 0
                      : arf_is_nan(data) ? 1
                      : arf_is_pos_inf(data) ? 2
                                             : 3 };
      boost::hash_combine(seed, tag);
      return static_cast<native_hash>(seed);
    }

    runtime::detail::fmpz_handle man, expo;
    arf_get_fmpz_2exp(man.data, expo.data, data);
    boost::hash_combine(seed, fmpz_sgn(man.data));
    boost::hash_combine(seed, fmpz_fdiv_ui(man.data, modulus));
    boost::hash_combine(seed, fmpz_fdiv_ui(expo.data, modulus));
    return static_cast<native_hash>(seed);
  }

  native_integer arb_float::compare(arb_float const &o) const
  {
    if(arf_is_nan(data) || arf_is_nan(o.data))
    {
      throw std::runtime_error{ util::format("not comparable: {} and {}",
                                             to_string(),
                                             o.to_string()) };
    }
    return arf_cmp(data, o.data);
  }

  native_integer arb_float::to_integer(rounding_mode const mode) const
  {
    /* Anything at or beyond 2^64 cannot be a native_integer, whichever way it rounds. */
    if(!arf_is_finite(data) || arf_cmpabs_2exp_si(data, 64) >= 0)
    {
      throw std::overflow_error{ util::format("{} does not fit in a native integer",
                                              to_string()) };
    }

    runtime::detail::fmpz_handle z;
    arf_get_fmpz(z.data, data, runtime::detail::to_arf_rounding(mode));
    if(!fmpz_fits_si(z.data))
    {
      throw std::overflow_error{ util::format("{} does not fit in a native integer",
                                              to_string()) };
    }
    return static_cast<native_integer>(fmpz_get_si(z.data));
  }

  template <typename T>
  static T narrow_integer(arb_float const &x, rounding_mode const mode)
  {
    auto const i{ x.to_integer(mode) };
    if(i < std::numeric_limits<T>::min() || i > std::numeric_limits<T>::max())
    {
      throw std::overflow_error{ util::format("{} does not fit in {} bits",
                                              i,
                                              std::numeric_limits<T>::digits + 1) };
    }
    return static_cast<T>(i);
  }

  std::int32_t arb_float::to_int32(rounding_mode const mode) const
  {
    return narrow_integer<std::int32_t>(*this, mode);
  }

  std::int16_t arb_float::to_int16(rounding_mode const mode) const
  {
    return narrow_integer<std::int16_t>(*this, mode);
  }

  native_real arb_float::to_real() const
  {
    return arf_get_d(data, ARF_RND_NEAR);
  }

  native_big_float arb_float::to_big_float(rounding_mode const mode) const
  {
    return to_big_float(precision, mode);
  }

  native_big_float arb_float::to_big_float(bit_precision const precision,
                                           rounding_mode const mode) const
  {
    native_big_float ret;
    mpfr_set_prec(ret.backend().data(), static_cast<mpfr_prec_t>(precision.bits));
    arf_get_mpfr(ret.backend().data(), data, runtime::detail::to_mpfr_rounding(mode));
    return ret;
  }

  native_big_integer arb_float::to_big_integer() const
  {
    if(!arf_is_finite(data))
    {
      throw std::domain_error{ util::format("{} has no integer value", to_string()) };
    }
    runtime::detail::fmpz_handle z;
    arf_get_fmpz(z.data, data, ARF_RND_DOWN);
    return z.to_big_integer();
  }

  native_big_integer arb_float::to_exact_integer() const
  {
    if(!is_integer())
    {
      throw inexact_error{ util::format("{} is not an integer", to_string()) };
    }
    return to_big_integer();
  }

  native_bool arb_float::sign_bit() const
  {
    return arf_sgn(data) < 0;
  }

  native_integer arb_float::sign() const
  {
    return arf_sgn(data);
  }

  native_bool arb_float::is_zero() const
  {
    return arf_is_zero(data);
  }

  native_bool arb_float::is_one() const
  {
    return arf_is_one(data);
  }

  native_bool arb_float::is_nan() const
  {
    return arf_is_nan(data);
  }

  native_bool arb_float::is_inf() const
  {
    return arf_is_inf(data);
  }

  native_bool arb_float::is_finite() const
  {
    return arf_is_finite(data);
  }

  native_bool arb_float::is_integer() const
  {
    return arf_is_int(data);
  }

  arb_float_ptr copy(arb_float_ptr const x)
  {
    return make_box<arb_float>(*x);
  }

  arb_float_ptr copy(arb_float_ptr const x, bit_precision const precision, rounding_mode const mode)
  {
    return make_box<arb_float>(*x, precision, mode);
  }

  arb_float_ptr copy(arb_float_ptr const x, rounding_mode const mode)
  {
    return copy(x, x->precision, mode);
  }

  arb_float_ptr copy(arb_float_ptr const x, bit_precision const precision)
  {
    return copy(x, precision, rounding_mode::nearest);
  }

  void swap(arb_float_ptr const x, arb_float_ptr const y)
  {
    x->swap(*y);
  }

  arb_float_ptr operator-(arb_float_ptr const x)
  {
    auto ret{ make_box<arb_float>(x->precision) };
    arf_neg(ret->data, x->data);
    return ret;
  }

  // Addition
  arb_float_ptr operator+(arb_float_ptr const l, arb_float_ptr const r)
  {
    auto ret{ make_box<arb_float>(max(l->precision, r->precision)) };
    arf_add(ret->data, l->data, r->data, ret->precision.bits, ARF_RND_NEAR);
    return ret;
  }

  arb_float_ptr operator+(arb_float_ptr const l, native_integer const r)
  {
    return l + make_box<arb_float>(r, l->precision);
  }

  arb_float_ptr operator+(native_integer const l, arb_float_ptr const r)
  {
    return make_box<arb_float>(l, r->precision) + r;
  }

  // Subtraction
  arb_float_ptr operator-(arb_float_ptr const l, arb_float_ptr const r)
  {
    auto ret{ make_box<arb_float>(max(l->precision, r->precision)) };
    arf_sub(ret->data, l->data, r->data, ret->precision.bits, ARF_RND_NEAR);
    return ret;
  }

  arb_float_ptr operator-(arb_float_ptr const l, native_integer const r)
  {
    return l - make_box<arb_float>(r, l->precision);
  }

  arb_float_ptr operator-(native_integer const l, arb_float_ptr const r)
  {
    return make_box<arb_float>(l, r->precision) - r;
  }

  // Multiplication
  arb_float_ptr operator*(arb_float_ptr const l, arb_float_ptr const r)
  {
    auto ret{ make_box<arb_float>(max(l->precision, r->precision)) };
    arf_mul(ret->data, l->data, r->data, ret->precision.bits, ARF_RND_NEAR);
    return ret;
  }

  arb_float_ptr operator*(arb_float_ptr const l, native_integer const r)
  {
    return l * make_box<arb_float>(r, l->precision);
  }

  arb_float_ptr operator*(native_integer const l, arb_float_ptr const r)
  {
    return make_box<arb_float>(l, r->precision) * r;
  }

  // Division
  arb_float_ptr operator/(arb_float_ptr const l, arb_float_ptr const r)
  {
    auto ret{ make_box<arb_float>(max(l->precision, r->precision)) };
    arf_div(ret->data, l->data, r->data, ret->precision.bits, ARF_RND_NEAR);
    return ret;
  }

  arb_float_ptr operator/(arb_float_ptr const l, native_integer const r)
  {
    return l / make_box<arb_float>(r, l->precision);
  }

  arb_float_ptr operator/(native_integer const l, arb_float_ptr const r)
  {
    return make_box<arb_float>(l, r->precision) / r;
  }

  static native_bool unordered(arb_float const &l, arb_float const &r)
  {
    return arf_is_nan(l.data) || arf_is_nan(r.data);
  }

  native_bool operator==(arb_float_ptr const l, arb_float_ptr const r)
  {
    return !unordered(*l, *r) && arf_equal(l->data, r->data);
  }

  native_bool operator==(arb_float_ptr const l, native_integer const r)
  {
    return l == make_box<arb_float>(r, l->precision);
  }

  native_bool operator==(native_integer const l, arb_float_ptr const r)
  {
    return r == l;
  }

  native_bool operator!=(arb_float_ptr const l, arb_float_ptr const r)
  {
    return !(l == r);
  }

  native_bool operator!=(arb_float_ptr const l, native_integer const r)
  {
    return !(l == r);
  }

  native_bool operator!=(native_integer const l, arb_float_ptr const r)
  {
    return !(l == r);
  }

  native_bool operator<(arb_float_ptr const l, arb_float_ptr const r)
  {
    return !unordered(*l, *r) && arf_cmp(l->data, r->data) < 0;
  }

  native_bool operator<(arb_float_ptr const l, native_integer const r)
  {
    return l < make_box<arb_float>(r, l->precision);
  }

  native_bool operator<(native_integer const l, arb_float_ptr const r)
  {
    return make_box<arb_float>(l, r->precision) < r;
  }

  native_bool operator<=(arb_float_ptr const l, arb_float_ptr const r)
  {
    return !unordered(*l, *r) && arf_cmp(l->data, r->data) <= 0;
  }

  native_bool operator<=(arb_float_ptr const l, native_integer const r)
  {
    return l <= make_box<arb_float>(r, l->precision);
  }

  native_bool operator<=(native_integer const l, arb_float_ptr const r)
  {
    return make_box<arb_float>(l, r->precision) <= r;
  }

  native_bool operator>(arb_float_ptr const l, arb_float_ptr const r)
  {
    return r < l;
  }

  native_bool operator>(arb_float_ptr const l, native_integer const r)
  {
    return make_box<arb_float>(r, l->precision) < l;
  }

  native_bool operator>(native_integer const l, arb_float_ptr const r)
  {
    return r < make_box<arb_float>(l, r->precision);
  }

  native_bool operator>=(arb_float_ptr const l, arb_float_ptr const r)
  {
    return r <= l;
  }

  native_bool operator>=(arb_float_ptr const l, native_integer const r)
  {
    return make_box<arb_float>(r, l->precision) <= l;
  }

  native_bool operator>=(native_integer const l, arb_float_ptr const r)
  {
    return r <= make_box<arb_float>(l, r->precision);
  }
}
