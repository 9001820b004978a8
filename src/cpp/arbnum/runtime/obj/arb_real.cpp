#include <stdexcept>
#include <utility>

#include <boost/container_hash/hash.hpp>

#include <arbnum/runtime/obj/arb_real.hpp>
#include <arbnum/runtime/core/make_box.hpp>
#include <arbnum/runtime/detail/flint.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  static arb_float midpoint_of(arb_real const &x)
  {
    arb_float ret{ x.precision };
    arf_set(ret.data, arb_midref(x.data));
    return ret;
  }

  arb_real::arb_real()
    : precision{ working_precision() }
  {
    arb_init(data);
  }

  arb_real::arb_real(bit_precision const precision)
    : precision{ precision }
  {
    arb_init(data);
  }

  arb_real::arb_real(arb_real const &o)
    : precision{ o.precision }
  {
    arb_init(data);
    arb_set(data, o.data);
  }

  arb_real::arb_real(arb_real &&o) noexcept
    : precision{ o.precision }
  {
    arb_init(data);
    arb_swap(data, o.data);
  }

  arb_real::~arb_real()
  {
    arb_clear(data);
  }

  arb_real &arb_real::operator=(arb_real const &o)
  {
    if(this != &o)
    {
      arb_set(data, o.data);
      precision = o.precision;
    }
    return *this;
  }

  arb_real &arb_real::operator=(arb_real &&o) noexcept
  {
    swap(o);
    return *this;
  }

  arb_real::arb_real(native_big_integer const &val, bit_precision const precision)
    : arb_real{ precision }
  {
    runtime::detail::fmpz_handle const z{ val };
    arb_set_fmpz(data, z.data);
  }

  arb_real::arb_real(native_big_rational const &val, bit_precision const precision)
    : arb_real{ precision }
  {
    runtime::detail::fmpq_handle const q{ val };
    arb_set_fmpq(data, q.data, precision.bits);
  }

  arb_real::arb_real(native_big_float const &val, bit_precision const precision)
    : arb_real{ precision }
  {
    arf_set_mpfr(arb_midref(data), val.backend().data());
    mag_zero(arb_radref(data));
  }

  arb_real::arb_real(constant const c, bit_precision const precision)
    : arb_real{ precision }
  {
    runtime::detail::set_constant(data, c, precision.bits);
  }

  arb_real::arb_real(arb_float const &val)
    : arb_real{ val.precision }
  {
    arb_set_arf(data, val.data);
  }

  arb_real::arb_real(native_persistent_string_view const &s, bit_precision const precision)
    : arb_real{ precision }
  {
    native_persistent_string const str{ s };
    if(arb_set_str(data, str.c_str(), precision.bits) != 0)
    {
      throw std::runtime_error{ util::format("Failed to construct arb_real from string '{}'",
                                             str) };
    }
  }

  arb_real::arb_real(arb_real const &o, bit_precision const precision)
    : arb_real{ precision }
  {
    arb_set_round(data, o.data, precision.bits);
  }

  arb_real_ptr arb_real::zero(bit_precision const precision)
  {
    return make_box<arb_real>(precision);
  }

  arb_real_ptr arb_real::one(bit_precision const precision)
  {
    auto ret{ make_box<arb_real>(precision) };
    arb_one(ret->data);
    return ret;
  }

  arb_real_ptr arb_real::pos_inf(bit_precision const precision)
  {
    auto ret{ make_box<arb_real>(precision) };
    arb_pos_inf(ret->data);
    return ret;
  }

  arb_real_ptr arb_real::neg_inf(bit_precision const precision)
  {
    auto ret{ make_box<arb_real>(precision) };
    arb_neg_inf(ret->data);
    return ret;
  }

  arb_real_ptr arb_real::nan(bit_precision const precision)
  {
    auto ret{ make_box<arb_real>(precision) };
    arb_indeterminate(ret->data);
    return ret;
  }

  void arb_real::set(native_integer const val)
  {
    runtime::detail::set_integer(arb_midref(data), val);
    mag_zero(arb_radref(data));
  }

  void arb_real::set(native_unsigned const val)
  {
    runtime::detail::set_unsigned(arb_midref(data), val);
    mag_zero(arb_radref(data));
  }

  void arb_real::set(native_real const val)
  {
    arb_set_d(data, val);
  }

  void arb_real::swap(arb_real &o) noexcept
  {
    arb_swap(data, o.data);
    std::swap(precision, o.precision);
  }

  native_bool arb_real::equal(arb_real const &o) const
  {
    return arb_equal(data, o.data);
  }

  native_persistent_string arb_real::to_string() const
  {
    return to_string(display_options{});
  }

  native_persistent_string arb_real::to_string(display_options const &opts) const
  {
    auto const mid{ arb_midref(data) };
    if(arf_is_nan(mid))
    {
      return "NaN";
    }
    if(arf_is_inf(mid) && mag_is_zero(arb_radref(data)))
    {
      return arf_sgn(mid) < 0 ? "-Inf" : "Inf";
    }

    ulong flags{};
    if(!opts.radius)
    {
      flags |= ARB_STR_NO_RADIUS;
    }
    if(opts.midpoint)
    {
      flags |= ARB_STR_MORE;
    }
    return runtime::detail::arb_str(data, precision.digits(), flags);
  }

  void arb_real::to_string(util::string_builder &buff) const
  {
    buff(to_string());
  }

  native_persistent_string arb_real::to_code_string() const
  {
    return to_string(display_all);
  }

  native_hash arb_real::to_hash() const
  {
    std::size_t seed{ midpoint_of(*this).to_hash() };
    boost::hash_combine(seed, mag_get_d(arb_radref(data)));
    return static_cast<native_hash>(seed);
  }

  native_integer arb_real::to_integer(rounding_mode const mode) const
  {
    return midpoint_of(*this).to_integer(mode);
  }

  native_real arb_real::to_real() const
  {
    return arf_get_d(arb_midref(data), ARF_RND_NEAR);
  }

  native_big_float arb_real::to_big_float(rounding_mode const mode) const
  {
    return midpoint_of(*this).to_big_float(mode);
  }

  native_bool arb_real::is_exact() const
  {
    return arb_is_exact(data);
  }

  native_bool arb_real::is_zero() const
  {
    return arb_is_zero(data);
  }

  native_bool arb_real::is_nonzero() const
  {
    return arb_is_nonzero(data);
  }

  native_bool arb_real::is_finite() const
  {
    return arb_is_finite(data);
  }

  native_bool arb_real::is_nan() const
  {
    return arf_is_nan(arb_midref(data));
  }

  native_bool arb_real::is_positive() const
  {
    return arb_is_positive(data);
  }

  native_bool arb_real::is_negative() const
  {
    return arb_is_negative(data);
  }

  native_bool arb_real::contains_zero() const
  {
    return arb_contains_zero(data);
  }

  native_integer arb_real::accuracy_bits() const
  {
    return arb_rel_accuracy_bits(data);
  }

  arb_real_ptr copy(arb_real_ptr const x)
  {
    return make_box<arb_real>(*x);
  }

  arb_real_ptr copy(arb_real_ptr const x, bit_precision const precision)
  {
    return make_box<arb_real>(*x, precision);
  }

  void swap(arb_real_ptr const x, arb_real_ptr const y)
  {
    x->swap(*y);
  }

  native_bool contains(arb_real_ptr const x, arb_real_ptr const y)
  {
    return arb_contains(x->data, y->data);
  }

  native_bool overlaps(arb_real_ptr const x, arb_real_ptr const y)
  {
    return arb_overlaps(x->data, y->data);
  }

  arb_real_ptr trim(arb_real_ptr const x)
  {
    auto ret{ make_box<arb_real>(x->precision) };
    arb_trim(ret->data, x->data);
    return ret;
  }

  arb_real_ptr operator-(arb_real_ptr const x)
  {
    auto ret{ make_box<arb_real>(x->precision) };
    arb_neg(ret->data, x->data);
    return ret;
  }

  // Addition
  arb_real_ptr operator+(arb_real_ptr const l, arb_real_ptr const r)
  {
    auto ret{ make_box<arb_real>(max(l->precision, r->precision)) };
    arb_add(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_real_ptr operator+(arb_real_ptr const l, native_integer const r)
  {
    return l + make_box<arb_real>(r, l->precision);
  }

  arb_real_ptr operator+(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) + r;
  }

  // Subtraction
  arb_real_ptr operator-(arb_real_ptr const l, arb_real_ptr const r)
  {
    auto ret{ make_box<arb_real>(max(l->precision, r->precision)) };
    arb_sub(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_real_ptr operator-(arb_real_ptr const l, native_integer const r)
  {
    return l - make_box<arb_real>(r, l->precision);
  }

  arb_real_ptr operator-(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) - r;
  }

  // Multiplication
  arb_real_ptr operator*(arb_real_ptr const l, arb_real_ptr const r)
  {
    auto ret{ make_box<arb_real>(max(l->precision, r->precision)) };
    arb_mul(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_real_ptr operator*(arb_real_ptr const l, native_integer const r)
  {
    return l * make_box<arb_real>(r, l->precision);
  }

  arb_real_ptr operator*(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) * r;
  }

  // Division
  arb_real_ptr operator/(arb_real_ptr const l, arb_real_ptr const r)
  {
    auto ret{ make_box<arb_real>(max(l->precision, r->precision)) };
    arb_div(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_real_ptr operator/(arb_real_ptr const l, native_integer const r)
  {
    return l / make_box<arb_real>(r, l->precision);
  }

  arb_real_ptr operator/(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) / r;
  }

  native_bool operator==(arb_real_ptr const l, arb_real_ptr const r)
  {
    return arb_eq(l->data, r->data);
  }

  native_bool operator==(arb_real_ptr const l, native_integer const r)
  {
    return l == make_box<arb_real>(r, l->precision);
  }

  native_bool operator==(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) == r;
  }

  native_bool operator!=(arb_real_ptr const l, arb_real_ptr const r)
  {
    return arb_ne(l->data, r->data);
  }

  native_bool operator!=(arb_real_ptr const l, native_integer const r)
  {
    return l != make_box<arb_real>(r, l->precision);
  }

  native_bool operator!=(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) != r;
  }

  native_bool operator<(arb_real_ptr const l, arb_real_ptr const r)
  {
    return arb_lt(l->data, r->data);
  }

  native_bool operator<(arb_real_ptr const l, native_integer const r)
  {
    return l < make_box<arb_real>(r, l->precision);
  }

  native_bool operator<(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) < r;
  }

  native_bool operator<=(arb_real_ptr const l, arb_real_ptr const r)
  {
    return arb_le(l->data, r->data);
  }

  native_bool operator<=(arb_real_ptr const l, native_integer const r)
  {
    return l <= make_box<arb_real>(r, l->precision);
  }

  native_bool operator<=(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) <= r;
  }

  native_bool operator>(arb_real_ptr const l, arb_real_ptr const r)
  {
    return arb_gt(l->data, r->data);
  }

  native_bool operator>(arb_real_ptr const l, native_integer const r)
  {
    return l > make_box<arb_real>(r, l->precision);
  }

  native_bool operator>(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) > r;
  }

  native_bool operator>=(arb_real_ptr const l, arb_real_ptr const r)
  {
    return arb_ge(l->data, r->data);
  }

  native_bool operator>=(arb_real_ptr const l, native_integer const r)
  {
    return l >= make_box<arb_real>(r, l->precision);
  }

  native_bool operator>=(native_integer const l, arb_real_ptr const r)
  {
    return make_box<arb_real>(l, r->precision) >= r;
  }
}
