#include <stdexcept>

#include <arbnum/runtime/core/interval.hpp>
#include <arbnum/runtime/core/make_box.hpp>
#include <arbnum/runtime/detail/flint.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime
{
  template <typename F>
  static obj::arb_float_ptr bound(obj::arb_real_ptr const x, F const fn)
  {
    auto ret{ make_box<obj::arb_float>(x->precision) };
    fn(ret->data, x->data, ret->precision.bits);
    return ret;
  }

  template <typename F>
  static obj::arb_complex_ptr per_part(obj::arb_complex_ptr const z, F const fn)
  {
    obj::arb_float re{ z->precision }, im{ z->precision };
    fn(re.data, acb_realref(z->data), z->precision.bits);
    fn(im.data, acb_imagref(z->data), z->precision.bits);
    return make_box<obj::arb_complex>(re, im);
  }

  obj::arb_float_ptr midpoint(obj::arb_float_ptr const x)
  {
    return x;
  }

  obj::arb_float_ptr radius(obj::arb_float_ptr const x)
  {
    return obj::arb_float::zero(x->precision);
  }

  float_pair ball(obj::arb_float_ptr const x)
  {
    return { midpoint(x), radius(x) };
  }

  obj::arb_float_ptr midpoint(obj::arb_real_ptr const x)
  {
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_set(ret->data, arb_midref(x->data));
    return ret;
  }

  obj::arb_float_ptr radius(obj::arb_real_ptr const x)
  {
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_set_mag(ret->data, arb_radref(x->data));
    return ret;
  }

  obj::mag_ptr radius_mag(obj::arb_real_ptr const x)
  {
    auto ret{ make_box<obj::mag>() };
    mag_set(ret->data, arb_radref(x->data));
    return ret;
  }

  float_pair ball(obj::arb_real_ptr const x)
  {
    return { midpoint(x), radius(x) };
  }

  obj::arb_real_ptr set_ball(obj::arb_float_ptr const mid, obj::arb_float_ptr const rad)
  {
    if(rad->is_nan() || rad->sign_bit())
    {
      throw std::invalid_argument{ util::format("nonnegative radius required ({})",
                                                rad->to_string()) };
    }
    auto ret{ make_box<obj::arb_real>(max(mid->precision, rad->precision)) };
    arf_set(arb_midref(ret->data), mid->data);
    arf_get_mag(arb_radref(ret->data), rad->data);
    return ret;
  }

  obj::arb_float_ptr lower_bound(obj::arb_real_ptr const x)
  {
    return bound(x, arb_get_lbound_arf);
  }

  obj::arb_float_ptr upper_bound(obj::arb_real_ptr const x)
  {
    return bound(x, arb_get_ubound_arf);
  }

  float_pair interval(obj::arb_real_ptr const x)
  {
    return { lower_bound(x), upper_bound(x) };
  }

  obj::arb_float_ptr lower_bound_abs(obj::arb_real_ptr const x)
  {
    return bound(x, arb_get_abs_lbound_arf);
  }

  obj::arb_float_ptr upper_bound_abs(obj::arb_real_ptr const x)
  {
    return bound(x, arb_get_abs_ubound_arf);
  }

  float_pair interval_abs(obj::arb_real_ptr const x)
  {
    return { lower_bound_abs(x), upper_bound_abs(x) };
  }

  obj::arb_real_ptr set_interval(obj::arb_float_ptr const lo, obj::arb_float_ptr const hi)
  {
    if(lo > hi)
    {
      return set_interval(hi, lo);
    }
    auto ret{ make_box<obj::arb_real>(max(lo->precision, hi->precision)) };
    arb_set_interval_arf(ret->data, lo->data, hi->data, ret->precision.bits);
    return ret;
  }

  obj::arb_real_ptr set_interval(obj::arb_real_ptr const lo, obj::arb_real_ptr const hi)
  {
    if(lo > hi)
    {
      return set_interval(hi, lo);
    }
    return set_interval(lower_bound(lo), upper_bound(hi));
  }

  obj::arb_float_ptr ulp(obj::arb_float_ptr const x)
  {
    if(arf_is_special(x->data))
    {
      throw std::domain_error{ util::format("ulp is undefined for {}", x->to_string()) };
    }
    mag_t m;
    mag_init(m);
    arf_mag_set_ulp(m, x->data, x->precision.bits);
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_set_mag(ret->data, m);
    mag_clear(m);
    return ret;
  }

  obj::arb_real_ptr increase_radius(obj::arb_real_ptr const x, obj::arb_float_ptr const err)
  {
    if(err->is_nan() || err->sign_bit())
    {
      throw std::invalid_argument{ util::format("nonnegative err required ({})",
                                                err->to_string()) };
    }
    arb_add_error_arf(x->data, err->data);
    return x;
  }

  obj::arb_real_ptr increase_radius(obj::arb_real_ptr const x, obj::arb_real_ptr const err)
  {
    if(!arb_is_nonnegative(err->data))
    {
      throw std::invalid_argument{ util::format("nonnegative err required ({})",
                                                err->to_string()) };
    }
    arb_add_error(x->data, err->data);
    return x;
  }

  obj::arb_real_ptr increase_radius(obj::arb_real_ptr const x)
  {
    return increase_radius(x, ulp(midpoint(x)));
  }

  static obj::arb_real_ptr shrink_radius(obj::arb_real_ptr const x, mag_t const by)
  {
    /* mag_sub rounds up and clamps at zero, so the result never undershoots. */
    mag_sub(arb_radref(x->data), arb_radref(x->data), by);
    return x;
  }

  obj::arb_real_ptr decrease_radius(obj::arb_real_ptr const x, obj::arb_float_ptr const err)
  {
    if(err->is_nan())
    {
      throw std::invalid_argument{ util::format("err must be a number ({})", err->to_string()) };
    }
    mag_t m;
    mag_init(m);
    arf_get_mag_lower(m, err->data);
    shrink_radius(x, m);
    mag_clear(m);
    return x;
  }

  obj::arb_real_ptr decrease_radius(obj::arb_real_ptr const x, obj::arb_real_ptr const err)
  {
    if(err->is_nan())
    {
      throw std::invalid_argument{ util::format("err must be a number ({})", err->to_string()) };
    }
    mag_t m;
    mag_init(m);
    arb_get_mag_lower(m, err->data);
    shrink_radius(x, m);
    mag_clear(m);
    return x;
  }

  obj::arb_real_ptr decrease_radius(obj::arb_real_ptr const x)
  {
    return decrease_radius(x, ulp(midpoint(x)));
  }

  obj::arb_complex_ptr midpoint(obj::arb_complex_ptr const z)
  {
    auto ret{ make_box<obj::arb_complex>(z->precision) };
    acb_get_mid(ret->data, z->data);
    return ret;
  }

  obj::arb_complex_ptr radius(obj::arb_complex_ptr const z)
  {
    obj::arb_float re{ z->precision }, im{ z->precision };
    arf_set_mag(re.data, arb_radref(acb_realref(z->data)));
    arf_set_mag(im.data, arb_radref(acb_imagref(z->data)));
    return make_box<obj::arb_complex>(re, im);
  }

  obj::arb_complex_ptr lower_bound(obj::arb_complex_ptr const z)
  {
    return per_part(z, arb_get_lbound_arf);
  }

  obj::arb_complex_ptr upper_bound(obj::arb_complex_ptr const z)
  {
    return per_part(z, arb_get_ubound_arf);
  }

  complex_pair interval(obj::arb_complex_ptr const z)
  {
    return { lower_bound(z), upper_bound(z) };
  }

  obj::arb_complex_ptr lower_bound_abs(obj::arb_complex_ptr const z)
  {
    return per_part(z, arb_get_abs_lbound_arf);
  }

  obj::arb_complex_ptr upper_bound_abs(obj::arb_complex_ptr const z)
  {
    return per_part(z, arb_get_abs_ubound_arf);
  }

  complex_pair interval_abs(obj::arb_complex_ptr const z)
  {
    return { lower_bound_abs(z), upper_bound_abs(z) };
  }
}
