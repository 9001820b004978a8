#include <arbnum/runtime/core/math.hpp>
#include <arbnum/runtime/core/make_box.hpp>
#include <arbnum/runtime/detail/flint.hpp>

namespace arbnum::runtime
{
  template <typename F>
  static obj::arb_real_ptr unary(obj::arb_real_ptr const x, F const fn)
  {
    auto ret{ make_box<obj::arb_real>(x->precision) };
    fn(ret->data, x->data, ret->precision.bits);
    return ret;
  }

  template <typename F>
  static obj::arb_real_ptr binary(obj::arb_real_ptr const x, obj::arb_real_ptr const y, F const fn)
  {
    auto ret{ make_box<obj::arb_real>(max(x->precision, y->precision)) };
    fn(ret->data, x->data, y->data, ret->precision.bits);
    return ret;
  }

  template <typename F>
  static obj::arb_complex_ptr unary(obj::arb_complex_ptr const z, F const fn)
  {
    auto ret{ make_box<obj::arb_complex>(z->precision) };
    fn(ret->data, z->data, ret->precision.bits);
    return ret;
  }

  /* Evaluates a ball function on an exact ball and keeps the midpoint, rounded
   * to the precision of the argument. */
  template <typename F>
  static obj::arb_float_ptr through_ball(obj::arb_float_ptr const x, F const fn)
  {
    obj::arb_real const ball{ *x };
    obj::arb_real out{ x->precision };
    fn(out.data, ball.data, x->precision.bits);
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_set_round(ret->data, arb_midref(out.data), ret->precision.bits, ARF_RND_NEAR);
    return ret;
  }

  obj::arb_real_ptr constant_value(constant const c, bit_precision const precision)
  {
    return make_box<obj::arb_real>(c, precision);
  }

  obj::arb_float_ptr abs(obj::arb_float_ptr const x)
  {
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_abs(ret->data, x->data);
    return ret;
  }

  obj::arb_float_ptr sqrt(obj::arb_float_ptr const x)
  {
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_sqrt(ret->data, x->data, ret->precision.bits, ARF_RND_NEAR);
    return ret;
  }

  obj::arb_float_ptr floor(obj::arb_float_ptr const x)
  {
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_floor(ret->data, x->data);
    return ret;
  }

  obj::arb_float_ptr ceil(obj::arb_float_ptr const x)
  {
    auto ret{ make_box<obj::arb_float>(x->precision) };
    arf_ceil(ret->data, x->data);
    return ret;
  }

  obj::arb_float_ptr trunc(obj::arb_float_ptr const x)
  {
    return x->sign_bit() ? ceil(x) : floor(x);
  }

  obj::arb_float_ptr exp(obj::arb_float_ptr const x)
  {
    return through_ball(x, arb_exp);
  }

  obj::arb_float_ptr log(obj::arb_float_ptr const x)
  {
    return through_ball(x, arb_log);
  }

  obj::arb_float_ptr sin(obj::arb_float_ptr const x)
  {
    return through_ball(x, arb_sin);
  }

  obj::arb_float_ptr cos(obj::arb_float_ptr const x)
  {
    return through_ball(x, arb_cos);
  }

  obj::arb_float_ptr tan(obj::arb_float_ptr const x)
  {
    return through_ball(x, arb_tan);
  }

  obj::arb_float_ptr atan(obj::arb_float_ptr const x)
  {
    return through_ball(x, arb_atan);
  }

  obj::arb_real_ptr abs(obj::arb_real_ptr const x)
  {
    auto ret{ make_box<obj::arb_real>(x->precision) };
    arb_abs(ret->data, x->data);
    return ret;
  }

  obj::arb_real_ptr sqrt(obj::arb_real_ptr const x)
  {
    return unary(x, arb_sqrt);
  }

  obj::arb_real_ptr exp(obj::arb_real_ptr const x)
  {
    return unary(x, arb_exp);
  }

  obj::arb_real_ptr log(obj::arb_real_ptr const x)
  {
    return unary(x, arb_log);
  }

  obj::arb_real_ptr sin(obj::arb_real_ptr const x)
  {
    return unary(x, arb_sin);
  }

  obj::arb_real_ptr cos(obj::arb_real_ptr const x)
  {
    return unary(x, arb_cos);
  }

  obj::arb_real_ptr tan(obj::arb_real_ptr const x)
  {
    return unary(x, arb_tan);
  }

  obj::arb_real_ptr atan(obj::arb_real_ptr const x)
  {
    return unary(x, arb_atan);
  }

  obj::arb_real_ptr sinh(obj::arb_real_ptr const x)
  {
    return unary(x, arb_sinh);
  }

  obj::arb_real_ptr cosh(obj::arb_real_ptr const x)
  {
    return unary(x, arb_cosh);
  }

  obj::arb_real_ptr tanh(obj::arb_real_ptr const x)
  {
    return unary(x, arb_tanh);
  }

  obj::arb_real_ptr inv(obj::arb_real_ptr const x)
  {
    return unary(x, arb_inv);
  }

  obj::arb_real_ptr pow(obj::arb_real_ptr const x, obj::arb_real_ptr const y)
  {
    return binary(x, y, arb_pow);
  }

  obj::arb_real_ptr pow(obj::arb_real_ptr const x, native_integer const y)
  {
    runtime::detail::fmpz_handle e;
    fmpz_set_si(e.data, static_cast<slong>(y));
    auto ret{ make_box<obj::arb_real>(x->precision) };
    arb_pow_fmpz(ret->data, x->data, e.data, ret->precision.bits);
    return ret;
  }

  obj::arb_real_ptr min(obj::arb_real_ptr const x, obj::arb_real_ptr const y)
  {
    return binary(x, y, arb_min);
  }

  obj::arb_real_ptr max(obj::arb_real_ptr const x, obj::arb_real_ptr const y)
  {
    return binary(x, y, arb_max);
  }

  obj::arb_real_ptr abs(obj::arb_complex_ptr const z)
  {
    auto ret{ make_box<obj::arb_real>(z->precision) };
    acb_abs(ret->data, z->data, ret->precision.bits);
    return ret;
  }

  obj::arb_real_ptr arg(obj::arb_complex_ptr const z)
  {
    auto ret{ make_box<obj::arb_real>(z->precision) };
    acb_arg(ret->data, z->data, ret->precision.bits);
    return ret;
  }

  obj::arb_complex_ptr conj(obj::arb_complex_ptr const z)
  {
    auto ret{ make_box<obj::arb_complex>(z->precision) };
    acb_conj(ret->data, z->data);
    return ret;
  }

  obj::arb_complex_ptr sqrt(obj::arb_complex_ptr const z)
  {
    return unary(z, acb_sqrt);
  }

  obj::arb_complex_ptr exp(obj::arb_complex_ptr const z)
  {
    return unary(z, acb_exp);
  }

  obj::arb_complex_ptr log(obj::arb_complex_ptr const z)
  {
    return unary(z, acb_log);
  }

  obj::arb_complex_ptr sin(obj::arb_complex_ptr const z)
  {
    return unary(z, acb_sin);
  }

  obj::arb_complex_ptr cos(obj::arb_complex_ptr const z)
  {
    return unary(z, acb_cos);
  }

  obj::arb_complex_ptr tan(obj::arb_complex_ptr const z)
  {
    return unary(z, acb_tan);
  }

  obj::arb_complex_ptr inv(obj::arb_complex_ptr const z)
  {
    return unary(z, acb_inv);
  }

  obj::arb_complex_ptr pow(obj::arb_complex_ptr const z, obj::arb_complex_ptr const w)
  {
    auto ret{ make_box<obj::arb_complex>(max(z->precision, w->precision)) };
    acb_pow(ret->data, z->data, w->data, ret->precision.bits);
    return ret;
  }

  obj::arb_complex_ptr pow(obj::arb_complex_ptr const z, native_integer const n)
  {
    auto ret{ make_box<obj::arb_complex>(z->precision) };
    acb_pow_si(ret->data, z->data, static_cast<slong>(n), ret->precision.bits);
    return ret;
  }
}
