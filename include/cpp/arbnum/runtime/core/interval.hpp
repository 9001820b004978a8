#pragma once

#include <utility>

#include <arbnum/runtime/obj/mag.hpp>
#include <arbnum/runtime/obj/arb_float.hpp>
#include <arbnum/runtime/obj/arb_real.hpp>
#include <arbnum/runtime/obj/arb_complex.hpp>

/* Views of numbers as balls and intervals. Bounds are rounded outward at the
 * precision of the argument, so [lower_bound(x), upper_bound(x)] always
 * contains x. */
namespace arbnum::runtime
{
  using float_pair = std::pair<obj::arb_float_ptr, obj::arb_float_ptr>;
  using complex_pair = std::pair<obj::arb_complex_ptr, obj::arb_complex_ptr>;

  /* A float is a ball of radius zero. */
  obj::arb_float_ptr midpoint(obj::arb_float_ptr x);
  obj::arb_float_ptr radius(obj::arb_float_ptr x);
  float_pair ball(obj::arb_float_ptr x);

  obj::arb_float_ptr midpoint(obj::arb_real_ptr x);
  obj::arb_float_ptr radius(obj::arb_real_ptr x);
  obj::mag_ptr radius_mag(obj::arb_real_ptr x);
  float_pair ball(obj::arb_real_ptr x);
  /* Throws std::invalid_argument if `rad` is negative. */
  obj::arb_real_ptr set_ball(obj::arb_float_ptr mid, obj::arb_float_ptr rad);

  obj::arb_float_ptr lower_bound(obj::arb_real_ptr x);
  obj::arb_float_ptr upper_bound(obj::arb_real_ptr x);
  float_pair interval(obj::arb_real_ptr x);
  obj::arb_float_ptr lower_bound_abs(obj::arb_real_ptr x);
  obj::arb_float_ptr upper_bound_abs(obj::arb_real_ptr x);
  float_pair interval_abs(obj::arb_real_ptr x);

  /* The smallest ball containing [lo, hi]. The bounds are swapped if given in
   * the wrong order. */
  obj::arb_real_ptr set_interval(obj::arb_float_ptr lo, obj::arb_float_ptr hi);
  /* Uses the lower bound of `lo` and the upper bound of `hi`. */
  obj::arb_real_ptr set_interval(obj::arb_real_ptr lo, obj::arb_real_ptr hi);

  /* One unit in the last place of `x` at its precision. */
  obj::arb_float_ptr ulp(obj::arb_float_ptr x);

  /* These widen or narrow the radius of `x` in place and return `x`. The error
   * given to increase_radius must be nonnegative. decrease_radius uses |err|
   * and stops at zero. Without an error, one ulp of the midpoint is used. */
  obj::arb_real_ptr increase_radius(obj::arb_real_ptr x, obj::arb_float_ptr err);
  obj::arb_real_ptr increase_radius(obj::arb_real_ptr x, obj::arb_real_ptr err);
  obj::arb_real_ptr increase_radius(obj::arb_real_ptr x);
  obj::arb_real_ptr decrease_radius(obj::arb_real_ptr x, obj::arb_float_ptr err);
  obj::arb_real_ptr decrease_radius(obj::arb_real_ptr x, obj::arb_real_ptr err);
  obj::arb_real_ptr decrease_radius(obj::arb_real_ptr x);

  obj::arb_complex_ptr midpoint(obj::arb_complex_ptr z);
  obj::arb_complex_ptr radius(obj::arb_complex_ptr z);

  /* Complex bounds are taken part by part: the real part of lower_bound(z) is
   * the lower bound of real(z), and likewise for the imaginary part. */
  obj::arb_complex_ptr lower_bound(obj::arb_complex_ptr z);
  obj::arb_complex_ptr upper_bound(obj::arb_complex_ptr z);
  complex_pair interval(obj::arb_complex_ptr z);
  obj::arb_complex_ptr lower_bound_abs(obj::arb_complex_ptr z);
  obj::arb_complex_ptr upper_bound_abs(obj::arb_complex_ptr z);
  complex_pair interval_abs(obj::arb_complex_ptr z);
}
