#pragma once

#include <arbnum/runtime/constant.hpp>
#include <arbnum/runtime/precision.hpp>
#include <arbnum/runtime/obj/arb_float.hpp>
#include <arbnum/runtime/obj/arb_real.hpp>
#include <arbnum/runtime/obj/arb_complex.hpp>

namespace arbnum::runtime
{
  obj::arb_real_ptr constant_value(constant c, bit_precision precision = working_precision());

  /* arb_float. abs, sqrt and the integer roundings are done by arf directly.
   * Everything else is evaluated as a ball and the midpoint is kept. */
  obj::arb_float_ptr abs(obj::arb_float_ptr x);
  obj::arb_float_ptr sqrt(obj::arb_float_ptr x);
  obj::arb_float_ptr floor(obj::arb_float_ptr x);
  obj::arb_float_ptr ceil(obj::arb_float_ptr x);
  obj::arb_float_ptr trunc(obj::arb_float_ptr x);
  obj::arb_float_ptr exp(obj::arb_float_ptr x);
  obj::arb_float_ptr log(obj::arb_float_ptr x);
  obj::arb_float_ptr sin(obj::arb_float_ptr x);
  obj::arb_float_ptr cos(obj::arb_float_ptr x);
  obj::arb_float_ptr tan(obj::arb_float_ptr x);
  obj::arb_float_ptr atan(obj::arb_float_ptr x);

  obj::arb_real_ptr abs(obj::arb_real_ptr x);
  obj::arb_real_ptr sqrt(obj::arb_real_ptr x);
  obj::arb_real_ptr exp(obj::arb_real_ptr x);
  obj::arb_real_ptr log(obj::arb_real_ptr x);
  obj::arb_real_ptr sin(obj::arb_real_ptr x);
  obj::arb_real_ptr cos(obj::arb_real_ptr x);
  obj::arb_real_ptr tan(obj::arb_real_ptr x);
  obj::arb_real_ptr atan(obj::arb_real_ptr x);
  obj::arb_real_ptr sinh(obj::arb_real_ptr x);
  obj::arb_real_ptr cosh(obj::arb_real_ptr x);
  obj::arb_real_ptr tanh(obj::arb_real_ptr x);
  obj::arb_real_ptr inv(obj::arb_real_ptr x);
  obj::arb_real_ptr pow(obj::arb_real_ptr x, obj::arb_real_ptr y);
  obj::arb_real_ptr pow(obj::arb_real_ptr x, native_integer y);
  obj::arb_real_ptr min(obj::arb_real_ptr x, obj::arb_real_ptr y);
  obj::arb_real_ptr max(obj::arb_real_ptr x, obj::arb_real_ptr y);

  obj::arb_real_ptr abs(obj::arb_complex_ptr z);
  obj::arb_real_ptr arg(obj::arb_complex_ptr z);
  obj::arb_complex_ptr conj(obj::arb_complex_ptr z);
  obj::arb_complex_ptr sqrt(obj::arb_complex_ptr z);
  obj::arb_complex_ptr exp(obj::arb_complex_ptr z);
  obj::arb_complex_ptr log(obj::arb_complex_ptr z);
  obj::arb_complex_ptr sin(obj::arb_complex_ptr z);
  obj::arb_complex_ptr cos(obj::arb_complex_ptr z);
  obj::arb_complex_ptr tan(obj::arb_complex_ptr z);
  obj::arb_complex_ptr inv(obj::arb_complex_ptr z);
  obj::arb_complex_ptr pow(obj::arb_complex_ptr z, obj::arb_complex_ptr w);
  obj::arb_complex_ptr pow(obj::arb_complex_ptr z, native_integer n);
}
