#include <cmath>
#include <complex>
#include <stdexcept>

#include <arbnum/runtime/core/interval.hpp>
#include <arbnum/runtime/core/make_box.hpp>

#include <doctest/doctest.h>

/* Radii are kept as upper bounds with a 30-bit mantissa, so a radius built from
 * 0.5 may come back a hair larger. Those checks use Approx. */
namespace arbnum::runtime
{
  static obj::arb_float_ptr f(native_real const val)
  {
    return make_box<obj::arb_float>(val);
  }

  static void check_near(std::complex<double> const actual, std::complex<double> const expected)
  {
    CHECK(actual.real() == doctest::Approx(expected.real()));
    CHECK(actual.imag() == doctest::Approx(expected.imag()));
  }

  TEST_SUITE("interval")
  {
    TEST_CASE("Floats are balls of radius zero")
    {
      auto const x{ f(1.5) };
      auto const [mid, rad]{ ball(x) };
      CHECK(mid == x);
      CHECK(rad->is_zero());
      CHECK_EQ(rad->precision, x->precision);
      CHECK(midpoint(x) == x);
      CHECK(radius(x)->is_zero());
    }

    TEST_CASE("set_ball")
    {
      auto const x{ set_ball(f(1), f(0.5)) };
      CHECK(midpoint(x) == 1);
      CHECK(radius(x) >= f(0.5));
      CHECK(radius(x)->to_real() == doctest::Approx(0.5));
      CHECK(radius_mag(x)->to_real() == doctest::Approx(0.5));
      CHECK(contains(x, make_box<obj::arb_real>(1.25)));
      CHECK(contains(x, make_box<obj::arb_real>(0.5)));
      CHECK_FALSE(contains(x, make_box<obj::arb_real>(2)));

      auto const [mid, rad]{ ball(x) };
      CHECK(mid == 1);
      CHECK(rad->to_real() == doctest::Approx(0.5));

      CHECK_THROWS_AS(set_ball(f(1), f(-0.5)), std::invalid_argument);
      CHECK_THROWS_AS(set_ball(f(1), obj::arb_float::nan()), std::invalid_argument);
      CHECK(set_ball(f(3), obj::arb_float::zero())->is_exact());

      SUBCASE("Precision is the larger of the two")
      {
        auto const hi{ make_box<obj::arb_float>(1, bit_precision{ 256 }) };
        CHECK_EQ(set_ball(hi, f(0.5))->precision.bits, 256);
      }
    }

    TEST_CASE("Bounds")
    {
      auto const x{ set_ball(f(1), f(0.5)) };
      CHECK(lower_bound(x) <= f(0.5));
      CHECK(upper_bound(x) >= f(1.5));
      CHECK(lower_bound(x)->to_real() == doctest::Approx(0.5));
      CHECK(upper_bound(x)->to_real() == doctest::Approx(1.5));
      CHECK_EQ(lower_bound(x)->precision, x->precision);

      auto const [lo, hi]{ interval(x) };
      CHECK(lo->to_real() == doctest::Approx(0.5));
      CHECK(hi->to_real() == doctest::Approx(1.5));

      SUBCASE("Exact values")
      {
        auto const three{ make_box<obj::arb_real>(3) };
        CHECK(lower_bound(three) == 3);
        CHECK(upper_bound(three) == 3);
      }

      SUBCASE("Absolute value")
      {
        auto const y{ set_ball(f(-1), f(0.5)) };
        CHECK(lower_bound_abs(y) <= f(0.5));
        CHECK(lower_bound_abs(y)->to_real() == doctest::Approx(0.5));
        CHECK(upper_bound_abs(y)->to_real() == doctest::Approx(1.5));

        auto const z{ set_ball(f(0), f(2)) };
        auto const [abs_lo, abs_hi]{ interval_abs(z) };
        CHECK(abs_lo->is_zero());
        CHECK(abs_hi->to_real() == doctest::Approx(2.0));
      }

      SUBCASE("Bounds enclose the ball")
      {
        auto const third{ make_box<obj::arb_real>(native_big_rational{ 1, 3 }) };
        CHECK(lower_bound(third) < upper_bound(third));
        CHECK(contains(set_interval(lower_bound(third), upper_bound(third)), third));
      }
    }

    TEST_CASE("set_interval")
    {
      auto const x{ set_interval(f(1), f(2)) };
      CHECK(contains(x, make_box<obj::arb_real>(1)));
      CHECK(contains(x, make_box<obj::arb_real>(2)));
      CHECK(contains(x, make_box<obj::arb_real>(1.5)));
      CHECK(lower_bound(x) <= 1);
      CHECK(upper_bound(x) >= 2);

      auto const swapped{ set_interval(f(2), f(1)) };
      CHECK(swapped->equal(*x));

      SUBCASE("From balls")
      {
        auto const lo{ set_ball(f(1), f(0.5)) };
        auto const hi{ set_ball(f(4), f(0.5)) };
        auto const y{ set_interval(lo, hi) };
        CHECK(contains(y, lo));
        CHECK(contains(y, hi));
        CHECK(set_interval(hi, lo)->equal(*y));
      }
    }

    TEST_CASE("ulp")
    {
      auto const one{ make_box<obj::arb_float>(1, bit_precision{ 24 }) };
      CHECK_EQ(ulp(one)->to_real(), std::ldexp(1.0, -23));
      CHECK_EQ(ulp(make_box<obj::arb_float>(1, bit_precision{ 53 }))->to_real(),
               std::ldexp(1.0, -52));
      CHECK_EQ(ulp(make_box<obj::arb_float>(-4, bit_precision{ 24 }))->to_real(),
               std::ldexp(1.0, -21));
      CHECK_THROWS_AS(ulp(obj::arb_float::zero()), std::domain_error);
      CHECK_THROWS_AS(ulp(obj::arb_float::nan()), std::domain_error);
    }

    TEST_CASE("increase_radius")
    {
      SUBCASE("By a float")
      {
        auto const x{ make_box<obj::arb_real>(1) };
        auto const same{ increase_radius(x, f(0.25)) };
        CHECK(same.get() == x.get());
        CHECK(radius(x) >= f(0.25));
        CHECK(radius(x)->to_real() == doctest::Approx(0.25));
        CHECK(midpoint(x) == 1);
        CHECK_THROWS_AS(increase_radius(x, f(-0.25)), std::invalid_argument);
      }

      SUBCASE("By a ball")
      {
        auto const x{ make_box<obj::arb_real>(1) };
        increase_radius(x, make_box<obj::arb_real>(0.5));
        CHECK(radius(x) >= f(0.5));
        CHECK_THROWS_AS(increase_radius(x, make_box<obj::arb_real>(-1)), std::invalid_argument);
      }

      SUBCASE("By one ulp")
      {
        auto const x{ make_box<obj::arb_real>(1, bit_precision{ 24 }) };
        increase_radius(x);
        CHECK(radius(x)->to_real() == doctest::Approx(std::ldexp(1.0, -23)));
        CHECK(contains(x, make_box<obj::arb_real>(1.0 + std::ldexp(1.0, -23))));
      }
    }

    TEST_CASE("decrease_radius")
    {
      SUBCASE("By a float")
      {
        auto const x{ set_ball(f(1), f(0.5)) };
        auto const same{ decrease_radius(x, f(0.25)) };
        CHECK(same.get() == x.get());
        CHECK(radius(x)->to_real() == doctest::Approx(0.25));
        CHECK(midpoint(x) == 1);
      }

      SUBCASE("Uses the magnitude of the error")
      {
        auto const x{ set_ball(f(1), f(0.5)) };
        decrease_radius(x, f(-0.25));
        CHECK(radius(x)->to_real() == doctest::Approx(0.25));
      }

      SUBCASE("Stops at zero")
      {
        auto const x{ set_ball(f(1), f(0.5)) };
        decrease_radius(x, f(2));
        CHECK(x->is_exact());
        CHECK(midpoint(x) == 1);
      }

      SUBCASE("By a ball")
      {
        auto const x{ set_ball(f(1), f(0.5)) };
        decrease_radius(x, make_box<obj::arb_real>(0.75));
        CHECK(x->is_exact());
      }

      SUBCASE("NaN is rejected")
      {
        auto const x{ set_ball(f(1), f(0.5)) };
        CHECK_THROWS_AS(decrease_radius(x, obj::arb_float::nan()), std::invalid_argument);
        CHECK_THROWS_AS(decrease_radius(x, obj::arb_real::nan()), std::invalid_argument);
        CHECK_FALSE(x->is_exact());
        CHECK(radius(x)->to_real() == doctest::Approx(0.5));
      }

      SUBCASE("By one ulp")
      {
        auto const x{ make_box<obj::arb_real>(1, bit_precision{ 24 }) };
        increase_radius(x);
        increase_radius(x);
        decrease_radius(x);
        CHECK(radius(x)->to_real() == doctest::Approx(std::ldexp(1.0, -23)));
      }
    }

    TEST_CASE("Complex")
    {
      obj::arb_real const re{ *set_ball(f(1), f(0.5)) };
      obj::arb_real const im{ *set_ball(f(2), f(0.25)) };
      auto const z{ make_box<obj::arb_complex>(re, im) };

      CHECK(midpoint(z) == make_box<obj::arb_complex>(1, 2));
      check_near(radius(z)->to_complex(), { 0.5, 0.25 });
      check_near(lower_bound(z)->to_complex(), { 0.5, 1.75 });
      check_near(upper_bound(z)->to_complex(), { 1.5, 2.25 });

      auto const [lo, hi]{ interval(z) };
      CHECK(lo->equal(*lower_bound(z)));
      CHECK(hi->equal(*upper_bound(z)));

      obj::arb_real const neg_re{ *set_ball(f(-1), f(0.5)) };
      auto const w{ make_box<obj::arb_complex>(neg_re, im) };
      auto const [abs_lo, abs_hi]{ interval_abs(w) };
      check_near(abs_lo->to_complex(), { 0.5, 1.75 });
      check_near(abs_hi->to_complex(), { 1.5, 2.25 });
      CHECK(lower_bound_abs(w)->equal(*abs_lo));
      CHECK(upper_bound_abs(w)->equal(*abs_hi));
    }
  }
}
