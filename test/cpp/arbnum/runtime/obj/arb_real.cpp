#include <stdexcept>
#include <string_view>

#include <arbnum/runtime/obj/arb_real.hpp>
#include <arbnum/runtime/core/make_box.hpp>

#include <doctest/doctest.h>

namespace arbnum::runtime::obj
{
  static bit_precision const p64{ 64 };
  static bit_precision const p128{ 128 };

  static arb_real_ptr ball_of(std::string_view const s)
  {
    return make_box<obj::arb_real>(s);
  }

  TEST_SUITE("arb_real")
  {
    TEST_CASE("Default constructor")
    {
      auto const x{ make_box<obj::arb_real>() };
      CHECK(x->is_zero());
      CHECK(x->is_exact());
      CHECK_EQ(x->precision, working_precision());
    }

    TEST_CASE("Exact construction")
    {
      SUBCASE("native_integer")
      {
        auto const x{ make_box<obj::arb_real>(3) };
        CHECK(x->is_exact());
        CHECK_EQ(x->to_integer(), 3);
        CHECK(x == 3);
      }

      SUBCASE("native_real")
      {
        auto const x{ make_box<obj::arb_real>(0.1, p64) };
        CHECK(x->is_exact());
        CHECK_EQ(x->to_real(), 0.1);
        CHECK_EQ(x->precision.bits, 64);
      }

      SUBCASE("native_big_integer")
      {
        native_big_integer const n{ "-98765432109876543210" };
        auto const x{ make_box<obj::arb_real>(n) };
        CHECK(x->is_exact());
        CHECK(x->is_negative());
      }

      SUBCASE("native_big_float")
      {
        native_big_float const f{ 1.75 };
        auto const x{ make_box<obj::arb_real>(f) };
        CHECK(x->is_exact());
        CHECK_EQ(x->to_real(), 1.75);
      }

      SUBCASE("arb_float")
      {
        obj::arb_float const f{ 2.5, p64 };
        auto const x{ make_box<obj::arb_real>(f) };
        CHECK(x->is_exact());
        CHECK_EQ(x->precision.bits, 64);
        CHECK_EQ(x->to_real(), 2.5);
      }
    }

    TEST_CASE("Inexact construction")
    {
      SUBCASE("native_big_rational")
      {
        auto const third{ make_box<obj::arb_real>(native_big_rational{ 1, 3 }, p128) };
        CHECK_FALSE(third->is_exact());
        CHECK(third->accuracy_bits() > 100);
        CHECK(contains(make_box<obj::arb_real>(3) * third, obj::arb_real::one()));
      }

      SUBCASE("constant")
      {
        auto const pi{ make_box<obj::arb_real>(constant::pi, p64) };
        CHECK_FALSE(pi->is_exact());
        CHECK(pi > 3);
        CHECK(pi < 4);
        CHECK(pi->to_real() == doctest::Approx(3.141592653589793));
      }

      SUBCASE("string")
      {
        auto const x{ ball_of("[3.14 +/- 0.01]") };
        CHECK_FALSE(x->is_exact());
        CHECK(contains(x, make_box<obj::arb_real>(3.145)));
        CHECK_FALSE(contains(x, make_box<obj::arb_real>(3.2)));
        CHECK(ball_of("12")->is_exact());
        CHECK_THROWS_AS(ball_of("pi-ish"), std::runtime_error);
      }

      SUBCASE("precision_request")
      {
        auto const x{ make_box<obj::arb_real>(1, precision_request{ .digits = 50 }) };
        CHECK_EQ(x->precision.bits, 167);
      }
    }

    TEST_CASE("Special values")
    {
      CHECK(obj::arb_real::zero()->is_zero());
      CHECK(obj::arb_real::one() == 1);
      CHECK(obj::arb_real::nan()->is_nan());
      CHECK_FALSE(obj::arb_real::nan()->is_finite());
      CHECK_FALSE(obj::arb_real::pos_inf()->is_finite());
      CHECK(obj::arb_real::neg_inf()->is_negative());
    }

    TEST_CASE("to_string")
    {
      CHECK_EQ(obj::arb_real::nan()->to_string(), "NaN");
      CHECK_EQ(obj::arb_real::pos_inf()->to_string(), "Inf");
      CHECK_EQ(obj::arb_real::neg_inf()->to_string(), "-Inf");
      CHECK(make_box<obj::arb_real>(3)->to_string().starts_with("3"));

      auto const x{ ball_of("[3.14 +/- 0.01]") };
      CHECK_EQ(x->to_string().find("+/-"), std::string::npos);
      CHECK_NE(x->to_string(display_options{ .radius = true }).find("+/-"), std::string::npos);
      CHECK_NE(x->to_code_string().find("+/-"), std::string::npos);
      CHECK_GT(x->to_string(display_options{ .midpoint = true }).size(), x->to_string().size());

      auto const third{ make_box<obj::arb_real>(native_big_rational{ 1, 3 }) };
      CHECK(third->to_string().starts_with("0.333"));
      CHECK(third->to_string(display_options{ .midpoint = true }).size()
            >= third->to_string().size());
    }

    TEST_CASE("Arithmetic")
    {
      auto const a{ make_box<obj::arb_real>(1.5) };
      auto const b{ make_box<obj::arb_real>(2.25) };

      CHECK(a + b == make_box<obj::arb_real>(3.75));
      CHECK(b - a == make_box<obj::arb_real>(0.75));
      CHECK(a * b == make_box<obj::arb_real>(3.375));
      CHECK(-a == make_box<obj::arb_real>(-1.5));
      CHECK(overlaps(a / b, make_box<obj::arb_real>(native_big_rational{ 2, 3 })));

      SUBCASE("With native_integer")
      {
        CHECK(a + 1 == make_box<obj::arb_real>(2.5));
        CHECK(1 - a == make_box<obj::arb_real>(-0.5));
        CHECK(2 * a == 3);
        CHECK(3 / a == 2);
      }

      SUBCASE("Result takes the larger precision")
      {
        auto const lo{ make_box<obj::arb_real>(1, p64) };
        auto const hi{ make_box<obj::arb_real>(1, bit_precision{ 256 }) };
        CHECK_EQ((lo + hi)->precision.bits, 256);
        CHECK_EQ((lo / hi)->precision.bits, 256);
      }

      SUBCASE("Balls widen")
      {
        auto const x{ ball_of("[1 +/- 0.5]") };
        auto const sum{ x + x };
        CHECK(contains(sum, make_box<obj::arb_real>(1)));
        CHECK(contains(sum, make_box<obj::arb_real>(3)));
        CHECK_FALSE(sum->is_exact());
      }
    }

    TEST_CASE("Comparison")
    {
      auto const one{ make_box<obj::arb_real>(1) };
      auto const two{ make_box<obj::arb_real>(2) };

      CHECK(one < two);
      CHECK(one <= two);
      CHECK(two > one);
      CHECK(two >= one);
      CHECK(one == obj::arb_real::one());
      CHECK(one != two);
      CHECK(one < 2);
      CHECK(0 < one);
      CHECK(2 >= one);

      SUBCASE("Overlapping balls are not ordered")
      {
        auto const x{ ball_of("[1 +/- 1]") };
        auto const y{ make_box<obj::arb_real>(1.5) };
        CHECK_FALSE(x == y);
        CHECK_FALSE(x != y);
        CHECK_FALSE(x < y);
        CHECK_FALSE(x >= y);
        CHECK(overlaps(x, y));
        CHECK(x->contains_zero());
        CHECK_FALSE(x->is_positive());
        CHECK_FALSE(x->is_nonzero());
      }

      SUBCASE("A ball is not certainly equal to itself")
      {
        auto const x{ ball_of("[1 +/- 0.1]") };
        CHECK_FALSE(x == x);
        CHECK(x->equal(*x));
      }
    }

    TEST_CASE("Number conversions use the midpoint")
    {
      auto const x{ make_box<obj::arb_real>(2.5) + ball_of("[0 +/- 0.25]") };
      CHECK_FALSE(x->is_exact());
      CHECK_EQ(x->to_integer(), 2);
      CHECK_EQ(x->to_integer(rounding_mode::up), 3);
      CHECK_EQ(x->to_real(), 2.5);
      CHECK_EQ(x->to_big_float(), native_big_float{ 2.5 });
      CHECK_THROWS_AS(obj::arb_real::nan()->to_integer(), std::overflow_error);
    }

    TEST_CASE("copy")
    {
      auto const third{ make_box<obj::arb_real>(native_big_rational{ 1, 3 }, p128) };

      auto const same{ copy(third) };
      CHECK(same->equal(*third));
      CHECK(same.get() != third.get());

      auto const low{ copy(third, bit_precision{ 32 }) };
      CHECK_EQ(low->precision.bits, 32);
      CHECK(contains(low, third));
      CHECK(low->accuracy_bits() < third->accuracy_bits());
    }

    TEST_CASE("trim")
    {
      auto const x{ ball_of("[3.14159265358979 +/- 0.001]") };
      auto const t{ trim(x) };
      CHECK(contains(t, x));
    }

    TEST_CASE("swap")
    {
      auto const a{ make_box<obj::arb_real>(1, p64) };
      auto const b{ make_box<obj::arb_real>(2, p128) };
      swap(a, b);
      CHECK(a == 2);
      CHECK_EQ(a->precision.bits, 128);
      CHECK(b == 1);
      CHECK_EQ(b->precision.bits, 64);
    }

    TEST_CASE("Hashing")
    {
      auto const a{ make_box<obj::arb_real>(1.5) };
      auto const b{ make_box<obj::arb_real>(native_big_rational{ 3, 2 }) };
      CHECK(a->equal(*b));
      CHECK_EQ(a->to_hash(), b->to_hash());
      CHECK_EQ(std::hash<obj::arb_real_ptr>{}(a), a->to_hash());

      auto const lo{ make_box<obj::arb_real>(1.5, p64) };
      auto const hi{ make_box<obj::arb_real>(1.5, p128) };
      CHECK(lo->equal(*hi));
      CHECK_NE(lo->to_hash(), hi->to_hash());
    }
  }
}
