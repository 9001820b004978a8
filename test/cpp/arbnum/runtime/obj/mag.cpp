#include <cmath>
#include <limits>
#include <stdexcept>

#include <arbnum/runtime/obj/mag.hpp>
#include <arbnum/runtime/core/make_box.hpp>

#include <doctest/doctest.h>

namespace arbnum::runtime::obj
{
  TEST_SUITE("mag")
  {
    TEST_CASE("Default constructor")
    {
      auto const m{ make_box<obj::mag>() };
      CHECK(m->is_zero());
      CHECK(m->is_finite());
      CHECK_EQ(m->to_real(), 0.0);
    }

    TEST_CASE("Constructor from native_real")
    {
      auto const m{ make_box<obj::mag>(0.5) };
      CHECK_FALSE(m->is_zero());
      CHECK_EQ(m->to_real(), 0.5);
      CHECK_EQ(m->to_string(), "0.5");

      SUBCASE("Rounds up")
      {
        auto const third{ make_box<obj::mag>(1.0 / 3.0) };
        CHECK(third->to_real() >= 1.0 / 3.0);
        CHECK(third->to_real() < 0.334);
      }

      SUBCASE("Infinite")
      {
        auto const inf{ make_box<obj::mag>(std::numeric_limits<double>::infinity()) };
        CHECK_FALSE(inf->is_finite());
      }

      SUBCASE("Rejects negatives and NaN")
      {
        CHECK_THROWS_AS(obj::mag{ -1.0 }, std::invalid_argument);
        CHECK_THROWS_AS(obj::mag{ std::nan("") }, std::invalid_argument);
      }
    }

    TEST_CASE("Copy and equality")
    {
      auto const m{ make_box<obj::mag>(2.0) };
      auto const c{ make_box<obj::mag>(*m) };
      CHECK(c->equal(*m));
      CHECK_EQ(c->to_hash(), m->to_hash());
      CHECK_FALSE(c->equal(obj::mag{ 4.0 }));

      obj::mag assigned;
      assigned = *m;
      CHECK(assigned.equal(*m));
    }
  }
}
