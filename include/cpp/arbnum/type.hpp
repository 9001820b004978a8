#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/mpfr.hpp>

namespace arbnum
{
  using native_integer = long long;
  using native_unsigned = unsigned long long;
  using native_real = double;
  using native_bool = bool;
  using native_hash = std::uint32_t;

  using native_persistent_string = std::string;
  using native_persistent_string_view = std::string_view;

  using native_big_integer = boost::multiprecision::cpp_int;
  using native_big_rational = boost::multiprecision::cpp_rational;
  /* Variable precision; the precision is set per value, in bits, through the backend. */
  using native_big_float = boost::multiprecision::mpfr_float;
}
