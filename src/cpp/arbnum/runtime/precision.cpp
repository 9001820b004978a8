#include <atomic>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <arbnum/runtime/precision.hpp>
#include <arbnum/util/fmt.hpp>
#include <arbnum/util/log.hpp>

namespace arbnum::runtime
{
  static constexpr native_real log2_of_10{ 3.321928094887362 };
  static constexpr native_real log10_of_2{ 0.3010299956639812 };

  bit_precision::bit_precision(native_integer const bits)
    : bits{ bits }
  {
    if(bits < minimum_precision)
    {
      throw std::domain_error{
        util::format("bit precision {} < {}", bits, minimum_precision)
      };
    }
  }

  bit_precision bit_precision::from_digits(native_integer const digits)
  {
    return bit_precision{ bits_for_digits(digits) };
  }

  native_integer bit_precision::digits() const
  {
    return digits_for_bits(bits);
  }

  bit_precision max(bit_precision const l, bit_precision const r)
  {
    return l.bits < r.bits ? r : l;
  }

  native_integer bits_for_digits(native_integer const digits)
  {
    return static_cast<native_integer>(std::ceil(static_cast<native_real>(digits) * log2_of_10));
  }

  native_integer digits_for_bits(native_integer const bits)
  {
    return static_cast<native_integer>(std::floor(static_cast<native_real>(bits) * log10_of_2));
  }

  bit_precision resolve_precision(precision_request const &request)
  {
    auto const base{ request.base != 0 ? request.base : (request.bits == 0 ? 10 : 2) };
    switch(base)
    {
      case 10:
        if(request.digits > 0)
        {
          return bit_precision::from_digits(request.digits);
        }
        if(request.bits > 0)
        {
          return bit_precision{ request.bits };
        }
        return working_precision();
      case 2:
        if(request.bits > 0)
        {
          return bit_precision{ request.bits };
        }
        if(request.digits > 0)
        {
          return bit_precision{ request.digits };
        }
        return working_precision();
      default:
        throw std::invalid_argument{ util::format("base expects 2 or 10, got {}", base) };
    }
  }

  native_integer parse_precision(char const * const value)
  {
    if(value == nullptr || *value == '\0')
    {
      return default_precision;
    }

    native_integer parsed{};
    auto const end{ value + std::strlen(value) };
    auto const res{ std::from_chars(value, end, parsed) };
    if(res.ec != std::errc{} || res.ptr != end || parsed < minimum_precision)
    {
      util::logger()->warn("ignoring ARBNUM_PRECISION='{}'; expected an integer >= {}",
                           value,
                           minimum_precision);
      return default_precision;
    }

    util::logger()->debug("initial working precision {} from ARBNUM_PRECISION", parsed);
    return parsed;
  }

  static std::atomic<native_integer> &working_bits()
  {
    static std::atomic<native_integer> bits{ parse_precision(std::getenv("ARBNUM_PRECISION")) };
    return bits;
  }

  bit_precision working_precision()
  {
    return bit_precision{ working_bits().load(std::memory_order_relaxed) };
  }

  void set_working_precision(bit_precision const precision)
  {
    auto const old{ working_bits().exchange(precision.bits, std::memory_order_relaxed) };
    if(old != precision.bits)
    {
      util::logger()->debug("working precision {} -> {}", old, precision.bits);
    }
  }

  precision_guard::precision_guard(bit_precision const precision)
    : previous{ working_precision() }
  {
    set_working_precision(precision);
  }

  precision_guard::~precision_guard()
  {
    set_working_precision(previous);
  }

  char const *rounding_mode_str(rounding_mode const mode)
  {
    switch(mode)
    {
      case rounding_mode::nearest:
        return "nearest";
      case rounding_mode::to_zero:
        return "to_zero";
      case rounding_mode::from_zero:
        return "from_zero";
      case rounding_mode::down:
        return "down";
      case rounding_mode::up:
        return "up";
    }
    return "unknown";
  }
}
