#include <stdexcept>

#include <arbnum/runtime/detail/flint.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::detail
{
  arf_rnd_t to_arf_rounding(rounding_mode const mode)
  {
    switch(mode)
    {
      case rounding_mode::nearest:
        return ARF_RND_NEAR;
      case rounding_mode::to_zero:
        return ARF_RND_DOWN;
      case rounding_mode::from_zero:
        return ARF_RND_UP;
      case rounding_mode::down:
        return ARF_RND_FLOOR;
      case rounding_mode::up:
        return ARF_RND_CEIL;
    }
    throw std::invalid_argument{ "unknown rounding mode" };
  }

  mpfr_rnd_t to_mpfr_rounding(rounding_mode const mode)
  {
    switch(mode)
    {
      case rounding_mode::nearest:
        return MPFR_RNDN;
      case rounding_mode::to_zero:
        return MPFR_RNDZ;
      case rounding_mode::from_zero:
        return MPFR_RNDA;
      case rounding_mode::down:
        return MPFR_RNDD;
      case rounding_mode::up:
        return MPFR_RNDU;
    }
    throw std::invalid_argument{ "unknown rounding mode" };
  }

  fmpz_handle::fmpz_handle()
  {
    fmpz_init(data);
  }

  fmpz_handle::fmpz_handle(native_big_integer const &value)
  {
    fmpz_init(data);
    /* cpp_int renders plain decimal, which fmpz always accepts. */
    if(fmpz_set_str(data, value.str().c_str(), 10) != 0)
    {
      fmpz_clear(data);
      throw std::runtime_error{ util::format("unable to convert {} to fmpz", value.str()) };
    }
  }

  fmpz_handle::~fmpz_handle()
  {
    fmpz_clear(data);
  }

  native_big_integer fmpz_handle::to_big_integer() const
  {
    flint_string const s{ fmpz_get_str(nullptr, 10, data) };
    return native_big_integer{ s.data };
  }

  fmpq_handle::fmpq_handle(native_big_rational const &value)
  {
    fmpz_handle const num{ boost::multiprecision::numerator(value) };
    fmpz_handle const den{ boost::multiprecision::denominator(value) };
    fmpq_init(data);
    /* cpp_rational is kept canonical, so the pair can be taken as is. */
    fmpz_set(fmpq_numref(data), num.data);
    fmpz_set(fmpq_denref(data), den.data);
  }

  fmpq_handle::~fmpq_handle()
  {
    fmpq_clear(data);
  }

  flint_string::flint_string(char * const data)
    : data{ data }
  {
  }

  flint_string::~flint_string()
  {
    flint_free(data);
  }

  native_persistent_string flint_string::str() const
  {
    return data;
  }

  void set_integer(arf_t out, native_integer const value)
  {
    if(fits_slong(value))
    {
      arf_set_si(out, static_cast<slong>(value));
      return;
    }
    set_big_integer(out, native_big_integer{ value });
  }

  void set_unsigned(arf_t out, native_unsigned const value)
  {
    if constexpr(sizeof(native_unsigned) > sizeof(ulong))
    {
      if(value > std::numeric_limits<ulong>::max())
      {
        set_big_integer(out, native_big_integer{ value });
        return;
      }
    }
    arf_set_ui(out, static_cast<ulong>(value));
  }

  void set_big_integer(arf_t out, native_big_integer const &value)
  {
    fmpz_handle const z{ value };
    arf_set_fmpz(out, z.data);
  }

  native_persistent_string arb_str(arb_t const x, native_integer const digits, ulong const flags)
  {
    flint_string const s{ arb_get_str(x, static_cast<slong>(digits), flags) };
    return s.str();
  }

  void set_constant(arb_t out, constant const c, native_integer const prec)
  {
    switch(c)
    {
      case constant::pi:
        arb_const_pi(out, prec);
        return;
      case constant::e:
        arb_const_e(out, prec);
        return;
      case constant::log2:
        arb_const_log2(out, prec);
        return;
      case constant::euler:
        arb_const_euler(out, prec);
        return;
      case constant::catalan:
        arb_const_catalan(out, prec);
        return;
    }
    throw std::invalid_argument{ util::format("unknown constant {}", static_cast<int>(c)) };
  }
}
