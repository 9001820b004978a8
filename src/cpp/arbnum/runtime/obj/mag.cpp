#include <functional>
#include <stdexcept>

#include <arbnum/runtime/obj/mag.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  mag::mag()
  {
    mag_init(data);
  }

  mag::mag(native_real const val)
  {
    if(!(val >= 0))
    {
      throw std::invalid_argument{ util::format("mag requires a nonnegative value, got {}", val) };
    }
    mag_init(data);
    mag_set_d(data, val);
  }

  mag::mag(mag const &o)
  {
    mag_init_set(data, o.data);
  }

  mag::mag(mag &&o) noexcept
  {
    mag_init(data);
    mag_swap(data, o.data);
  }

  mag::~mag()
  {
    mag_clear(data);
  }

  mag &mag::operator=(mag const &o)
  {
    mag_set(data, o.data);
    return *this;
  }

  native_bool mag::equal(mag const &o) const
  {
    return mag_equal(data, o.data);
  }

  native_persistent_string mag::to_string() const
  {
    return util::format("{}", to_real());
  }

  void mag::to_string(util::string_builder &buff) const
  {
    buff.format("{}", to_real());
  }

  native_hash mag::to_hash() const
  {
    return static_cast<native_hash>(std::hash<native_real>{}(to_real()));
  }

  native_real mag::to_real() const
  {
    return mag_get_d(data);
  }

  native_bool mag::is_zero() const
  {
    return mag_is_zero(data);
  }

  native_bool mag::is_finite() const
  {
    return mag_is_finite(data);
  }
}
