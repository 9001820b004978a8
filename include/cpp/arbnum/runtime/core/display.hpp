#pragma once

#include <iostream>
#include <ostream>
#include <string_view>

#include <fmt/format.h>

#include <arbnum/runtime/display_options.hpp>
#include <arbnum/runtime/obj/mag.hpp>
#include <arbnum/runtime/obj/arb_float.hpp>
#include <arbnum/runtime/obj/arb_real.hpp>
#include <arbnum/runtime/obj/arb_complex.hpp>

namespace arbnum::runtime
{
  void show(std::ostream &os, obj::mag_ptr x);
  void show(std::ostream &os, obj::arb_float_ptr x, display_options const &opts = {});
  void show(std::ostream &os, obj::arb_real_ptr x, display_options const &opts = {});
  void show(std::ostream &os, obj::arb_complex_ptr z, display_options const &opts = {});

  /* Midpoint and radius both on. */
  void show_all(std::ostream &os, obj::arb_float_ptr x);
  void show_all(std::ostream &os, obj::arb_real_ptr x);
  void show_all(std::ostream &os, obj::arb_complex_ptr z);

  /* To stdout, with no trailing newline. */
  template <typename T>
  void show(T const &x)
  {
    show(std::cout, x);
  }

  template <typename T>
  void show_all(T const &x)
  {
    show_all(std::cout, x);
  }
}

namespace arbnum::runtime::obj
{
  std::ostream &operator<<(std::ostream &os, mag_ptr x);
  std::ostream &operator<<(std::ostream &os, arb_float_ptr x);
  std::ostream &operator<<(std::ostream &os, arb_real_ptr x);
  std::ostream &operator<<(std::ostream &os, arb_complex_ptr z);
}

namespace arbnum::runtime::detail
{
  /* Formats a box through its to_string, honoring width, fill and alignment. */
  template <typename T>
  struct box_formatter : fmt::formatter<std::string_view>
  {
    template <typename FormatContext>
    auto format(native_box<T> const &o, FormatContext &ctx) const
    {
      if(!o)
      {
        return fmt::formatter<std::string_view>::format("nil", ctx);
      }
      return fmt::formatter<std::string_view>::format(o->to_string(), ctx);
    }
  };
}

template <>
struct fmt::formatter<arbnum::runtime::obj::mag_ptr>
  : arbnum::runtime::detail::box_formatter<arbnum::runtime::obj::mag>
{
};

template <>
struct fmt::formatter<arbnum::runtime::obj::arb_float_ptr>
  : arbnum::runtime::detail::box_formatter<arbnum::runtime::obj::arb_float>
{
};

template <>
struct fmt::formatter<arbnum::runtime::obj::arb_real_ptr>
  : arbnum::runtime::detail::box_formatter<arbnum::runtime::obj::arb_real>
{
};

template <>
struct fmt::formatter<arbnum::runtime::obj::arb_complex_ptr>
  : arbnum::runtime::detail::box_formatter<arbnum::runtime::obj::arb_complex>
{
};
