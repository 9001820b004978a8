#pragma once

#include <arbnum/type.hpp>

namespace arbnum::runtime
{
  /* How much of a number to render. By default only the digits the value
   * actually supports are shown. `midpoint` asks for every digit of the
   * midpoint, `radius` adds the ball radius as `[m +/- r]`. */
  struct display_options
  {
    native_bool midpoint{};
    native_bool radius{};
  };

  static constexpr display_options display_all{ true, true };
}
