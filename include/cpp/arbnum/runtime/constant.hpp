#pragma once

namespace arbnum::runtime
{
  /* Mathematical constants Arb can enclose to any precision. */
  enum class constant
  {
    pi,
    e,
    log2,
    euler,
    catalan
  };

  char const *constant_str(constant c);
}
