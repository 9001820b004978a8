#pragma once

#include <stdexcept>

#include <arbnum/type.hpp>

namespace arbnum
{
  /* Thrown when a value has no exact representation in the requested type,
   * such as asking for the integer value of 2.5. */
  struct inexact_error : std::runtime_error
  {
    explicit inexact_error(native_persistent_string const &message)
      : std::runtime_error{ message }
    {
    }
  };
}
