#pragma once

#include <utility>

#include <arbnum/runtime/gc.hpp>

namespace arbnum::runtime
{
  template <typename T, typename... Args>
  native_box<T> make_box(Args &&...args)
  {
    return native_box<T>{ new T(std::forward<Args>(args)...) };
  }
}
