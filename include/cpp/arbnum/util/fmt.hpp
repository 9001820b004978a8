#pragma once

#include <iterator>
#include <utility>

#include <fmt/format.h>

#include <arbnum/type.hpp>

namespace arbnum::util
{
  template <typename... Args>
  native_persistent_string format(fmt::format_string<Args...> const fmt_str, Args &&...args)
  {
    return fmt::format(fmt_str, std::forward<Args>(args)...);
  }

  /* Accumulates the pieces of a rendering before it becomes a string. */
  struct string_builder
  {
    string_builder &operator()(native_persistent_string_view const s)
    {
      buffer.append(s.data(), s.data() + s.size());
      return *this;
    }

    string_builder &operator()(char const c)
    {
      buffer.push_back(c);
      return *this;
    }

    template <typename... Args>
    string_builder &format(fmt::format_string<Args...> const fmt_str, Args &&...args)
    {
      fmt::format_to(std::back_inserter(buffer), fmt_str, std::forward<Args>(args)...);
      return *this;
    }

    native_persistent_string release()
    {
      return fmt::to_string(buffer);
    }

    fmt::memory_buffer buffer;
  };
}
