#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace arbnum::util
{
  /* The shared `arbnum` logger. Created on first use, writing to stderr. The
   * level comes from SPDLOG_LEVEL and defaults to warn. */
  std::shared_ptr<spdlog::logger> const &logger();
}
