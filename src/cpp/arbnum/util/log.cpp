#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <arbnum/util/log.hpp>

namespace arbnum::util
{
  static std::shared_ptr<spdlog::logger> make_logger()
  {
    auto existing{ spdlog::get("arbnum") };
    if(existing)
    {
      return existing;
    }

    auto log{ spdlog::stderr_color_mt("arbnum") };
    log->set_level(spdlog::level::warn);
    /* SPDLOG_LEVEL=arbnum=debug and friends override the default above. */
    spdlog::cfg::load_env_levels();
    return log;
  }

  std::shared_ptr<spdlog::logger> const &logger()
  {
    static auto const log{ make_logger() };
    return log;
  }
}
