#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <arbnum/runtime/precision.hpp>
#include <arbnum/util/log.hpp>

int main(int const argc, char const **argv)
{
  /* Tests assume the default working precision, whatever the environment says. */
  arbnum::runtime::set_working_precision(
    arbnum::runtime::bit_precision{ arbnum::runtime::default_precision });
  arbnum::util::logger()->set_level(spdlog::level::warn);

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  context.setOption("no-breaks", true);
  return context.run();
}
