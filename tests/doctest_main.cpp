#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <orrery/core/logger.hpp>

int main(int argc, char **argv) {
  orrery::core::Logger::init();
  // Rejections are logged at warn; keep the test output readable.
  orrery::core::Logger::setLevel(spdlog::level::err);

  doctest::Context context;
  context.applyCommandLine(argc, argv);

  int res = context.run();

  orrery::core::Logger::shutdown();

  return res;
}
