#include "cronhive/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);

  // Synchronous stderr logging; tests that need the writer thread start it.
  cronhive::log::set_output_stderr();
  cronhive::log::set_level(cronhive::log::Level::Warn);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
