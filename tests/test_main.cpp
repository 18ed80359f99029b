#include "stagehand/util/log.hpp"

#include <csignal>
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  // Shell tasks may close their pipes early.
  std::signal(SIGPIPE, SIG_IGN);

  stagehand::log::set_output_stderr();
  const char *level = std::getenv("STAGEHAND_TEST_LOG_LEVEL");
  stagehand::log::set_level(level != nullptr ? level : "error");

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
