#include "stagehand/util/log.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace stagehand;

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = test::make_temp_path("stagehand_log_");
    ASSERT_FALSE(path_.empty());
    previous_ = log::logger().level();
  }

  void TearDown() override {
    log::stop();
    log::set_level(previous_);
    (void)log::set_output_file("");
    log::set_output_stderr();
    std::remove(path_.c_str());
  }

  auto contents() const -> std::string {
    std::ifstream in(path_);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  std::string path_;
  log::Level previous_{log::Level::Info};
};

TEST(LogLevelTest, ParsesNamesAndFallsBackToInfo) {
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_EQ(log::parse_level("WARN"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("verbose"), log::Level::Info);
  EXPECT_EQ(log::level_name(log::Level::Trace), "trace");
}

TEST_F(LogTest, SynchronousWritesWhenStopped) {
  ASSERT_TRUE(log::set_output_file(path_));
  log::set_level(log::Level::Info);
  log::info("dispatched {} tasks", 3);
  log::debug("hidden detail");
  auto text = contents();
  EXPECT_NE(text.find("dispatched 3 tasks"), std::string::npos);
  EXPECT_EQ(text.find("hidden detail"), std::string::npos);
}

TEST_F(LogTest, AsyncWriterFlushesOnStop) {
  ASSERT_TRUE(log::set_output_file(path_));
  log::set_level(log::Level::Trace);
  log::start();
  for (int i = 0; i < 100; ++i) {
    log::trace("line {}", i);
  }
  log::stop();
  auto text = contents();
  EXPECT_NE(text.find("line 0"), std::string::npos);
  EXPECT_NE(text.find("line 99"), std::string::npos);
}

TEST_F(LogTest, OutputCannotChangeWhileRunning) {
  log::start();
  EXPECT_FALSE(log::set_output_file(path_));
  log::stop();
  EXPECT_TRUE(log::set_output_file(path_));
}
