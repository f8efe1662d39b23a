// Repository: VidSync
// Component: Logger unit tests

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "vidsync/util/Logger.hpp"

namespace vidsync::util {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    Logger::SetErrorSink(nullptr);
    Logger::SetWarnSink(nullptr);
    Logger::SetDebugEnabled(false);
  }
};

TEST_F(LoggerTest, ErrorSinkReceivesUnprefixedLine) {
  std::vector<std::string> captured;
  Logger::SetErrorSink([&captured](const std::string& line) { captured.push_back(line); });

  Logger::Error("[Test] disk full");
  Logger::Info("[Test] not an error");

  ASSERT_EQ(captured.size(), 1u);
  EXPECT_EQ(captured[0], "[Test] disk full");
}

TEST_F(LoggerTest, WarnSinkIsSeparateFromErrorSink) {
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
  Logger::SetWarnSink([&warnings](const std::string& line) { warnings.push_back(line); });
  Logger::SetErrorSink([&errors](const std::string& line) { errors.push_back(line); });

  Logger::Warn("w1");
  Logger::Error("e1");
  Logger::Warn("w2");

  EXPECT_EQ(warnings, (std::vector<std::string>{"w1", "w2"}));
  EXPECT_EQ(errors, (std::vector<std::string>{"e1"}));
}

TEST_F(LoggerTest, ClearedSinkIsNotCalled) {
  int calls = 0;
  Logger::SetErrorSink([&calls](const std::string&) { ++calls; });
  Logger::SetErrorSink(nullptr);
  Logger::Error("after clear");
  EXPECT_EQ(calls, 0);
}

TEST_F(LoggerTest, DebugToggle) {
  Logger::SetDebugEnabled(true);
  EXPECT_TRUE(Logger::DebugEnabled());
  Logger::Debug("visible");
  Logger::SetDebugEnabled(false);
  EXPECT_FALSE(Logger::DebugEnabled());
  Logger::Debug("suppressed");
}

TEST_F(LoggerTest, ConcurrentWritersAllReachSink) {
  std::vector<std::string> captured;
  Logger::SetWarnSink([&captured](const std::string& line) { captured.push_back(line); });

  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < kPerThread; ++i) {
        Logger::Warn("t" + std::to_string(t) + "-" + std::to_string(i));
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(captured.size(), static_cast<size_t>(kThreads * kPerThread));
}

}  // namespace
}  // namespace vidsync::util
