#include <gtest/gtest.h>

#include <sys/wait.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "BaseContractTest.h"
#include "ContractRegistryEnvironment.h"
#include "support/TempDir.h"
#include "support/TransferClient.h"
#include "vidsync/config/PlayerConfig.h"
#include "vidsync/decoder/ProcessSupervisor.h"

namespace vidsync::tests::contracts {

namespace {

using decoder::ProcessSupervisor;
using support::FileExists;
using support::ReadFile;
using support::WaitFor;

struct ExitRecord {
  uint64_t session_id = 0;
  int status = 0;
};

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "ProcessSupervisor", {"PSV_001", "PSV_002", "PSV_003", "PSV_004", "PSV_005"});
  return true;
}();

}  // namespace

// The decoder is stood in for by /bin/sh scripts reading the control FIFO
// on stdin, with the video path as $1.
class ProcessSupervisorContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "ProcessSupervisor"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"PSV_001", "PSV_002", "PSV_003", "PSV_004", "PSV_005"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    video_path_ = dir_.File("video.mp4");
    support::WriteFile(video_path_, "video");
    config_.fifo_path = dir_.File("decoder.fifo");
    config_.stop_grace_period = std::chrono::milliseconds(5000);
  }

  void UseScript(const std::string& script) {
    config_.decoder_binary = "/bin/sh";
    config_.decoder_args = {"-c", script, "sh", "{video}"};
  }

  std::unique_ptr<ProcessSupervisor> MakeSupervisor() {
    auto supervisor = std::make_unique<ProcessSupervisor>(config_);
    supervisor->SetExitCallback([this](uint64_t session_id, int status) {
      std::lock_guard<std::mutex> lock(exits_mutex_);
      exits_.push_back({session_id, status});
    });
    return supervisor;
  }

  std::vector<ExitRecord> exits() {
    std::lock_guard<std::mutex> lock(exits_mutex_);
    return exits_;
  }

  support::TempDir dir_;
  std::string video_path_;
  config::PlayerConfig config_;
  std::mutex exits_mutex_;
  std::vector<ExitRecord> exits_;
};

TEST_F(ProcessSupervisorContractTest, PSV_001_QuitEndsDecoderWithinGrace) {
  UseScript("head -c 1 >/dev/null");
  auto supervisor = MakeSupervisor();
  ASSERT_TRUE(supervisor->Start(video_path_, 1));
  EXPECT_TRUE(supervisor->IsRunning());
  EXPECT_GT(supervisor->pid(), 0);
  EXPECT_TRUE(FileExists(config_.fifo_path));

  const auto begin = std::chrono::steady_clock::now();
  supervisor->Terminate();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
  EXPECT_FALSE(supervisor->IsRunning());
  EXPECT_EQ(supervisor->pid(), -1);
  EXPECT_FALSE(FileExists(config_.fifo_path));
  EXPECT_TRUE(exits().empty());
}

TEST_F(ProcessSupervisorContractTest, PSV_001_ControlBytesReachDecoderStdin) {
  // dd bs=1 consumes exactly one byte per step.
  UseScript(
      "dd bs=1 count=1 of=\"$1.first\" 2>/dev/null; "
      "dd bs=1 count=1 of=\"$1.second\" 2>/dev/null; "
      "dd bs=1 count=1 of=\"$1.third\" 2>/dev/null");
  auto supervisor = MakeSupervisor();
  ASSERT_TRUE(supervisor->Start(video_path_, 1));

  ASSERT_TRUE(supervisor->Pause());
  ASSERT_TRUE(supervisor->Resume());
  supervisor->Terminate();

  EXPECT_EQ(ReadFile(video_path_ + ".first"), "p");
  EXPECT_EQ(ReadFile(video_path_ + ".second"), "p");
  EXPECT_EQ(ReadFile(video_path_ + ".third"), "q");
  EXPECT_TRUE(exits().empty());
}

TEST_F(ProcessSupervisorContractTest, PSV_002_DecoderIgnoringQuitIsKilled) {
  config_.stop_grace_period = std::chrono::milliseconds(200);
  // The shell stays in the foreground with a child; both must die.
  UseScript("sleep 30; sleep 30");
  auto supervisor = MakeSupervisor();
  ASSERT_TRUE(supervisor->Start(video_path_, 1));

  const auto begin = std::chrono::steady_clock::now();
  supervisor->Terminate();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_GE(elapsed, std::chrono::milliseconds(200));
  EXPECT_LT(elapsed, std::chrono::milliseconds(5000));
  EXPECT_FALSE(supervisor->IsRunning());
  EXPECT_TRUE(exits().empty());
}

TEST_F(ProcessSupervisorContractTest, PSV_003_UnexpectedExitReportsSession) {
  UseScript("exit 3");
  auto supervisor = MakeSupervisor();
  ASSERT_TRUE(supervisor->Start(video_path_, 42));

  ASSERT_TRUE(WaitFor([this] { return !exits().empty(); }));
  const auto records = exits();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].session_id, 42u);
  ASSERT_TRUE(WIFEXITED(records[0].status));
  EXPECT_EQ(WEXITSTATUS(records[0].status), 3);

  EXPECT_TRUE(WaitFor([&supervisor] { return !supervisor->IsRunning(); }));
  EXPECT_FALSE(supervisor->Pause());

  // The same supervisor relaunches after an unexpected exit and reports the
  // next exit under the new session.
  ASSERT_TRUE(supervisor->Start(video_path_, 43));
  ASSERT_TRUE(WaitFor([this] { return exits().size() == 2; }));
  const auto after_relaunch = exits();
  EXPECT_EQ(after_relaunch[1].session_id, 43u);
  ASSERT_TRUE(WIFEXITED(after_relaunch[1].status));
  EXPECT_EQ(WEXITSTATUS(after_relaunch[1].status), 3);
  EXPECT_TRUE(WaitFor([&supervisor] { return !supervisor->IsRunning(); }));

  supervisor->Terminate();
  EXPECT_EQ(exits().size(), 2u);
}

TEST_F(ProcessSupervisorContractTest, PSV_004_MissingBinaryFailsStart) {
  config_.decoder_binary = dir_.File("no-such-decoder");
  auto supervisor = MakeSupervisor();

  EXPECT_FALSE(supervisor->Start(video_path_, 1));
  EXPECT_FALSE(supervisor->IsRunning());
  EXPECT_FALSE(FileExists(config_.fifo_path));
  EXPECT_FALSE(supervisor->Pause());
  supervisor->Terminate();
  EXPECT_TRUE(exits().empty());
}

TEST_F(ProcessSupervisorContractTest, PSV_005_SingleDecoderAtATime) {
  UseScript("head -c 1 >/dev/null");
  auto supervisor = MakeSupervisor();
  ASSERT_TRUE(supervisor->Start(video_path_, 1));
  const pid_t first = supervisor->pid();

  EXPECT_FALSE(supervisor->Start(video_path_, 2));
  EXPECT_EQ(supervisor->pid(), first);

  supervisor->Terminate();
  ASSERT_TRUE(supervisor->Start(video_path_, 3));
  EXPECT_NE(supervisor->pid(), -1);
  supervisor->Terminate();
  EXPECT_TRUE(exits().empty());
}

TEST_F(ProcessSupervisorContractTest, PSV_005_VideoPathIsPassedToDecoder) {
  UseScript("printf '%s' \"$1\" > \"$1.arg\"; head -c 1 >/dev/null");
  auto supervisor = MakeSupervisor();
  ASSERT_TRUE(supervisor->Start(video_path_, 1));

  ASSERT_TRUE(WaitFor([this] { return ReadFile(video_path_ + ".arg") == video_path_; }));
  supervisor->Terminate();
}

TEST_F(ProcessSupervisorContractTest, PSV_005_TerminateWithoutDecoderIsNoop) {
  auto supervisor = MakeSupervisor();
  supervisor->Terminate();
  supervisor->Terminate();
  EXPECT_FALSE(supervisor->IsRunning());
}

}  // namespace vidsync::tests::contracts
