#include "health-monitor/clock.h"
#include "health-monitor/health_engine.h"
#include "health-monitor/logger.h"
#include "health-monitor/process_inspector.h"
#include "health-monitor/process_locator.h"
#include "health-monitor/process_spawner.h"
#include "health-monitor/restart_orchestrator.h"
#include "../test_fakes.h"

#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <memory>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace hmon {

namespace {

std::string sleep_helper_path() {
  const char* path = std::getenv("HM_SLEEP_PATH");
  return path ? path : "";
}

bool wait_until_gone(IProcessInspector& inspector, pid_t pid) {
  for (int i = 0; i < 100; ++i) {
    if (!inspector.probe(pid).exists) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return false;
}

} // namespace

class IntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    helper_ = sleep_helper_path();
    if (helper_.empty()) {
      GTEST_SKIP() << "HM_SLEEP_PATH not set";
    }
    servers_.specs.push_back(make_spec("sleeper", helper_, {"--seconds", "47"}));
    servers_.specs.push_back(make_spec("stubborn", helper_, {"--seconds", "53", "--ignore-term"}));

    policy_.startup_grace = std::chrono::milliseconds(300);
    policy_.poll_interval = std::chrono::milliseconds(50);
    policy_.kill_grace = std::chrono::milliseconds(500);
    orchestrator_ = std::make_unique<RestartOrchestrator>(servers_, engine_, locator_, registry_,
                                                          spawner_, inspector_, clock_, logger_,
                                                          policy_);
  }

  void TearDown() override {
    for (const char* name : {"sleeper", "stubborn"}) {
      if (auto pid = registry_.get(name)) {
        kill(*pid, SIGKILL);
      }
    }
  }

  std::string helper_;
  std::stringstream log_;
  Logger logger_{log_, LogLevel::Debug};
  FakeServerSource servers_;
  ProcfsProcessInspector inspector_;
  PosixProcessSpawner spawner_;
  SystemClock clock_;
  SpawnRegistry registry_;
  ProcessLocator locator_{inspector_, registry_, getpid()};
  HealthEngine engine_{servers_, inspector_, locator_, registry_, clock_, logger_};
  RestartPolicy policy_;
  std::unique_ptr<RestartOrchestrator> orchestrator_;
};

TEST_F(IntegrationTest, RestartSpawnsDetachedServer) {
  auto result = orchestrator_->restart("sleeper");
  ASSERT_TRUE(result.success) << result.message << "\n" << log_.str();

  auto pid = registry_.get("sleeper");
  ASSERT_TRUE(pid.has_value());
  EXPECT_EQ(result.message, "Successfully restarted sleeper (PID: " + std::to_string(*pid) + ")");

  auto status = engine_.force_check("sleeper");
  ASSERT_TRUE(status.ok());
  EXPECT_TRUE(status.value().healthy);
  EXPECT_EQ(status.value().state, HealthState::Healthy);
  EXPECT_EQ(status.value().match, MatchSource::Spawned);
  EXPECT_EQ(*status.value().pid, *pid);
  ASSERT_TRUE(status.value().uptime_seconds.has_value());
  EXPECT_GE(*status.value().uptime_seconds, 0);

  auto heuristic = locator_.locate_by_command_line(servers_.specs[0]);
  ASSERT_TRUE(heuristic.pid.has_value());
  EXPECT_EQ(*heuristic.pid, *pid);
}

TEST_F(IntegrationTest, SecondRestartReplacesFirstProcess) {
  ASSERT_TRUE(orchestrator_->restart("sleeper").success);
  pid_t first = *registry_.get("sleeper");

  ASSERT_TRUE(orchestrator_->restart("sleeper").success);
  pid_t second = *registry_.get("sleeper");

  EXPECT_NE(first, second);
  EXPECT_TRUE(wait_until_gone(inspector_, first));
  EXPECT_TRUE(inspector_.probe(second).exists);
}

TEST_F(IntegrationTest, SigtermIgnoringServerIsKilled) {
  ASSERT_TRUE(orchestrator_->restart("stubborn").success);
  pid_t first = *registry_.get("stubborn");

  ASSERT_TRUE(orchestrator_->restart("stubborn").success);
  EXPECT_TRUE(wait_until_gone(inspector_, first));
  EXPECT_NE(log_.str().find("sending SIGKILL"), std::string::npos);
}

TEST_F(IntegrationTest, KilledServerBecomesUnknown) {
  ASSERT_TRUE(orchestrator_->restart("sleeper").success);
  pid_t pid = *registry_.get("sleeper");

  ASSERT_EQ(kill(pid, SIGKILL), 0);
  ASSERT_TRUE(wait_until_gone(inspector_, pid));

  auto status = engine_.force_check("sleeper");
  ASSERT_TRUE(status.ok());
  EXPECT_EQ(status.value().state, HealthState::Unknown);
  EXPECT_FALSE(registry_.get("sleeper").has_value());
}

TEST_F(IntegrationTest, MissingExecutableFailsSpawn) {
  auto result = spawner_.spawn_detached("/nonexistent/hm-server", {});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::SpawnFailed);
  EXPECT_NE(result.error().message.find("exec /nonexistent/hm-server"), std::string::npos);
}

} // namespace hmon
