#include "health-monitor/restart_orchestrator.h"
#include "health-monitor/health_engine.h"
#include "health-monitor/logger.h"
#include "test_fakes.h"

#include <gtest/gtest.h>
#include <memory>
#include <sstream>

namespace hmon {

class RestartOrchestratorTest : public ::testing::Test {
protected:
    std::stringstream log_;
    Logger logger_{log_, LogLevel::Debug};
    FakeServerSource servers_;
    FakeProcessInspector inspector_;
    FakeProcessSpawner spawner_{inspector_};
    FakeClock clock_;
    SpawnRegistry registry_;
    ProcessLocator locator_{inspector_, registry_, 1};
    RestartPolicy policy_;
    std::unique_ptr<HealthEngine> engine_;
    std::unique_ptr<RestartOrchestrator> orchestrator_;

    void SetUp() override {
        servers_.specs.push_back(make_spec("alpha", "node", {"/srv/alpha.js"}));
        servers_.specs.push_back(make_spec("beta", "python3", {"-m", "beta_server"}));
        build(UnknownPolicy::TreatAsHealthy);
    }

    void build(UnknownPolicy unknown_policy) {
        engine_ = std::make_unique<HealthEngine>(servers_, inspector_, locator_, registry_,
                                                 clock_, logger_, unknown_policy);
        orchestrator_ = std::make_unique<RestartOrchestrator>(servers_, *engine_, locator_, registry_,
                                                              spawner_, inspector_, clock_, logger_,
                                                              policy_);
    }
};

TEST_F(RestartOrchestratorTest, UnknownServerTouchesNothing) {
    auto result = orchestrator_->restart("ghost");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Server ghost not found in configuration");
    EXPECT_TRUE(spawner_.spawns.empty());
    EXPECT_TRUE(spawner_.signals_sent.empty());
    EXPECT_EQ(inspector_.list_count, 0);
}

TEST_F(RestartOrchestratorTest, RestartReplacesRunningProcess) {
    inspector_.add(4242, "node /srv/alpha.js", 3600);

    auto result = orchestrator_->restart("alpha");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Successfully restarted alpha (PID: 5000)");

    EXPECT_TRUE(spawner_.was_signal_sent(4242, SIGTERM));
    EXPECT_FALSE(spawner_.was_signal_sent(4242, SIGKILL));
    EXPECT_FALSE(inspector_.alive(4242));

    ASSERT_EQ(spawner_.spawns.size(), 1u);
    EXPECT_EQ(spawner_.spawns[0].command, "node");
    ASSERT_EQ(spawner_.spawns[0].args.size(), 1u);
    EXPECT_EQ(spawner_.spawns[0].args[0], "/srv/alpha.js");

    ASSERT_TRUE(registry_.get("alpha").has_value());
    EXPECT_EQ(*registry_.get("alpha"), 5000);

    auto status = engine_->last_status("alpha");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, HealthState::Healthy);
    EXPECT_EQ(*status->pid, 5000);
    EXPECT_EQ(status->match, MatchSource::Spawned);
}

TEST_F(RestartOrchestratorTest, WaitsOutStartupGraceBeforeVerifying) {
    auto before = clock_.now();
    auto result = orchestrator_->restart("alpha");
    EXPECT_TRUE(result.success);
    EXPECT_GE(clock_.now() - before, policy_.startup_grace);
}

TEST_F(RestartOrchestratorTest, RestartWithNothingRunningStillSpawns) {
    auto result = orchestrator_->restart("beta");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(spawner_.signals_sent.empty());
    ASSERT_EQ(spawner_.spawns.size(), 1u);
    EXPECT_EQ(spawner_.spawns[0].command, "python3");
}

TEST_F(RestartOrchestratorTest, SpawnFailureReportsErrorAndLeavesStatus) {
    inspector_.add(4242, "node /srv/alpha.js");
    engine_->check_one("alpha");
    spawner_.failing_commands.insert("node");

    auto result = orchestrator_->restart("alpha");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Failed to restart alpha: exec node: No such file or directory");
    EXPECT_FALSE(registry_.get("alpha").has_value());

    auto status = engine_->last_status("alpha");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status->pid, 4242);
}

TEST_F(RestartOrchestratorTest, StubbornProcessGetsSigkill) {
    inspector_.add(4242, "node /srv/alpha.js");
    spawner_.stubborn.insert(4242);

    auto before = clock_.now();
    auto result = orchestrator_->restart("alpha");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(spawner_.was_signal_sent(4242, SIGTERM));
    EXPECT_TRUE(spawner_.was_signal_sent(4242, SIGKILL));
    EXPECT_GE(clock_.now() - before, policy_.kill_grace + policy_.startup_grace);
}

TEST_F(RestartOrchestratorTest, ProcessDyingDuringStartupEndsWaitEarly) {
    spawner_.spawn_dies = true;

    auto before = clock_.now();
    auto result = orchestrator_->restart("alpha");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Restarted alpha but health check still failing");
    EXPECT_LT(clock_.now() - before, policy_.startup_grace);
}

TEST_F(RestartOrchestratorTest, DeadRestartReportsUnknownNotHealthy) {
    spawner_.spawn_dies = true;
    orchestrator_->restart("alpha");

    auto status = engine_->last_status("alpha");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, HealthState::Unknown);
    EXPECT_FALSE(registry_.get("alpha").has_value());
}

TEST_F(RestartOrchestratorTest, ConcurrentRestartOfSameServerIsRejected) {
    RestartResult nested;
    spawner_.on_spawn = [&]() {
        spawner_.on_spawn = nullptr;
        nested = orchestrator_->restart("alpha");
    };

    auto outer = orchestrator_->restart("alpha");
    EXPECT_TRUE(outer.success);
    EXPECT_FALSE(nested.success);
    EXPECT_EQ(nested.message, "Restart of alpha already in progress");

    // The marker is released once the outer restart returns.
    auto again = orchestrator_->restart("alpha");
    EXPECT_TRUE(again.success);
}

TEST_F(RestartOrchestratorTest, RestartAllUnhealthyIsolatesFailures) {
    build(UnknownPolicy::TreatAsUnhealthy);
    spawner_.failing_commands.insert("python3");

    auto results = orchestrator_->restart_all_unhealthy();
    ASSERT_EQ(results.size(), 2u);

    EXPECT_EQ(results[0].name, "alpha");
    EXPECT_TRUE(results[0].success);

    EXPECT_EQ(results[1].name, "beta");
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].message, "Failed to restart beta: exec python3: No such file or directory");

    ASSERT_EQ(spawner_.spawns.size(), 1u);
    EXPECT_EQ(spawner_.spawns[0].command, "node");
}

TEST_F(RestartOrchestratorTest, RestartAllUnhealthyWithAllHealthyDoesNothing) {
    inspector_.add(4242, "node /srv/alpha.js");
    inspector_.add(4300, "python3 -m beta_server");

    auto results = orchestrator_->restart_all_unhealthy();
    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(spawner_.spawns.empty());
    EXPECT_TRUE(spawner_.signals_sent.empty());
}

} // namespace hmon
