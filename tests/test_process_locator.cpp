#include "health-monitor/process_locator.h"
#include "test_fakes.h"

#include <gtest/gtest.h>

namespace hmon {

class ProcessLocatorTest : public ::testing::Test {
protected:
    static constexpr pid_t kSelfPid = 100;
    FakeProcessInspector inspector_;
    SpawnRegistry registry_;
    ProcessLocator locator_{inspector_, registry_, kSelfPid};
    ServerSpec alpha_ = make_spec("alpha", "node", {"/srv/alpha.js", "--port", "7000"});
};

TEST(CommandLineMatchTest, CommandOrJoinedArgs) {
    auto spec = make_spec("alpha", "node", {"/srv/alpha.js", "--port", "7000"});
    EXPECT_TRUE(command_line_matches("/usr/bin/node /srv/alpha.js", spec));
    EXPECT_TRUE(command_line_matches("bun /srv/alpha.js --port 7000", spec));
    EXPECT_FALSE(command_line_matches("bun /srv/alpha.js --port 7001", spec));
    EXPECT_FALSE(command_line_matches("python3 -m http.server", spec));
}

TEST(CommandLineMatchTest, EmptyArgsNeverMatchOnArgs) {
    auto spec = make_spec("tool", "mytool", {});
    EXPECT_FALSE(command_line_matches("bash -c sleep", spec));
    EXPECT_TRUE(command_line_matches("/opt/bin/mytool --serve", spec));
}

TEST_F(ProcessLocatorTest, PicksLowestMatchingPid) {
    inspector_.add(900, "node /srv/alpha.js --port 7000");
    inspector_.add(300, "node /srv/other.js");
    inspector_.add(50, "init");

    auto match = locator_.locate(alpha_);
    ASSERT_TRUE(match.pid.has_value());
    EXPECT_EQ(*match.pid, 300);
    EXPECT_EQ(match.source, MatchSource::CommandLine);
}

TEST_F(ProcessLocatorTest, SkipsOwnProcess) {
    inspector_.add(kSelfPid, "health-monitor --config /srv/node.json");
    inspector_.add(900, "node /srv/alpha.js --port 7000");

    auto match = locator_.locate(alpha_);
    ASSERT_TRUE(match.pid.has_value());
    EXPECT_EQ(*match.pid, 900);
}

TEST_F(ProcessLocatorTest, NothingMatches) {
    inspector_.add(300, "python3 -m http.server");
    auto match = locator_.locate(alpha_);
    EXPECT_FALSE(match.pid.has_value());
    EXPECT_EQ(match.source, MatchSource::None);
}

TEST_F(ProcessLocatorTest, RecordedSpawnWins) {
    inspector_.add(300, "node /srv/alpha.js --port 7000");
    inspector_.add(5000, "node /srv/alpha.js --port 7000");
    registry_.record("alpha", 5000);

    auto match = locator_.locate(alpha_);
    EXPECT_EQ(*match.pid, 5000);
    EXPECT_EQ(match.source, MatchSource::Spawned);

    auto heuristic = locator_.locate_by_command_line(alpha_);
    EXPECT_EQ(*heuristic.pid, 300);
}

TEST_F(ProcessLocatorTest, RecycledSpawnPidIsNotTrusted) {
    inspector_.add(300, "node /srv/alpha.js --port 7000");
    inspector_.add(5000, "/usr/bin/unrelated-daemon");
    registry_.record("alpha", 5000);

    auto match = locator_.locate(alpha_);
    ASSERT_TRUE(match.pid.has_value());
    EXPECT_EQ(*match.pid, 300);
    EXPECT_EQ(match.source, MatchSource::CommandLine);
    EXPECT_FALSE(registry_.get("alpha").has_value());
}

TEST_F(ProcessLocatorTest, ExitedSpawnIsForgotten) {
    registry_.record("alpha", 5000);

    auto match = locator_.locate(alpha_);
    EXPECT_FALSE(match.pid.has_value());
    EXPECT_EQ(match.source, MatchSource::None);
    EXPECT_FALSE(registry_.get("alpha").has_value());
}

TEST_F(ProcessLocatorTest, RestartVictimsMatchArgsOnly) {
    inspector_.add(300, "node /srv/unrelated.js");
    inspector_.add(400, "node /srv/alpha.js --port 7000");
    inspector_.add(500, "bun /srv/alpha.js --port 7000");

    auto victims = locator_.find_restart_victims(alpha_);
    ASSERT_EQ(victims.size(), 2u);
    EXPECT_EQ(victims[0], 400);
    EXPECT_EQ(victims[1], 500);
}

TEST_F(ProcessLocatorTest, RecordedSpawnIsVictimWhileStillOurs) {
    auto tool = make_spec("tool", "mytool", {});
    inspector_.add(700, "mytool --serve");
    inspector_.add(800, "mytool --other");
    registry_.record("tool", 700);

    auto victims = locator_.find_restart_victims(tool);
    ASSERT_EQ(victims.size(), 1u);
    EXPECT_EQ(victims[0], 700);
}

TEST_F(ProcessLocatorTest, RecycledSpawnPidIsLeftAlone) {
    auto tool = make_spec("tool", "mytool", {});
    inspector_.add(700, "sshd: session");
    registry_.record("tool", 700);

    EXPECT_TRUE(locator_.find_restart_victims(tool).empty());
}

TEST(SpawnRegistryTest, RecordForget) {
    SpawnRegistry registry;
    EXPECT_FALSE(registry.get("alpha").has_value());
    registry.record("alpha", 42);
    EXPECT_EQ(*registry.get("alpha"), 42);
    registry.record("alpha", 43);
    EXPECT_EQ(*registry.get("alpha"), 43);
    registry.forget("alpha");
    EXPECT_FALSE(registry.get("alpha").has_value());
}

TEST(MatchSourceTest, Names) {
    EXPECT_EQ(match_source_to_string(MatchSource::None), "none");
    EXPECT_EQ(match_source_to_string(MatchSource::Spawned), "spawned");
    EXPECT_EQ(match_source_to_string(MatchSource::CommandLine), "cmdline");
}

} // namespace hmon
