// tests/test_discovery_manager.cpp
#include <atomic>
#include <chrono>
#include <cstdio>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "discovery/discovery_manager.hpp"
#include "driver/simulated_scan_driver.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;
using discovery::DiscoveryManager;
using driver::SimulatedScanDriver;
using feature::FeatureKind;

namespace
{
std::string addr_for(std::size_t i)
{
    char buf[18];
    std::snprintf(buf, sizeof(buf), "C0:FF:EE:00:%02X:%02X", unsigned((i >> 8) & 0xFF),
                  unsigned(i & 0xFF));
    return buf;
}

class ManagerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        sim = std::make_shared<SimulatedScanDriver>();
        sim->set_ms_per_second(10);
        discovery::Options o;
        o.scan_slice = 5ms;
        mgr          = DiscoveryManager::create(sim, o);
        ASSERT_NE(mgr, nullptr);
        rec = std::make_shared<testutil::RecordingListener>();
        mgr->add_listener(rec);
    }

    void TearDown() override { mgr.reset(); }

    // a fresh tag on every process() slice
    void generate_unique_nodes()
    {
        sim->set_generator([](std::size_t slice) {
            return std::vector<driver::Advertisement>{testutil::adv(addr_for(slice), "gen")};
        });
    }

    std::shared_ptr<SimulatedScanDriver>         sim;
    std::shared_ptr<DiscoveryManager>            mgr;
    std::shared_ptr<testutil::RecordingListener> rec;
};
}  // namespace

TEST(ManagerSingleton, OneLiveManager)
{
    auto sim = std::make_shared<SimulatedScanDriver>();
    EXPECT_EQ(DiscoveryManager::instance(), nullptr);

    auto first = DiscoveryManager::create(sim);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(DiscoveryManager::instance(), first);

    bluest::Error err;
    EXPECT_EQ(DiscoveryManager::create(sim, {}, &err), nullptr);
    EXPECT_EQ(err.code, bluest::Errc::already_exists);

    first.reset();
    EXPECT_EQ(DiscoveryManager::instance(), nullptr);
    auto second = DiscoveryManager::create(sim);
    EXPECT_NE(second, nullptr);
}

TEST(ManagerSingleton, NeedsDriver)
{
    bluest::Error err;
    EXPECT_EQ(DiscoveryManager::create(nullptr, {}, &err), nullptr);
    EXPECT_EQ(err.code, bluest::Errc::driver_failure);
    EXPECT_EQ(DiscoveryManager::instance(), nullptr);
}

TEST(ManagerOptions, FromConfig)
{
    bluest::Config cfg;
    cfg.scan_timeout_s   = 3;
    cfg.listener_threads = 2;
    const auto o         = discovery::Options::from_config(cfg);
    EXPECT_EQ(o.default_timeout_s, 3);
    EXPECT_EQ(o.listener_threads, 2u);
    EXPECT_EQ(o.scan_slice, constants::SCAN_SLICE);
}

TEST_F(ManagerTest, SyncDiscoverFindsNodesAndNotifiesOnce)
{
    sim->queue_advertisement(testutil::adv("C0:FF:EE:00:00:01", "STile01", -50));
    sim->queue_advertisement(testutil::adv("C0:FF:EE:00:00:02", "Nucleo7", -70, 0x80, 0x001C0000u));

    bluest::Error err;
    ASSERT_TRUE(mgr->discover(false, 2, &err)) << err.message;
    EXPECT_FALSE(mgr->is_discovering());
    EXPECT_EQ(sim->scan_calls(), 1u);

    // node events are delivered before discover() returns
    EXPECT_EQ(rec->starts.load(), 1);
    EXPECT_EQ(rec->stops.load(), 1);
    EXPECT_EQ(rec->nodes.load(), 2);
    EXPECT_EQ(mgr->get_nodes().size(), 2u);

    auto n = mgr->get_node_with_name("Nucleo7");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->tag(), "C0:FF:EE:00:00:02");
    EXPECT_EQ(n->type(), advert::NodeType::Nucleo);
    EXPECT_EQ(mgr->get_node_with_tag("C0:FF:EE:00:00:01")->name(), "STile01");
    EXPECT_EQ(mgr->get_node_with_tag("C0:FF:EE:00:00:99"), nullptr);
    EXPECT_EQ(mgr->get_node_with_name("nobody"), nullptr);
}

TEST_F(ManagerTest, AddNodeRejectsDuplicateTag)
{
    auto a = discovery::Node::create(sim, testutil::adv("C0:FF:EE:00:00:01", "one"), {});
    auto b = discovery::Node::create(sim, testutil::adv("C0:FF:EE:00:00:01", "two"), {});
    ASSERT_TRUE(a && b);

    EXPECT_TRUE(mgr->add_node(a));
    EXPECT_FALSE(mgr->add_node(b));
    EXPECT_FALSE(mgr->add_node(nullptr));
    ASSERT_EQ(mgr->get_nodes().size(), 1u);
    EXPECT_EQ(mgr->get_nodes()[0]->name(), "one");

    mgr.reset();
    EXPECT_EQ(rec->nodes.load(), 1);
}

TEST_F(ManagerTest, StartWhileScanningIsRejected)
{
    ASSERT_TRUE(mgr->start_discovery(false, 30));
    EXPECT_TRUE(mgr->is_discovering());
    bluest::Error busy;
    EXPECT_FALSE(mgr->start_discovery(false, 30, &busy));
    EXPECT_EQ(busy.code, bluest::Errc::already_exists);
    bluest::Error busy_sync;
    EXPECT_FALSE(mgr->discover(false, 1, &busy_sync));
    EXPECT_EQ(busy_sync.code, bluest::Errc::already_exists);

    ASSERT_TRUE(mgr->stop_discovery());
    EXPECT_FALSE(mgr->is_discovering());
    EXPECT_EQ(rec->starts.load(), 1);
    EXPECT_EQ(rec->stops.load(), 1);
    EXPECT_EQ(sim->start_calls(), 1u);
    EXPECT_EQ(sim->stop_calls(), 1u);
    EXPECT_EQ(sim->scan_calls(), 0u);
}

TEST_F(ManagerTest, StopWhenIdleReturnsFalseWithoutEvents)
{
    bluest::Error err;
    EXPECT_FALSE(mgr->stop_discovery(&err));
    EXPECT_FALSE(err);

    ASSERT_TRUE(mgr->start_discovery(false, 30));
    ASSERT_TRUE(mgr->stop_discovery());
    EXPECT_FALSE(mgr->stop_discovery());
    EXPECT_EQ(rec->stops.load(), 1);
}

TEST_F(ManagerTest, NoNodeEventAfterStopReturns)
{
    generate_unique_nodes();
    ASSERT_TRUE(mgr->start_discovery(false, 5));
    ASSERT_TRUE(testutil::wait_until([&] { return rec->nodes.load() >= 5; }));

    ASSERT_TRUE(mgr->stop_discovery());
    const int at_stop = rec->nodes.load();
    EXPECT_EQ(rec->stops.load(), 1);
    EXPECT_EQ(static_cast<std::size_t>(at_stop), mgr->get_nodes().size());

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(rec->nodes.load(), at_stop);
    EXPECT_EQ(rec->stops.load(), 1);
    EXPECT_FALSE(sim->async_active());
}

TEST_F(ManagerTest, TimeoutReturnsToIdle)
{
    ASSERT_TRUE(mgr->start_discovery(false, 1));
    ASSERT_TRUE(testutil::wait_until([&] { return !mgr->is_discovering(); }, 3000ms));
    ASSERT_TRUE(testutil::wait_until([&] { return rec->stops.load() == 1; }));
    EXPECT_EQ(sim->stop_calls(), 1u);

    // stop after the timeout is a no-op; a new session can start
    EXPECT_FALSE(mgr->stop_discovery());
    ASSERT_TRUE(mgr->start_discovery(false, 30));
    ASSERT_TRUE(mgr->stop_discovery());
    EXPECT_EQ(rec->starts.load(), 2);
    EXPECT_EQ(rec->stops.load(), 2);
}

TEST_F(ManagerTest, ZeroTimeoutUsesDefault)
{
    mgr.reset();
    discovery::Options o;
    o.default_timeout_s = 1;
    o.scan_slice        = 5ms;
    mgr                 = DiscoveryManager::create(sim, o);
    ASSERT_NE(mgr, nullptr);
    mgr->add_listener(rec);

    ASSERT_TRUE(mgr->start_discovery());
    ASSERT_TRUE(testutil::wait_until([&] { return !mgr->is_discovering(); }, 3000ms));
}

TEST_F(ManagerTest, SyncDiscoverCannotBeStopped)
{
    sim->set_ms_per_second(500);  // one scan second takes half a real one
    std::atomic<bool> ok{false};
    std::thread       t([&] { ok = mgr->discover(false, 1); });

    const bool    running = testutil::wait_until([&] { return mgr->is_discovering(); });
    bluest::Error err;
    const bool    stopped = mgr->stop_discovery(&err);
    t.join();

    ASSERT_TRUE(running);
    EXPECT_FALSE(stopped);
    EXPECT_FALSE(err);
    EXPECT_TRUE(ok.load());
    EXPECT_FALSE(mgr->is_discovering());
    EXPECT_EQ(rec->stops.load(), 1);
}

TEST_F(ManagerTest, DiscoverPermissionFailureCarriesHint)
{
    sim->fail_next(SimulatedScanDriver::Op::Scan,
                   bluest::make_error(bluest::Errc::permission_denied, "hci0: Operation not permitted"));
    bluest::Error err;
    EXPECT_FALSE(mgr->discover(false, 1, &err));
    EXPECT_EQ(err.code, bluest::Errc::permission_denied);
    EXPECT_NE(err.message.find(constants::PRIVILEGE_HINT), std::string::npos);
    EXPECT_NE(err.message.find("Operation not permitted"), std::string::npos);

    // back to Idle: one start, one stop, and scanning works again
    EXPECT_FALSE(mgr->is_discovering());
    EXPECT_EQ(rec->starts.load(), 1);
    EXPECT_EQ(rec->stops.load(), 1);
    EXPECT_TRUE(mgr->discover(false, 1));
}

TEST_F(ManagerTest, DiscoverDriverFailureStaysDriverFailure)
{
    sim->fail_next(SimulatedScanDriver::Op::Scan,
                   bluest::make_error(bluest::Errc::driver_failure, "adapter hci0 not found"));
    bluest::Error err;
    EXPECT_FALSE(mgr->discover(false, 1, &err));
    EXPECT_EQ(err.code, bluest::Errc::driver_failure);
    EXPECT_EQ(err.message.find(constants::PRIVILEGE_HINT), std::string::npos);
    EXPECT_FALSE(mgr->is_discovering());
}

TEST_F(ManagerTest, AsyncFailureReportedByStop)
{
    sim->fail_next(SimulatedScanDriver::Op::Start,
                   bluest::make_error(bluest::Errc::permission_denied, "not permitted"));
    ASSERT_TRUE(mgr->start_discovery(false, 30));

    // the session stays open until the caller collects the failure
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(mgr->is_discovering());

    bluest::Error err;
    EXPECT_FALSE(mgr->stop_discovery(&err));
    EXPECT_EQ(err.code, bluest::Errc::permission_denied);
    EXPECT_NE(err.message.find(constants::PRIVILEGE_HINT), std::string::npos);
    EXPECT_FALSE(mgr->is_discovering());
    EXPECT_EQ(rec->starts.load(), 1);
    EXPECT_EQ(rec->stops.load(), 1);
    EXPECT_EQ(sim->stop_calls(), 0u);
}

TEST_F(ManagerTest, ResetKeepsConnectedNodes)
{
    sim->queue_advertisement(testutil::adv("C0:FF:EE:00:00:01", "keep"));
    sim->queue_advertisement(testutil::adv("C0:FF:EE:00:00:02", "drop"));
    ASSERT_TRUE(mgr->discover(false, 1));
    ASSERT_EQ(mgr->get_nodes().size(), 2u);
    ASSERT_TRUE(mgr->get_node_with_name("keep")->connect());

    generate_unique_nodes();
    ASSERT_TRUE(mgr->start_discovery(false, 30));
    ASSERT_TRUE(mgr->reset_discovery());
    EXPECT_FALSE(mgr->is_discovering());

    const auto left = mgr->get_nodes();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0]->name(), "keep");
    EXPECT_TRUE(left[0]->is_connected());

    // idle reset is fine too
    EXPECT_TRUE(mgr->reset_discovery());
    EXPECT_EQ(mgr->get_nodes().size(), 1u);
}

TEST_F(ManagerTest, ResetReportsScanFailure)
{
    sim->queue_advertisement(testutil::adv("C0:FF:EE:00:00:01", "stale"));
    ASSERT_TRUE(mgr->discover(false, 1));

    sim->fail_next(SimulatedScanDriver::Op::Start,
                   bluest::make_error(bluest::Errc::permission_denied, "not permitted"));
    ASSERT_TRUE(mgr->start_discovery(false, 30));
    std::this_thread::sleep_for(20ms);

    bluest::Error err;
    EXPECT_FALSE(mgr->reset_discovery(&err));
    EXPECT_EQ(err.code, bluest::Errc::permission_denied);
    EXPECT_NE(err.message.find(constants::PRIVILEGE_HINT), std::string::npos);
    // the failure does not skip the cleanup
    EXPECT_FALSE(mgr->is_discovering());
    EXPECT_TRUE(mgr->get_nodes().empty());
}

TEST_F(ManagerTest, ResetAfterTimeoutSucceeds)
{
    ASSERT_TRUE(mgr->start_discovery(false, 1));
    ASSERT_TRUE(testutil::wait_until([&] { return !mgr->is_discovering(); }, 3000ms));

    bluest::Error err;
    EXPECT_TRUE(mgr->reset_discovery(&err));
    EXPECT_FALSE(err);
}

TEST_F(ManagerTest, ListenersAreASet)
{
    mgr->add_listener(rec);
    mgr->add_listener(nullptr);
    EXPECT_EQ(mgr->listener_count(), 1u);

    auto other = std::make_shared<testutil::RecordingListener>();
    mgr->add_listener(other);
    EXPECT_EQ(mgr->listener_count(), 2u);

    sim->queue_advertisement(testutil::adv("C0:FF:EE:00:00:01", "one"));
    ASSERT_TRUE(mgr->discover(false, 1));
    EXPECT_EQ(rec->nodes.load(), 1);
    EXPECT_EQ(other->nodes.load(), 1);
    EXPECT_EQ(rec->starts.load(), 1);

    mgr->remove_listener(other);
    mgr->remove_listener(other);
    EXPECT_EQ(mgr->listener_count(), 1u);
    ASSERT_TRUE(mgr->discover(false, 1));
    EXPECT_EQ(other->starts.load(), 1);
    EXPECT_EQ(rec->starts.load(), 2);
}

namespace
{
// Stops the scan from inside a listener callback.
class StoppingListener : public discovery::DiscoveryListener
{
  public:
    std::atomic<int>  stops{0};
    std::atomic<bool> stop_result{false};

    void on_discovery_change(DiscoveryManager &, bool enabled) override
    {
        if (!enabled)
            ++stops;
    }
    void on_node_discovered(DiscoveryManager &m, std::shared_ptr<discovery::Node>) override
    {
        if (!fired_.exchange(true))
            stop_result = m.stop_discovery();
    }

  private:
    std::atomic<bool> fired_{false};
};
}  // namespace

TEST_F(ManagerTest, ListenerMayStopDiscovery)
{
    auto stopper = std::make_shared<StoppingListener>();
    mgr->add_listener(stopper);
    generate_unique_nodes();

    ASSERT_TRUE(mgr->start_discovery(false, 30));
    ASSERT_TRUE(testutil::wait_until([&] { return !mgr->is_discovering(); }));
    EXPECT_TRUE(stopper->stop_result.load());
    ASSERT_TRUE(testutil::wait_until([&] { return stopper->stops.load() == 1; }));
    ASSERT_TRUE(testutil::wait_until([&] { return rec->stops.load() == 1; }));
    EXPECT_FALSE(sim->async_active());
}

TEST_F(ManagerTest, FeatureRegistrationNeedsSingleBits)
{
    bluest::Error err;
    ASSERT_TRUE(mgr->add_features_to_node(
        0x02, {{0x1u, FeatureKind::Switch}, {0x2u, FeatureKind::ActivityRecognition}, {0x4u, FeatureKind::Custom}},
        &err));
    auto m = mgr->get_node_features(0x02);
    EXPECT_EQ(m.size(), 3u);
    EXPECT_EQ(m.at(0x2u), FeatureKind::ActivityRecognition);

    EXPECT_FALSE(mgr->add_features_to_node(0x02, {{0x8u, FeatureKind::Switch}, {0x3u, FeatureKind::Custom}}, &err));
    EXPECT_EQ(err.code, bluest::Errc::invalid_mask);
    EXPECT_NE(err.message.find("00000003"), std::string::npos);
    // the rejected map left nothing behind
    m = mgr->get_node_features(0x02);
    EXPECT_EQ(m.size(), 3u);
    EXPECT_EQ(m.count(0x8u), 0u);

    EXPECT_FALSE(mgr->add_features_to_node(0x02, {{0x0u, FeatureKind::Switch}}));

    // a later registration adds to the table
    ASSERT_TRUE(mgr->add_features_to_node(0x02, {{0x8u, FeatureKind::Gyroscope}}));
    EXPECT_EQ(mgr->get_node_features(0x02).size(), 4u);
}

TEST_F(ManagerTest, UnregisteredDeviceUsesDefaultFeatures)
{
    const auto m = mgr->get_node_features(0x05);
    EXPECT_EQ(m.size(), feature::default_mask_to_feature().size());
    EXPECT_EQ(m.at(0x00800000u), FeatureKind::Accelerometer);
}

TEST_F(ManagerTest, StopFromAnotherThreadEndsNodeEvents)
{
    generate_unique_nodes();
    std::thread scanner([&] { EXPECT_TRUE(mgr->start_discovery(false, 5)); });

    bool stopped = false;
    int  at_stop = -1;
    std::thread stopper([&] {
        std::this_thread::sleep_for(1s);
        stopped = mgr->stop_discovery();
        at_stop = rec->nodes.load();
    });
    scanner.join();
    stopper.join();

    ASSERT_TRUE(stopped);
    EXPECT_GT(at_stop, 0);
    EXPECT_FALSE(mgr->is_discovering());
    EXPECT_EQ(rec->stops.load(), 1);

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(rec->nodes.load(), at_stop);
    EXPECT_EQ(static_cast<std::size_t>(at_stop), mgr->get_nodes().size());
}

TEST_F(ManagerTest, ConcurrentAddNodeKeepsTagsUnique)
{
    const int                kTags = 50;
    std::atomic<bool>        go{false};
    std::atomic<int>         added{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&] {
            while (!go.load())
                std::this_thread::yield();
            for (int i = 0; i < kTags; ++i)
            {
                auto n = discovery::Node::create(sim, testutil::adv(addr_for(i), "dup"), {});
                if (n && mgr->add_node(n))
                    ++added;
            }
        });
    }
    go = true;
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(added.load(), kTags);
    const auto        nodes = mgr->get_nodes();
    std::set<std::string> tags;
    for (const auto &n : nodes)
        tags.insert(n->tag());
    EXPECT_EQ(nodes.size(), static_cast<std::size_t>(kTags));
    EXPECT_EQ(tags.size(), static_cast<std::size_t>(kTags));

    mgr.reset();  // drains the listener pool
    EXPECT_EQ(rec->nodes.load(), kTags);
}

TEST_F(ManagerTest, SnapshotIsStableUnderMutation)
{
    for (int i = 0; i < 20; ++i)
        ASSERT_TRUE(mgr->add_node(discovery::Node::create(sim, testutil::adv(addr_for(i), "first"), {})));
    const auto snapshot = mgr->get_nodes();
    ASSERT_EQ(snapshot.size(), 20u);

    std::atomic<bool> done{false};
    std::thread       adder([&] {
        for (int i = 20; i < 220; ++i)
            mgr->add_node(discovery::Node::create(sim, testutil::adv(addr_for(i), "later"), {}));
        done = true;
    });
    std::thread remover([&] {
        while (!done.load())
            mgr->remove_nodes();
        mgr->remove_nodes();
    });

    // readers walk their own copies while the list changes underneath
    bool stable = true;
    while (!done.load())
    {
        const auto now = mgr->get_nodes();
        std::set<std::string> tags;
        for (const auto &n : now)
            tags.insert(n->tag());
        stable = stable && tags.size() == now.size() && snapshot.size() == 20u;
    }
    adder.join();
    remover.join();

    EXPECT_TRUE(stable);
    ASSERT_EQ(snapshot.size(), 20u);
    for (int i = 0; i < 20; ++i)
    {
        EXPECT_EQ(snapshot[i]->tag(), addr_for(i));
        EXPECT_EQ(snapshot[i]->name(), "first");
    }
    EXPECT_TRUE(mgr->get_nodes().empty());
}
