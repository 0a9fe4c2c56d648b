#include "fake_transport.hpp"
#include "polling_loop.hpp"
#include "test_site.hpp"
#include <gtest/gtest.h>
#include <thread>

class PollingLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(bus.open(ConnectionParams()), ConnectionError::None);
    }

    void useMap(const std::vector<SlaveDevice>& devices, const std::vector<RegisterMapping>& mappings) {
        loop.setRegisterMap(std::make_shared<const RegisterMap>(devices, mappings));
    }

    FakeTransport bus;
    ValueCache cache;
    PollingSettings settings{5, 10000, false};
    PollingLoop loop{bus, cache, settings};
};

TEST_F(PollingLoopTest, VisitsSlavesThenRegistersAscending) {
    useMap({makeDevice(9), makeDevice(2), makeDevice(5)},
           {tankVolume(1, 9, 3, 1), tankVolume(2, 2, 8, 2), tankVolume(3, 2, 1, 3), tankVolume(4, 5, 0, 4)});
    for (int slave : {2, 5, 9}) {
        for (int reg : {0, 1, 3, 8}) bus.setValue(slave, 3, reg, 1);
    }

    loop.pollOnce();

    auto calls = bus.calls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[0].slave_address, 2);
    EXPECT_EQ(calls[0].register_address, 1);
    EXPECT_EQ(calls[1].slave_address, 2);
    EXPECT_EQ(calls[1].register_address, 8);
    EXPECT_EQ(calls[2].slave_address, 5);
    EXPECT_EQ(calls[3].slave_address, 9);
}

TEST_F(PollingLoopTest, ScaledValueReachesCacheAndSnapshot) {
    useMap({makeDevice(3)}, {tankVolume(7, 3, 10, 1, 0.1)});
    bus.setValue(3, 3, 10, 550);

    Snapshot emitted;
    loop.snapshotReady.connect([&emitted](const Snapshot& snapshot) { emitted = snapshot; });

    Snapshot snapshot = loop.pollOnce();
    ASSERT_EQ(snapshot.count({3, 7}), 1u);
    EXPECT_DOUBLE_EQ(snapshot.at({3, 7}), 55.0);
    EXPECT_EQ(emitted, snapshot);
    ASSERT_TRUE(cache.get(3, 7).has_value());
    EXPECT_DOUBLE_EQ(cache.get(3, 7)->value, 55.0);
    EXPECT_EQ(loop.cycleCount(), 1u);
}

TEST_F(PollingLoopTest, FailedReadDoesNotStopTheCycle) {
    useMap({makeDevice(1), makeDevice(2)}, {tankVolume(1, 1, 10, 1), tankVolume(2, 1, 11, 2), tankVolume(3, 2, 10, 3)});
    bus.setValue(1, 3, 10, 10);
    bus.setValue(1, 3, 11, 11);
    bus.setValue(2, 3, 10, 20);
    bus.setFailing(1, 3, 10, true);

    std::vector<std::string> errors;
    loop.errorOccurred.connect([&errors](const std::string& message) { errors.push_back(message); });

    Snapshot snapshot = loop.pollOnce();
    EXPECT_EQ(snapshot.count({1, 1}), 0u);
    EXPECT_DOUBLE_EQ(snapshot.at({1, 2}), 11.0);
    EXPECT_DOUBLE_EQ(snapshot.at({2, 3}), 20.0);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("1 read(s) failed"), std::string::npos);
}

TEST_F(PollingLoopTest, FailedReadKeepsPreviousCacheValue) {
    useMap({makeDevice(1)}, {tankVolume(1, 1, 10, 1)});
    bus.setValue(1, 3, 10, 42);
    loop.pollOnce();
    ASSERT_DOUBLE_EQ(cache.get(1, 1)->value, 42.0);

    bus.setValue(1, 3, 10, 99);
    bus.setFailing(1, 3, 10, true);
    Snapshot snapshot = loop.pollOnce();

    EXPECT_TRUE(snapshot.empty());
    EXPECT_DOUBLE_EQ(cache.get(1, 1)->value, 42.0);
}

TEST_F(PollingLoopTest, NoErrorSignalWhenEverythingSucceeds) {
    useMap({makeDevice(1)}, {tankVolume(1, 1, 10, 1)});
    bus.setValue(1, 3, 10, 1);

    int errors = 0;
    loop.errorOccurred.connect([&errors](const std::string&) { ++errors; });
    loop.pollOnce();
    EXPECT_EQ(errors, 0);
}

TEST_F(PollingLoopTest, StartRequiresOpenChannel) {
    bus.close();
    EXPECT_FALSE(loop.start());
    EXPECT_FALSE(loop.isRunning());
}

TEST_F(PollingLoopTest, RunsUntilStopped) {
    useMap({makeDevice(1)}, {tankVolume(1, 1, 10, 1)});
    bus.setValue(1, 3, 10, 5);

    ASSERT_TRUE(loop.start());
    EXPECT_TRUE(loop.isRunning());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (loop.cycleCount() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    loop.stop();

    EXPECT_FALSE(loop.isRunning());
    EXPECT_GE(loop.cycleCount(), 3u);

    // No read happens once stop() has returned
    size_t reads = bus.calls().size();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(bus.calls().size(), reads);
}

TEST_F(PollingLoopTest, StopInterruptsLongSleep) {
    settings.cycle_interval_ms = 60000;
    PollingLoop slow(bus, cache, settings);
    ASSERT_TRUE(slow.start());

    auto begin = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    slow.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST_F(PollingLoopTest, SlowCycleIsStillFollowedByFullPause) {
    settings.cycle_interval_ms = 40;
    PollingLoop paced(bus, cache, settings);
    paced.setRegisterMap(std::make_shared<const RegisterMap>(
        std::vector<SlaveDevice>{makeDevice(1)}, std::vector<RegisterMapping>{tankVolume(1, 1, 10, 1)}));
    bus.setValue(1, 3, 10, 5);
    // Each cycle takes longer than the interval
    bus.setReadDelay(std::chrono::milliseconds(60));

    ASSERT_TRUE(paced.start());
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (bus.calls().size() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    paced.stop();

    auto calls = bus.calls();
    ASSERT_GE(calls.size(), 3u);
    for (size_t i = 1; i < calls.size(); ++i) {
        EXPECT_GE(calls[i].at - calls[i - 1].at, std::chrono::milliseconds(95));
    }
}

TEST_F(PollingLoopTest, MapSwapAppliesToNextCycle) {
    useMap({makeDevice(1)}, {tankVolume(1, 1, 10, 1)});
    bus.setValue(1, 3, 10, 1);
    bus.setValue(1, 3, 20, 2);
    EXPECT_EQ(loop.pollOnce().size(), 1u);

    useMap({makeDevice(1)}, {tankVolume(1, 1, 10, 1), tankVolume(2, 1, 20, 2)});
    Snapshot snapshot = loop.pollOnce();
    EXPECT_EQ(snapshot.size(), 2u);
    EXPECT_DOUBLE_EQ(snapshot.at({1, 2}), 2.0);
}
