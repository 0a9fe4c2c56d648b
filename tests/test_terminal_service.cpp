#include "fake_transport.hpp"
#include "sqlite_repository.hpp"
#include "terminal_service.hpp"
#include "test_site.hpp"
#include <gtest/gtest.h>
#include <functional>

class TerminalServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(repo.open(":memory:"), RepositoryStatus::Ok);

        SiteProfile site;
        site.devices = {makeDevice(2), makeDevice(3)};
        site.storage_tanks = {makeTank(1, "T-101")};
        site.weighbridges = {makeWeighbridge(1, "WB-01")};
        site.orders = {makeOrder(100, OrderStatus::Ready)};
        site.mappings = {
            tankVolume(1, 3, 10, 1, 0.1),
            makeMapping(2, 2, 0, RegisterType::HoldingRegister, EntityKind::Weighbridge, 1, "CurrentWeight", 10.0),
        };
        ASSERT_EQ(repo.importSite(site), 7u);

        bus.setValue(3, 3, 10, 550);
        bus.setValue(2, 3, 0, 1200);

        service.errorOccurred.connect([this](const std::string& message) { errors.push_back(message); });
    }

    void TearDown() override {
        service.disconnect();
    }

    // Pumps events until the condition holds or a few seconds pass
    bool processUntil(const std::function<bool()>& condition) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (std::chrono::steady_clock::now() < deadline) {
            service.processEvents(std::chrono::milliseconds(20));
            if (condition()) return true;
        }
        return condition();
    }

    std::vector<std::string> errors;
    SqliteRepository repo;
    FakeTransport bus;
    PollingSettings settings{5, 3600000, false};
    TerminalService service{repo, bus, settings};
};

TEST_F(TerminalServiceTest, PolledValueReachesSnapshotCacheAndTank) {
    Snapshot last;
    service.dataUpdated.connect([&last](const Snapshot& snapshot) { last = snapshot; });

    ASSERT_TRUE(service.attachDatabase());
    ASSERT_EQ(service.connect(ConnectionParams()), ConnectionError::None);
    EXPECT_TRUE(service.isConnected());

    ASSERT_TRUE(processUntil([&last] { return last.count({3, 1}) > 0; }));
    EXPECT_DOUBLE_EQ(last.at({3, 1}), 55.0);
    EXPECT_DOUBLE_EQ(service.valueCache().get(3, 1)->value, 55.0);

    auto tank = service.storageTanks().find(1);
    ASSERT_TRUE(tank.has_value());
    EXPECT_TRUE(tank->is_live);
    EXPECT_DOUBLE_EQ(tank->current_volume.value(), 55.0);
    EXPECT_TRUE(errors.empty());
}

TEST_F(TerminalServiceTest, ConnectAndDisconnectAnnounceState) {
    std::vector<bool> states;
    service.modbusConnected.connect([&states](bool connected) { states.push_back(connected); });

    ASSERT_TRUE(service.attachDatabase());
    ASSERT_EQ(service.connect(ConnectionParams()), ConnectionError::None);
    EXPECT_EQ(service.connect(ConnectionParams()), ConnectionError::AlreadyOpen);
    service.disconnect();

    EXPECT_FALSE(service.isConnected());
    EXPECT_FALSE(bus.isOpen());
    EXPECT_FALSE(service.pollingLoop().isRunning());
    EXPECT_EQ(states, (std::vector<bool>{true, false}));

    // Closing twice is harmless
    service.disconnect();
    EXPECT_EQ(states.size(), 2u);
}

TEST_F(TerminalServiceTest, FailedOpenIsReported) {
    bus.setOpenFails(true);
    std::vector<bool> states;
    service.modbusConnected.connect([&states](bool connected) { states.push_back(connected); });

    EXPECT_EQ(service.connect(ConnectionParams()), ConnectionError::OpenFailed);
    EXPECT_FALSE(service.isConnected());
    EXPECT_EQ(states, (std::vector<bool>{false}));
    EXPECT_EQ(errors.size(), 1u);

    ConnectionParams bad;
    bad.baudrate = 1234;
    bus.setOpenFails(false);
    EXPECT_EQ(service.connect(bad), ConnectionError::InvalidParameters);
}

TEST_F(TerminalServiceTest, ReadErrorsReachForegroundListeners) {
    bus.setSlaveFailing(2, true);

    ASSERT_TRUE(service.attachDatabase());
    ASSERT_EQ(service.connect(ConnectionParams()), ConnectionError::None);
    ASSERT_TRUE(processUntil([this] { return !errors.empty(); }));
    EXPECT_NE(errors.front().find("Modbus read error"), std::string::npos);

    // The other slave is still polled
    ASSERT_TRUE(processUntil([this] { return service.valueCache().get(3, 1).has_value(); }));
}

TEST_F(TerminalServiceTest, WeighingUsesPolledWeights) {
    ASSERT_TRUE(service.attachDatabase());
    ASSERT_EQ(service.connect(ConnectionParams()), ConnectionError::None);

    WeighingStation& station = service.weighingStation();
    ASSERT_TRUE(processUntil([&station] { return station.currentWeight(1).has_value(); }));
    EXPECT_DOUBLE_EQ(station.currentWeight(1).value(), 12000.0);

    ASSERT_EQ(station.startWeighing(1, 100, 5, "34 ABC 123"), WeighingError::None);
    ASSERT_EQ(station.setTare(1), WeighingError::None);
    EXPECT_DOUBLE_EQ(service.weighbridges().find(1)->tare_weight.value(), 12000.0);

    bus.setValue(2, 3, 0, 4200);
    ASSERT_TRUE(processUntil([&station] { return station.currentWeight(1).value() == 42000.0; }));
    ASSERT_EQ(station.setGross(1), WeighingError::None);

    auto order = repo.getOrder(100);
    EXPECT_EQ(order->status, OrderStatus::Completed);
    EXPECT_DOUBLE_EQ(order->actual_quantity.value(), 30000.0);
}

TEST_F(TerminalServiceTest, CancelClearsWeighbridgeWeights) {
    ASSERT_TRUE(service.attachDatabase());
    service.weighingStation().onCurrentWeight(1, 8000.0);
    ASSERT_EQ(service.weighingStation().startWeighing(1, 100, 5, "x"), WeighingError::None);
    ASSERT_EQ(service.weighingStation().setTare(1), WeighingError::None);
    ASSERT_TRUE(service.weighbridges().find(1)->tare_weight.has_value());

    ASSERT_EQ(service.weighingStation().cancelWeighing(1), WeighingError::None);
    EXPECT_FALSE(service.weighbridges().find(1)->tare_weight.has_value());
}

TEST_F(TerminalServiceTest, MappingChangesRefreshThePollPlan) {
    ASSERT_TRUE(service.attachDatabase());
    EXPECT_EQ(service.pollingLoop().registerMap()->mappingCount(), 2u);

    RegisterMapping mass = makeMapping(0, 3, 11, RegisterType::HoldingRegister, EntityKind::StorageTank, 1, "CurrentMass");
    ASSERT_EQ(service.addMapping(mass), RepositoryStatus::Ok);
    EXPECT_EQ(service.pollingLoop().registerMap()->mappingCount(), 3u);

    ASSERT_EQ(service.deleteDevice(3), RepositoryStatus::Ok);
    EXPECT_EQ(service.pollingLoop().registerMap()->deviceCount(), 1u);
    EXPECT_EQ(service.pollingLoop().registerMap()->mappingCount(), 1u);

    RegisterMapping orphan = tankVolume(0, 3, 12, 1);
    EXPECT_EQ(service.addMapping(orphan), RepositoryStatus::ValidationError);
    EXPECT_FALSE(errors.empty());
}

TEST_F(TerminalServiceTest, InactiveDeviceIsNotPolled) {
    ASSERT_TRUE(service.attachDatabase());
    ASSERT_EQ(service.setDeviceCommunicationStatus(3, false), RepositoryStatus::Ok);

    ASSERT_EQ(bus.open(ConnectionParams()), ConnectionError::None);
    service.pollingLoop().pollOnce();
    for (const auto& call : bus.calls()) {
        EXPECT_NE(call.slave_address, 3);
    }
}

TEST_F(TerminalServiceTest, PersistWritesTankReadings) {
    ASSERT_TRUE(service.attachDatabase());
    ASSERT_EQ(service.connect(ConnectionParams()), ConnectionError::None);
    ASSERT_TRUE(processUntil([this] { return service.valueCache().get(3, 1).has_value(); }));

    EXPECT_EQ(service.persistReadings(), 1u);
    EXPECT_DOUBLE_EQ(repo.listStorageTanks()[0].current_volume.value(), 55.0);
}

TEST_F(TerminalServiceTest, DetachForgetsEntities) {
    ASSERT_TRUE(service.attachDatabase());
    ASSERT_EQ(service.connect(ConnectionParams()), ConnectionError::None);

    service.detachDatabase();
    EXPECT_FALSE(service.isAttached());
    EXPECT_FALSE(service.isConnected());
    EXPECT_TRUE(service.storageTanks().entities().empty());
    EXPECT_EQ(service.pollingLoop().registerMap()->mappingCount(), 0u);
    EXPECT_EQ(service.persistReadings(), 0u);
}
