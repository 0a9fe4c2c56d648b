#include "sqlite_repository.hpp"
#include "test_site.hpp"
#include <gtest/gtest.h>

class SqliteRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(repo.open(":memory:"), RepositoryStatus::Ok);
        StorageTank tank = makeTank(1, "T-101");
        ASSERT_EQ(repo.addStorageTank(tank), RepositoryStatus::Ok);
        Weighbridge weighbridge = makeWeighbridge(1, "WB-01");
        ASSERT_EQ(repo.addWeighbridge(weighbridge), RepositoryStatus::Ok);
    }

    SqliteRepository repo;
};

TEST_F(SqliteRepositoryTest, AddAndGetDevice) {
    SlaveDevice device = makeDevice(3, "Tank gauge");
    device.parity = 'E';
    device.baudrate = 19200;
    ASSERT_EQ(repo.addDevice(device), RepositoryStatus::Ok);

    auto stored = repo.getDevice(3);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name, "Tank gauge");
    EXPECT_EQ(stored->parity, 'E');
    EXPECT_EQ(stored->baudrate, 19200);
    EXPECT_TRUE(stored->active);
}

TEST_F(SqliteRepositoryTest, RejectsInvalidAndDuplicateDevices) {
    ASSERT_EQ(repo.addDevice(makeDevice(3, "Tank gauge")), RepositoryStatus::Ok);

    EXPECT_EQ(repo.addDevice(makeDevice(3, "Other")), RepositoryStatus::ValidationError);
    EXPECT_EQ(repo.addDevice(makeDevice(4, "Tank gauge")), RepositoryStatus::ValidationError);
    EXPECT_EQ(repo.addDevice(makeDevice(0)), RepositoryStatus::ValidationError);
    EXPECT_EQ(repo.addDevice(makeDevice(248)), RepositoryStatus::ValidationError);

    SlaveDevice bad_baud = makeDevice(5);
    bad_baud.baudrate = 1200;
    EXPECT_EQ(repo.addDevice(bad_baud), RepositoryStatus::ValidationError);

    EXPECT_EQ(repo.listActiveDevices().size(), 1u);
}

TEST_F(SqliteRepositoryTest, SoftDeletedDeviceDisappearsAndCanBeRecreated) {
    ASSERT_EQ(repo.addDevice(makeDevice(3)), RepositoryStatus::Ok);
    ASSERT_EQ(repo.deleteDevice(3), RepositoryStatus::Ok);

    EXPECT_FALSE(repo.getDevice(3).has_value());
    EXPECT_TRUE(repo.listActiveDevices().empty());
    EXPECT_EQ(repo.deleteDevice(3), RepositoryStatus::NotFound);

    EXPECT_EQ(repo.addDevice(makeDevice(3, "Replacement")), RepositoryStatus::Ok);
    EXPECT_EQ(repo.getDevice(3)->name, "Replacement");
}

TEST_F(SqliteRepositoryTest, UpdateDevice) {
    ASSERT_EQ(repo.addDevice(makeDevice(3)), RepositoryStatus::Ok);
    SlaveDevice changed = makeDevice(3, "Renamed");
    changed.stop_bits = 2;
    EXPECT_EQ(repo.updateDevice(changed), RepositoryStatus::Ok);
    EXPECT_EQ(repo.getDevice(3)->stop_bits, 2);

    EXPECT_EQ(repo.updateDevice(makeDevice(9)), RepositoryStatus::NotFound);
}

TEST_F(SqliteRepositoryTest, CommunicationStatusTogglesActiveFlag) {
    ASSERT_EQ(repo.addDevice(makeDevice(3)), RepositoryStatus::Ok);
    EXPECT_EQ(repo.setDeviceCommunicationStatus(3, false), RepositoryStatus::Ok);
    EXPECT_FALSE(repo.getDevice(3)->active);
    EXPECT_EQ(repo.setDeviceCommunicationStatus(8, true), RepositoryStatus::NotFound);
}

TEST_F(SqliteRepositoryTest, AddMappingAssignsId) {
    ASSERT_EQ(repo.addDevice(makeDevice(3)), RepositoryStatus::Ok);
    RegisterMapping mapping = tankVolume(0, 3, 10, 1, 0.1);
    mapping.store_historical = true;

    ASSERT_EQ(repo.addMapping(mapping), RepositoryStatus::Ok);
    EXPECT_GT(mapping.mapping_id, 0);

    auto stored = repo.getMapping(mapping.mapping_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->register_type, RegisterType::HoldingRegister);
    EXPECT_EQ(stored->entity_kind, EntityKind::StorageTank);
    EXPECT_EQ(stored->column, "CurrentVolume");
    EXPECT_DOUBLE_EQ(stored->scale_factor, 0.1);
    EXPECT_TRUE(stored->store_historical);
}

TEST_F(SqliteRepositoryTest, RejectsMappingsWithoutTargets) {
    ASSERT_EQ(repo.addDevice(makeDevice(3)), RepositoryStatus::Ok);

    RegisterMapping unknown_slave = tankVolume(0, 4, 10, 1);
    EXPECT_EQ(repo.addMapping(unknown_slave), RepositoryStatus::ValidationError);

    RegisterMapping unknown_tank = tankVolume(0, 3, 10, 99);
    EXPECT_EQ(repo.addMapping(unknown_tank), RepositoryStatus::ValidationError);

    RegisterMapping wrong_code = tankVolume(0, 3, 10, 1);
    wrong_code.function_code = 1;
    EXPECT_EQ(repo.addMapping(wrong_code), RepositoryStatus::ValidationError);

    EXPECT_TRUE(repo.listActiveMappings().empty());
}

TEST_F(SqliteRepositoryTest, ActiveMappingsAreOrderedAndFollowDevices) {
    ASSERT_EQ(repo.addDevice(makeDevice(5)), RepositoryStatus::Ok);
    ASSERT_EQ(repo.addDevice(makeDevice(2)), RepositoryStatus::Ok);
    RegisterMapping a = tankVolume(0, 5, 1, 1);
    RegisterMapping b = tankVolume(0, 2, 20, 1);
    RegisterMapping c = tankVolume(0, 2, 3, 1);
    ASSERT_EQ(repo.addMapping(a), RepositoryStatus::Ok);
    ASSERT_EQ(repo.addMapping(b), RepositoryStatus::Ok);
    ASSERT_EQ(repo.addMapping(c), RepositoryStatus::Ok);

    auto mappings = repo.listActiveMappings();
    ASSERT_EQ(mappings.size(), 3u);
    EXPECT_EQ(mappings[0].mapping_id, c.mapping_id);
    EXPECT_EQ(mappings[1].mapping_id, b.mapping_id);
    EXPECT_EQ(mappings[2].mapping_id, a.mapping_id);

    ASSERT_EQ(repo.deleteDevice(2), RepositoryStatus::Ok);
    mappings = repo.listActiveMappings();
    ASSERT_EQ(mappings.size(), 1u);
    EXPECT_EQ(mappings[0].mapping_id, a.mapping_id);
}

TEST_F(SqliteRepositoryTest, UpdateAndDeleteMapping) {
    ASSERT_EQ(repo.addDevice(makeDevice(3)), RepositoryStatus::Ok);
    RegisterMapping mapping = tankVolume(0, 3, 10, 1);
    ASSERT_EQ(repo.addMapping(mapping), RepositoryStatus::Ok);

    mapping.register_address = 11;
    mapping.offset = -5.0;
    EXPECT_EQ(repo.updateMapping(mapping), RepositoryStatus::Ok);
    EXPECT_EQ(repo.getMapping(mapping.mapping_id)->register_address, 11);
    EXPECT_DOUBLE_EQ(repo.getMapping(mapping.mapping_id)->offset, -5.0);

    EXPECT_EQ(repo.deleteMapping(mapping.mapping_id), RepositoryStatus::Ok);
    EXPECT_FALSE(repo.getMapping(mapping.mapping_id).has_value());
    EXPECT_EQ(repo.deleteMapping(mapping.mapping_id), RepositoryStatus::NotFound);
    EXPECT_EQ(repo.updateMapping(mapping), RepositoryStatus::NotFound);
}

TEST_F(SqliteRepositoryTest, UpdateEntityFieldsWritesLiveColumns) {
    Timestamp read_at = Clock::now() - std::chrono::minutes(5);
    int changed = repo.updateEntityFields(EntityKind::StorageTank, 1,
                                          {{"CurrentVolume", 55.0}, {"CurrentTemperature", 21.5}}, read_at);
    EXPECT_EQ(changed, 1);

    auto tanks = repo.listStorageTanks();
    ASSERT_EQ(tanks.size(), 1u);
    EXPECT_DOUBLE_EQ(tanks[0].current_volume.value(), 55.0);
    EXPECT_DOUBLE_EQ(tanks[0].current_temperature.value(), 21.5);
    EXPECT_FALSE(tanks[0].current_mass.has_value());
    // Stamped with the read time, not the write time
    ASSERT_TRUE(tanks[0].last_reading.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(*tanks[0].last_reading - read_at).count(), 0);

    std::map<std::string, double> fields = {{"CurrentVolume", 1.0}};
    EXPECT_EQ(repo.updateEntityFields(EntityKind::StorageTank, 42, fields, read_at), 0);
}

TEST_F(SqliteRepositoryTest, UpdateEntityFieldsRejectsUnknownColumns) {
    try {
        repo.updateEntityFields(EntityKind::StorageTank, 1, {{"TotalVolume", 1.0}}, Clock::now());
        FAIL() << "Expected RepositoryError";
    } catch (const RepositoryError& e) {
        EXPECT_EQ(e.code(), RepositoryStatus::ValidationError);
    }
}

TEST_F(SqliteRepositoryTest, ClaimAndCompleteOrder) {
    Order open = makeOrder(100, OrderStatus::Ready);
    Order closed = makeOrder(101, OrderStatus::Completed);
    ASSERT_EQ(repo.addOrder(open), RepositoryStatus::Ok);
    ASSERT_EQ(repo.addOrder(closed), RepositoryStatus::Ok);

    EXPECT_EQ(repo.claimOrderForWeighing(101, 1, 7, "34 XYZ 1"), 0);
    EXPECT_EQ(repo.claimOrderForWeighing(100, 1, 7, "34 XYZ 1"), 1);

    auto claimed = repo.getOrder(100);
    ASSERT_TRUE(claimed.has_value());
    EXPECT_EQ(claimed->status, OrderStatus::InProgress);
    EXPECT_EQ(claimed->weighbridge_id.value(), 1);
    EXPECT_EQ(claimed->driver_id.value(), 7);
    EXPECT_EQ(claimed->vehicle_license, "34 XYZ 1");

    WeighingSession session;
    session.weighbridge_id = 1;
    session.order_id = 100;
    session.driver_id = 7;
    session.tare_weight = 12000.0;
    session.gross_weight = 42000.0;
    session.net_weight = 30000.0;
    EXPECT_EQ(repo.completeWeighing(session), 1);
    EXPECT_EQ(repo.completeWeighing(session), 0);

    auto completed = repo.getOrder(100);
    EXPECT_EQ(completed->status, OrderStatus::Completed);
    EXPECT_DOUBLE_EQ(completed->initial_weight.value(), 12000.0);
    EXPECT_DOUBLE_EQ(completed->final_weight.value(), 42000.0);
    EXPECT_DOUBLE_EQ(completed->actual_quantity.value(), 30000.0);

    EXPECT_TRUE(repo.listOpenOrders().empty());
}

TEST_F(SqliteRepositoryTest, HistoryIsReturnedInTimeOrder) {
    Timestamp t0 = Clock::now();
    repo.recordHistoricalValue(4, 2.0, t0 + std::chrono::seconds(10));
    repo.recordHistoricalValue(4, 1.0, t0);
    repo.recordHistoricalValue(5, 9.0, t0);

    auto history = repo.listHistory(4);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_DOUBLE_EQ(history[0].value, 1.0);
    EXPECT_DOUBLE_EQ(history[1].value, 2.0);
}

TEST_F(SqliteRepositoryTest, ImportSiteSkipsExistingRecords) {
    SiteProfile site;
    site.devices = {makeDevice(3)};
    site.storage_tanks = {makeTank(1, "T-101"), makeTank(2, "T-102")};
    site.loading_arms = {makeArm(1, "LA-01")};
    site.orders = {makeOrder(500, OrderStatus::Pending)};
    site.mappings = {tankVolume(1, 3, 10, 2)};

    // Device, tank 2, arm, order and mapping are new
    EXPECT_EQ(repo.importSite(site), 5u);
    EXPECT_EQ(repo.importSite(site), 0u);
    EXPECT_EQ(repo.listStorageTanks().size(), 2u);
    EXPECT_EQ(repo.listLoadingArms().size(), 1u);
    EXPECT_EQ(repo.listOpenOrders().size(), 1u);
    EXPECT_EQ(repo.listActiveMappings().size(), 1u);

    // Records deleted since the last start stay deleted
    ASSERT_EQ(repo.deleteDevice(3), RepositoryStatus::Ok);
    EXPECT_EQ(repo.importSite(site), 0u);
    EXPECT_FALSE(repo.getDevice(3).has_value());
    EXPECT_TRUE(repo.listActiveDevices().empty());
    EXPECT_TRUE(repo.listActiveMappings().empty());
}

TEST_F(SqliteRepositoryTest, LoadingWeightReadingKeepsArmCapacity) {
    LoadingArm arm = makeArm(1, "LA-01");
    arm.loading_weight = 5000.0;
    ASSERT_EQ(repo.addLoadingArm(arm), RepositoryStatus::Ok);

    std::map<std::string, double> fields = {{"FlowRate", 12.5}, {"LoadingWeight", 800.0}};
    ASSERT_EQ(repo.updateEntityFields(EntityKind::LoadingArm, 1, fields, Clock::now()), 1);

    auto arms = repo.listLoadingArms();
    ASSERT_EQ(arms.size(), 1u);
    EXPECT_DOUBLE_EQ(arms[0].loading_weight, 5000.0);
    EXPECT_DOUBLE_EQ(arms[0].current_loading_weight, 800.0);
    EXPECT_DOUBLE_EQ(arms[0].flow_rate, 12.5);
    EXPECT_TRUE(arms[0].last_reading.has_value());
}

TEST(SqliteRepositoryClosedTest, QueriesThrowWithoutDatabase) {
    SqliteRepository repo;
    EXPECT_FALSE(repo.isOpen());
    EXPECT_THROW(repo.listActiveDevices(), RepositoryError);
    EXPECT_EQ(repo.deleteDevice(1), RepositoryStatus::PersistenceError);
}
