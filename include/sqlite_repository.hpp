#ifndef SQLITE_REPOSITORY_H
#define SQLITE_REPOSITORY_H

#include "terminal_repository.hpp"
#include <string>

struct sqlite3;

/**
 * @class SqliteRepository
 * @brief TerminalRepository stored in a SQLite database file.
 *
 * Rows are soft deleted through an is_deleted flag. The schema is created on
 * open(). Use ":memory:" as path for a throwaway database.
 */
class SqliteRepository : public TerminalRepository {
public:
    SqliteRepository();

    /**
     * @brief Destructor, closes the database.
     */
    ~SqliteRepository() override;

    SqliteRepository(const SqliteRepository&) = delete;
    SqliteRepository& operator=(const SqliteRepository&) = delete;

    /**
     * @brief Opens (or creates) the database and its schema.
     * @param path Database file path.
     * @return RepositoryStatus::Ok on success.
     */
    RepositoryStatus open(const std::string& path);
    void close();
    bool isOpen() const { return db != nullptr; }

    std::vector<SlaveDevice> listActiveDevices() override;
    std::optional<SlaveDevice> getDevice(int slave_address) override;
    RepositoryStatus addDevice(const SlaveDevice& device) override;
    RepositoryStatus updateDevice(const SlaveDevice& device) override;
    RepositoryStatus deleteDevice(int slave_address) override;
    RepositoryStatus setDeviceCommunicationStatus(int slave_address, bool active) override;

    std::vector<RegisterMapping> listActiveMappings() override;
    std::optional<RegisterMapping> getMapping(int mapping_id) override;
    RepositoryStatus addMapping(RegisterMapping& mapping) override;
    RepositoryStatus updateMapping(const RegisterMapping& mapping) override;
    RepositoryStatus deleteMapping(int mapping_id) override;

    std::vector<StorageTank> listStorageTanks() override;
    std::vector<LoadingArm> listLoadingArms() override;
    std::vector<Weighbridge> listWeighbridges() override;
    int updateEntityFields(EntityKind kind, int entity_id, const std::map<std::string, double>& fields,
                           Timestamp read_at) override;

    std::optional<Order> getOrder(int order_id) override;
    std::vector<Order> listOpenOrders() override;
    int claimOrderForWeighing(int order_id, int weighbridge_id, int driver_id,
                              const std::string& vehicle_license) override;
    int completeWeighing(const WeighingSession& session) override;

    void recordHistoricalValue(int mapping_id, double value, Timestamp at) override;
    std::vector<HistoricalValue> listHistory(int mapping_id) override;

    // Static entity records and orders are maintained by other screens; these
    // exist to seed a site profile.
    RepositoryStatus addStorageTank(StorageTank& tank);
    RepositoryStatus addLoadingArm(LoadingArm& arm);
    RepositoryStatus addWeighbridge(Weighbridge& weighbridge);
    RepositoryStatus addOrder(Order& order);

    /**
     * @brief Imports a site profile, skipping records that already exist.
     *
     * Soft-deleted records count as existing and stay deleted.
     * @return Number of records added.
     */
    size_t importSite(const SiteProfile& site);

private:
    void createSchema();
    bool entityExists(EntityKind kind, int entity_id);
    bool keyExists(const char* table, const char* key_column, int key);
    sqlite3* connection();

    sqlite3 *db;
};

#endif // SQLITE_REPOSITORY_H
