#ifndef ENTITY_PROJECTOR_H
#define ENTITY_PROJECTOR_H

#include "event_signal.hpp"
#include "register_map.hpp"
#include "terminal_repository.hpp"
#include "value_cache.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @class EntityProjector
 * @brief Projects poll snapshots onto the live fields of one entity collection.
 *
 * For every entity the projector looks up the mappings that feed it, applies
 * each mapped column present in the snapshot and marks the entity live if its
 * liveness column was read. An entity whose liveness column is missing from
 * the snapshot is marked inactive. listUpdated fires after every snapshot.
 *
 * Not thread-safe; used on the foreground thread only.
 *
 * @tparam Entity StorageTank, LoadingArm or Weighbridge.
 */
template <typename Entity>
class EntityProjector {
public:
    explicit EntityProjector(EntityKind kind)
        : kind(kind), map(std::make_shared<const RegisterMap>()) {}

    virtual ~EntityProjector() = default;

    EntityKind entityKind() const { return kind; }

    /**
     * @brief Replaces the tracked entities, usually with a fresh repository listing.
     */
    void setEntities(std::vector<Entity> list) {
        tracked = std::move(list);
        listUpdated.emit(tracked);
    }

    void setRegisterMap(std::shared_ptr<const RegisterMap> new_map) {
        map = new_map ? std::move(new_map) : std::make_shared<const RegisterMap>();
    }

    const std::vector<Entity>& entities() const { return tracked; }

    std::optional<Entity> find(int entity_id) const {
        for (const auto& entity : tracked) {
            if (entity.id == entity_id) return entity;
        }
        return std::nullopt;
    }

    /**
     * @brief Applies one poll snapshot.
     * @param snapshot Values read in the last cycle, keyed by (slave, mapping id).
     */
    void onSnapshot(const Snapshot& snapshot) {
        const std::string& liveness = livenessColumn(kind);
        Timestamp now = Clock::now();

        for (auto& entity : tracked) {
            bool live = false;
            for (const auto& mapping : map->mappingsForEntity(kind, entity.id)) {
                auto it = snapshot.find({mapping.slave_address, mapping.mapping_id});
                if (it == snapshot.end()) continue;
                applyColumn(entity, mapping, it->second);
                if (mapping.column == liveness) {
                    live = true;
                }
            }
            setLive(entity, live, now);
        }
        listUpdated.emit(tracked);
    }

    Signal<const std::vector<Entity>&> listUpdated;
    Signal<const std::string&> errorOccurred;

protected:
    /// @brief Writes one mapped column into the entity.
    virtual void applyColumn(Entity& entity, const RegisterMapping& mapping, double value) = 0;

    /// @brief Updates the live flag and, when live, the last reading time.
    virtual void setLive(Entity& entity, bool live, Timestamp at) = 0;

    Entity* findMutable(int entity_id) {
        for (auto& entity : tracked) {
            if (entity.id == entity_id) return &entity;
        }
        return nullptr;
    }

    const RegisterMap& registerMap() const { return *map; }

    /**
     * @brief Writes cached readings of every tracked entity to the repository.
     *
     * Only values read since the last write of an entity are written, stamped
     * with the time the newest of them was read. A device that stops answering
     * therefore leaves its row untouched. Mappings flagged store_historical
     * also get one history row per new reading. A failure on one entity is
     * reported through errorOccurred and the others are still written.
     *
     * @param repository Destination of the readings.
     * @param cache Source of the last good values.
     * @param label Entity name used in messages.
     * @return Number of entities written.
     */
    size_t persistReadings(TerminalRepository& repository, const ValueCache& cache, const std::string& label) {
        size_t written = 0;

        for (const auto& entity : tracked) {
            // --- 1. Collect the readings that are newer than the last write ---
            auto persisted = last_persisted.find(entity.id);
            std::map<std::string, double> fields;
            std::vector<std::pair<int, CachedValue>> history;
            Timestamp newest = Timestamp::min();
            for (const auto& mapping : map->mappingsForEntity(kind, entity.id)) {
                auto cached = cache.get(mapping.slave_address, mapping.mapping_id);
                if (!cached) continue;
                if (persisted != last_persisted.end() && cached->timestamp <= persisted->second) continue;
                fields[mapping.column] = cached->value;
                if (cached->timestamp > newest) {
                    newest = cached->timestamp;
                }

                if (mapping.store_historical) {
                    auto it = last_recorded.find(mapping.mapping_id);
                    if (it == last_recorded.end() || cached->timestamp > it->second) {
                        history.emplace_back(mapping.mapping_id, *cached);
                    }
                }
            }
            if (fields.empty()) continue;

            // --- 2. Write them; a failing entity does not stop the others ---
            try {
                if (repository.updateEntityFields(kind, entity.id, fields, newest) == 0) {
                    std::cerr << "Warning: " << label << " " << entity.id << " no longer exists, readings not saved"
                              << std::endl;
                    continue;
                }
                last_persisted[entity.id] = newest;
                for (const auto& entry : history) {
                    repository.recordHistoricalValue(entry.first, entry.second.value, entry.second.timestamp);
                    last_recorded[entry.first] = entry.second.timestamp;
                }
                ++written;
            } catch (const RepositoryError& e) {
                std::string message = "Error updating " + label + " " + entity.name + ": " + e.what();
                std::cerr << message << std::endl;
                errorOccurred.emit(message);
            }
        }
        return written;
    }

    EntityKind kind;
    std::vector<Entity> tracked;

private:
    std::shared_ptr<const RegisterMap> map;
    std::map<int, Timestamp> last_persisted; // entity id -> read time of the newest value written
    std::map<int, Timestamp> last_recorded;  // mapping id -> cached timestamp already in history
};

/**
 * @class StorageTankProjector
 * @brief Live volume, mass and temperature of storage tanks.
 */
class StorageTankProjector : public EntityProjector<StorageTank> {
public:
    StorageTankProjector();

    /**
     * @brief Writes new cached tank readings to the repository.
     * @return Number of tanks written.
     */
    size_t persist(TerminalRepository& repository, const ValueCache& cache);

protected:
    void applyColumn(StorageTank& tank, const RegisterMapping& mapping, double value) override;
    void setLive(StorageTank& tank, bool live, Timestamp at) override;
};

/**
 * @class LoadingArmProjector
 * @brief Live flow rate and loaded weight of loading arms.
 */
class LoadingArmProjector : public EntityProjector<LoadingArm> {
public:
    LoadingArmProjector();

    /// @brief Writes new cached flow rate and loaded weight readings.
    size_t persist(TerminalRepository& repository, const ValueCache& cache);

protected:
    void applyColumn(LoadingArm& arm, const RegisterMapping& mapping, double value) override;
    void setLive(LoadingArm& arm, bool live, Timestamp at) override;
};

/**
 * @class WeighbridgeProjector
 * @brief Live weight of weighbridges plus the tare/gross of their weighing session.
 *
 * CurrentWeight readings raise currentWeightUpdated, which feeds the
 * weighing workflow.
 */
class WeighbridgeProjector : public EntityProjector<Weighbridge> {
public:
    WeighbridgeProjector();

    /// @brief Mirrors the tare and gross of a session onto its weighbridge.
    void onWeighingUpdated(const WeighingSession& session);

    /// @brief Clears tare and gross after a session was cancelled.
    void onWeighingCancelled(int weighbridge_id);

    Signal<int, double> currentWeightUpdated;

protected:
    void applyColumn(Weighbridge& weighbridge, const RegisterMapping& mapping, double value) override;
    void setLive(Weighbridge& weighbridge, bool live, Timestamp at) override;
};

#endif // ENTITY_PROJECTOR_H
