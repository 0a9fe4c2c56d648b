#ifndef EVENT_SIGNAL_H
#define EVENT_SIGNAL_H

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

/**
 * @class Signal
 * @brief A minimal observer registry.
 *
 * Slots run synchronously on the thread that calls emit(). Connecting or
 * disconnecting from inside a slot is allowed; the change applies to the next
 * emission.
 */
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    /**
     * @brief Registers a slot.
     * @return An id that can be passed to disconnect().
     */
    int connect(Slot slot) {
        std::lock_guard<std::mutex> lock(slots_mutex);
        int id = next_id++;
        slots.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(int id) {
        std::lock_guard<std::mutex> lock(slots_mutex);
        for (auto it = slots.begin(); it != slots.end(); ++it) {
            if (it->first == id) {
                slots.erase(it);
                return;
            }
        }
    }

    void disconnectAll() {
        std::lock_guard<std::mutex> lock(slots_mutex);
        slots.clear();
    }

    void emit(Args... args) const {
        std::vector<std::pair<int, Slot>> current;
        {
            std::lock_guard<std::mutex> lock(slots_mutex);
            current = slots;
        }
        for (const auto& entry : current) {
            entry.second(args...);
        }
    }

private:
    mutable std::mutex slots_mutex;
    std::vector<std::pair<int, Slot>> slots;
    int next_id = 1;
};

#endif // EVENT_SIGNAL_H
