#ifndef DISPATCH_QUEUE_H
#define DISPATCH_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

/**
 * @class DispatchQueue
 * @brief Carries work from the polling thread to the foreground thread.
 *
 * Producers call post() from any thread. The foreground thread calls
 * dispatch(), which runs the queued tasks in FIFO order on the caller's thread.
 */
class DispatchQueue {
public:
    /**
     * @brief Queues a task and wakes a waiting dispatch().
     * @param task The work to run on the foreground thread.
     */
    void post(std::function<void()> task);

    /**
     * @brief Queues a task that supersedes any pending task with the same key.
     *
     * The pending task is dropped and the new one goes to the back of the
     * queue, so a stalled consumer only sees the latest state.
     *
     * @param key Identifies tasks that replace each other.
     * @param task The work to run on the foreground thread.
     */
    void postLatest(const std::string& key, std::function<void()> task);

    /**
     * @brief Runs every queued task, waiting up to max_wait for the first one.
     * @param max_wait How long to block when the queue is empty.
     * @return The number of tasks that ran.
     */
    size_t dispatch(std::chrono::milliseconds max_wait);

    size_t pending() const;

    /// @brief Drops queued tasks without running them.
    void clear();

private:
    struct Entry {
        std::string key; // empty for tasks that are never replaced
        std::function<void()> task;
    };

    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Entry> tasks;
};

#endif // DISPATCH_QUEUE_H
