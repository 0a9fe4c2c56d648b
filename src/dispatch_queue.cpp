#include "dispatch_queue.hpp"
#include <algorithm>

void DispatchQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        tasks.push_back({std::string(), std::move(task)});
    }
    queue_cv.notify_one();
}

void DispatchQueue::postLatest(const std::string& key, std::function<void()> task) {
    if (key.empty()) {
        post(std::move(task));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                                   [&key](const Entry& entry) { return entry.key == key; }),
                    tasks.end());
        tasks.push_back({key, std::move(task)});
    }
    queue_cv.notify_one();
}

size_t DispatchQueue::dispatch(std::chrono::milliseconds max_wait) {
    std::deque<Entry> ready;
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (tasks.empty() && max_wait.count() > 0) {
            queue_cv.wait_for(lock, max_wait, [this] { return !tasks.empty(); });
        }
        ready.swap(tasks);
    }

    // Tasks run unlocked so they may post follow-up work
    for (auto& entry : ready) {
        entry.task();
    }
    return ready.size();
}

size_t DispatchQueue::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void DispatchQueue::clear() {
    std::lock_guard<std::mutex> lock(queue_mutex);
    tasks.clear();
}
